#pragma once

#include "credential_pool.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

nlohmann::json build_run_report(const RunSummary& summary,
                                const CheckpointMap& checkpoints,
                                const std::vector<CredentialStatus>& credentials);

bool write_run_report(const std::string& path, const nlohmann::json& report);
