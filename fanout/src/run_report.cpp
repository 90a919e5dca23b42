#include "run_report.hpp"
#include "util.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

nlohmann::json build_run_report(const RunSummary& summary,
                                const CheckpointMap& checkpoints,
                                const std::vector<CredentialStatus>& credentials) {
    nlohmann::json report = summary.to_json();
    report["generated_at"] = util::current_iso8601();

    nlohmann::json cp = nlohmann::json::object();
    for (const auto& [item_id, entry] : checkpoints) {
        cp[item_id] = entry.to_json();
    }
    report["checkpoints"] = cp;

    nlohmann::json creds = nlohmann::json::array();
    for (const auto& status : credentials) {
        creds.push_back({
            {"credential", status.masked},
            {"in_use", status.in_use},
            {"disabled", status.disabled},
            {"rate_limited_for_seconds", status.rate_limited_for_seconds},
            {"times_acquired", status.times_acquired}
        });
    }
    report["credentials"] = creds;

    return report;
}

bool write_run_report(const std::string& path, const nlohmann::json& report) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open run report {}", path);
        return false;
    }

    // Child output may carry invalid UTF-8
    out << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out) {
        spdlog::error("Failed to write run report {}", path);
        return false;
    }

    spdlog::info("Run report written to {}", path);
    return true;
}
