#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class ItemStatus { Succeeded, Failed, Interrupted };

const char* status_name(ItemStatus status);

// Outcome of one item. Created exactly once, when the item reaches a terminal state.
struct WorkflowResult {
    std::string item_id;
    ItemStatus status = ItemStatus::Failed;
    std::optional<std::string> error;
    std::chrono::duration<double> duration{0.0};
    int attempts = 0;
    std::string credential;  // masked

    bool success() const { return status == ItemStatus::Succeeded; }
    nlohmann::json to_json() const;
};

struct ProgressStats {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t interrupted = 0;

    std::size_t success_count() const { return completed - failed; }
    nlohmann::json to_json() const;
};

struct CheckpointEntry {
    std::string status = "interrupted";

    nlohmann::json to_json() const;
};

using CheckpointMap = std::map<std::string, CheckpointEntry>;

struct RunSummary {
    ProgressStats stats;
    std::vector<WorkflowResult> results;  // arrival order

    nlohmann::json to_json() const;
};
