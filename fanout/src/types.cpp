#include "types.hpp"

const char* status_name(ItemStatus status) {
    switch (status) {
        case ItemStatus::Succeeded:   return "succeeded";
        case ItemStatus::Failed:      return "failed";
        case ItemStatus::Interrupted: return "interrupted";
    }
    return "failed";
}

nlohmann::json WorkflowResult::to_json() const {
    nlohmann::json j = {
        {"item_id", item_id},
        {"status", status_name(status)},
        {"success", success()},
        {"duration_seconds", duration.count()},
        {"attempts", attempts}
    };
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    if (!credential.empty()) {
        j["credential"] = credential;
    }
    return j;
}

nlohmann::json ProgressStats::to_json() const {
    return {
        {"total", total},
        {"completed", completed},
        {"failed", failed},
        {"interrupted", interrupted},
        {"success_count", success_count()}
    };
}

nlohmann::json CheckpointEntry::to_json() const {
    return {{"status", status}};
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results) {
        items.push_back(result.to_json());
    }
    return {
        {"stats", stats.to_json()},
        {"results", items}
    };
}
