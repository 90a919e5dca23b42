#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Append-only JSON-lines record of credential events (rate limits, capacity
// backoff, quota exhaustion, rejected keys, rotation). An empty path disables it.
class EventLog {
public:
    explicit EventLog(const std::string& path = "");

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    bool enabled() const { return enabled_; }

    // `credential` is masked before it is written
    void record(const std::string& event_type,
                const std::string& item_id,
                const std::string& credential = "",
                const std::string& error = "",
                const nlohmann::json& details = nlohmann::json::object());

private:
    std::string path_;
    bool enabled_ = false;
    std::ofstream out_;
    std::mutex mutex_;
};
