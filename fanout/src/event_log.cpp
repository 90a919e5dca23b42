#include "event_log.hpp"
#include "util.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxErrorBytes = 200;

} // namespace

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) {
        return;
    }

    try {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create event log directory for {}: {}", path_, e.what());
        return;
    }

    out_.open(path_, std::ios::app);
    if (!out_) {
        spdlog::error("Failed to open event log {}", path_);
        return;
    }
    enabled_ = true;
    spdlog::info("Writing credential events to {}", path_);
}

void EventLog::record(const std::string& event_type,
                      const std::string& item_id,
                      const std::string& credential,
                      const std::string& error,
                      const nlohmann::json& details) {
    if (!enabled_) {
        return;
    }

    nlohmann::json entry = {
        {"timestamp", util::current_iso8601()},
        {"event", event_type},
        {"item_id", item_id}
    };
    if (!credential.empty()) {
        entry["credential"] = util::mask_credential(credential);
    }
    if (!error.empty()) {
        entry["error"] = util::truncate_utf8(error, kMaxErrorBytes);
    }
    if (!details.empty()) {
        entry["details"] = details;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_) {
        spdlog::error("Failed to append to event log {}", path_);
    }
}
