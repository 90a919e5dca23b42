#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace util;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "fanout");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // Concurrency
    config.max_workers = std::stoi(get_env_var("FANOUT_MAX_WORKERS", "3"));

    // Credentials (comma-separated, then the optional credentials file)
    config.credentials = split_string(get_env_var("FANOUT_CREDENTIALS"), ',');
    config.credentials_file = get_env_var("FANOUT_CREDENTIALS_FILE");
    if (!config.credentials_file.empty()) {
        auto from_file = load_credentials_file(config.credentials_file);
        config.credentials.insert(config.credentials.end(), from_file.begin(), from_file.end());
    }

    // Acquisition and retry
    config.acquire_timeout_seconds = std::stoi(get_env_var("FANOUT_ACQUIRE_TIMEOUT_SECONDS", "300"));
    config.base_backoff_seconds = std::stod(get_env_var("FANOUT_BACKOFF_BASE_SECONDS", "2.0"));
    config.max_backoff_seconds = std::stod(get_env_var("FANOUT_BACKOFF_MAX_SECONDS", "60.0"));
    config.rate_limit_wait_seconds = std::stod(get_env_var("FANOUT_RATE_LIMIT_WAIT_SECONDS", "60.0"));
    config.max_attempts = std::stoi(get_env_var("FANOUT_MAX_ATTEMPTS", "3"));
    config.simulate_rate_limit = get_env_flag("FANOUT_SIMULATE_429");

    // Work
    config.command = get_env_var("FANOUT_COMMAND");
    config.items_file = get_env_var("FANOUT_ITEMS_FILE");
    config.dry_run = get_env_flag("FANOUT_DRY_RUN");

    // Outputs
    config.report_path = get_env_var("FANOUT_REPORT_PATH");
    config.event_log_path = get_env_var("FANOUT_EVENT_LOG");

    return config;
}

std::vector<std::string> Config::load_credentials_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Credentials file not found: " + path);
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse credentials file " + path + ": " + e.what());
    }

    std::vector<std::string> keys;
    if (!data.contains("credentials") || !data["credentials"].is_array()) {
        spdlog::warn("Credentials file {} has no 'credentials' array", path);
        return keys;
    }

    for (const auto& entry : data["credentials"]) {
        if (!entry.is_object()) continue;
        if (!entry.value("enabled", true)) {
            spdlog::debug("Skipping disabled credential '{}'", entry.value("name", "unnamed"));
            continue;
        }
        auto key = entry.value("key", "");
        if (key.empty()) {
            spdlog::warn("Credential '{}' has no key, skipping", entry.value("name", "unnamed"));
            continue;
        }
        keys.push_back(key);
    }

    spdlog::info("Loaded {} credentials from {}", keys.size(), path);
    return keys;
}

void Config::validate() const {
    if (max_workers < 1) {
        throw std::runtime_error("FANOUT_MAX_WORKERS must be at least 1");
    }

    if (acquire_timeout_seconds <= 0) {
        throw std::runtime_error("Acquire timeout must be positive");
    }

    if (max_attempts < 1) {
        throw std::runtime_error("Max attempts must be at least 1");
    }

    if (base_backoff_seconds < 0.0 || rate_limit_wait_seconds < 0.0) {
        throw std::runtime_error("Backoff durations must not be negative");
    }

    if (base_backoff_seconds > max_backoff_seconds) {
        throw std::runtime_error("Base backoff must not exceed max backoff");
    }

    if (!dry_run && command.empty()) {
        throw std::runtime_error("FANOUT_COMMAND is required unless running in dry-run mode");
    }

    spdlog::info("Configuration validated successfully");
}
