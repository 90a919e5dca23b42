#pragma once
#include <string>
#include <vector>

class Config {
public:
    // Service info
    std::string service_name = "fanout";
    std::string log_level = "info";

    // Concurrency
    int max_workers = 3;

    // Credentials (FANOUT_CREDENTIALS and/or FANOUT_CREDENTIALS_FILE)
    std::vector<std::string> credentials;
    std::string credentials_file;

    // Credential acquisition and retry
    int acquire_timeout_seconds = 300;
    double base_backoff_seconds = 2.0;
    double max_backoff_seconds = 60.0;
    double rate_limit_wait_seconds = 60.0;
    int max_attempts = 3;

    // Test hook: answer the first credentialed attempt with a synthetic 429
    bool simulate_rate_limit = false;

    // Work
    std::string command;      // "{id}" is replaced with the item identifier
    std::string items_file;
    bool dry_run = false;

    // Outputs
    std::string report_path;
    std::string event_log_path;

    static Config from_env();
    void validate() const;

    // Reads enabled keys from a {"credentials": [{"key": ..., "enabled": ...}]} file
    static std::vector<std::string> load_credentials_file(const std::string& path);
};
