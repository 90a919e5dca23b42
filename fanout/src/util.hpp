#pragma once
#include <string>
#include <cstddef>
#include <vector>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
bool get_env_flag(const std::string& name, bool default_value = false);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string replace_all(std::string str, const std::string& from, const std::string& to);
// Cuts to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& str, std::size_t max_bytes);

// Time utilities
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
double to_seconds(std::chrono::steady_clock::duration d);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

// Credentials are never logged in full
std::string mask_credential(const std::string& credential);

// Throws std::invalid_argument for identifiers that are not path-safe
std::string sanitize_identifier(const std::string& identifier);

} // namespace util
