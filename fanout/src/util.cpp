#include "util.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <regex>
#include <random>
#include <iomanip>
#include <mutex>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

bool get_env_flag(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    auto v = to_lower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off" || v.empty()) return false;
    return default_value;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
    return str;
}

std::string truncate_utf8(const std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) return str;

    std::size_t cut = max_bytes;
    // Step back over continuation bytes to the lead byte of the straddling sequence
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

double to_seconds(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

double random_jitter(double base_value, double jitter_factor) {
    static std::mutex gen_mutex;
    static std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        jitter = dis(gen);
    }
    return base_value * (1.0 + jitter);
}

std::string mask_credential(const std::string& credential) {
    if (credential.size() <= 8) {
        return credential.substr(0, 2) + "...";
    }
    return credential.substr(0, 8) + "...";
}

std::string sanitize_identifier(const std::string& identifier) {
    if (identifier.empty()) {
        throw std::invalid_argument("Invalid identifier: empty");
    }
    if (identifier.find("..") != std::string::npos) {
        throw std::invalid_argument("Invalid identifier: path traversal not allowed: " + identifier);
    }
    if (identifier[0] == '/' || (identifier.size() > 1 && identifier[1] == ':')) {
        throw std::invalid_argument("Invalid identifier: absolute paths not allowed: " + identifier);
    }
    if (identifier.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Invalid identifier: path separators not allowed: " + identifier);
    }

    static const std::regex valid_identifier("^[a-zA-Z0-9_-]+$");
    if (!std::regex_match(identifier, valid_identifier)) {
        throw std::invalid_argument("Invalid identifier: invalid characters in: " + identifier);
    }
    return identifier;
}

} // namespace util
