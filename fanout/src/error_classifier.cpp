#include "error_classifier.hpp"
#include "util.hpp"
#include <regex>
#include <vector>

namespace {

const std::vector<std::string> kCapacityPatterns = {
    "MODEL_CAPACITY_EXHAUSTED",
    "RESOURCE_EXHAUSTED",
    "The model is overloaded",
    "overloaded",
    "529",
    "503",
};

const std::vector<std::string> kQuotaPatterns = {
    "TerminalQuotaError",
    "QUOTA_EXHAUSTED",
    "exhausted your capacity",
    "Resource has been exhausted",
    "daily limit",
};

const std::vector<std::string> kRateLimitPatterns = {
    "rate limit",
    "rate_limit_exceeded",
    "too many requests",
    "per minute",
    "429",
};

const std::vector<std::string> kAuthPatterns = {
    "API_KEY_INVALID",
    "API key not valid",
    "PERMISSION_DENIED",
    "UNAUTHENTICATED",
    "401",
    "403",
};

bool matches_any(const std::string& lowered, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (lowered.find(util::to_lower(pattern)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

Classification classify_error(const std::string& raw_error_text, int http_status) {
    const auto lowered = util::to_lower(raw_error_text);

    if (http_status == 503 || http_status == 529 || matches_any(lowered, kCapacityPatterns)) {
        return {ErrorCategory::CapacityExhausted, true};
    }

    if (matches_any(lowered, kQuotaPatterns)) {
        return {ErrorCategory::QuotaExhausted, false};
    }

    if (http_status == 429 || matches_any(lowered, kRateLimitPatterns)) {
        return {ErrorCategory::RateLimited, true};
    }

    if (http_status == 401 || http_status == 403 || matches_any(lowered, kAuthPatterns)) {
        return {ErrorCategory::Authentication, false};
    }

    return {ErrorCategory::Unknown, true};
}

const char* category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CapacityExhausted: return "capacity_exhausted";
        case ErrorCategory::QuotaExhausted:    return "quota_exhausted";
        case ErrorCategory::RateLimited:       return "rate_limited";
        case ErrorCategory::Authentication:    return "auth_error";
        case ErrorCategory::Unknown:           return "unknown";
    }
    return "unknown";
}

std::optional<double> parse_reset_after(const std::string& error_text) {
    static const std::regex reset_pattern(R"(reset after (\d+)h(\d+)m)");
    std::smatch match;
    if (std::regex_search(error_text, match, reset_pattern)) {
        double hours = std::stod(match[1].str());
        double minutes = std::stod(match[2].str());
        return hours + minutes / 60.0;
    }
    return std::nullopt;
}
