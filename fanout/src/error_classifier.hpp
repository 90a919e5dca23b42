#pragma once
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorCategory {
    CapacityExhausted,  // server overloaded, back off and retry the same credential
    QuotaExhausted,     // account quota gone, fail immediately
    RateLimited,        // per-minute limit, park the credential for a fixed window
    Authentication,     // credential rejected, drop it for the rest of the run
    Unknown             // retried with standard backoff
};

struct Classification {
    ErrorCategory category = ErrorCategory::Unknown;
    bool retryable = true;
};

// Thrown by work functions to hand an upstream failure to the retry protocol.
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(const std::string& message, int http_status = 0)
        : std::runtime_error(message), http_status_(http_status) {}

    int http_status() const { return http_status_; }

private:
    int http_status_;
};

// Detection order matters: capacity markers are checked before quota and
// per-minute markers because the texts overlap.
Classification classify_error(const std::string& raw_error_text, int http_status = 0);

const char* category_name(ErrorCategory category);

// "Your quota will reset after 15h11m58s" -> 15.18 hours
std::optional<double> parse_reset_after(const std::string& error_text);
