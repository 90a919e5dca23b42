#include "backoff_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffPolicy::BackoffPolicy(double base_delay_seconds, double max_delay_seconds,
                             double rate_limit_wait_seconds, int max_attempts,
                             double jitter_factor)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      rate_limit_wait_seconds_(rate_limit_wait_seconds),
      max_attempts_(max_attempts),
      jitter_factor_(jitter_factor) {
}

std::chrono::milliseconds BackoffPolicy::compute_delay(int attempt,
                                                       double base_delay_seconds,
                                                       double max_delay_seconds,
                                                       double jitter_factor) {
    if (attempt < 1) {
        attempt = 1;
    }

    // Exponent is bounded so large attempt numbers saturate at the cap
    int exponent = std::min(attempt - 1, 62);
    double delay_seconds = base_delay_seconds * std::pow(2.0, exponent);

    // Jitter (+/- jitter_factor) against synchronized retries, then cap
    delay_seconds = util::random_jitter(delay_seconds, jitter_factor);
    delay_seconds = std::min(delay_seconds, max_delay_seconds);
    delay_seconds = std::max(delay_seconds, 0.0);

    return std::chrono::milliseconds(static_cast<long long>(delay_seconds * 1000));
}

std::chrono::milliseconds BackoffPolicy::compute_delay(int attempt) const {
    return compute_delay(attempt, base_delay_seconds_, max_delay_seconds_, jitter_factor_);
}

std::chrono::milliseconds BackoffPolicy::rate_limit_wait() const {
    return std::chrono::milliseconds(static_cast<long long>(rate_limit_wait_seconds_ * 1000));
}

RetryDecision BackoffPolicy::decide(const Classification& classification, int attempt) const {
    RetryDecision decision;

    // Credential side effects apply even when the attempt budget is spent
    if (classification.category == ErrorCategory::RateLimited) {
        decision.credential_backoff = rate_limit_wait();
    } else if (classification.category == ErrorCategory::Authentication) {
        decision.disable_credential = true;
    }

    if (classification.category == ErrorCategory::QuotaExhausted || attempt >= max_attempts_) {
        return decision;
    }

    switch (classification.category) {
        case ErrorCategory::CapacityExhausted:
        case ErrorCategory::Unknown:
            decision.action = RetryAction::RetrySameCredential;
            decision.delay = compute_delay(attempt);
            break;
        case ErrorCategory::RateLimited:
            decision.action = RetryAction::RotateCredential;
            break;
        case ErrorCategory::Authentication:
            decision.action = RetryAction::DisableAndRotate;
            break;
        case ErrorCategory::QuotaExhausted:
            break;
    }

    return decision;
}
