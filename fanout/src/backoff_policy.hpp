#pragma once
#include "error_classifier.hpp"
#include <chrono>

enum class RetryAction {
    RetrySameCredential,
    RotateCredential,      // park the credential for rate_limit_wait, then take another
    DisableAndRotate,      // credential rejected, never hand it out again this run
    Fail
};

struct RetryDecision {
    RetryAction action = RetryAction::Fail;
    std::chrono::milliseconds delay{0};             // sleep before the next attempt
    std::chrono::milliseconds credential_backoff{0}; // how long the credential stays parked
    bool disable_credential = false;
};

class BackoffPolicy {
public:
    BackoffPolicy(double base_delay_seconds = 2.0,
                  double max_delay_seconds = 60.0,
                  double rate_limit_wait_seconds = 60.0,
                  int max_attempts = 3,
                  double jitter_factor = 0.2);

    // min(cap, base * 2^(attempt-1)) with +/- jitter_factor applied before the cap,
    // so the result never exceeds the cap and never shrinks as attempts grow.
    static std::chrono::milliseconds compute_delay(int attempt,
                                                   double base_delay_seconds,
                                                   double max_delay_seconds,
                                                   double jitter_factor = 0.2);

    std::chrono::milliseconds compute_delay(int attempt) const;

    // attempt is the 1-based number of the attempt that just failed
    RetryDecision decide(const Classification& classification, int attempt) const;

    std::chrono::milliseconds rate_limit_wait() const;
    int max_attempts() const { return max_attempts_; }

private:
    double base_delay_seconds_;
    double max_delay_seconds_;
    double rate_limit_wait_seconds_;
    int max_attempts_;
    double jitter_factor_;
};
