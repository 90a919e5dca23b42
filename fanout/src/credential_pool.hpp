#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;

struct CredentialStatus {
    std::string masked;
    bool in_use = false;
    bool disabled = false;
    double rate_limited_for_seconds = 0.0;  // 0 when not rate-limited
    int times_acquired = 0;
};

// Fixed set of credentials, each held by at most one worker at a time.
// A rate-limited credential is skipped until its deadline passes; a disabled
// one (rejected by the upstream) is skipped for the rest of the pool's life.
class CredentialPool {
public:
    explicit CredentialPool(const std::vector<std::string>& credentials);

    CredentialPool(const CredentialPool&) = delete;
    CredentialPool& operator=(const CredentialPool&) = delete;

    // Blocks until a credential is free, the timeout passes (no timeout means
    // wait indefinitely) or `cancel` fires. Returns nullopt in the last two cases
    // and when every credential has been disabled.
    std::optional<std::string> acquire(std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                       const CancellationToken* cancel = nullptr);

    // Unknown credentials are ignored
    void release(const std::string& credential);
    void mark_rate_limited(const std::string& credential, std::chrono::milliseconds backoff);
    void disable(const std::string& credential);

    // Observability only, acquire() re-checks under the lock
    std::size_t available_count() const;
    std::size_t in_use_count() const;
    std::size_t size() const;
    std::size_t exhaustion_count() const;
    // False once the pool is empty or every credential has been disabled
    bool has_usable() const;
    std::vector<CredentialStatus> status() const;

private:
    using Clock = std::chrono::steady_clock;

    struct CredentialRecord {
        std::string token;
        bool in_use = false;
        bool disabled = false;
        std::optional<Clock::time_point> rate_limited_until;
        int times_acquired = 0;
    };

    static bool is_eligible(const CredentialRecord& record, Clock::time_point now);
    CredentialRecord* find_locked(const std::string& credential);
    CredentialRecord* find_eligible_locked(Clock::time_point now);
    std::optional<Clock::time_point> next_expiry_locked(Clock::time_point now) const;
    bool all_disabled_locked() const;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<CredentialRecord> records_;
    std::size_t exhaustion_count_ = 0;
};

// Holds at most one credential and hands it back to the pool on destruction,
// whichever way the holder exits.
class CredentialLease {
public:
    explicit CredentialLease(CredentialPool* pool) : pool_(pool) {}
    ~CredentialLease() { release(); }

    CredentialLease(const CredentialLease&) = delete;
    CredentialLease& operator=(const CredentialLease&) = delete;

    void assign(std::string credential);
    bool held() const { return credential_.has_value(); }
    const std::optional<std::string>& credential() const { return credential_; }

    void release();
    void mark_rate_limited(std::chrono::milliseconds backoff);
    void disable();

private:
    CredentialPool* pool_;
    std::optional<std::string> credential_;
};
