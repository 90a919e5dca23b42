#include "credential_pool.hpp"
#include "cancellation.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace {

// Upper bound on a single wait while a cancellation token is attached
constexpr std::chrono::milliseconds kCancelPollInterval{100};

} // namespace

CredentialPool::CredentialPool(const std::vector<std::string>& credentials) {
    std::unordered_set<std::string> seen;
    for (const auto& credential : credentials) {
        if (credential.empty()) {
            spdlog::warn("Ignoring empty credential");
            continue;
        }
        if (!seen.insert(credential).second) {
            spdlog::warn("Ignoring duplicate credential {}", util::mask_credential(credential));
            continue;
        }
        CredentialRecord record;
        record.token = credential;
        records_.push_back(std::move(record));
    }
    spdlog::debug("Credential pool created with {} credentials", records_.size());
}

std::optional<std::string> CredentialPool::acquire(std::optional<std::chrono::milliseconds> timeout,
                                                   const CancellationToken* cancel) {
    std::optional<Clock::time_point> deadline;
    if (timeout) {
        deadline = Clock::now() + *timeout;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool exhaustion_reported = false;

    while (true) {
        if (cancel && cancel->is_cancelled()) {
            return std::nullopt;
        }

        auto now = Clock::now();
        if (auto* record = find_eligible_locked(now)) {
            record->in_use = true;
            record->rate_limited_until.reset();
            record->times_acquired++;
            return record->token;
        }

        if (records_.empty()) {
            spdlog::error("Credential pool is empty");
            return std::nullopt;
        }
        if (all_disabled_locked()) {
            spdlog::error("No usable credentials remain, all {} have been disabled", records_.size());
            return std::nullopt;
        }

        // Reported once per wait, not on every re-scan
        if (!exhaustion_reported) {
            exhaustion_reported = true;
            exhaustion_count_++;
            spdlog::warn("Credential pool exhausted, waiting for release...");
        }

        if (deadline && now >= *deadline) {
            return std::nullopt;
        }

        std::optional<Clock::time_point> wake = deadline;
        if (auto expiry = next_expiry_locked(now)) {
            wake = wake ? std::min(*wake, *expiry) : *expiry;
        }
        if (cancel) {
            auto poll = now + kCancelPollInterval;
            wake = wake ? std::min(*wake, poll) : poll;
        }

        if (wake) {
            changed_.wait_until(lock, *wake);
        } else {
            changed_.wait(lock);
        }
    }
}

void CredentialPool::release(const std::string& credential) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(credential);
        if (!record) {
            return;
        }
        record->in_use = false;
    }
    changed_.notify_all();
}

void CredentialPool::mark_rate_limited(const std::string& credential, std::chrono::milliseconds backoff) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(credential);
        if (!record) {
            return;
        }
        record->in_use = false;
        record->rate_limited_until = Clock::now() + backoff;
        spdlog::warn("Credential {} is rate-limited, backoff: {:.1f}s",
                     util::mask_credential(credential),
                     std::chrono::duration<double>(backoff).count());
    }
    changed_.notify_all();
}

void CredentialPool::disable(const std::string& credential) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(credential);
        if (!record) {
            return;
        }
        record->in_use = false;
        record->disabled = true;
        spdlog::error("Credential {} rejected by upstream, disabled for the rest of the run",
                      util::mask_credential(credential));
    }
    changed_.notify_all();
}

std::size_t CredentialPool::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [now](const CredentialRecord& record) { return is_eligible(record, now); }));
}

std::size_t CredentialPool::in_use_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [](const CredentialRecord& record) { return record.in_use; }));
}

std::size_t CredentialPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t CredentialPool::exhaustion_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exhaustion_count_;
}

bool CredentialPool::has_usable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !records_.empty() && !all_disabled_locked();
}

std::vector<CredentialStatus> CredentialPool::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    std::vector<CredentialStatus> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        CredentialStatus s;
        s.masked = util::mask_credential(record.token);
        s.in_use = record.in_use;
        s.disabled = record.disabled;
        if (record.rate_limited_until && *record.rate_limited_until > now) {
            s.rate_limited_for_seconds = util::to_seconds(*record.rate_limited_until - now);
        }
        s.times_acquired = record.times_acquired;
        out.push_back(std::move(s));
    }
    return out;
}

bool CredentialPool::is_eligible(const CredentialRecord& record, Clock::time_point now) {
    if (record.in_use || record.disabled) {
        return false;
    }
    return !record.rate_limited_until || *record.rate_limited_until <= now;
}

CredentialPool::CredentialRecord* CredentialPool::find_locked(const std::string& credential) {
    auto it = std::find_if(records_.begin(), records_.end(),
        [&credential](const CredentialRecord& record) { return record.token == credential; });
    return it == records_.end() ? nullptr : &*it;
}

CredentialPool::CredentialRecord* CredentialPool::find_eligible_locked(Clock::time_point now) {
    auto it = std::find_if(records_.begin(), records_.end(),
        [now](const CredentialRecord& record) { return is_eligible(record, now); });
    return it == records_.end() ? nullptr : &*it;
}

std::optional<CredentialPool::Clock::time_point> CredentialPool::next_expiry_locked(Clock::time_point now) const {
    std::optional<Clock::time_point> soonest;
    for (const auto& record : records_) {
        if (record.disabled || !record.rate_limited_until || *record.rate_limited_until <= now) {
            continue;
        }
        if (!soonest || *record.rate_limited_until < *soonest) {
            soonest = record.rate_limited_until;
        }
    }
    return soonest;
}

bool CredentialPool::all_disabled_locked() const {
    return std::all_of(records_.begin(), records_.end(),
        [](const CredentialRecord& record) { return record.disabled; });
}

void CredentialLease::assign(std::string credential) {
    release();
    credential_ = std::move(credential);
}

void CredentialLease::release() {
    if (pool_ && credential_) {
        pool_->release(*credential_);
    }
    credential_.reset();
}

void CredentialLease::mark_rate_limited(std::chrono::milliseconds backoff) {
    if (pool_ && credential_) {
        pool_->mark_rate_limited(*credential_, backoff);
    }
    credential_.reset();
}

void CredentialLease::disable() {
    if (pool_ && credential_) {
        pool_->disable(*credential_);
    }
    credential_.reset();
}
