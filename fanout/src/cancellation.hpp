#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared shutdown signal. Every blocking call in the run (credential waits,
// backoff sleeps) takes one so it can return early once shutdown starts.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns true only for the call that actually flipped the flag
    bool cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Sleeps for up to `duration`. Returns true if cancelled before it elapsed.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
