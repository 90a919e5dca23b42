#include "cancellation.hpp"

bool CancellationToken::cancel() {
    bool first;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        first = !cancelled_.exchange(true);
    }
    cv_.notify_all();
    return first;
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}
