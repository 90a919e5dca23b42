#pragma once
#include <atomic>
#include <signal.h>
#include <thread>

class CancellationToken;

// Turns SIGINT/SIGTERM into a cancellation instead of running work inside a
// signal handler. Construct it on the main thread before any worker starts so
// every later thread inherits the blocked mask.
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    int last_signal() const { return last_signal_.load(); }

private:
    void watch();

    CancellationToken& token_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<bool> stop_{false};
    std::atomic<int> last_signal_{0};
    std::thread thread_;
};
