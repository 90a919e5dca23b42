#include "signal_watcher.hpp"
#include "cancellation.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr long kWaitSliceNanos = 200L * 1000 * 1000;

} // namespace

SignalWatcher::SignalWatcher(CancellationToken& token) : token_(token) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        throw std::runtime_error(fmt::format("pthread_sigmask failed: {}", std::strerror(rc)));
    }

    thread_ = std::thread(&SignalWatcher::watch, this);
}

SignalWatcher::~SignalWatcher() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::watch() {
    timespec slice{};
    slice.tv_sec = 0;
    slice.tv_nsec = kWaitSliceNanos;

    while (!stop_.load()) {
        int signum = sigtimedwait(&signals_, nullptr, &slice);
        if (signum < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("sigtimedwait failed: {}", std::strerror(errno));
                return;
            }
            continue;
        }

        last_signal_.store(signum);
        if (token_.cancel()) {
            spdlog::warn("Received signal {}, initiating graceful shutdown...", signum);
        } else {
            spdlog::warn("Received signal {}, already shutting down", signum);
        }
    }
}
