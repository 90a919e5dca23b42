#pragma once

#include "backoff_policy.hpp"
#include "cancellation.hpp"
#include "credential_pool.hpp"
#include "output_multiplexer.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Config;
class EventLog;

struct CoordinatorOptions {
    std::chrono::milliseconds acquire_timeout{std::chrono::seconds(300)};
    double base_backoff_seconds = 2.0;
    double max_backoff_seconds = 60.0;
    double rate_limit_wait_seconds = 60.0;
    int max_attempts = 3;
    bool simulate_rate_limit = false;
    EventLog* event_log = nullptr;

    static CoordinatorOptions from_config(const Config& config);
};

// Runs one work function per item across a bounded number of threads. Each
// running item borrows a credential from the pool (when one is bound), upstream
// failures go through the classifier and backoff policy, and a cancelled token
// turns every item that has not started into an interrupted, checkpointed one.
class Coordinator {
public:
    static constexpr int kDefaultParallelism = 3;
    static constexpr int kMaxParallelism = 10;

    using ItemFn = std::function<void(std::size_t index,
                                      const std::optional<std::string>& credential,
                                      OutputMultiplexer& out)>;

    // max_workers above kMaxParallelism is clamped with a warning; below 1 throws
    Coordinator(int max_workers,
                CredentialPool* pool,
                CancellationToken& cancel,
                SharedSink& sink,
                CoordinatorOptions options = {});

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // work_fn(item, credential); id_fn(item) -> identifier
    template <typename Item, typename WorkFn, typename IdFn>
    RunSummary execute(const std::vector<Item>& items, WorkFn work_fn, IdFn id_fn, bool dry_run = false);

    // work_fn(item, credential, out) where `out` prefixes lines with "[<id>]"
    template <typename Item, typename WorkFn, typename IdFn>
    RunSummary execute_with_output(const std::vector<Item>& items, WorkFn work_fn, IdFn id_fn,
                                   bool dry_run = false);

    RunSummary run(const std::vector<std::string>& ids, const ItemFn& work_fn, bool dry_run);

    // Idempotent. Running items finish, pending ones are checkpointed.
    void request_shutdown();
    bool shutdown_requested() const { return cancel_.is_cancelled(); }

    CheckpointMap get_checkpoints() const;
    int max_workers() const { return max_workers_; }

private:
    struct RunState {
        std::mutex mutex;
        RunSummary summary;
        std::atomic<std::size_t> next{0};
    };

    RunSummary list_only(const std::vector<std::string>& ids);
    void worker_loop(int worker_id, const std::vector<std::string>& ids, const ItemFn& work_fn,
                     RunState& state);
    WorkflowResult run_item(std::size_t index, const std::string& id, const ItemFn& work_fn);
    WorkflowResult interrupted(const std::string& id);
    void record_result(RunState& state, WorkflowResult result);
    void log_event(const std::string& event_type, const std::string& item_id,
                   const std::optional<std::string>& credential, const std::string& error,
                   const nlohmann::json& details = nlohmann::json::object());

    int max_workers_;
    CredentialPool* pool_;
    CancellationToken& cancel_;
    SharedSink& sink_;
    CoordinatorOptions options_;
    BackoffPolicy policy_;

    std::atomic<bool> simulated_rate_limit_used_{false};

    mutable std::mutex checkpoints_mutex_;
    CheckpointMap checkpoints_;
};

template <typename Item, typename WorkFn, typename IdFn>
RunSummary Coordinator::execute(const std::vector<Item>& items, WorkFn work_fn, IdFn id_fn, bool dry_run) {
    return execute_with_output(
        items,
        [&work_fn](const Item& item, const std::optional<std::string>& credential, OutputMultiplexer&) {
            work_fn(item, credential);
        },
        id_fn, dry_run);
}

template <typename Item, typename WorkFn, typename IdFn>
RunSummary Coordinator::execute_with_output(const std::vector<Item>& items, WorkFn work_fn, IdFn id_fn,
                                            bool dry_run) {
    std::vector<std::string> ids;
    ids.reserve(items.size());
    for (const auto& item : items) {
        ids.push_back(id_fn(item));
    }

    return run(ids,
               [&items, &work_fn](std::size_t index, const std::optional<std::string>& credential,
                                  OutputMultiplexer& out) {
                   work_fn(items[index], credential, out);
               },
               dry_run);
}
