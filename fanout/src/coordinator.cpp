#include "coordinator.hpp"
#include "config.hpp"
#include "error_classifier.hpp"
#include "event_log.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

CoordinatorOptions CoordinatorOptions::from_config(const Config& config) {
    CoordinatorOptions options;
    options.acquire_timeout = std::chrono::seconds(config.acquire_timeout_seconds);
    options.base_backoff_seconds = config.base_backoff_seconds;
    options.max_backoff_seconds = config.max_backoff_seconds;
    options.rate_limit_wait_seconds = config.rate_limit_wait_seconds;
    options.max_attempts = config.max_attempts;
    options.simulate_rate_limit = config.simulate_rate_limit;
    return options;
}

Coordinator::Coordinator(int max_workers,
                         CredentialPool* pool,
                         CancellationToken& cancel,
                         SharedSink& sink,
                         CoordinatorOptions options)
    : max_workers_(max_workers),
      pool_(pool),
      cancel_(cancel),
      sink_(sink),
      options_(options),
      policy_(options.base_backoff_seconds, options.max_backoff_seconds,
              options.rate_limit_wait_seconds, options.max_attempts) {
    if (max_workers_ < 1) {
        throw std::invalid_argument(fmt::format("max_workers must be at least 1, got {}", max_workers_));
    }

    if (max_workers_ > kMaxParallelism) {
        spdlog::warn("Requested parallelism {} exceeds maximum {}, capping to {}",
                     max_workers_, kMaxParallelism, kMaxParallelism);
        max_workers_ = kMaxParallelism;
    }
}

void Coordinator::request_shutdown() {
    if (cancel_.cancel()) {
        spdlog::warn("Graceful shutdown requested, running items will finish, pending items are checkpointed");
    } else {
        spdlog::info("Shutdown already in progress");
    }
}

CheckpointMap Coordinator::get_checkpoints() const {
    std::lock_guard<std::mutex> lock(checkpoints_mutex_);
    return checkpoints_;
}

RunSummary Coordinator::run(const std::vector<std::string>& ids, const ItemFn& work_fn, bool dry_run) {
    if (dry_run) {
        return list_only(ids);
    }

    RunState state;
    state.summary.stats.total = ids.size();
    state.summary.results.reserve(ids.size());

    if (ids.empty()) {
        sink_.write_line("Completed: 0/0 succeeded, 0 failed");
        return state.summary;
    }

    int workers = static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(max_workers_), ids.size()));
    spdlog::info("Processing {} items with {} workers", ids.size(), workers);

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        try {
            threads.emplace_back(&Coordinator::worker_loop, this, i, std::cref(ids), std::cref(work_fn),
                                 std::ref(state));
        } catch (const std::system_error& e) {
            // Items are pulled from a shared cursor, so fewer threads still drain the batch
            spdlog::error("Failed to start worker {}: {}", i, e.what());
            if (threads.empty()) {
                throw;
            }
            break;
        }
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    const auto& stats = state.summary.stats;
    auto line = fmt::format("Completed: {}/{} succeeded, {} failed",
                            stats.success_count(), stats.total, stats.failed);
    if (stats.interrupted > 0) {
        line += fmt::format(", {} interrupted", stats.interrupted);
    }
    sink_.write_line(line);
    sink_.flush();

    return state.summary;
}

RunSummary Coordinator::list_only(const std::vector<std::string>& ids) {
    RunSummary summary;
    summary.stats.total = ids.size();

    sink_.write_line(fmt::format("Dry run mode - would process {} items:", ids.size()));
    for (const auto& id : ids) {
        sink_.write_line("  - " + id);
    }
    sink_.flush();
    return summary;
}

void Coordinator::worker_loop(int worker_id, const std::vector<std::string>& ids, const ItemFn& work_fn,
                              RunState& state) {
    spdlog::debug("Worker-{} started", worker_id);

    while (true) {
        std::size_t index = state.next.fetch_add(1);
        if (index >= ids.size()) {
            break;
        }

        const auto& id = ids[index];
        WorkflowResult result;
        try {
            if (cancel_.is_cancelled()) {
                result = interrupted(id);
            } else {
                result = run_item(index, id, work_fn);
            }
        } catch (const std::exception& e) {
            spdlog::error("Worker-{} internal error on {}: {}", worker_id, id, e.what());
            result.item_id = id;
            result.status = ItemStatus::Failed;
            result.error = e.what();
        }
        record_result(state, std::move(result));
    }

    spdlog::debug("Worker-{} stopped", worker_id);
}

WorkflowResult Coordinator::interrupted(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(checkpoints_mutex_);
        checkpoints_[id] = CheckpointEntry{};
    }
    log_event("item_interrupted", id, std::nullopt, "");

    WorkflowResult result;
    result.item_id = id;
    result.status = ItemStatus::Interrupted;
    result.error = "interrupted by shutdown";
    return result;
}

WorkflowResult Coordinator::run_item(std::size_t index, const std::string& id, const ItemFn& work_fn) {
    auto start = std::chrono::steady_clock::now();
    auto finish = [&start](WorkflowResult r) {
        r.duration = std::chrono::steady_clock::now() - start;
        return r;
    };

    WorkflowResult result;
    result.item_id = id;

    OutputMultiplexer out("[" + id + "]", sink_);
    CredentialLease lease(pool_);
    int attempt = 0;

    while (true) {
        if (cancel_.is_cancelled()) {
            auto r = interrupted(id);
            r.attempts = attempt;
            r.credential = result.credential;
            return finish(std::move(r));
        }

        if (pool_ && !lease.held()) {
            auto credential = pool_->acquire(options_.acquire_timeout, &cancel_);
            if (!credential) {
                if (cancel_.is_cancelled()) {
                    auto r = interrupted(id);
                    r.attempts = attempt;
                    r.credential = result.credential;
                    return finish(std::move(r));
                }
                result.status = ItemStatus::Failed;
                result.error = pool_->has_usable()
                    ? "Failed to acquire credential after timeout"
                    : "No usable credentials remain";
                result.attempts = attempt;
                log_event("credential_timeout", id, std::nullopt, *result.error);
                return finish(std::move(result));
            }
            if (!result.credential.empty()) {
                log_event("credential_rotated", id, credential, "",
                          {{"previous_credential", result.credential}});
            }
            result.credential = util::mask_credential(*credential);
            lease.assign(std::move(*credential));
        }

        ++attempt;
        result.attempts = attempt;

        try {
            if (options_.simulate_rate_limit && lease.held() && !simulated_rate_limit_used_.exchange(true)) {
                throw UpstreamError("429 rate limit exceeded (simulated)", 429);
            }

            work_fn(index, lease.credential(), out);
            out.flush();
            result.status = ItemStatus::Succeeded;
            result.error.reset();
            return finish(std::move(result));
        } catch (const UpstreamError& e) {
            out.flush();
            auto classification = classify_error(e.what(), e.http_status());
            auto decision = policy_.decide(classification, attempt);
            const auto held = lease.credential();

            if (decision.disable_credential && held) {
                log_event("auth_error", id, held, e.what());
                lease.disable();
            } else if (decision.credential_backoff.count() > 0 && held) {
                log_event("rate_limited", id, held, e.what(),
                          {{"backoff_seconds", std::chrono::duration<double>(decision.credential_backoff).count()}});
                lease.mark_rate_limited(decision.credential_backoff);
            }

            switch (decision.action) {
                case RetryAction::RetrySameCredential: {
                    double delay_seconds = std::chrono::duration<double>(decision.delay).count();
                    spdlog::warn("{}: {} on attempt {}, backing off {:.1f}s",
                                 id, category_name(classification.category), attempt, delay_seconds);
                    log_event("capacity_backoff", id, held, e.what(),
                              {{"backoff_seconds", delay_seconds}, {"attempt", attempt},
                               {"category", category_name(classification.category)}});
                    if (cancel_.sleep_for(decision.delay)) {
                        auto r = interrupted(id);
                        r.attempts = attempt;
                        r.credential = result.credential;
                        return finish(std::move(r));
                    }
                    continue;
                }
                case RetryAction::RotateCredential:
                    if (!held) {
                        // Nothing to park, so the item itself waits out the window
                        double wait_seconds = std::chrono::duration<double>(decision.credential_backoff).count();
                        spdlog::warn("{}: rate limited on attempt {}, waiting {:.1f}s",
                                     id, attempt, wait_seconds);
                        log_event("rate_limited", id, held, e.what(), {{"backoff_seconds", wait_seconds}});
                        if (cancel_.sleep_for(decision.credential_backoff)) {
                            auto r = interrupted(id);
                            r.attempts = attempt;
                            return finish(std::move(r));
                        }
                        continue;
                    }
                    spdlog::warn("{}: {} on attempt {}, rotating credential",
                                 id, category_name(classification.category), attempt);
                    continue;
                case RetryAction::DisableAndRotate:
                    if (!held) {
                        break;
                    }
                    spdlog::warn("{}: {} on attempt {}, rotating credential",
                                 id, category_name(classification.category), attempt);
                    continue;
                case RetryAction::Fail:
                    break;
            }

            if (classification.category == ErrorCategory::QuotaExhausted) {
                nlohmann::json details = nlohmann::json::object();
                if (auto hours = parse_reset_after(e.what())) {
                    details["reset_hours"] = *hours;
                }
                log_event("quota_exhausted", id, held, e.what(), details);
            }

            result.status = ItemStatus::Failed;
            result.error = fmt::format("{}: {}", category_name(classification.category), e.what());
            spdlog::error("{} failed after {} attempt(s): {}", id, attempt, *result.error);
            return finish(std::move(result));
        } catch (const std::exception& e) {
            out.flush();
            result.status = ItemStatus::Failed;
            result.error = e.what();
            return finish(std::move(result));
        } catch (...) {
            out.flush();
            result.status = ItemStatus::Failed;
            result.error = "unknown error";
            return finish(std::move(result));
        }
    }
}

void Coordinator::record_result(RunState& state, WorkflowResult result) {
    std::lock_guard<std::mutex> lock(state.mutex);
    auto& stats = state.summary.stats;

    switch (result.status) {
        case ItemStatus::Succeeded:
            stats.completed++;
            break;
        case ItemStatus::Failed:
            stats.completed++;
            stats.failed++;
            break;
        case ItemStatus::Interrupted:
            stats.interrupted++;
            break;
    }

    if (result.status == ItemStatus::Failed) {
        spdlog::warn("[{}/{}] {} failed ({:.1f}s): {}",
                     stats.completed + stats.interrupted, stats.total, result.item_id,
                     result.duration.count(), result.error.value_or(""));
    } else {
        spdlog::info("[{}/{}] {} {} ({:.1f}s)",
                     stats.completed + stats.interrupted, stats.total, result.item_id,
                     status_name(result.status), result.duration.count());
    }

    state.summary.results.push_back(std::move(result));
}

void Coordinator::log_event(const std::string& event_type, const std::string& item_id,
                            const std::optional<std::string>& credential, const std::string& error,
                            const nlohmann::json& details) {
    if (!options_.event_log) {
        return;
    }
    try {
        options_.event_log->record(event_type, item_id, credential.value_or(""), error, details);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record {} event for {}: {}", event_type, item_id, e.what());
    }
}
