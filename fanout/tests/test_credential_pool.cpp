#include "cancellation.hpp"
#include "credential_pool.hpp"
#include "log_capture.hpp"
#include <atomic>
#include <thread>
#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

const std::vector<std::string> kKeys = {"AIzaSyAAAAAAAAAAAAAA", "AIzaSyBBBBBBBBBBBBBB"};

} // namespace

TEST(CredentialPoolTest, DropsEmptyAndDuplicateCredentials) {
    LogCapture logs;
    CredentialPool pool({"AIzaSyAAAAAAAAAAAAAA", "", "AIzaSyAAAAAAAAAAAAAA", "AIzaSyBBBBBBBBBBBBBB"});
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_TRUE(logs.contains("duplicate credential AIzaSyAA..."));
    EXPECT_FALSE(logs.contains("AIzaSyAAAAAAAAAAAAAA"));
}

TEST(CredentialPoolTest, CredentialIsHeldByOneWorkerAtATime) {
    CredentialPool pool(kKeys);
    std::atomic<int> holders_a{0};
    std::atomic<int> holders_b{0};
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto credential = pool.acquire(5s);
                ASSERT_TRUE(credential.has_value());
                auto& counter = (*credential == kKeys[0]) ? holders_a : holders_b;
                if (counter.fetch_add(1) != 0) {
                    overlap = true;
                }
                std::this_thread::sleep_for(1ms);
                counter.fetch_sub(1);
                pool.release(*credential);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(overlap.load());
    EXPECT_EQ(pool.in_use_count(), 0u);
    EXPECT_EQ(pool.available_count(), 2u);
}

TEST(CredentialPoolTest, AcquireTimesOutWhenEverythingIsHeld) {
    LogCapture logs;
    CredentialPool pool({kKeys[0]});
    auto held = pool.acquire();
    ASSERT_TRUE(held.has_value());

    auto start = std::chrono::steady_clock::now();
    auto second = pool.acquire(100ms);
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(second.has_value());
    EXPECT_GE(waited, 90ms);
    EXPECT_EQ(pool.exhaustion_count(), 1u);
    EXPECT_EQ(logs.count("Credential pool exhausted, waiting for release..."), 1u);
}

TEST(CredentialPoolTest, ReleaseWakesWaitingAcquire) {
    CredentialPool pool({kKeys[0]});
    auto held = pool.acquire();
    ASSERT_TRUE(held.has_value());

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        pool.release(*held);
    });
    auto next = pool.acquire(5s);
    releaser.join();

    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, kKeys[0]);
}

TEST(CredentialPoolTest, RateLimitedCredentialReturnsAfterDeadline) {
    CredentialPool pool({kKeys[0]});
    auto held = pool.acquire();
    ASSERT_TRUE(held.has_value());

    pool.mark_rate_limited(*held, 150ms);
    EXPECT_EQ(pool.in_use_count(), 0u);
    EXPECT_EQ(pool.available_count(), 0u);
    EXPECT_FALSE(pool.acquire(20ms).has_value());

    auto status = pool.status();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_GT(status[0].rate_limited_for_seconds, 0.0);

    auto again = pool.acquire(5s);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, kKeys[0]);
}

TEST(CredentialPoolTest, SkipsRateLimitedCredentialForAnother) {
    CredentialPool pool(kKeys);
    auto first = pool.acquire();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, kKeys[0]);
    pool.mark_rate_limited(*first, 60s);

    auto second = pool.acquire(100ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, kKeys[1]);
}

TEST(CredentialPoolTest, DisabledCredentialIsNeverHandedOut) {
    CredentialPool pool(kKeys);
    auto first = pool.acquire();
    ASSERT_TRUE(first.has_value());
    pool.disable(*first);

    auto second = pool.acquire(100ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, kKeys[1]);
    pool.disable(*second);

    // Nothing left to wait for
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(pool.acquire(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    auto status = pool.status();
    EXPECT_TRUE(status[0].disabled);
    EXPECT_TRUE(status[1].disabled);
}

TEST(CredentialPoolTest, ReleasingUnknownCredentialIsANoOp) {
    CredentialPool pool({kKeys[0]});
    auto held = pool.acquire();
    ASSERT_TRUE(held.has_value());

    pool.release("not-a-pool-member");
    EXPECT_EQ(pool.in_use_count(), 1u);
}

TEST(CredentialPoolTest, CancellationEndsTheWait) {
    CredentialPool pool({kKeys[0]});
    CancellationToken cancel;
    auto held = pool.acquire();
    ASSERT_TRUE(held.has_value());

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = pool.acquire(std::nullopt, &cancel);
    canceller.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(CredentialPoolTest, LeaseReturnsCredentialOnScopeExit) {
    CredentialPool pool({kKeys[0]});
    {
        CredentialLease lease(&pool);
        auto credential = pool.acquire();
        ASSERT_TRUE(credential.has_value());
        lease.assign(*credential);
        EXPECT_TRUE(lease.held());
        EXPECT_EQ(pool.in_use_count(), 1u);
    }
    EXPECT_EQ(pool.in_use_count(), 0u);
    EXPECT_EQ(pool.status()[0].times_acquired, 1);
}
