#include "event_log.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>

namespace {

class EventLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/fanout_event_log_test_" + std::to_string(getpid()) + ".jsonl";
        std::remove(path_.c_str());
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::vector<nlohmann::json> read_events() const {
        std::ifstream in(path_);
        std::vector<nlohmann::json> events;
        std::string line;
        while (std::getline(in, line)) {
            events.push_back(nlohmann::json::parse(line));
        }
        return events;
    }

    std::string path_;
};

} // namespace

TEST_F(EventLogTest, EmptyPathDisablesLog) {
    EventLog log("");
    EXPECT_FALSE(log.enabled());
    EXPECT_NO_THROW(log.record("rate_limited", "a", "AIzaSyAAAAAAAAAAAAAA", "429"));
}

TEST_F(EventLogTest, RecordsMaskedCredentialAndDetails) {
    {
        EventLog log(path_);
        ASSERT_TRUE(log.enabled());
        log.record("rate_limited", "issue-1", "AIzaSyAAAAAAAAAAAAAA", "429 Too Many Requests",
                   {{"backoff_seconds", 60.0}});
    }

    auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event"].get<std::string>(), "rate_limited");
    EXPECT_EQ(events[0]["credential"].get<std::string>(), "AIzaSyAA...");
    EXPECT_DOUBLE_EQ(events[0]["details"]["backoff_seconds"].get<double>(), 60.0);
    EXPECT_TRUE(events[0].contains("timestamp"));
}

TEST_F(EventLogTest, TruncationKeepsMultiByteCharactersWhole) {
    // 199 ASCII bytes followed by a two-byte character straddling the limit
    std::string error(199, 'x');
    error += "\xC3\xA9 tail";
    {
        EventLog log(path_);
        EXPECT_NO_THROW(log.record("capacity_backoff", "a", "", error));
    }

    auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["error"].get<std::string>(), std::string(199, 'x'));
}

TEST_F(EventLogTest, InvalidUtf8IsReplacedNotThrown) {
    {
        EventLog log(path_);
        EXPECT_NO_THROW(log.record("quota_exhausted", "a", "", "caf\xE9"));
    }

    auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["error"].get<std::string>(), "caf\xEF\xBF\xBD");
}
