#include "command_runner.hpp"
#include "error_classifier.hpp"
#include "output_multiplexer.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>

TEST(CommandRunnerTest, SubstitutesItemId) {
    CommandRunner runner("process --issue {id} --again {id}");
    EXPECT_EQ(runner.render("42"), "process --issue 42 --again 42");
}

TEST(CommandRunnerTest, EmptyTemplateThrows) {
    EXPECT_THROW(CommandRunner(""), std::invalid_argument);
}

TEST(CommandRunnerTest, OutputIsPrefixed) {
    std::ostringstream stream;
    SharedSink sink(stream);
    OutputMultiplexer out("[issue-7]", sink);

    CommandRunner runner("echo hello {id}; echo to-stderr >&2");
    runner.run("issue-7", std::nullopt, out);

    auto text = stream.str();
    EXPECT_NE(text.find("[issue-7] hello issue-7\n"), std::string::npos);
    EXPECT_NE(text.find("[issue-7] to-stderr\n"), std::string::npos);
}

TEST(CommandRunnerTest, CredentialIsExportedToChild) {
    std::ostringstream stream;
    SharedSink sink(stream);
    OutputMultiplexer out("[a]", sink);

    CommandRunner runner("echo \"key=$FANOUT_CREDENTIAL\"");
    runner.run("a", std::string("secret-key-123"), out);
    EXPECT_EQ(stream.str(), "[a] key=secret-key-123\n");
}

TEST(CommandRunnerTest, CredentialIsNotInheritedWhenAbsent) {
    setenv("FANOUT_CREDENTIAL", "leaked", 1);
    std::ostringstream stream;
    SharedSink sink(stream);
    OutputMultiplexer out("[a]", sink);

    CommandRunner runner("echo \"key=${FANOUT_CREDENTIAL:-none}\"");
    runner.run("a", std::nullopt, out);
    unsetenv("FANOUT_CREDENTIAL");

    EXPECT_EQ(stream.str(), "[a] key=none\n");
}

TEST(CommandRunnerTest, NonZeroExitBecomesUpstreamErrorWithOutputTail) {
    std::ostringstream stream;
    SharedSink sink(stream);
    OutputMultiplexer out("[a]", sink);

    CommandRunner runner("echo 'Error: 429 Too Many Requests' >&2; exit 3");
    try {
        runner.run("a", std::nullopt, out);
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("exit code 3"), std::string::npos);
        EXPECT_NE(message.find("Too Many Requests"), std::string::npos);
        EXPECT_EQ(classify_error(message, e.http_status()).category, ErrorCategory::RateLimited);
    }
}
