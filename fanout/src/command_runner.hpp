#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

class OutputMultiplexer;

// Runs the configured shell command for one item. "{id}" in the template is
// replaced with the item identifier and the credential (if any) is exported to
// the child as FANOUT_CREDENTIAL. Combined stdout/stderr goes through `out`.
class CommandRunner {
public:
    static constexpr const char* kCredentialEnvVar = "FANOUT_CREDENTIAL";

    explicit CommandRunner(std::string command_template);

    // Throws UpstreamError carrying the output tail when the command exits
    // non-zero, std::runtime_error when it cannot be started.
    void run(const std::string& item_id,
             const std::optional<std::string>& credential,
             OutputMultiplexer& out) const;

    std::string render(const std::string& item_id) const;

private:
    static constexpr std::size_t kTailLines = 20;

    std::string command_template_;
};
