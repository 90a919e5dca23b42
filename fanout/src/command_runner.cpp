#include "command_runner.hpp"
#include "error_classifier.hpp"
#include "output_multiplexer.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace {

// Child environment with `name` overridden. Built before fork() since the
// child may only call async-signal-safe functions.
std::vector<std::string> build_environment(const std::string& name, const std::optional<std::string>& value) {
    std::vector<std::string> env;
    const std::string prefix = name + "=";
    for (char** entry = environ; entry && *entry; ++entry) {
        if (std::strncmp(*entry, prefix.c_str(), prefix.size()) == 0) {
            continue;
        }
        env.emplace_back(*entry);
    }
    if (value) {
        env.push_back(prefix + *value);
    }
    return env;
}

void remember_line(std::deque<std::string>& tail, std::string& partial, const char* data, std::size_t size,
                   std::size_t limit) {
    for (std::size_t i = 0; i < size; ++i) {
        if (data[i] == '\n') {
            tail.push_back(partial);
            partial.clear();
            if (tail.size() > limit) {
                tail.pop_front();
            }
        } else {
            partial.push_back(data[i]);
        }
    }
}

} // namespace

CommandRunner::CommandRunner(std::string command_template) : command_template_(std::move(command_template)) {
    if (command_template_.empty()) {
        throw std::invalid_argument("Command template must not be empty");
    }
}

std::string CommandRunner::render(const std::string& item_id) const {
    return util::replace_all(command_template_, "{id}", item_id);
}

void CommandRunner::run(const std::string& item_id,
                        const std::optional<std::string>& credential,
                        OutputMultiplexer& out) const {
    const std::string command = render(item_id);

    std::vector<std::string> env = build_environment(kCredentialEnvVar, credential);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string sh = "sh";
    std::string dash_c = "-c";
    std::string command_copy = command;
    char* argv[] = {sh.data(), dash_c.data(), command_copy.data(), nullptr};

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(fmt::format("pipe failed: {}", std::strerror(errno)));
    }

    spdlog::debug("Running for {}: {}", item_id, command);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execve("/bin/sh", argv, envp.data());
        _exit(127);
    }

    close(fds[1]);

    std::deque<std::string> tail;
    std::string partial;
    char buffer[4096];
    while (true) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Reading output of {} failed: {}", item_id, std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        out.write(std::string(buffer, static_cast<std::size_t>(n)));
        remember_line(tail, partial, buffer, static_cast<std::size_t>(n), kTailLines);
    }
    close(fds[0]);
    out.flush();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return;
    }

    if (!partial.empty()) {
        tail.push_back(partial);
    }
    std::string tail_text;
    for (const auto& line : tail) {
        if (!tail_text.empty()) {
            tail_text += '\n';
        }
        tail_text += line;
    }

    std::string reason = WIFEXITED(status)
        ? fmt::format("exit code {}", WEXITSTATUS(status))
        : fmt::format("killed by signal {}", WIFSIGNALED(status) ? WTERMSIG(status) : 0);

    throw UpstreamError(tail_text.empty() ? fmt::format("Command {}", reason)
                                          : fmt::format("Command {}: {}", reason, tail_text));
}
