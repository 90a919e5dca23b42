#pragma once
#include <mutex>
#include <ostream>
#include <string>

// Stream shared by every worker. One write_line() call lands as one
// uninterrupted line no matter how many threads write at once.
class SharedSink {
public:
    explicit SharedSink(std::ostream& stream);

    SharedSink(const SharedSink&) = delete;
    SharedSink& operator=(const SharedSink&) = delete;

    // `line` must not contain the terminating newline
    void write_line(const std::string& line);
    void flush();

private:
    std::ostream& stream_;
    std::mutex mutex_;
};

// Per-worker writer. Buffers partial lines and forwards only complete
// "<prefix> <line>" lines to the shared sink. Not safe for concurrent use
// of the same instance.
class OutputMultiplexer {
public:
    OutputMultiplexer(std::string prefix, SharedSink& sink);
    ~OutputMultiplexer();

    OutputMultiplexer(const OutputMultiplexer&) = delete;
    OutputMultiplexer& operator=(const OutputMultiplexer&) = delete;

    void write(const std::string& text);
    void flush();

    const std::string& prefix() const { return prefix_; }

private:
    void emit(const std::string& line);

    std::string prefix_;
    SharedSink& sink_;
    std::string buffer_;
};
