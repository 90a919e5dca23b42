#include "output_multiplexer.hpp"
#include <spdlog/spdlog.h>

SharedSink::SharedSink(std::ostream& stream) : stream_(stream) {
}

void SharedSink::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line << '\n';
}

void SharedSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_.flush();
}

OutputMultiplexer::OutputMultiplexer(std::string prefix, SharedSink& sink)
    : prefix_(std::move(prefix)), sink_(sink) {
}

OutputMultiplexer::~OutputMultiplexer() {
    try {
        flush();
    } catch (const std::exception& e) {
        spdlog::error("Failed to flush output for {}: {}", prefix_, e.what());
    }
}

void OutputMultiplexer::write(const std::string& text) {
    buffer_ += text;

    std::size_t start = 0;
    std::size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        emit(buffer_.substr(start, newline - start));
        start = newline + 1;
    }
    buffer_.erase(0, start);
}

void OutputMultiplexer::flush() {
    if (!buffer_.empty()) {
        emit(buffer_);
        buffer_.clear();
    }
    sink_.flush();
}

void OutputMultiplexer::emit(const std::string& line) {
    std::string content = line;
    if (!content.empty() && content.back() == '\r') {
        content.pop_back();
    }

    // Blank lines pass through unprefixed
    if (content.empty()) {
        sink_.write_line("");
        return;
    }
    sink_.write_line(prefix_ + " " + content);
}
