#pragma once
#include <memory>
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>

// Routes the default spdlog logger into a string for the lifetime of the object
class LogCapture {
public:
    LogCapture();
    ~LogCapture();

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const;
    bool contains(const std::string& needle) const;
    std::size_t count(const std::string& needle) const;

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};
