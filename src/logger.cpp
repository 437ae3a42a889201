#include "logger.h"

#include <iostream>
#include <map>

#include "string_utils.h"

namespace rls {

Logger::Logger()
    : stream_(&std::cerr) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(Level level) noexcept {
    level_ = level;
}

Logger::Level Logger::level() const noexcept {
    return level_;
}

void Logger::set_output_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

std::optional<Logger::Level> Logger::ParseLevel(std::string_view text) {
    static const std::map<std::string, Level, std::less<>> table{
        {"error", Level::Error},
        {"warn", Level::Warn},
        {"warning", Level::Warn},
        {"info", Level::Info},
        {"debug", Level::Debug},
        {"trace", Level::Trace},
    };
    auto it = table.find(StringUtils::ToLower(text));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view Logger::to_string(Level level) noexcept {
    switch (level) {
    case Level::Error: return "ERROR";
    case Level::Warn: return "WARN";
    case Level::Info: return "INFO";
    case Level::Debug: return "DEBUG";
    case Level::Trace: return "TRACE";
    }
    return "INFO";
}

void Logger::write(Level level, const std::string& message) {
    std::scoped_lock lock(mutex_);
    if (!stream_) {
        return;
    }
    *stream_ << '[' << to_string(level) << "] " << message << '\n';
}

}  // namespace rls
