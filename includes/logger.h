#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace rls {

class Logger {
public:
    enum class Level {
        Error = 0,
        Warn,
        Info,
        Debug,
        Trace,
    };

    static Logger& instance();

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] bool enabled(Level level) const noexcept { return level <= level_; }

    void set_output_stream(std::ostream* stream);

    // Message parts are streamed one after another, so callers pass the
    // pieces in order: log(Level::Warn, "cannot read ", path, ": ", reason).
    template <typename... Args>
    void log(Level level, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        std::ostringstream message;
        (message << ... << std::forward<Args>(args));
        write(level, message.str());
    }

    template <typename... Args>
    void error(Args&&... args) { log(Level::Error, std::forward<Args>(args)...); }

    template <typename... Args>
    void warn(Args&&... args) { log(Level::Warn, std::forward<Args>(args)...); }

    template <typename... Args>
    void info(Args&&... args) { log(Level::Info, std::forward<Args>(args)...); }

    template <typename... Args>
    void debug(Args&&... args) { log(Level::Debug, std::forward<Args>(args)...); }

    template <typename... Args>
    void trace(Args&&... args) { log(Level::Trace, std::forward<Args>(args)...); }

    static std::optional<Level> ParseLevel(std::string_view text);
    [[nodiscard]] static std::string_view to_string(Level level) noexcept;

private:
    Logger();

    void write(Level level, const std::string& message);

    Level level_ { Level::Error };
    std::ostream* stream_ { nullptr };
    std::mutex mutex_;
};

}  // namespace rls
