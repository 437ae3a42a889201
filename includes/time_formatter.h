#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace rls {

// Fixed-width timestamps.
//
//   short: "xxxU ago" relative to Options::now, or " yyyy-mm" once older
//          than the day cutoff (always 8 columns)
//   long:  "yyyy-mm-dd HH:MM:SS.uuuuuu" in local time
class TimeFormatter {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Options {
        bool long_form = false;
        // Reference point for relative times, fixed once so every row of a
        // listing is measured against the same instant.
        TimePoint now = std::chrono::system_clock::now();
    };

    static constexpr int kShortWidth = 8;

    TimeFormatter();
    explicit TimeFormatter(Options options);

    std::string Format(TimePoint time) const;

    const Options& options() const { return options_; }

private:
    std::string FormatLong(TimePoint time) const;
    std::string FormatShort(TimePoint time) const;

    static std::tm ToLocalTime(TimePoint time);

    Options options_{};
};

}  // namespace rls
