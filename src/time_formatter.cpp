#include "time_formatter.h"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

#include "number_formatter.h"

namespace rls {
namespace {

struct RelativeUnit {
    std::string_view label;
    double seconds;
    double cutoff;
};

constexpr std::array<RelativeUnit, 4> kRelativeUnits{{
    {"s ago", 1.0, 120.0},
    {"m ago", 60.0, 120.0},
    {"h ago", 3600.0, 48.0},
    {"d ago", 86400.0, 100.0},
}};

constexpr int kRelativeDigits = 3;

}  // namespace

TimeFormatter::TimeFormatter()
    : TimeFormatter(Options{}) {}

TimeFormatter::TimeFormatter(Options options)
    : options_(options) {}

std::tm TimeFormatter::ToLocalTime(TimePoint time) {
    const std::time_t time_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time_value);
#else
    localtime_r(&time_value, &tm);
#endif
    return tm;
}

std::string TimeFormatter::Format(TimePoint time) const {
    return options_.long_form ? FormatLong(time) : FormatShort(time);
}

std::string TimeFormatter::FormatLong(TimePoint time) const {
    using namespace std::chrono;
    const auto whole = floor<seconds>(time);
    const auto micros = duration_cast<microseconds>(time - whole).count();

    const std::tm tm = ToLocalTime(time_point_cast<system_clock::duration>(whole));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::string TimeFormatter::FormatShort(TimePoint time) const {
    const double ago = std::chrono::duration<double>(options_.now - time).count();

    for (const RelativeUnit& unit : kRelativeUnits) {
        const double amount = ago / unit.seconds;
        if (amount >= unit.cutoff) {
            continue;
        }
        if (auto text = NumberFormatter::FixedLength(amount, kRelativeDigits)) {
            return *text + std::string(unit.label);
        }
    }

    const std::tm tm = ToLocalTime(time);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m");
    std::string month = oss.str();
    if (month.size() < static_cast<std::size_t>(kShortWidth)) {
        month.insert(0, static_cast<std::size_t>(kShortWidth) - month.size(), ' ');
    }
    return month;
}

}  // namespace rls
