#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

namespace rls::perf {

// Process-wide collection of named timings and counters, reported on
// --perf-debug. Every call is a no-op while disabled.
class Manager {
public:
    using Clock = std::chrono::steady_clock;

    static Manager& Instance();

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const { return enabled_; }

    void AddDuration(std::string_view label, Clock::duration duration);
    void IncrementCounter(std::string_view name, std::uint64_t delta = 1);

    [[nodiscard]] std::uint64_t Counter(std::string_view name) const;
    [[nodiscard]] std::uint64_t TimingCount(std::string_view label) const;

    void Report(std::ostream& os) const;
    void Clear();

private:
    Manager() = default;

    struct TimingData {
        Clock::duration total{};
        Clock::duration max{};
        std::uint64_t count = 0;
    };

    bool enabled_ = false;
    std::map<std::string, TimingData, std::less<>> timings_;
    std::map<std::string, std::uint64_t, std::less<>> counters_;
};

// Adds the time between construction and Stop() (or destruction) to the
// manager under its label.
class Timer {
public:
    explicit Timer(std::string label);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void Stop();

private:
    std::string label_;
    Manager::Clock::time_point start_{};
    bool active_ = false;
};

}  // namespace rls::perf
