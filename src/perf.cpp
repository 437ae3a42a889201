#include "perf.h"

#include <iomanip>
#include <ios>
#include <ostream>
#include <string>
#include <utility>

namespace rls::perf {

namespace {

double ToMilliseconds(Manager::Clock::duration duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

}  // namespace

Manager& Manager::Instance()
{
    static Manager instance;
    return instance;
}

void Manager::set_enabled(bool enabled)
{
    enabled_ = enabled;
    Clear();
}

void Manager::AddDuration(std::string_view label, Clock::duration duration)
{
    if (!enabled_) return;
    auto it = timings_.find(label);
    if (it == timings_.end()) {
        it = timings_.emplace(std::string(label), TimingData{}).first;
    }
    TimingData& data = it->second;
    data.total += duration;
    data.count += 1;
    if (duration > data.max) {
        data.max = duration;
    }
}

void Manager::IncrementCounter(std::string_view name, std::uint64_t delta)
{
    if (!enabled_) return;
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        counters_.emplace(std::string(name), delta);
        return;
    }
    it->second += delta;
}

std::uint64_t Manager::Counter(std::string_view name) const
{
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::uint64_t Manager::TimingCount(std::string_view label) const
{
    auto it = timings_.find(label);
    return it == timings_.end() ? 0 : it->second.count;
}

void Manager::Report(std::ostream& os) const
{
    if (!enabled_) return;

    if (!timings_.empty()) {
        const auto previous_flags = os.flags();
        const auto previous_precision = os.precision();
        os << "[perf] Timings (ms)\n";
        os.setf(std::ios::fixed, std::ios::floatfield);
        for (const auto& [label, data] : timings_) {
            const double total = ToMilliseconds(data.total);
            const double avg = data.count > 0 ? total / static_cast<double>(data.count) : 0.0;
            os << "  " << label << ": total=" << std::setprecision(3) << total
               << " avg=" << avg << " max=" << ToMilliseconds(data.max)
               << " count=" << data.count << '\n';
        }
        os.flags(previous_flags);
        os.precision(previous_precision);
    }

    if (!counters_.empty()) {
        os << "[perf] Counters\n";
        for (const auto& [name, value] : counters_) {
            os << "  " << name << ": " << value << '\n';
        }
    }
}

void Manager::Clear()
{
    timings_.clear();
    counters_.clear();
}

Timer::Timer(std::string label)
{
    if (!Manager::Instance().enabled()) return;
    label_ = std::move(label);
    start_ = Manager::Clock::now();
    active_ = true;
}

Timer::~Timer()
{
    Stop();
}

void Timer::Stop()
{
    if (!active_) {
        return;
    }
    active_ = false;
    Manager::Instance().AddDuration(label_, Manager::Clock::now() - start_);
}

}  // namespace rls::perf
