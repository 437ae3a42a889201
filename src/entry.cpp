#include "entry.h"

#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#endif

#include "logger.h"
#include "perf.h"

namespace fs = std::filesystem;

namespace rls {
namespace {

Entry::TimePoint ToSystemTime(const fs::file_time_type& timestamp) {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(
        timestamp - fs::file_time_type::clock::now() + system_clock::now());
}

#ifndef _WIN32
Entry::TimePoint FromTimespec(std::int64_t seconds, std::int64_t nanoseconds) {
    using namespace std::chrono;
    auto since_epoch = duration_cast<system_clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanoseconds));
    return Entry::TimePoint(since_epoch);
}
#endif

// Birth time where the filesystem records one, otherwise the status change
// time.
std::optional<Entry::TimePoint> ReadCreationTime(const fs::path& path) {
#if defined(__linux__)
    struct ::statx sx {};
    if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME | STATX_CTIME, &sx) != 0) {
        return std::nullopt;
    }
    if ((sx.stx_mask & STATX_BTIME) != 0) {
        return FromTimespec(sx.stx_btime.tv_sec, sx.stx_btime.tv_nsec);
    }
    return FromTimespec(sx.stx_ctime.tv_sec, sx.stx_ctime.tv_nsec);
#elif !defined(_WIN32)
    struct ::stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return FromTimespec(st.st_ctime, 0);
#else
    (void)path;
    return std::nullopt;
#endif
}

} // namespace

const DirectoryEnumerator& DirectoryEnumerator::Default() {
    static const FilesystemEnumerator enumerator;
    return enumerator;
}

std::error_code FilesystemEnumerator::Enumerate(const fs::path& directory,
                                                std::vector<ChildRecord>& children) const {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return ec;
    }
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return ec;
        }
        const fs::directory_entry& child = *it;
        ChildRecord record;
        record.path = child.path();

        std::error_code status_ec;
        const fs::file_status own_status = child.symlink_status(status_ec);
        record.is_directory = !status_ec && fs::is_directory(own_status);
        if (!record.is_directory) {
            const fs::file_status target_status = child.status(status_ec);
            if (!status_ec && fs::is_regular_file(target_status)) {
                const std::uintmax_t bytes = child.file_size(status_ec);
                record.size = status_ec ? 0 : static_cast<std::int64_t>(bytes);
            }
        }
        children.push_back(std::move(record));
    }
    return ec;
}

SubtreeStats AggregateSubtree(const fs::path& root, const DirectoryEnumerator& enumerator) {
    perf::Timer timer("entry::aggregate");
    auto& perf_manager = perf::Manager::Instance();
    perf_manager.IncrementCounter("aggregations");

    SubtreeStats stats;
    std::vector<fs::path> stack{root};
    std::vector<ChildRecord> children;
    while (!stack.empty()) {
        fs::path directory = std::move(stack.back());
        stack.pop_back();

        children.clear();
        if (std::error_code ec = enumerator.Enumerate(directory, children)) {
            Logger::instance().debug("aggregation of ", root.string(), " abandoned at ",
                                     directory.string(), ": ", ec.message());
            perf_manager.IncrementCounter("aggregation_failures");
            return SubtreeStats{Entry::kUnknown, Entry::kUnknown, Entry::kUnknown};
        }

        for (ChildRecord& child : children) {
            if (child.is_directory) {
                ++stats.subdirs;
                stack.push_back(std::move(child.path));
            } else {
                ++stats.subfiles;
                stats.size += child.size;
            }
        }
    }
    return stats;
}

Entry::Entry(std::string name,
             fs::path path,
             bool is_directory,
             TimePoint creation_time,
             TimePoint modification_time,
             const DirectoryEnumerator& enumerator)
    : name_(std::move(name)),
      path_(std::move(path)),
      is_directory_(is_directory),
      creation_time_(creation_time),
      modification_time_(modification_time),
      enumerator_(&enumerator) {}

Entry Entry::FromDirectoryEntry(const fs::directory_entry& entry, const DirectoryEnumerator& enumerator) {
    std::error_code ec;
    const bool is_directory = entry.is_directory(ec);

    TimePoint modification_time{};
    const fs::file_time_type write_time = entry.last_write_time(ec);
    if (ec) {
        Logger::instance().debug("no modification time for ", entry.path().string(), ": ", ec.message());
    } else {
        modification_time = ToSystemTime(write_time);
    }
    const TimePoint creation_time = ReadCreationTime(entry.path()).value_or(modification_time);

    Entry result(entry.path().filename().string(), entry.path(), is_directory,
                 creation_time, modification_time, enumerator);
    if (!is_directory) {
        std::int64_t size = 0;
        const std::uintmax_t bytes = entry.file_size(ec);
        if (ec) {
            Logger::instance().debug("no size for ", entry.path().string(), ": ", ec.message());
        } else {
            size = static_cast<std::int64_t>(bytes);
        }
        result.stats_ = SubtreeStats{size, kNotDirectory, kNotDirectory};
    }
    return result;
}

Entry Entry::File(std::string name, std::int64_t size, TimePoint creation_time, TimePoint modification_time) {
    fs::path path(name);
    Entry result(std::move(name), std::move(path), false, creation_time, modification_time,
                 DirectoryEnumerator::Default());
    result.stats_ = SubtreeStats{size, kNotDirectory, kNotDirectory};
    return result;
}

Entry Entry::Directory(std::string name,
                       fs::path path,
                       TimePoint creation_time,
                       TimePoint modification_time,
                       const DirectoryEnumerator& enumerator) {
    return Entry(std::move(name), std::move(path), true, creation_time, modification_time, enumerator);
}

std::string Entry::display_path() const {
    return is_directory_ ? name_ + '/' : name_;
}

std::string Entry::extension() const {
    if (is_directory_) {
        return {};
    }
    const std::size_t dot = name_.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    return name_.substr(dot);
}

const SubtreeStats& Entry::stats() const {
    if (!stats_) {
        stats_ = AggregateSubtree(path_, *enumerator_);
    }
    return *stats_;
}

std::int64_t Entry::size() const {
    return stats().size;
}

std::int64_t Entry::subfile_count() const {
    return stats().subfiles;
}

std::int64_t Entry::subdir_count() const {
    return stats().subdirs;
}

}  // namespace rls
