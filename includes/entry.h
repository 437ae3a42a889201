#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rls {

// One immediate child reported by a DirectoryEnumerator.
struct ChildRecord {
    std::filesystem::path path;
    bool is_directory = false;
    std::int64_t size = 0;
};

// Lists the immediate children of a directory for subtree aggregation.
class DirectoryEnumerator {
public:
    virtual ~DirectoryEnumerator() = default;

    // Appends the children of `directory` to `children`. Returns the error
    // that stopped the listing; the children appended so far are then
    // meaningless.
    virtual std::error_code Enumerate(const std::filesystem::path& directory,
                                      std::vector<ChildRecord>& children) const = 0;

    static const DirectoryEnumerator& Default();
};

// Reads the real filesystem. Only true directories are reported as
// directories; symbolic links are never followed, so a link to a directory
// counts as a zero-byte file.
class FilesystemEnumerator : public DirectoryEnumerator {
public:
    std::error_code Enumerate(const std::filesystem::path& directory,
                              std::vector<ChildRecord>& children) const override;
};

struct SubtreeStats {
    std::int64_t size = 0;
    std::int64_t subfiles = 0;
    std::int64_t subdirs = 0;
};

// Walks the subtree below `root` depth first with an explicit stack. Any
// directory that cannot be listed makes every field -1.
SubtreeStats AggregateSubtree(const std::filesystem::path& root, const DirectoryEnumerator& enumerator);

class Entry {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Aggregate value of a directory whose subtree could not be read.
    static constexpr std::int64_t kUnknown = -1;
    // Sub-file and sub-directory count reported by files.
    static constexpr std::int64_t kNotDirectory = -2;

    static Entry FromDirectoryEntry(const std::filesystem::directory_entry& entry,
                                    const DirectoryEnumerator& enumerator = DirectoryEnumerator::Default());

    static Entry File(std::string name, std::int64_t size, TimePoint creation_time, TimePoint modification_time);
    static Entry Directory(std::string name,
                           std::filesystem::path path,
                           TimePoint creation_time,
                           TimePoint modification_time,
                           const DirectoryEnumerator& enumerator = DirectoryEnumerator::Default());

    const std::string& name() const { return name_; }
    const std::filesystem::path& path() const { return path_; }
    bool is_directory() const { return is_directory_; }
    TimePoint creation_time() const { return creation_time_; }
    TimePoint modification_time() const { return modification_time_; }

    // Name with a trailing '/' for directories.
    std::string display_path() const;
    // Suffix from the last '.', or empty for directories and dot-less names.
    std::string extension() const;

    // The three aggregates below run the subtree walk on first use for a
    // directory; later calls reuse the result.
    std::int64_t size() const;
    std::int64_t subfile_count() const;
    std::int64_t subdir_count() const;

    bool aggregated() const { return stats_.has_value(); }

private:
    Entry(std::string name,
          std::filesystem::path path,
          bool is_directory,
          TimePoint creation_time,
          TimePoint modification_time,
          const DirectoryEnumerator& enumerator);

    const SubtreeStats& stats() const;

    std::string name_;
    std::filesystem::path path_;
    bool is_directory_ = false;
    TimePoint creation_time_{};
    TimePoint modification_time_{};
    const DirectoryEnumerator* enumerator_ = nullptr;
    mutable std::optional<SubtreeStats> stats_;
};

}  // namespace rls
