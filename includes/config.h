#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "logger.h"
#include "sort_key.h"

namespace rls {

class Config {
public:
    enum class Filter { All, FilesOnly, DirectoriesOnly };
    // How an attribute column is shown, if at all.
    enum class Detail { Hidden, Short, Long };

    static constexpr std::size_t kDefaultWidth = 100;

    Config() = default;

    const std::string& path() const;
    void set_path(std::string value);

    Filter filter() const;
    void set_filter(Filter value);

    Detail creation_time() const;
    void set_creation_time(Detail value);

    Detail modification_time() const;
    void set_modification_time(Detail value);

    Detail sub_counts() const;
    void set_sub_counts(Detail value);

    Detail size() const;
    void set_size(Detail value);

    bool highlight_extensions() const;
    void set_highlight_extensions(bool value);

    SortField sort_field() const;
    void set_sort_field(SortField value);

    bool reverse() const;
    void set_reverse(bool value);

    // Explicit column limit from -1 or --columns.
    std::optional<std::size_t> columns() const;
    void set_columns(std::optional<std::size_t> value);

    std::size_t width() const;
    void set_width(std::size_t value);

    bool no_colour() const;
    void set_no_colour(bool value);

    bool no_running() const;
    void set_no_running(bool value);

    bool row_wise() const;
    void set_row_wise(bool value);

    bool uniform_width() const;
    void set_uniform_width(bool value);

    Logger::Level log_level() const;
    void set_log_level(Logger::Level value);

    bool perf_logging() const;
    void set_perf_logging(bool value);

    // Columns of a rendered row, the name included. Sub-counts take two.
    std::size_t display_column_count() const;

    // The explicit column limit, otherwise 1 for rows with attributes or
    // extension highlighting and 4 for bare names.
    std::size_t max_columns() const;

    // The sort field implied by the included attributes: name when there are
    // none, the attribute when there is exactly one. Sub-counts name two
    // possible fields and never imply one.
    std::optional<SortField> InferSortField() const;

private:
    std::string path_ = ".";
    Filter filter_ = Filter::All;
    Detail creation_time_ = Detail::Hidden;
    Detail modification_time_ = Detail::Hidden;
    Detail sub_counts_ = Detail::Hidden;
    Detail size_ = Detail::Hidden;
    bool highlight_extensions_ = false;
    SortField sort_field_ = SortField::Name;
    bool reverse_ = false;
    std::optional<std::size_t> columns_;
    std::size_t width_ = kDefaultWidth;
    bool no_colour_ = false;
    bool no_running_ = false;
    bool row_wise_ = false;
    bool uniform_width_ = false;
    Logger::Level log_level_ = Logger::Level::Error;
    bool perf_logging_ = false;
};

}  // namespace rls
