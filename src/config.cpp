#include "config.h"

#include <utility>

namespace rls {

const std::string& Config::path() const { return path_; }
void Config::set_path(std::string value) { path_ = std::move(value); }

Config::Filter Config::filter() const { return filter_; }
void Config::set_filter(Filter value) { filter_ = value; }

Config::Detail Config::creation_time() const { return creation_time_; }
void Config::set_creation_time(Detail value) { creation_time_ = value; }

Config::Detail Config::modification_time() const { return modification_time_; }
void Config::set_modification_time(Detail value) { modification_time_ = value; }

Config::Detail Config::sub_counts() const { return sub_counts_; }
void Config::set_sub_counts(Detail value) { sub_counts_ = value; }

Config::Detail Config::size() const { return size_; }
void Config::set_size(Detail value) { size_ = value; }

bool Config::highlight_extensions() const { return highlight_extensions_; }
void Config::set_highlight_extensions(bool value) { highlight_extensions_ = value; }

SortField Config::sort_field() const { return sort_field_; }
void Config::set_sort_field(SortField value) { sort_field_ = value; }

bool Config::reverse() const { return reverse_; }
void Config::set_reverse(bool value) { reverse_ = value; }

std::optional<std::size_t> Config::columns() const { return columns_; }
void Config::set_columns(std::optional<std::size_t> value) { columns_ = value; }

std::size_t Config::width() const { return width_; }
void Config::set_width(std::size_t value) { width_ = value; }

bool Config::no_colour() const { return no_colour_; }
void Config::set_no_colour(bool value) { no_colour_ = value; }

bool Config::no_running() const { return no_running_; }
void Config::set_no_running(bool value) { no_running_ = value; }

bool Config::row_wise() const { return row_wise_; }
void Config::set_row_wise(bool value) { row_wise_ = value; }

bool Config::uniform_width() const { return uniform_width_; }
void Config::set_uniform_width(bool value) { uniform_width_ = value; }

Logger::Level Config::log_level() const { return log_level_; }
void Config::set_log_level(Logger::Level value) { log_level_ = value; }

bool Config::perf_logging() const { return perf_logging_; }
void Config::set_perf_logging(bool value) { perf_logging_ = value; }

std::size_t Config::display_column_count() const {
    std::size_t count = 1;
    if (creation_time_ != Detail::Hidden) {
        ++count;
    }
    if (modification_time_ != Detail::Hidden) {
        ++count;
    }
    if (sub_counts_ != Detail::Hidden) {
        count += 2;
    }
    if (size_ != Detail::Hidden) {
        ++count;
    }
    return count;
}

std::size_t Config::max_columns() const {
    if (columns_) {
        return *columns_;
    }
    return display_column_count() > 1 || highlight_extensions_ ? 1 : 4;
}

std::optional<SortField> Config::InferSortField() const {
    if (sub_counts_ != Detail::Hidden) {
        return std::nullopt;
    }
    std::optional<SortField> inferred;
    std::size_t candidates = 0;
    auto consider = [&](bool included, SortField field) {
        if (included) {
            inferred = field;
            ++candidates;
        }
    };
    consider(creation_time_ != Detail::Hidden, SortField::CreationTime);
    consider(modification_time_ != Detail::Hidden, SortField::ModificationTime);
    consider(size_ != Detail::Hidden, SortField::Size);
    consider(highlight_extensions_, SortField::Extension);

    if (candidates == 0) {
        return SortField::Name;
    }
    if (candidates > 1) {
        return std::nullopt;
    }
    return inferred;
}

}  // namespace rls
