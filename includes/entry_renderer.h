#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "entry.h"
#include "time_formatter.h"

namespace rls {

// 256-colour ids for each kind of output. Nothing is coloured when disabled.
struct Palette {
    bool enabled = true;
    int creation_time = 63;
    int modification_time = 98;
    int sub_counts = 126;
    int size = 43;
    int extension = 220;
    int file = 80;
    int directory = 120;

    std::string Paint(int colour, std::string_view text) const;
};

// Quotes names that would otherwise print ambiguously: leading or trailing
// blanks or quotes, and control characters, which become escapes.
std::string QuoteName(std::string_view name);

// One display column of a listing row.
class Column {
public:
    virtual ~Column() = default;

    virtual std::string Render(const Entry& entry) const = 0;
};

class TimeColumn : public Column {
public:
    enum class Field { Creation, Modification };

    TimeColumn(Field field, TimeFormatter formatter, Palette palette);

    std::string Render(const Entry& entry) const override;

private:
    Field field_;
    TimeFormatter formatter_;
    Palette palette_;
};

// Sub-file or sub-directory count. Files get blanks of the same width.
class CountColumn : public Column {
public:
    enum class Field { Subfiles, Subdirs };

    CountColumn(Field field, bool long_form, Palette palette);

    std::string Render(const Entry& entry) const override;

private:
    Field field_;
    bool long_form_;
    Palette palette_;
};

class SizeColumn : public Column {
public:
    SizeColumn(bool long_form, Palette palette);

    std::string Render(const Entry& entry) const override;

private:
    bool long_form_;
    Palette palette_;
};

// Quoted display path, optionally with the extension in its own colour.
class NameColumn : public Column {
public:
    NameColumn(bool highlight_extension, Palette palette);

    std::string Render(const Entry& entry) const override;

private:
    bool highlight_extension_;
    Palette palette_;
};

// Joins its columns, in the order added, into one listing row.
class EntryRenderer {
public:
    EntryRenderer() = default;

    EntryRenderer(EntryRenderer&&) = default;
    EntryRenderer& operator=(EntryRenderer&&) = default;

    void Add(std::unique_ptr<Column> column);

    std::string Render(const Entry& entry) const;

    std::size_t column_count() const { return columns_.size(); }

private:
    std::vector<std::unique_ptr<Column>> columns_;
};

}  // namespace rls
