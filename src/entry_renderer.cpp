#include "entry_renderer.h"

#include <utility>

#include "number_formatter.h"
#include "string_utils.h"

namespace rls {
namespace {

constexpr const char* kHex = "0123456789abcdef";

// Length in bytes of the control character starting at `i`, or 0. C0
// controls and DEL are single bytes; C1 controls (U+0080 to U+009F) are
// encoded as 0xC2 0x80..0x9F.
std::size_t ControlLength(std::string_view text, std::size_t i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (ch < 0x20 || ch == 0x7f) {
        return 1;
    }
    if (ch == 0xc2 && i + 1 < text.size()) {
        const auto next = static_cast<unsigned char>(text[i + 1]);
        if (next >= 0x80 && next <= 0x9f) {
            return 2;
        }
    }
    return 0;
}

bool HasControl(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (ControlLength(text, i) > 0) {
            return true;
        }
    }
    return false;
}

std::string Escape(unsigned int code) {
    switch (code) {
        case '\t': return "\\t";
        case '\n': return "\\n";
        case '\r': return "\\r";
        default: break;
    }
    std::string out = "\\x";
    out.push_back(kHex[(code >> 4) & 0x0f]);
    out.push_back(kHex[code & 0x0f]);
    return out;
}

bool StartsOrEndsWith(std::string_view text, char ch) {
    return !text.empty() && (text.front() == ch || text.back() == ch);
}

}  // namespace

std::string Palette::Paint(int colour, std::string_view text) const {
    if (!enabled) {
        return std::string(text);
    }
    std::string out = "\x1b[38;5;" + std::to_string(colour) + "m";
    out += text;
    out += "\x1b[0m";
    return out;
}

std::string QuoteName(std::string_view name) {
    const bool quote = StartsOrEndsWith(name, ' ') || StartsOrEndsWith(name, '"') ||
                       StartsOrEndsWith(name, '\'') || HasControl(name);

    std::string quoted;
    if (quote) {
        const char mark = name.find('\'') == std::string_view::npos ? '\'' : '"';
        quoted.push_back(mark);
        for (char ch : name) {
            if (ch == '\\' || ch == mark) {
                quoted.push_back('\\');
            }
            quoted.push_back(ch);
        }
        quoted.push_back(mark);
    } else {
        quoted = std::string(name);
    }

    std::string out;
    out.reserve(quoted.size());
    for (std::size_t i = 0; i < quoted.size();) {
        const std::size_t length = ControlLength(quoted, i);
        if (length == 0) {
            out.push_back(quoted[i]);
            ++i;
            continue;
        }
        const auto code = length == 1 ? static_cast<unsigned char>(quoted[i])
                                       : static_cast<unsigned char>(quoted[i + 1]);
        out += Escape(code);
        i += length;
    }
    return out;
}

TimeColumn::TimeColumn(Field field, TimeFormatter formatter, Palette palette)
    : field_(field),
      formatter_(std::move(formatter)),
      palette_(palette) {}

std::string TimeColumn::Render(const Entry& entry) const {
    if (field_ == Field::Creation) {
        return palette_.Paint(palette_.creation_time, formatter_.Format(entry.creation_time()));
    }
    return palette_.Paint(palette_.modification_time, formatter_.Format(entry.modification_time()));
}

CountColumn::CountColumn(Field field, bool long_form, Palette palette)
    : field_(field),
      long_form_(long_form),
      palette_(palette) {}

std::string CountColumn::Render(const Entry& entry) const {
    if (!entry.is_directory()) {
        // Same width as a rendered count without asking a file for one.
        return std::string(NumberFormatter::Format(0, long_form_).size(), ' ');
    }
    const std::int64_t count = field_ == Field::Subfiles ? entry.subfile_count() : entry.subdir_count();
    return palette_.Paint(palette_.sub_counts,
                          NumberFormatter::Format(static_cast<double>(count), long_form_));
}

SizeColumn::SizeColumn(bool long_form, Palette palette)
    : long_form_(long_form),
      palette_(palette) {}

std::string SizeColumn::Render(const Entry& entry) const {
    return palette_.Paint(palette_.size,
                          NumberFormatter::Format(static_cast<double>(entry.size()), long_form_, "B"));
}

NameColumn::NameColumn(bool highlight_extension, Palette palette)
    : highlight_extension_(highlight_extension),
      palette_(palette) {}

std::string NameColumn::Render(const Entry& entry) const {
    const std::string path = QuoteName(entry.display_path());
    if (entry.is_directory()) {
        return palette_.Paint(palette_.directory, path);
    }
    const std::size_t dot = path.rfind('.');
    if (!highlight_extension_ || dot == std::string::npos) {
        return palette_.Paint(palette_.file, path);
    }

    const std::string_view view(path);
    if (path.front() == '\'' || path.front() == '"') {
        // Keep the closing quote out of the extension colour.
        return palette_.Paint(palette_.file, view.substr(0, dot)) +
               palette_.Paint(palette_.extension, view.substr(dot, path.size() - 1 - dot)) +
               palette_.Paint(palette_.file, view.substr(path.size() - 1));
    }
    return palette_.Paint(palette_.file, view.substr(0, dot)) +
           palette_.Paint(palette_.extension, view.substr(dot));
}

void EntryRenderer::Add(std::unique_ptr<Column> column) {
    columns_.push_back(std::move(column));
}

std::string EntryRenderer::Render(const Entry& entry) const {
    std::string row;
    if (columns_.size() > 1) {
        row.push_back(' ');
    }
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) {
            row += "  ";
        }
        row += columns_[i]->Render(entry);
    }
    return row;
}

}  // namespace rls
