#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace rls {

class StringUtils {
public:
    static std::string ToLower(std::string_view value);

    // Case-insensitive comparison form of a name. Only ASCII letters fold.
    static std::string CaseFold(std::string_view value) { return ToLower(value); }

    // Number of characters the text occupies once printed: ANSI control
    // sequences (ESC '[' params letter) take no space and each UTF-8 code
    // point counts as one column.
    static std::size_t VisibleLength(std::string_view text);

private:
    static constexpr unsigned char ascii_to_lower(unsigned char ch) noexcept
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<unsigned char>(ch - 'A' + 'a') : ch;
    }
};

} // namespace rls
