#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace rls {

std::string StringUtils::ToLower(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(StringUtils::ascii_to_lower(ch));
    });
    return result;
}

std::size_t StringUtils::VisibleLength(std::string_view text)
{
    std::size_t width = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0x1b && i + 1 < text.size() && text[i + 1] == '[') {
            std::size_t j = i + 2;
            while (j < text.size() &&
                   (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == ';')) {
                ++j;
            }
            if (j < text.size() && std::isalpha(static_cast<unsigned char>(text[j]))) {
                i = j + 1;
                continue;
            }
        }

        std::size_t adv = 1;
        if      ((c & 0xE0u) == 0xC0u) adv = 2;
        else if ((c & 0xF0u) == 0xE0u) adv = 3;
        else if ((c & 0xF8u) == 0xF0u) adv = 4;
        i += std::min(adv, text.size() - i);
        ++width;
    }
    return width;
}

} // namespace rls
