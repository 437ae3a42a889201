#include "number_formatter.h"

#include <iomanip>
#include <sstream>
#include <string>

namespace rls {
namespace {

std::string Fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string PadLeft(std::string text, std::size_t width) {
    if (text.size() < width) {
        text.insert(0, width - text.size(), ' ');
    }
    return text;
}

std::string PadRight(std::string text, std::size_t width) {
    if (text.size() < width) {
        text.append(width - text.size(), ' ');
    }
    return text;
}

}  // namespace

std::optional<std::string> NumberFormatter::FixedLength(double value, int length) {
    const auto width = static_cast<std::size_t>(length);

    std::string text = Fixed(value, length);
    const std::size_t point = text.find('.');
    if (point != std::string::npos && point > width) {
        return std::nullopt;
    }

    // Round to the decimals left over after the integer part, then cut: the
    // rounding may carry into a new integer digit, so its own width is not
    // trusted. A carry is cut, not rescaled: 999.7 becomes "100" and
    // 1023999 bytes read "100k".
    const int decimals = point < width ? length - 1 - static_cast<int>(point) : 0;
    const double rounded = std::stod(Fixed(value, decimals));

    text = Fixed(rounded, length).substr(0, width);
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    return PadLeft(std::move(text), width);
}

std::string NumberFormatter::Format(double value, bool long_form, std::string_view unit) {
    if (value < 0) {
        if (long_form) {
            return std::string(" ???? ") + (unit.empty() ? "" : "?") + " ";
        }
        return " ???";
    }

    const double limit = long_form ? 1024.0 : 1000.0;
    std::size_t prefix = 0;
    while (value >= limit && prefix + 1 < kPrefixes.size()) {
        value /= 1024.0;
        ++prefix;
    }

    if (value >= limit) {
        if (long_form) {
            return std::string(" lots ") + std::string(unit) + " ";
        }
        return "lots";
    }

    int digits = long_form ? kLongDigits : kShortDigits;
    std::string suffix;
    if (long_form) {
        suffix = " " + PadRight(std::string(kPrefixes[prefix]) + std::string(unit), 1 + unit.size());
    } else {
        suffix = PadRight(std::string(kPrefixes[prefix]), 1);
    }

    // Without a magnitude the short form's prefix slot is free: a one
    // character unit takes it, otherwise it becomes another digit.
    if (!long_form && kPrefixes[prefix].empty()) {
        if (unit.empty()) {
            digits += 1;
            suffix.clear();
        } else if (unit.size() == 1) {
            suffix = std::string(unit);
        }
    }

    auto number = FixedLength(value, digits);
    return number.value_or(std::string(static_cast<std::size_t>(digits), '?')) + suffix;
}

}  // namespace rls
