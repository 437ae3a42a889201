#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace rls {

// Fixed-width rendering of byte and item counts.
//
//   short: "xxxP"      (4 columns; "12k", "999", "1.5M", " ???", "lots")
//   long:  "xxxxx PU"  (6 + prefix slot + unit columns; "1023.9 kB")
class NumberFormatter {
public:
    static constexpr int kShortDigits = 3;
    static constexpr int kLongDigits = 5;

    // Negative values mean "unknown" and render as a placeholder of the same
    // width. Values past the largest prefix render as "lots".
    static std::string Format(double value, bool long_form = false, std::string_view unit = {});

    // Most accurate rendering of `value` in exactly `length` characters,
    // right-aligned. Empty when the integer part alone does not fit.
    static std::optional<std::string> FixedLength(double value, int length);

    static constexpr std::array<std::string_view, 11> kPrefixes{
        "", "k", "M", "G", "T", "P", "E", "Z", "Y", "R", "Q"};
};

}  // namespace rls
