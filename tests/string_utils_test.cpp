#include <gtest/gtest.h>

#include "string_utils.h"

namespace rls {
namespace {

TEST(StringUtilsTest, VisibleLengthSkipsAnsiSequences) {
    EXPECT_EQ(StringUtils::VisibleLength("plain"), 5u);
    EXPECT_EQ(StringUtils::VisibleLength("\x1b[38;5;120mdir/\x1b[0m"), 4u);
    EXPECT_EQ(StringUtils::VisibleLength("\x1b[2K"), 0u);
    EXPECT_EQ(StringUtils::VisibleLength(""), 0u);
}

TEST(StringUtilsTest, VisibleLengthCountsCodePoints) {
    EXPECT_EQ(StringUtils::VisibleLength("caf\xc3\xa9"), 4u);
    EXPECT_EQ(StringUtils::VisibleLength("\xe2\x82\xac"), 1u);
}

TEST(StringUtilsTest, CaseFoldLowersAsciiOnly) {
    EXPECT_EQ(StringUtils::CaseFold("ReadMe.TXT"), "readme.txt");
    EXPECT_EQ(StringUtils::CaseFold("\xc3\x89"), "\xc3\x89");
}

}  // namespace
}  // namespace rls
