#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "column_layout.h"
#include "string_utils.h"

namespace rls {
namespace {

std::vector<std::string> Cells(std::size_t count, std::size_t length) {
    std::vector<std::string> cells;
    for (std::size_t i = 0; i < count; ++i) {
        std::string cell = std::to_string(i);
        cell.insert(0, length - cell.size(), 'f');
        cells.push_back(cell);
    }
    return cells;
}

TEST(ColumnLayoutTest, ThirtySevenShortCellsUseFourColumns) {
    const ColumnLayout layout(LayoutOptions{});
    const auto grid = layout.Solve(Cells(37, 10));
    EXPECT_EQ(grid.columns(), 4u);
    EXPECT_EQ(grid.rows.size(), 10u);
    for (std::size_t width : grid.widths) {
        EXPECT_EQ(width, 16u);
    }
}

TEST(ColumnLayoutTest, NarrowBudgetFallsBackToFewerColumns) {
    LayoutOptions options;
    options.max_total_width = 40;
    const ColumnLayout layout(options);
    EXPECT_EQ(layout.Solve(Cells(37, 10)).columns(), 2u);

    options.max_total_width = 20;
    EXPECT_EQ(ColumnLayout(options).Solve(Cells(37, 10)).columns(), 1u);
}

TEST(ColumnLayoutTest, LongCellsWidenColumns) {
    const ColumnLayout layout(LayoutOptions{});
    const auto grid = layout.Solve(Cells(10, 30));
    EXPECT_EQ(grid.columns(), 2u);
    EXPECT_EQ(grid.widths, (std::vector<std::size_t>{35, 35}));
}

TEST(ColumnLayoutTest, SingleColumnAlwaysFits) {
    LayoutOptions options;
    options.max_total_width = 5;
    const auto grid = ColumnLayout(options).Arrange(Cells(3, 40), 1);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->rows.size(), 3u);
}

TEST(ColumnLayoutTest, EmptyInputHasNoLines) {
    EXPECT_TRUE(ColumnLayout(LayoutOptions{}).Lines({}).empty());
}

TEST(ColumnLayoutTest, ColumnMajorFillsEveryColumn) {
    const ColumnLayout layout(LayoutOptions{});
    const auto grid = layout.Arrange({"a", "b", "c", "d", "e"}, 4);
    ASSERT_TRUE(grid.has_value());
    ASSERT_EQ(grid->rows.size(), 2u);
    EXPECT_EQ(grid->rows[0], (std::vector<std::string>{"a", "c", "d", "e"}));
    EXPECT_EQ(grid->rows[1], (std::vector<std::string>{"b", "", "", ""}));
}

TEST(ColumnLayoutTest, ColumnMajorReadsDownColumns) {
    const ColumnLayout layout(LayoutOptions{});
    const auto grid = layout.Arrange({"a", "b", "c", "d", "e", "f"}, 3);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->rows[0], (std::vector<std::string>{"a", "c", "e"}));
    EXPECT_EQ(grid->rows[1], (std::vector<std::string>{"b", "d", "f"}));
}

TEST(ColumnLayoutTest, RowWiseReadsAcrossRows) {
    LayoutOptions options;
    options.row_wise = true;
    const auto grid = ColumnLayout(options).Arrange({"a", "b", "c", "d", "e"}, 4);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->rows[0], (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(grid->rows[1], (std::vector<std::string>{"e", "", "", ""}));
}

TEST(ColumnLayoutTest, UniformWidthLeavesLastColumnAlone) {
    LayoutOptions options;
    options.uniform_width = true;
    const auto grid = ColumnLayout(options).Arrange({"short", "a much longer cell", "x", "y"}, 4);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->widths, (std::vector<std::size_t>{23, 23, 23, 16}));
}

TEST(ColumnLayoutTest, RenderedLinesIndentAndPadAllButLastCell) {
    const ColumnLayout layout(LayoutOptions{});
    const auto lines = layout.Lines({"a", "b", "c"});
    ASSERT_EQ(lines.size(), 1u);
    // Three cells in four columns leave an empty last column, so "c" is padded.
    EXPECT_EQ(lines[0], " a" + std::string(15, ' ') + "b" + std::string(15, ' ') + "c" + std::string(15, ' '));
}

TEST(ColumnLayoutTest, SingleColumnLinesAreBare) {
    LayoutOptions options;
    options.max_columns = 1;
    EXPECT_EQ(ColumnLayout(options).Lines({"one", "two"}), (std::vector<std::string>{"one", "two"}));
}

TEST(ColumnLayoutTest, ColourCodesDoNotCountTowardsWidth) {
    const std::string coloured = "\x1b[38;5;80mname\x1b[0m";
    LayoutOptions options;
    options.max_columns = 2;
    const auto lines = ColumnLayout(options).Lines({coloured, "b"});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(StringUtils::VisibleLength(lines[0]), 1u + 16u + 1u);
}

}  // namespace
}  // namespace rls
