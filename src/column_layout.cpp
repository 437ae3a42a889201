#include "column_layout.h"

#include <algorithm>
#include <numeric>
#include <utility>

#include "string_utils.h"

namespace rls {

ColumnLayout::ColumnLayout(LayoutOptions options)
    : options_(options) {}

std::size_t ColumnLayout::ColumnWidth(const std::vector<std::string>& column) const {
    std::size_t longest = 0;
    for (const auto& cell : column) {
        longest = std::max(longest, StringUtils::VisibleLength(cell));
    }
    return std::max(options_.min_width, longest + options_.padding);
}

std::optional<ColumnLayout::Grid> ColumnLayout::Arrange(const std::vector<std::string>& cells,
                                                        std::size_t columns) const {
    Grid grid;
    if (columns <= 1) {
        grid.rows.reserve(cells.size());
        for (const auto& cell : cells) {
            grid.rows.push_back({cell});
        }
        grid.widths.push_back(ColumnWidth(cells));
        return grid;
    }

    std::vector<std::string> padded(cells);
    const std::size_t count = padded.size();
    const std::size_t rows = (count + columns - 1) / columns;

    // Filling column by column can leave trailing columns empty (5 cells in
    // 4 columns of 2 rows fill only 3). Blank cells at the bottom of the
    // columns before the last one push content right until every column
    // holds something.
    if (!options_.row_wise && rows > 0) {
        const std::size_t filled_columns = (count + rows - 1) / rows;
        if (filled_columns < columns) {
            const std::size_t missing = rows * columns - 1 - count;
            for (std::size_t i = 0; i < missing; ++i) {
                const std::size_t column = columns - 1 - missing + i;
                const std::size_t at = rows * column + rows - 1;
                padded.insert(padded.begin() + static_cast<std::ptrdiff_t>(std::min(at, padded.size())), std::string{});
            }
        }
    }
    padded.resize(rows * columns);

    auto index_of = [&](std::size_t row, std::size_t column) {
        return options_.row_wise ? row * columns + column : column * rows + row;
    };

    grid.widths.reserve(columns);
    for (std::size_t column = 0; column < columns; ++column) {
        std::vector<std::string> cells_in_column;
        cells_in_column.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            cells_in_column.push_back(padded[index_of(row, column)]);
        }
        grid.widths.push_back(ColumnWidth(cells_in_column));
    }

    if (options_.uniform_width) {
        const std::size_t uniform = *std::max_element(grid.widths.begin(), grid.widths.end() - 1);
        std::fill(grid.widths.begin(), grid.widths.end() - 1, uniform);
    }

    const std::size_t total = std::accumulate(grid.widths.begin(), grid.widths.end(), std::size_t{0});
    if (total > options_.max_total_width) {
        return std::nullopt;
    }

    grid.rows.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        std::vector<std::string> line;
        line.reserve(columns);
        for (std::size_t column = 0; column < columns; ++column) {
            line.push_back(std::move(padded[index_of(row, column)]));
        }
        grid.rows.push_back(std::move(line));
    }
    return grid;
}

ColumnLayout::Grid ColumnLayout::Solve(const std::vector<std::string>& cells) const {
    if (cells.empty()) {
        return {};
    }
    for (std::size_t columns = std::max<std::size_t>(options_.max_columns, 1); columns > 1; --columns) {
        if (auto grid = Arrange(cells, columns)) {
            return std::move(*grid);
        }
    }
    return *Arrange(cells, 1);
}

std::vector<std::string> ColumnLayout::Lines(const std::vector<std::string>& cells) const {
    return Render(Solve(cells));
}

std::vector<std::string> ColumnLayout::Render(const Grid& grid) {
    std::vector<std::string> lines;
    lines.reserve(grid.rows.size());
    for (const auto& row : grid.rows) {
        if (row.empty()) {
            lines.emplace_back();
            continue;
        }
        std::string line;
        if (row.size() > 1) {
            line.push_back(' ');
        }
        for (std::size_t column = 0; column + 1 < row.size(); ++column) {
            const std::string& cell = row[column];
            line += cell;
            const std::size_t visible = StringUtils::VisibleLength(cell);
            if (grid.widths[column] > visible) {
                line.append(grid.widths[column] - visible, ' ');
            }
        }
        line += row.back();
        lines.push_back(std::move(line));
    }
    return lines;
}

}  // namespace rls
