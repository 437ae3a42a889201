#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rls {

struct LayoutOptions {
    std::size_t max_total_width = 100;
    std::size_t min_width = 16;
    std::size_t padding = 5;
    std::size_t max_columns = 4;
    bool row_wise = false;
    bool uniform_width = false;
};

// Arranges rendered cells into the widest grid that fits the width budget.
class ColumnLayout {
public:
    struct Grid {
        std::vector<std::vector<std::string>> rows;
        std::vector<std::size_t> widths;

        std::size_t columns() const { return widths.size(); }
    };

    explicit ColumnLayout(LayoutOptions options = {});

    // Grid with exactly `columns` columns, or empty when it is wider than
    // the budget. One column always fits.
    std::optional<Grid> Arrange(const std::vector<std::string>& cells, std::size_t columns) const;

    // Tries max_columns down to one and keeps the first grid that fits.
    Grid Solve(const std::vector<std::string>& cells) const;

    // Printable lines of the solved grid, without line terminators.
    std::vector<std::string> Lines(const std::vector<std::string>& cells) const;

    static std::vector<std::string> Render(const Grid& grid);

    const LayoutOptions& options() const { return options_; }

private:
    std::size_t ColumnWidth(const std::vector<std::string>& column) const;

    LayoutOptions options_;
};

}  // namespace rls
