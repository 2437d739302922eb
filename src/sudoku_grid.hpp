#pragma once

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

constexpr int GRID_SIZE = 9;
constexpr int BOX_SIZE = 3;
constexpr int CELL_COUNT = GRID_SIZE * GRID_SIZE;

// Flat row-major 9x9 board, 0 = empty
using Grid = std::array<int, CELL_COUNT>;

struct Cell {
    int row;
    int col;

    bool operator==(const Cell&) const = default;
};

inline Grid empty_grid() {
    Grid g;
    g.fill(0);
    return g;
}

// True iff digit appears nowhere else in the row, column or box of (row, col).
// The cell itself is not looked at.
[[nodiscard]] bool is_valid_placement(const Grid& g, int row, int col, int digit);

bool is_complete(const Grid& g);
bool is_valid_solution(const Grid& g);
int count_empty(const Grid& g);

// Accepts 81 cells: '1'-'9', '0' or '.' for empty. Whitespace and '|', '-', '+' are skipped.
std::optional<Grid> parse_grid(std::string_view text);
std::string to_string(const Grid& g);

std::vector<std::vector<int>> to_rows(const Grid& g);
std::optional<Grid> from_rows(const std::vector<std::vector<int>>& rows);

void print_grid(const Grid& g, std::ostream& out);
