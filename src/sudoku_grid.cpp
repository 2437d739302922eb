#include "sudoku_grid.hpp"

#include <iostream>
#include <cstdint>

bool is_valid_placement(const Grid& g, int row, int col, int digit) {
    for (int i = 0; i < GRID_SIZE; ++i) {
        if (i != col && g[row * GRID_SIZE + i] == digit) return false;
        if (i != row && g[i * GRID_SIZE + col] == digit) return false;
    }

    int start_row = (row / BOX_SIZE) * BOX_SIZE;
    int start_col = (col / BOX_SIZE) * BOX_SIZE;
    for (int r = start_row; r < start_row + BOX_SIZE; ++r) {
        for (int c = start_col; c < start_col + BOX_SIZE; ++c) {
            if (r == row && c == col) continue;
            if (g[r * GRID_SIZE + c] == digit) return false;
        }
    }
    return true;
}

bool is_complete(const Grid& g) {
    for (int v : g)
        if (v == 0) return false;
    return true;
}

bool is_valid_solution(const Grid& g) {
    // Every row, column and box must see all nine bits exactly once
    for (int unit = 0; unit < GRID_SIZE; ++unit) {
        uint16_t row_seen = 0, col_seen = 0, box_seen = 0;
        int box_row = (unit / BOX_SIZE) * BOX_SIZE;
        int box_col = (unit % BOX_SIZE) * BOX_SIZE;

        for (int i = 0; i < GRID_SIZE; ++i) {
            int rv = g[unit * GRID_SIZE + i];
            int cv = g[i * GRID_SIZE + unit];
            int bv = g[(box_row + i / BOX_SIZE) * GRID_SIZE + box_col + i % BOX_SIZE];
            if (rv < 1 || rv > 9 || cv < 1 || cv > 9 || bv < 1 || bv > 9) return false;
            row_seen |= 1 << (rv - 1);
            col_seen |= 1 << (cv - 1);
            box_seen |= 1 << (bv - 1);
        }
        if (row_seen != 0x1FF || col_seen != 0x1FF || box_seen != 0x1FF) return false;
    }
    return true;
}

int count_empty(const Grid& g) {
    int count = 0;
    for (int v : g)
        if (v == 0) ++count;
    return count;
}

std::optional<Grid> parse_grid(std::string_view text) {
    Grid g;
    int idx = 0;
    for (char ch : text) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
            ch == '|' || ch == '-' || ch == '+') {
            continue;
        }
        if (idx >= CELL_COUNT) return std::nullopt;

        if (ch == '.' || ch == '0') {
            g[idx++] = 0;
        } else if (ch >= '1' && ch <= '9') {
            g[idx++] = ch - '0';
        } else {
            return std::nullopt;
        }
    }
    if (idx != CELL_COUNT) return std::nullopt;
    return g;
}

std::string to_string(const Grid& g) {
    std::string s;
    s.reserve(CELL_COUNT);
    for (int v : g) s.push_back(v == 0 ? '.' : static_cast<char>('0' + v));
    return s;
}

std::vector<std::vector<int>> to_rows(const Grid& g) {
    std::vector<std::vector<int>> rows(GRID_SIZE, std::vector<int>(GRID_SIZE));
    for (int r = 0; r < GRID_SIZE; ++r)
        for (int c = 0; c < GRID_SIZE; ++c)
            rows[r][c] = g[r * GRID_SIZE + c];
    return rows;
}

std::optional<Grid> from_rows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != GRID_SIZE) return std::nullopt;
    for (const auto& row : rows) if (row.size() != GRID_SIZE) return std::nullopt;

    Grid g;
    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            int v = rows[r][c];
            if (v < 0 || v > 9) return std::nullopt;
            g[r * GRID_SIZE + c] = v;
        }
    }
    return g;
}

void print_grid(const Grid& g, std::ostream& out) {
    for (int r = 0; r < GRID_SIZE; ++r) {
        if (r > 0 && r % BOX_SIZE == 0) out << "------+-------+------\n";
        for (int c = 0; c < GRID_SIZE; ++c) {
            if (c > 0 && c % BOX_SIZE == 0) out << "| ";
            out << (g[r * GRID_SIZE + c] == 0 ? '.' : (char)('0' + g[r * GRID_SIZE + c])) << " ";
        }
        out << "\n";
    }
}
