#include "sudoku_solver.hpp"

#include <algorithm>
#include <optional>
#include <bit>
#include <stdexcept>

/**
 * Backtracking Sudoku solver
 * * Rows, cols and boxes keep 16-bit masks of the digits already used,
 *   so a consistency check is three ORs instead of a 27-cell scan.
 * * fill_random and count_solutions walk the empty cells in row-major order.
 *   solve() branches on the cell with the fewest candidates (MRV) instead.
 */

SudokuSolver::SudokuSolver(uint32_t seed, SolverLimits limits)
    : rng(seed), limits(limits) {
    // Precompute box indices to avoid repetitive calculation
    for (int i = 0; i < CELL_COUNT; ++i) {
        int r = i / GRID_SIZE;
        int c = i % GRID_SIZE;
        box_indices[i] = (r / BOX_SIZE) * BOX_SIZE + (c / BOX_SIZE);
    }
}

// Reset state from g. Returns false if two givens clash.
bool SudokuSolver::load(const Grid& g) {
    grid.fill(0);
    row_mask.fill(0);
    col_mask.fill(0);
    box_mask.fill(0);
    empty_cells.clear();
    empty_cells.reserve(CELL_COUNT);

    bool consistent = true;
    for (int i = 0; i < CELL_COUNT; ++i) {
        int v = g[i];
        if (v == 0) {
            empty_cells.push_back(i);
            continue;
        }
        uint16_t bit = 1 << (v - 1);
        if ((row_mask[i / GRID_SIZE] | col_mask[i % GRID_SIZE] | box_mask[box_indices[i]]) & bit)
            consistent = false;
        place(i, v);
    }
    return consistent;
}

bool SudokuSolver::fill_random(Grid& g) {
    if (!load(g)) return false;
    if (!fill_recursive(0)) return false;

    g = grid;
    return true;
}

int SudokuSolver::count_solutions(const Grid& g, int cutoff) {
    if (cutoff < 1) throw std::invalid_argument("count_solutions: cutoff must be at least 1");

    nodes = 0;
    limit_hit = false;
    if (!load(g)) return 0;

    int found = 0;
    count_recursive(0, cutoff, found);
    return limit_hit ? cutoff : found;
}

// Main entry point for user supplied puzzles
bool SudokuSolver::solve(const std::vector<std::vector<int>>& input, std::vector<std::vector<int>>& result) {
    std::optional<Grid> parsed = from_rows(input);
    if (!parsed) return false;
    if (!load(*parsed)) return false;

    if (solve_recursive(0)) {
        result = to_rows(grid);
        return true;
    }
    return false;
}

// Mark a number as used in the bitmasks and grid
void SudokuSolver::place(int idx, int val) {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    grid[idx] = val;
    row_mask[r] |= bit;
    col_mask[c] |= bit;
    box_mask[b] |= bit;
}

// Unmark a number (backtracking)
void SudokuSolver::remove(int idx, int val) {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    grid[idx] = 0;
    row_mask[r] &= ~bit;
    col_mask[c] &= ~bit;
    box_mask[b] &= ~bit;
}

// Returns 9 bits where 1 means "available"
uint16_t SudokuSolver::get_candidates(int idx) const {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    int b = box_indices[idx];

    return ~(row_mask[r] | col_mask[c] | box_mask[b]) & 0x1FF;
}

// empty_cells is in row-major order, so empty_cells[k] is always the first empty cell
bool SudokuSolver::fill_recursive(size_t k) {
    if (k == empty_cells.size()) {
        return true;
    }

    int idx = empty_cells[k];
    std::array<int, GRID_SIZE> digits = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    std::shuffle(digits.begin(), digits.end(), rng);

    uint16_t candidates = get_candidates(idx);
    for (int val : digits) {
        if (!(candidates & (1 << (val - 1)))) continue;

        place(idx, val);
        if (fill_recursive(k + 1)) {
            return true;
        }
        remove(idx, val);
    }

    return false;
}

void SudokuSolver::count_recursive(size_t k, int cutoff, int& found) {
    if (++nodes > limits.max_nodes) {
        limit_hit = true;
        return;
    }
    if (k == empty_cells.size()) {
        ++found;
        return;
    }

    int idx = empty_cells[k];
    uint16_t candidates = get_candidates(idx);
    while (candidates && found < cutoff && !limit_hit) {
        int val = std::countr_zero(candidates) + 1;

        place(idx, val);
        count_recursive(k + 1, cutoff, found);
        remove(idx, val);

        candidates &= (candidates - 1);
    }
}

// Recursive backtracking with MRV (Minimum Remaining Values) heuristic
// k is the number of entries of empty_cells already filled
bool SudokuSolver::solve_recursive(size_t k) {
    if (k == empty_cells.size()) {
        return true; // All cells filled
    }

    // Scan empty_cells[k...end] for the cell with the FEWEST candidates and swap it to position k
    size_t best_idx = k;
    int min_candidates = 10;
    uint16_t best_mask = 0;

    for (size_t i = k; i < empty_cells.size(); ++i) {
        uint16_t mask = get_candidates(empty_cells[i]);
        int count = std::popcount(mask);

        if (count == 0) return false; // Dead end

        if (count < min_candidates) {
            min_candidates = count;
            best_mask = mask;
            best_idx = i;
            if (count == 1) break; // Can't get better than 1
        }
    }

    std::swap(empty_cells[k], empty_cells[best_idx]);

    int current_cell_idx = empty_cells[k];

    while (best_mask) {
        int val = std::countr_zero(best_mask) + 1;

        place(current_cell_idx, val);

        if (solve_recursive(k + 1)) {
            return true;
        }

        remove(current_cell_idx, val);

        // Clear the lowest set bit to move to the next candidate
        best_mask &= (best_mask - 1);
    }

    return false;
}
