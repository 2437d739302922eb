#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <vector>

#include "sudoku_grid.hpp"

struct SolverLimits {
    // Search nodes a single count_solutions call may expand
    long max_nodes = 2'000'000;
};

class SudokuSolver {
public:
    explicit SudokuSolver(uint32_t seed = std::random_device{}(), SolverLimits limits = {});

    // Randomized fill of every empty cell, row-major, digits tried in shuffled order.
    // On failure g is left exactly as it was passed in.
    bool fill_random(Grid& g);

    // Number of completions of g, counting stops at cutoff. g is never modified.
    // Reports cutoff when the node limit is reached before the search finishes.
    int count_solutions(const Grid& g, int cutoff);
    bool has_unique_solution(const Grid& g) { return count_solutions(g, 2) == 1; }

    // Deterministic MRV solve of a 9x9 puzzle given as rows
    bool solve(const std::vector<std::vector<int>>& input, std::vector<std::vector<int>>& result);

    long last_node_count() const { return nodes; }
    bool node_limit_hit() const { return limit_hit; }

private:
    Grid grid;
    std::array<uint16_t, GRID_SIZE> row_mask;
    std::array<uint16_t, GRID_SIZE> col_mask;
    std::array<uint16_t, GRID_SIZE> box_mask;
    std::array<int, CELL_COUNT> box_indices;
    std::vector<int> empty_cells;

    std::mt19937 rng;
    SolverLimits limits;
    long nodes = 0;
    bool limit_hit = false;

    bool load(const Grid& g);
    void place(int idx, int val);
    void remove(int idx, int val);
    [[nodiscard]] uint16_t get_candidates(int idx) const;
    bool fill_recursive(size_t k);
    void count_recursive(size_t k, int cutoff, int& found);
    bool solve_recursive(size_t k);
};
