#pragma once

#include <array>
#include <optional>
#include <random>
#include <vector>

#include "sudoku_grid.hpp"

// Checks a player's grid against the known solution of its puzzle

bool is_solved(const Grid& grid, const Grid& solution);

// Filled cells whose value is not the solution's, row-major
std::vector<Cell> find_mistakes(const Grid& grid, const Grid& solution);

// Copies the solution value into a random empty cell of grid and returns that cell
std::optional<Cell> reveal_hint(Grid& grid, const Grid& solution, std::mt19937& rng);

// counts[d] = occurrences of digit d, counts[0] unused
std::array<int, 10> digit_counts(const Grid& grid);

// Every filled cell of puzzle equals the solution at the same position
bool matches_solution(const Grid& puzzle, const Grid& solution);
