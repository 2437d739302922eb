#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"

enum class Difficulty { Easy, Medium, Hard, Expert, Master };

// Cells cleared from the 81 of a solved grid; throws std::invalid_argument outside the enum
constexpr int target_removals(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return 38;
        case Difficulty::Medium: return 46;
        case Difficulty::Hard:   return 53;
        case Difficulty::Expert: return 59;
        case Difficulty::Master: return 64;
    }
    throw std::invalid_argument("Unknown difficulty value");
}

constexpr std::array<Difficulty, 5> all_difficulties() {
    return {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard, Difficulty::Expert, Difficulty::Master};
}

std::string difficulty_name(Difficulty d);

// Case-insensitive; throws std::invalid_argument for unknown names
Difficulty parse_difficulty(std::string_view name);

// Whole text must be a decimal number that fits in 32 bits
std::optional<uint32_t> parse_seed(std::string_view text);

struct GeneratedPuzzle {
    Grid puzzle;
    Grid solution;
    Difficulty difficulty;
    int removed;
};

class PuzzleGenerator {
public:
    PuzzleGenerator();
    explicit PuzzleGenerator(uint32_t seed, SolverLimits limits = {});

    /**
     * Fills an empty grid at random, then tries every cell once in shuffled order,
     * clearing it only if the grid keeps exactly one solution.
     * Stops at target_removals(d) or when every cell has been tried.
     * Throws std::logic_error if the empty grid cannot be filled.
     */
    GeneratedPuzzle generate(Difficulty d);

private:
    std::mt19937 rng;
    SolverLimits limits;
};
