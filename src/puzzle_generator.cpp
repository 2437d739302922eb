#include "puzzle_generator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <vector>

std::string difficulty_name(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
        case Difficulty::Expert: return "expert";
        case Difficulty::Master: return "master";
    }
    return "unknown";
}

Difficulty parse_difficulty(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    for (Difficulty d : all_difficulties()) {
        if (difficulty_name(d) == lower) return d;
    }
    throw std::invalid_argument("Unknown difficulty: " + std::string(name));
}

std::optional<uint32_t> parse_seed(std::string_view text) {
    uint32_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

PuzzleGenerator::PuzzleGenerator() : rng(std::random_device{}()) {}

PuzzleGenerator::PuzzleGenerator(uint32_t seed, SolverLimits limits)
    : rng(seed), limits(limits) {}

GeneratedPuzzle PuzzleGenerator::generate(Difficulty d) {
    const int target = target_removals(d);
    SudokuSolver solver(rng(), limits);

    Grid grid = empty_grid();
    if (!solver.fill_random(grid)) {
        throw std::logic_error("generate: could not fill an empty grid");
    }
    const Grid solution = grid;

    std::vector<Cell> candidates;
    candidates.reserve(CELL_COUNT);
    for (int i = 0; i < CELL_COUNT; ++i) candidates.push_back({i / GRID_SIZE, i % GRID_SIZE});
    std::shuffle(candidates.begin(), candidates.end(), rng);

    int removed = 0;
    while (!candidates.empty() && removed < target) {
        Cell cell = candidates.back();
        candidates.pop_back();

        int idx = cell.row * GRID_SIZE + cell.col;
        int saved = grid[idx];
        grid[idx] = 0;

        if (solver.count_solutions(grid, 2) == 1) {
            ++removed;
        } else {
            grid[idx] = saved;
        }
    }

    return {grid, solution, d, removed};
}
