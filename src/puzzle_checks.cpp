#include "puzzle_checks.hpp"

bool is_solved(const Grid& grid, const Grid& solution) {
    for (int i = 0; i < CELL_COUNT; ++i)
        if (grid[i] == 0 || grid[i] != solution[i]) return false;
    return true;
}

std::vector<Cell> find_mistakes(const Grid& grid, const Grid& solution) {
    std::vector<Cell> mistakes;
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (grid[i] != 0 && grid[i] != solution[i])
            mistakes.push_back({i / GRID_SIZE, i % GRID_SIZE});
    }
    return mistakes;
}

std::optional<Cell> reveal_hint(Grid& grid, const Grid& solution, std::mt19937& rng) {
    std::vector<int> empty;
    for (int i = 0; i < CELL_COUNT; ++i)
        if (grid[i] == 0) empty.push_back(i);
    if (empty.empty()) return std::nullopt;

    std::uniform_int_distribution<size_t> pick(0, empty.size() - 1);
    int idx = empty[pick(rng)];
    grid[idx] = solution[idx];
    return Cell{idx / GRID_SIZE, idx % GRID_SIZE};
}

std::array<int, 10> digit_counts(const Grid& grid) {
    std::array<int, 10> counts{};
    for (int v : grid)
        if (v >= 1 && v <= 9) ++counts[v];
    return counts;
}

bool matches_solution(const Grid& puzzle, const Grid& solution) {
    for (int i = 0; i < CELL_COUNT; ++i)
        if (puzzle[i] != 0 && puzzle[i] != solution[i]) return false;
    return true;
}
