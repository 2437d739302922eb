#include "sudoku_solver.hpp"
#include "test_common.hpp"

#include <vector>
#include <chrono>

int main() {
    Grid solved = knownGrid(KNOWN_SOLUTION);
    Grid puzzle = knownGrid(KNOWN_PUZZLE);

    std::cout << "Testing fill_random..\n";
    bool allValid = true;
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        SudokuSolver solver(seed);
        Grid g = empty_grid();
        if (!solver.fill_random(g) || !is_valid_solution(g)) allValid = false;
    }
    printResult(allValid, "Empty grids filled validly:       ");

    {
        SudokuSolver a(7), b(7), c(8);
        Grid ga = empty_grid(), gb = empty_grid(), gc = empty_grid();
        a.fill_random(ga);
        b.fill_random(gb);
        c.fill_random(gc);
        printResult(ga == gb, "Same seed, same grid:             ");
        printResult(ga != gc, "Other seed, other grid:           ");
    }

    {
        SudokuSolver solver(3);
        Grid g = puzzle;
        bool filled = solver.fill_random(g);
        printResult(filled && g == solved, "Partial grid completed:           ");
    }

    {
        // Row 0 is open and fills in many ways. Row 1 holds 1-8 and the 9 that (1,8)
        // needs sits below it in column 8, so every row 0 attempt dies one cell later.
        Grid g = empty_grid();
        for (int c = 0; c < 8; ++c) g[1 * GRID_SIZE + c] = c + 1;
        g[2 * GRID_SIZE + 8] = 9;
        Grid before = g;
        SudokuSolver solver(11);
        bool filled = solver.fill_random(g);
        printResult(!filled && g == before, "Unsatisfiable grid left untouched: ");
        printResult(solver.count_solutions(g, 2) == 0, "Unsatisfiable grid counts none:   ");
    }

    std::cout << "Testing count_solutions..\n";
    SudokuSolver solver(5);
    printResult(solver.count_solutions(solved, 2) == 1, "Solved grid counts once:          ");
    printResult(solver.count_solutions(puzzle, 2) == 1, "Known puzzle is unique:           ");

    bool singleHoles = true;
    for (int i = 0; i < CELL_COUNT; ++i) {
        Grid g = solved;
        g[i] = 0;
        if (solver.count_solutions(g, 2) != 1) singleHoles = false;
    }
    printResult(singleHoles, "Any single hole is unique:        ");

    {
        // Rows 3-4 hold 1/3 and 3/1 in columns 5 and 8: two boxes, swappable
        Grid g = solved;
        bool pattern = g[3 * 9 + 5] == g[4 * 9 + 8] && g[3 * 9 + 8] == g[4 * 9 + 5];
        g[3 * 9 + 5] = g[3 * 9 + 8] = g[4 * 9 + 5] = g[4 * 9 + 8] = 0;
        printResult(pattern && solver.count_solutions(g, 2) == 2, "Swap rectangle has two solutions: ");
        printResult(solver.count_solutions(g, 10) == 2,             "Exact count below cutoff:         ");
        printResult(!solver.has_unique_solution(g),                 "has_unique_solution says no:      ");
    }

    Grid before = puzzle;
    solver.count_solutions(puzzle, 2);
    printResult(puzzle == before, "Caller grid not mutated:          ");

    printResult(solver.count_solutions(empty_grid(), 2) == 2, "Empty grid stops at cutoff:       ");

    Grid clash = empty_grid();
    clash[0] = 4;
    clash[1] = 4;
    printResult(solver.count_solutions(clash, 2) == 0, "Clashing givens have none:        ");

    {
        SudokuSolver capped(5, SolverLimits{10});
        int count = capped.count_solutions(empty_grid(), 2);
        printResult(count == 2 && capped.node_limit_hit(), "Node cap reports cutoff:          ");
    }

    std::cout << "Testing MRV solve..\n";
    {
        SudokuSolver mrv;
        std::vector<std::vector<int>> result;
        auto start = std::chrono::high_resolution_clock::now();
        bool found = mrv.solve(to_rows(puzzle), result);
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::micro> elapsed = end - start;
        std::cout << "Time: " << elapsed.count() << " microseconds\n";
        printResult(found && result == to_rows(solved), "Known puzzle solved:              ");

        // Sparse puzzle with many completions still gets one valid answer
        std::vector<std::vector<int>> sparse = {
            {1,0,0,0,0,0,0,0,0},
            {0,0,0,0,0,0,0,0,0},
            {0,0,0,0,0,0,5,0,0},
            {0,0,0,0,0,0,0,0,0},
            {0,0,0,0,8,0,0,0,2},
            {6,0,0,0,0,4,0,0,0},
            {0,0,0,0,0,0,0,1,0},
            {0,4,0,0,0,0,0,0,0},
            {0,0,0,0,0,0,0,0,0},
        };
        found = mrv.solve(sparse, result);
        auto flat = from_rows(result);
        printResult(found && flat && is_valid_solution(*flat), "Sparse puzzle solved:             ");

        std::vector<std::vector<int>> conflicting = to_rows(puzzle);
        conflicting[0][2] = 5;
        printResult(!mrv.solve(conflicting, result), "Conflicting givens rejected:      ");

        std::vector<std::vector<int>> badShape(9, std::vector<int>(8, 0));
        printResult(!mrv.solve(badShape, result), "Wrong shape rejected:             ");
    }

    return failures == 0 ? 0 : 1;
}
