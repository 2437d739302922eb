#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <random>
#include <stdexcept>

#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"
#include "puzzle_generator.hpp"
#include "puzzle_worker.hpp"
#include "board_renderer.hpp"

void printUsage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " generate <easy|medium|hard|expert|master> [--seed N] [--image out.png] [--background]\n"
              << "  " << prog << " solve <81-char puzzle, '.' or '0' for empty>" << std::endl;
}

int runGenerate(int argc, char* argv[]) {
    Difficulty difficulty = parse_difficulty(argv[2]);

    std::optional<uint32_t> seed;
    std::string imagePath;
    bool background = false;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed" && i + 1 < argc) {
            seed = parse_seed(argv[++i]);
            if (!seed) {
                std::cerr << "Error: seed must be a number from 0 to 4294967295" << std::endl;
                printUsage(argv[0]);
                return -1;
            }
        } else if (arg == "--image" && i + 1 < argc) {
            imagePath = argv[++i];
        } else if (arg == "--background") {
            background = true;
        } else {
            printUsage(argv[0]);
            return -1;
        }
    }

    // --- 1. Generation ---
    auto t1_start = std::chrono::high_resolution_clock::now();
    GeneratedPuzzle result;
    if (background) {
        PuzzleWorker worker(seed ? *seed : std::random_device{}());
        std::future<GeneratedPuzzle> pending = worker.request(difficulty);
        std::cout << "Waiting for background generation..." << std::endl;
        result = pending.get();
    } else {
        PuzzleGenerator generator(seed ? *seed : std::random_device{}());
        result = generator.generate(difficulty);
    }
    auto t1_end = std::chrono::high_resolution_clock::now();
    auto t1_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1_end - t1_start).count();
    std::cout << "Step 1 (Puzzle Generation) took: " << t1_ms << " ms" << std::endl;

    std::cout << "Difficulty: " << difficulty_name(difficulty)
              << ", removed " << result.removed << " of " << target_removals(difficulty) << " cells" << std::endl;
    std::cout << "Puzzle:" << std::endl;
    print_grid(result.puzzle, std::cout);
    std::cout << to_string(result.puzzle) << std::endl;
    std::cout << "Solution:" << std::endl;
    print_grid(result.solution, std::cout);

    // --- 2. Puzzle Sheet ---
    if (!imagePath.empty()) {
        auto t2_start = std::chrono::high_resolution_clock::now();
        cv::Mat sheet = render_board(result.puzzle);
        bool saved = save_board(sheet, imagePath);
        auto t2_end = std::chrono::high_resolution_clock::now();
        auto t2_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2_end - t2_start).count();
        std::cout << "Step 2 (Rendering) took: " << t2_ms << " ms" << std::endl;

        if (!saved) {
            std::cerr << "Error: Could not write image to " << imagePath << std::endl;
            return -1;
        }
        std::cout << "Saved: " << imagePath << std::endl;
    }

    return 0;
}

int runSolve(const std::string& text) {
    std::optional<Grid> puzzle = parse_grid(text);
    if (!puzzle) {
        std::cerr << "Error: puzzle must contain exactly 81 cells of 1-9, '0' or '.'" << std::endl;
        return -1;
    }

    std::cout << "Solving puzzle:" << std::endl;
    print_grid(*puzzle, std::cout);

    SudokuSolver solver;
    std::vector<std::vector<int>> solvedGrid;
    auto start = std::chrono::high_resolution_clock::now();
    bool success = solver.solve(to_rows(*puzzle), solvedGrid);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::micro> elapsed = end - start;

    std::cout << "\nStatus: " << (success ? "Solved" : "Unsolvable") << "\n";
    std::cout << "Time: " << elapsed.count() << " microseconds\n\n";

    if (!success) {
        std::cout << "Could not solve the sudoku (invalid configuration)." << std::endl;
        return 1;
    }

    std::optional<Grid> solved = from_rows(solvedGrid);
    if (solved) print_grid(*solved, std::cout);
    int solutions = solver.count_solutions(*puzzle, 2);
    if (solver.node_limit_hit()) {
        std::cout << "Uniqueness not decided within " << solver.last_node_count() << " search nodes" << std::endl;
    } else {
        std::cout << (solutions == 1 ? "Solution is unique" : "Puzzle has more than one solution") << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return -1;
    }

    std::string command = argv[1];
    try {
        if (command == "generate") return runGenerate(argc, argv);
        if (command == "solve" && argc == 3) return runSolve(argv[2]);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return -1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    printUsage(argv[0]);
    return -1;
}
