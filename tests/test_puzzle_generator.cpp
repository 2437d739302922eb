#include "puzzle_generator.hpp"
#include "puzzle_checks.hpp"
#include "test_common.hpp"

#include <chrono>
#include <stdexcept>

bool wellFormed(const GeneratedPuzzle& p) {
    SudokuSolver checker(0);
    return is_valid_solution(p.solution)
        && matches_solution(p.puzzle, p.solution)
        && count_empty(p.puzzle) == p.removed
        && p.removed <= target_removals(p.difficulty)
        && checker.count_solutions(p.puzzle, 2) == 1;
}

int main() {
    std::cout << "Testing difficulty table..\n";
    printResult(target_removals(Difficulty::Easy) == 38 && target_removals(Difficulty::Medium) == 46 &&
                target_removals(Difficulty::Hard) == 53 && target_removals(Difficulty::Expert) == 59 &&
                target_removals(Difficulty::Master) == 64, "Removal targets:            ");
    printResult(parse_difficulty("expert") == Difficulty::Expert, "Parse name:                 ");
    printResult(parse_difficulty("MASTER") == Difficulty::Master, "Parse ignores case:         ");

    bool rejected = false;
    try {
        parse_difficulty("impossible");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    printResult(rejected, "Unknown name rejected:      ");

    bool namesRoundTrip = true;
    for (Difficulty d : all_difficulties())
        if (parse_difficulty(difficulty_name(d)) != d) namesRoundTrip = false;
    printResult(namesRoundTrip, "Names parse back:           ");

    std::cout << "Testing generate..\n";
    for (Difficulty d : all_difficulties()) {
        bool ok = true;
        for (uint32_t seed = 100; seed < 103; ++seed) {
            auto start = std::chrono::high_resolution_clock::now();
            PuzzleGenerator generator(seed);
            GeneratedPuzzle p = generator.generate(d);
            auto end = std::chrono::high_resolution_clock::now();
            std::cout << "  " << difficulty_name(d) << " seed " << seed << ": removed " << p.removed << " in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() << " ms\n";
            if (p.difficulty != d || !wellFormed(p)) ok = false;
        }
        printResult(ok, "Unique sub-assignment (" + difficulty_name(d) + "): ");
    }

    {
        PuzzleGenerator a(2024), b(2024);
        GeneratedPuzzle pa = a.generate(Difficulty::Hard);
        GeneratedPuzzle pb = b.generate(Difficulty::Hard);
        printResult(pa.puzzle == pb.puzzle && pa.solution == pb.solution, "Same seed, same puzzle:     ");

        GeneratedPuzzle next = a.generate(Difficulty::Hard);
        printResult(next.solution != pa.solution, "Calls are independent:      ");
    }

    {
        PuzzleGenerator easyGen(1), masterGen(2);
        GeneratedPuzzle easy = easyGen.generate(Difficulty::Easy);
        GeneratedPuzzle master = masterGen.generate(Difficulty::Master);
        printResult(easy.removed == 38,                   "Easy reaches its target:    ");
        printResult(master.removed > easy.removed,         "Master removes more:        ");
        printResult(wellFormed(easy) && wellFormed(master), "Both unique:                ");
    }

    {
        // Every uniqueness check gives up at once, so nothing may be removed
        PuzzleGenerator starved(9, SolverLimits{1});
        GeneratedPuzzle p = starved.generate(Difficulty::Medium);
        printResult(p.removed == 0 && p.puzzle == p.solution && is_valid_solution(p.solution),
                    "Undecided checks keep cells: ");
    }

    {
        bool threw = false;
        try {
            PuzzleGenerator generator(4);
            generator.generate(static_cast<Difficulty>(42));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        printResult(threw, "Out-of-range level rejected: ");
    }

    std::cout << "Testing seed parsing..\n";
    printResult(parse_seed("5") == 5u && parse_seed("4294967295") == 4294967295u, "Plain numbers accepted:     ");
    printResult(!parse_seed("5x"),         "Trailing junk rejected:     ");
    printResult(!parse_seed("-1"),         "Negative rejected:          ");
    printResult(!parse_seed("4294967301"), "Overflow rejected:          ");
    printResult(!parse_seed(""),           "Empty rejected:             ");

    return failures == 0 ? 0 : 1;
}
