#pragma once

#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <queue>
#include <random>
#include <thread>
#include <utility>

#include "puzzle_generator.hpp"

// Runs generation requests one at a time on a background thread.
// Each request gets exactly one result (or the exception generation threw).
class PuzzleWorker {
public:
    PuzzleWorker();
    explicit PuzzleWorker(uint32_t seed, SolverLimits limits = {});
    ~PuzzleWorker();

    PuzzleWorker(const PuzzleWorker&) = delete;
    PuzzleWorker& operator=(const PuzzleWorker&) = delete;

    std::future<GeneratedPuzzle> request(Difficulty d);

private:
    void run();

    std::mt19937 seeds;
    SolverLimits limits;

    std::queue<std::pair<Difficulty, std::promise<GeneratedPuzzle>>> requests;
    std::mutex requestMutex;
    std::condition_variable requestCV;
    bool stopping = false;
    std::thread worker;
};
