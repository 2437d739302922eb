#include "puzzle_worker.hpp"

PuzzleWorker::PuzzleWorker() : PuzzleWorker(std::random_device{}()) {}

PuzzleWorker::PuzzleWorker(uint32_t seed, SolverLimits limits)
    : seeds(seed), limits(limits), worker([this] { run(); }) {}

// Drains the queue before joining
PuzzleWorker::~PuzzleWorker() {
    {
        std::lock_guard lock(requestMutex);
        stopping = true;
    }
    requestCV.notify_all();
    if (worker.joinable()) worker.join();
}

std::future<GeneratedPuzzle> PuzzleWorker::request(Difficulty d) {
    std::promise<GeneratedPuzzle> promise;
    std::future<GeneratedPuzzle> future {promise.get_future()};
    {
        std::lock_guard lock(requestMutex);
        requests.emplace(d, std::move(promise));
    }
    requestCV.notify_one();
    return future;
}

void PuzzleWorker::run() {
    for (;;) {
        std::unique_lock lock(requestMutex);
        requestCV.wait(lock, [this] { return stopping || !requests.empty(); });
        if (requests.empty() && stopping) return;

        auto job {std::move(requests.front())};
        requests.pop();
        // Seed drawn under the lock, so request order fixes the seed sequence
        uint32_t seed = seeds();
        lock.unlock();

        try {
            PuzzleGenerator generator(seed, limits);
            job.second.set_value(generator.generate(job.first));
        } catch (...) {
            job.second.set_exception(std::current_exception());
        }
    }
}
