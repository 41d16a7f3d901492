#include "tectogen/core/parallel.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace tectogen {

namespace {

// Joins every started worker on scope exit, including when starting a later one throws
struct WorkerJoiner {
    std::vector<std::thread>& workers;

    ~WorkerJoiner() {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
};

}  // namespace

size_t resolveThreadCount(size_t requested) {
    if (requested == 0) {
        requested = std::max(1u, std::thread::hardware_concurrency());
    }
    return requested;
}

void parallelRows(int32_t rows, size_t threadCount, const RowBandFn& fn) {
    if (rows <= 0) return;

    size_t bands = std::min(resolveThreadCount(threadCount), static_cast<size_t>(rows));
    if (bands <= 1) {
        fn(0, rows);
        return;
    }

    std::vector<std::exception_ptr> errors(bands);
    std::vector<std::thread> workers;
    workers.reserve(bands);

    int32_t rowsPerBand = rows / static_cast<int32_t>(bands);
    int32_t remainder = rows % static_cast<int32_t>(bands);

    {
        WorkerJoiner joiner{workers};
        int32_t begin = 0;
        for (size_t i = 0; i < bands; ++i) {
            int32_t end = begin + rowsPerBand + (static_cast<int32_t>(i) < remainder ? 1 : 0);
            workers.emplace_back([&fn, &errors, i, begin, end]() {
                try {
                    fn(begin, end);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
            begin = end;
        }
    }

    for (auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

}  // namespace tectogen
