#pragma once

/**
 * @file parallel.hpp
 * @brief Row-banded fork/join over worker threads
 *
 * Used by the per-tile generation stages. Each band is a contiguous range of
 * rows; the call returns only after every worker has joined, so the caller
 * sees a full barrier before the next stage begins.
 */

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tectogen {

/// Callback receiving a half-open row range [rowBegin, rowEnd)
using RowBandFn = std::function<void(int32_t rowBegin, int32_t rowEnd)>;

/// Resolve a requested worker count (0 = hardware concurrency, at least 1)
[[nodiscard]] size_t resolveThreadCount(size_t requested);

/// Run fn over [0, rows) split into at most threadCount bands.
/// With one band the callback runs on the calling thread.
/// The first exception thrown by any band is rethrown after all workers join.
void parallelRows(int32_t rows, size_t threadCount, const RowBandFn& fn);

}  // namespace tectogen
