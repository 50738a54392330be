#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace equipot {

/**
 * @brief Split [0, count) into contiguous chunks and run fn(chunkIndex, begin, end) on each.
 *
 * Chunk c always covers a lower range than chunk c + 1, so callers that keep one output
 * buffer per chunk can concatenate them in chunk order and reproduce the sequential result.
 * The first exception raised by a worker is rethrown after every worker has joined.
 */
template <typename Fn>
std::size_t parallelChunks(std::size_t count, std::size_t threads, Fn&& fn) {
    if (count == 0) {
        return 0;
    }
    const std::size_t chunkCount = std::max<std::size_t>(1, std::min(threads, count));
    const std::size_t perChunk = (count + chunkCount - 1) / chunkCount;

    if (chunkCount == 1) {
        fn(std::size_t{0}, std::size_t{0}, count);
        return 1;
    }

    std::exception_ptr firstError;
    std::mutex errorMutex;
    std::vector<std::thread> workers;
    workers.reserve(chunkCount);
    for (std::size_t c = 0; c < chunkCount; ++c) {
        const std::size_t begin = std::min(count, c * perChunk);
        const std::size_t end = std::min(count, begin + perChunk);
        workers.emplace_back([&, c, begin, end]() {
            try {
                fn(c, begin, end);
            } catch (...) {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!firstError) {
                    firstError = std::current_exception();
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
    return chunkCount;
}

}  // namespace equipot
