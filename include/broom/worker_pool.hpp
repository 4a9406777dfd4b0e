#ifndef BROOM_WORKER_POOL_HPP
#define BROOM_WORKER_POOL_HPP

#include "broom/cancellation.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <thread>
#include <vector>

namespace Broom {
namespace WorkerPool {

/**
 * @brief Upper bound on concurrent workers for one scan.
 */
inline size_t workerLimit(size_t units)
{
    const size_t hardware = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::max<size_t>(1, std::min({units, hardware, size_t(8)}));
}

/**
 * @brief Runs work(0) .. work(count - 1) on a bounded set of workers.
 *
 * Workers claim the next index from a shared counter and check the token
 * before starting each claimed unit. A unit claimed after cancellation is
 * not run and delivers std::nullopt, as does a unit whose work gave up
 * part way through. collect() is invoked on the calling thread in index
 * order as results become available. An exception thrown by work()
 * propagates out of run() when its unit is collected.
 *
 * @return The number of units that delivered no result.
 */
template <typename T>
size_t run(size_t count,
           const CancellationToken& token,
           const std::function<std::optional<T>(size_t)>& work,
           const std::function<void(size_t, std::optional<T>&)>& collect)
{
    std::vector<std::promise<std::optional<T>>> promises(count);
    std::vector<std::future<std::optional<T>>> results;
    results.reserve(count);
    for (auto& promise : promises) {
        results.push_back(promise.get_future());
    }

    std::atomic<size_t> next{0};
    std::vector<std::future<void>> workers;
    const size_t workerCount = count == 0 ? 0 : workerLimit(count);
    for (size_t w = 0; w < workerCount; ++w) {
        workers.push_back(std::async(std::launch::async, [&]() {
            for (size_t index = next.fetch_add(1); index < count; index = next.fetch_add(1)) {
                if (token.isCancelled()) {
                    promises[index].set_value(std::nullopt);
                    continue;
                }
                try {
                    promises[index].set_value(work(index));
                } catch (...) {
                    promises[index].set_exception(std::current_exception());
                }
            }
        }));
    }

    size_t skipped = 0;
    for (size_t index = 0; index < count; ++index) {
        std::optional<T> result = results[index].get();
        if (!result) {
            ++skipped;
        }
        collect(index, result);
    }
    for (auto& worker : workers) {
        worker.get();
    }
    return skipped;
}

} // namespace WorkerPool
} // namespace Broom

#endif // BROOM_WORKER_POOL_HPP
