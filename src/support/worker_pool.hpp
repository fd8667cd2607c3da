//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/worker_pool.hpp
// Purpose: Order-preserving parallel map used for per-file analysis.
// Key invariants:
//   - Result slot i always holds fn(inputs[i]) regardless of scheduling.
//   - Workers claim indices from a shared atomic counter; no other state is
//     shared between them.
//   - The first exception thrown by fn is rethrown on the calling thread after
//     every worker has joined.
//   - When a thread cannot be started, the calling thread works alongside the
//     threads already running and joins them before returning.
// Ownership/Lifetime:
//   - Threads live only for the duration of one map() call.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <type_traits>
#include <vector>

namespace thymus::support
{

class WorkerPool
{
  public:
    /// Starts one worker thread; may throw std::system_error.
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    /// @brief Create a pool running at most @p jobs threads (0 = hardware concurrency).
    explicit WorkerPool(unsigned jobs = 0, ThreadFactory factory = {})
        : jobs_(jobs), factory_(std::move(factory))
    {
        if (jobs_ == 0)
            jobs_ = std::max(1u, std::thread::hardware_concurrency());
        if (!factory_)
            factory_ = [](std::function<void()> body) { return std::thread(std::move(body)); };
    }

    [[nodiscard]] unsigned jobs() const noexcept
    {
        return jobs_;
    }

    /// @brief Apply @p fn to every element of @p inputs in parallel.
    /// @return Results in input order.
    template <class In, class Fn>
    auto map(const std::vector<In> &inputs, Fn fn) const
        -> std::vector<std::invoke_result_t<Fn &, const In &>>
    {
        using Out = std::invoke_result_t<Fn &, const In &>;
        std::vector<Out> results(inputs.size());
        if (inputs.empty())
            return results;

        const size_t threads = std::min<size_t>(jobs_, inputs.size());
        if (threads <= 1)
        {
            for (size_t i = 0; i < inputs.size(); ++i)
                results[i] = fn(inputs[i]);
            return results;
        }

        std::atomic<size_t> next{0};
        std::exception_ptr failure;
        std::mutex failureMu;

        auto worker = [&]()
        {
            for (;;)
            {
                const size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= inputs.size())
                    return;
                try
                {
                    results[i] = fn(inputs[i]);
                }
                catch (...)
                {
                    std::lock_guard<std::mutex> lock(failureMu);
                    if (!failure)
                        failure = std::current_exception();
                    next.store(inputs.size(), std::memory_order_relaxed);
                    return;
                }
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(threads);
        try
        {
            for (size_t t = 0; t < threads; ++t)
                pool.push_back(factory_(worker));
        }
        catch (const std::system_error &)
        {
            // Out of threads: drain the remaining indices here.
            worker();
        }
        catch (...)
        {
            for (auto &th : pool)
                th.join();
            throw;
        }
        for (auto &th : pool)
            th.join();

        if (failure)
            std::rethrow_exception(failure);
        return results;
    }

  private:
    unsigned jobs_;
    ThreadFactory factory_;
};

} // namespace thymus::support
