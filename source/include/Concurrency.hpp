#pragma once

#include <algorithm>
#include <future>
#include <memory>
#include <type_traits>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// Runs fn(0) .. fn(count - 1) on a private pool and joins before returning.
// Results come back in index order; the first stored exception is rethrown
// only after every task has finished.
template <typename Fn>
auto fan_out(size_t count, unsigned max_threads, Fn fn) -> std::vector<std::invoke_result_t<Fn&, size_t>> {
    using Result = std::invoke_result_t<Fn&, size_t>;

    std::vector<Result> results;
    if (count == 0) return results;

    std::vector<std::future<Result>> futures;
    futures.reserve(count);

    {
        boost::asio::thread_pool pool(std::max<size_t>(1, std::min<size_t>(count, max_threads)));

        for (size_t i = 0; i < count; ++i) {
            auto task = std::make_shared<std::packaged_task<Result()>>([&fn, i] { return fn(i); });
            futures.push_back(task->get_future());
            boost::asio::post(pool, [task] { (*task)(); });
        }

        pool.join();
    }

    results.reserve(count);
    for (auto& f : futures) results.push_back(f.get());
    return results;
}
