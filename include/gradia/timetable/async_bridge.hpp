#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace gradia::timetable {

using boost::asio::awaitable;

/// Fixed-size worker pool for blocking browser work. Coroutine callers
/// await the result without ever blocking their own executor.
class AsyncBridge {
public:
    explicit AsyncBridge(size_t threads);
    ~AsyncBridge();

    AsyncBridge(const AsyncBridge&) = delete;
    AsyncBridge& operator=(const AsyncBridge&) = delete;

    /// Run `fn` on a worker; the awaiting coroutine resumes on its own
    /// executor. Exceptions thrown by `fn` are rethrown to the awaiter.
    template <typename F>
    auto run(F fn) -> awaitable<std::invoke_result_t<F&>> {
        using R = std::invoke_result_t<F&>;
        co_return co_await boost::asio::co_spawn(
            pool_,
            [f = std::move(fn)]() mutable -> awaitable<R> { co_return f(); },
            boost::asio::use_awaitable);
    }

    /// Run `fn` on a worker and hand back a future, for callers that are
    /// not coroutines.
    template <typename F>
    auto submit(F fn) -> std::future<std::invoke_result_t<F&>> {
        using R = std::invoke_result_t<F&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task] { (*task)(); });
        return future;
    }

    /// Wait for every queued and running job to finish.
    void join();

    [[nodiscard]] auto thread_count() const -> size_t { return threads_; }

private:
    size_t threads_;
    boost::asio::thread_pool pool_;
};

} // namespace gradia::timetable
