#pragma once
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <type_traits>
#include <utility>

// Runs blocking backend calls (curl, sqlite) off the connection threads.
// The awaiting coroutine is suspended until the call finishes and resumes
// on its own executor; exceptions thrown by the call propagate to it.
class BlockingExecutor {
public:
    explicit BlockingExecutor(std::size_t threads) : pool_(threads) {}
    ~BlockingExecutor() { pool_.join(); }

    BlockingExecutor(const BlockingExecutor&) = delete;
    BlockingExecutor& operator=(const BlockingExecutor&) = delete;

    template <typename F>
    boost::asio::awaitable<std::invoke_result_t<F&>> run(F fn) {
        using R = std::invoke_result_t<F&>;
        co_return co_await boost::asio::co_spawn(
            pool_.get_executor(),
            [fn = std::move(fn)]() mutable -> boost::asio::awaitable<R> { co_return fn(); },
            boost::asio::use_awaitable);
    }

    void stop() { pool_.stop(); }
    void join() { pool_.join(); }

private:
    boost::asio::thread_pool pool_;
};
