#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <chrono>
#include <expected>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <string_view>
#include <type_traits>

namespace net = boost::asio;

class ThreadPool
{
public:
    enum class errc { stopped, timeout };

    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Runs fn on a worker and waits at most `timeout` for it. On timeout the
    // task keeps running to completion on its worker; its result is dropped.
    // Exceptions thrown by fn are rethrown to the caller.
    template<class Fn>
    auto submit_for(Fn&& fn, std::chrono::milliseconds timeout)
        -> std::expected<std::invoke_result_t<Fn>, errc>
    {
        using Ret = std::invoke_result_t<Fn>;

        if (!running)
        {
            return std::unexpected(errc::stopped);
        }

        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();

        net::post(pool_exec, [task] { std::invoke(*task); });

        if (fut.wait_for(timeout) != std::future_status::ready)
        {
            return std::unexpected(errc::timeout);
        }

        if constexpr (std::is_void_v<Ret>)
        {
            fut.get();
            return {};
        }
        else
        {
            return fut.get();
        }
    }

    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::atomic<bool> running{true};

    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};

[[nodiscard]] std::string_view to_string(ThreadPool::errc e);
