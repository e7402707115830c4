#include "threadpool/threadpool.hpp"

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(n_threads == 0 ? 1 : n_threads)
{
    for (auto& t : workers)
    {
        t = std::jthread([this] { pool_ctx.run(); });
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

// Blocks until the in-flight handlers return; queued ones are discarded.
void ThreadPool::stop()
{
    if (bool was_running = running.exchange(false); !was_running)
    {
        return;
    }

    work_guard.reset();
    pool_ctx.stop();

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

std::string_view to_string(ThreadPool::errc e)
{
    switch (e)
    {
        case ThreadPool::errc::stopped: return "thread pool stopped";
        case ThreadPool::errc::timeout: return "timed out";
    }
    return "unknown";
}
