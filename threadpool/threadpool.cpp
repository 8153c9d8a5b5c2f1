#include "threadpool/threadpool.hpp"

#include <algorithm>

namespace
{

size_t resolve_threads(size_t n)
{
    if (n != 0)
    {
        return n;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

}

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(resolve_threads(n_threads))
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

void ThreadPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(post_mtx);
        if (!running)
        {
            return;
        }
        running = false;
    }

    // Let already-posted tasks finish so no submit() caller waits forever.
    work_guard.reset();

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}
