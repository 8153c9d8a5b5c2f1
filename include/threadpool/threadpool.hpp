#pragma once

#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <format>
#include <type_traits>

namespace net = boost::asio;

/**
 * Fixed set of workers draining one io_context.
 * submit() blocks the caller until the task has run on a worker.
 */
class ThreadPool
{
public:
    // 0 picks hardware_concurrency (at least 1)
    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<class Fn>
    auto submit(Fn&& fn) -> std::expected<std::invoke_result_t<Fn>, std::string>
    {
        using Ret = std::invoke_result_t<Fn>;

        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();

        {
            // stop() flips running under the same lock, so a posted task always has workers.
            std::lock_guard<std::mutex> lock(post_mtx);
            if (!running)
            {
                return std::unexpected("ThreadPool stopped");
            }
            net::post(pool_ctx, [task] { (*task)(); });
        }

        try
        {
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
        catch (const std::future_error&)
        {
            // Pool stopped before the task ran
            return std::unexpected("ThreadPool stopped");
        }
        catch (const std::exception& e)
        {
            return std::unexpected(std::format("Task failed: {}", e.what()));
        }
    }

    [[nodiscard]] size_t size() const { return workers.size(); }
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::mutex post_mtx;
    bool running = true;
};
