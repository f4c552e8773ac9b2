#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <memory>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace starfit {

/*
 * Fixed set of jthread workers fed from one FIFO queue.  `init` runs once
 * on every worker before it takes tasks (per-thread settings such as the
 * OpenMP team size).
 */
class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = std::thread::hardware_concurrency(),
                        std::function<void()> init = {});
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /*
     * f(0) ... f(n-1) on the workers, results in index order.  Waits for
     * every task before rethrowing the first exception, so nothing that
     * f references is still in use when this returns.
     */
    template <class F>
    auto map(std::size_t n, F&& f)
        -> std::vector<std::invoke_result_t<F, std::size_t>>;

private:
    void worker_loop(const std::function<void()>& init);

    std::vector<std::jthread>         workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mtx_;
    std::condition_variable           cv_;
    bool                              stop_ = false;
};

template <class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using Ret = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        if (stop_) throw std::runtime_error("ThreadPool: enqueue on a stopped pool");
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

template <class F>
auto ThreadPool::map(std::size_t n, F&& f)
    -> std::vector<std::invoke_result_t<F, std::size_t>>
{
    using Ret = std::invoke_result_t<F, std::size_t>;
    std::vector<std::future<Ret>> futs;
    futs.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        futs.push_back(enqueue([&f, i] { return f(i); }));

    std::vector<Ret>   out;
    std::exception_ptr first;
    out.reserve(n);
    for (auto& fu : futs) {
        try {
            out.push_back(fu.get());
        } catch (...) {
            if (!first) first = std::current_exception();
            out.push_back(Ret{});
        }
    }
    if (first) std::rethrow_exception(first);
    return out;
}

} // namespace starfit
