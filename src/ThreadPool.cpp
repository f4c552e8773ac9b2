#include "starfit/ThreadPool.hpp"
#include <algorithm>

namespace starfit {

ThreadPool::ThreadPool(unsigned nthreads, std::function<void()> init)
{
    nthreads = std::max(1u, nthreads);     // hardware_concurrency() may report 0
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i)
        workers_.emplace_back([this, init] { worker_loop(init); });
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    // workers drain the queue before they exit
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

/* runs queued tasks until stopped and the queue is empty */
void ThreadPool::worker_loop(const std::function<void()>& init)
{
    if (init) init();
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lk(mtx_);
            cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) return;          // stop_ is set
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace starfit
