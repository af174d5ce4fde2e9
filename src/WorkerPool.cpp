#include "WorkerPool.hpp"

#include <spdlog/spdlog.h>

WorkerPool::WorkerPool(size_t threads)
{
    if (threads == 0)
        threads = 1;
    _threads.reserve(threads);
    for (size_t i = 0; i < threads; ++i)
        _threads.emplace_back([this]() { workerLoop(); });
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_stop)
        {
            spdlog::warn("worker pool stopped, task dropped");
            return;
        }
        _tasks.push_back(std::move(task));
    }
    _cv.notify_one();
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_stop && _threads.empty())
            return;
        _stop = true;
    }
    _cv.notify_all();
    for (auto& t : _threads)
        if (t.joinable())
            t.join();
    _threads.clear();
}

void WorkerPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(_mtx);
            _cv.wait(lk, [this] { return _stop || !_tasks.empty(); });
            if (_tasks.empty())
                return;
            task = std::move(_tasks.front());
            _tasks.pop_front();
        }
        task();
    }
}
