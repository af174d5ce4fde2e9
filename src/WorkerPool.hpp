#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Where FetchPipeline runs backend calls.
class Executor
{
public:
    virtual ~Executor() = default;
    virtual void submit(std::function<void()> task) = 0;
};

/// @brief Fixed set of threads draining a FIFO of tasks.
class WorkerPool : public Executor
{
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task) override;
    // Finishes queued tasks, then joins.
    void shutdown();

    size_t size() const { return _threads.size(); }

private:
    void workerLoop();

private:
    std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<std::function<void()>> _tasks;
    bool _stop = false;
    std::vector<std::thread> _threads;
};
