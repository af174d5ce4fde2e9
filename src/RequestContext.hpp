#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

enum class ContextError : int { None = 0, Canceled, DeadlineExceeded };

const char* contextErrorName(ContextError e);

/// @brief Cancellation token with a deadline, shared by the event loop and one worker.
/// Cancellation is cooperative: the worker polls err() or blocks in waitFor().
class RequestContext
{
public:
    using Clock = std::chrono::steady_clock;

    explicit RequestContext(Clock::duration timeout);
    RequestContext();

    static std::shared_ptr<RequestContext> withTimeout(Clock::duration timeout);
    // no deadline
    static std::shared_ptr<RequestContext> background();

    void cancel();
    ContextError err() const;
    bool done() const { return err() != ContextError::None; }

    bool hasDeadline() const { return _hasDeadline; }
    Clock::time_point deadline() const { return _deadline; }

    // Blocks until the context is done or `d` elapsed. Returns err().
    ContextError waitFor(Clock::duration d) const;

private:
    void settle(ContextError e) const;

private:
    Clock::time_point _deadline;
    bool _hasDeadline;
    // first terminal state wins
    mutable std::atomic<int> _err;
    mutable std::mutex _mtx;
    mutable std::condition_variable _cv;
};
