#include "RequestContext.hpp"

const char* contextErrorName(ContextError e)
{
    switch (e)
    {
        case ContextError::Canceled:         return "context canceled";
        case ContextError::DeadlineExceeded: return "context deadline exceeded";
        default:                             return "none";
    }
}

RequestContext::RequestContext(Clock::duration timeout)
    : _deadline{ Clock::now() + timeout }
    , _hasDeadline{ true }
    , _err{ static_cast<int>(ContextError::None) }
{
}

RequestContext::RequestContext()
    : _deadline{}
    , _hasDeadline{ false }
    , _err{ static_cast<int>(ContextError::None) }
{
}

std::shared_ptr<RequestContext> RequestContext::withTimeout(Clock::duration timeout)
{
    return std::make_shared<RequestContext>(timeout);
}

std::shared_ptr<RequestContext> RequestContext::background()
{
    return std::make_shared<RequestContext>();
}

void RequestContext::settle(ContextError e) const
{
    int expected = static_cast<int>(ContextError::None);
    if (_err.compare_exchange_strong(expected, static_cast<int>(e)))
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _cv.notify_all();
    }
}

void RequestContext::cancel()
{
    if (_hasDeadline && Clock::now() >= _deadline)
        settle(ContextError::DeadlineExceeded);
    else
        settle(ContextError::Canceled);
}

ContextError RequestContext::err() const
{
    auto cur = static_cast<ContextError>(_err.load());
    if (cur != ContextError::None)
        return cur;
    if (_hasDeadline && Clock::now() >= _deadline)
    {
        settle(ContextError::DeadlineExceeded);
        return static_cast<ContextError>(_err.load());
    }
    return ContextError::None;
}

ContextError RequestContext::waitFor(Clock::duration d) const
{
    auto until = Clock::now() + d;
    if (_hasDeadline && _deadline < until)
        until = _deadline;

    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait_until(lk, until, [&] { return static_cast<ContextError>(_err.load()) != ContextError::None; });
    lk.unlock();
    return err();
}
