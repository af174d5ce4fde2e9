#pragma once
#include "RequestContext.hpp"

#include <string>

struct FetchError
{
    enum class Kind { Canceled, DeadlineExceeded, Backend, Parse };

    Kind kind = Kind::Backend;
    std::string message;

    // canceled or timed out: never shown to the user
    bool isContextError() const { return kind == Kind::Canceled || kind == Kind::DeadlineExceeded; }

    static FetchError fromContext(ContextError e)
    {
        if (e == ContextError::DeadlineExceeded)
            return { Kind::DeadlineExceeded, contextErrorName(e) };
        return { Kind::Canceled, contextErrorName(ContextError::Canceled) };
    }
    static FetchError backend(std::string msg) { return { Kind::Backend, std::move(msg) }; }
    static FetchError parse(std::string msg) { return { Kind::Parse, std::move(msg) }; }
};
