#pragma once
#include "FetchError.hpp"
#include "RequestContext.hpp"
#include "model.hpp"

#include <string>
#include <vector>

struct ChatReply
{
    std::string conversationId;
    ChatMessage message;
};

/// @brief Conversational assistant backend. The whole history is sent each turn;
/// the first user message carries a summary of the current view.
class ChatClient
{
public:
    virtual ~ChatClient() = default;
    virtual bool converse(const RequestContext& ctx, const std::string& conversationId, const std::vector<ChatMessage>& history, ChatReply& out, FetchError* outError) = 0;
};
