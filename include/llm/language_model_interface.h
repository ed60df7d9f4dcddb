#pragma once

/**
 * @file language_model_interface.h
 * @brief Streaming language-model interface
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include "memory/conversation_memory.h"
#include <string>

namespace samaira {
namespace llm {

class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    /**
     * @brief Stream a reply token by token
     * @param context Prior conversation, system prompt first
     * @param user_text The new user turn
     * @param on_token Called for every token, in order, on the calling thread
     * @param cancel Polled between tokens; aborts the request when set
     * @return Ok when the stream ended normally
     */
    virtual Result<void> generate(const memory::ConversationContext& context,
                                  const std::string& user_text,
                                  const TokenCallback& on_token,
                                  const CancellationToken& cancel) = 0;

    virtual bool is_ready() const = 0;
};

} // namespace llm
} // namespace samaira
