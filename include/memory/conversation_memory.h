#pragma once

/**
 * @file conversation_memory.h
 * @brief Per-session conversation history
 *
 * Features:
 * - Bounded history (max messages)
 * - Token estimation and limiting
 * - Export to chat-API message arrays
 *
 * Thread-safe: a turn's pipeline thread appends while the registry reads stats.
 */

#include "core/types.h"
#include "core/constants.h"
#include <string>
#include <vector>
#include <memory>

namespace samaira {
namespace memory {

/**
 * @brief Configuration for conversation memory
 */
struct ConversationConfig {
    /// Maximum messages to keep in history (system prompt not counted)
    size_t max_messages = constants::memory::MAX_HISTORY_MESSAGES;

    /// Maximum estimated tokens before pruning old messages
    size_t max_tokens = constants::memory::MAX_HISTORY_TOKENS;

    /// System prompt (always first message)
    std::string system_prompt = "You are a helpful assistant.";
};

/**
 * @brief Single message in conversation
 */
struct ConversationMessage {
    MessageRole role = MessageRole::User;
    std::string content;
    int64_t timestamp_ms = 0;

    /// Estimate token count for this message
    size_t estimated_tokens() const;

    static ConversationMessage system(const std::string& content);
    static ConversationMessage user(const std::string& content);
    static ConversationMessage assistant(const std::string& content);
};

/// Ordered messages handed to the language model (system prompt first)
using ConversationContext = std::vector<ConversationMessage>;

/// "system" / "user" / "assistant"
const char* role_name(MessageRole role);

/// Serialize as a JSON array of {role, content} objects
std::string context_to_json(const ConversationContext& context);

/**
 * @brief Conversation memory manager
 */
class ConversationMemory {
public:
    explicit ConversationMemory(const ConversationConfig& config = {});
    ~ConversationMemory();

    // Non-copyable
    ConversationMemory(const ConversationMemory&) = delete;
    ConversationMemory& operator=(const ConversationMemory&) = delete;

    // =========================================================================
    // Message Management
    // =========================================================================

    void add_user_message(const std::string& content);
    void add_assistant_message(const std::string& content);

    /**
     * @brief Append one finished turn atomically
     *
     * An empty reply (turn failed before any token) stores only the user text.
     */
    void add_turn(const std::string& user_text, const std::string& reply_text);

    /// Clear all messages (except system prompt)
    void clear();

    // =========================================================================
    // Query
    // =========================================================================

    /// All messages including the system prompt
    ConversationContext get_messages() const;

    /// System prompt plus the last n messages
    ConversationContext get_recent_messages(size_t n) const;

    /// Message count (excluding system prompt)
    size_t message_count() const;

    size_t estimated_tokens() const;

    /// Check if empty (only system prompt)
    bool is_empty() const;

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_system_prompt(const std::string& prompt);
    std::string get_system_prompt() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memory
} // namespace samaira
