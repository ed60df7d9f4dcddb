/**
 * @file conversation_memory.cpp
 * @brief Conversation memory implementation
 */

#include "memory/conversation_memory.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace samaira {
namespace memory {

// =============================================================================
// ConversationMessage Implementation
// =============================================================================

size_t ConversationMessage::estimated_tokens() const {
    // Rough estimation: ~4 characters per token
    return static_cast<size_t>(content.size() * constants::memory::TOKENS_PER_CHAR) + 4; // +4 for role tokens
}

ConversationMessage ConversationMessage::system(const std::string& content) {
    return ConversationMessage{MessageRole::System, content, now_ms()};
}

ConversationMessage ConversationMessage::user(const std::string& content) {
    return ConversationMessage{MessageRole::User, content, now_ms()};
}

ConversationMessage ConversationMessage::assistant(const std::string& content) {
    return ConversationMessage{MessageRole::Assistant, content, now_ms()};
}

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

std::string context_to_json(const ConversationContext& context) {
    json messages_json = json::array();
    for (const auto& msg : context) {
        messages_json.push_back({{"role", role_name(msg.role)}, {"content", msg.content}});
    }
    return messages_json.dump();
}

// =============================================================================
// ConversationMemory Implementation
// =============================================================================

class ConversationMemory::Impl {
public:
    explicit Impl(const ConversationConfig& config)
        : config_(config)
        , system_message_(ConversationMessage::system(config.system_prompt))
    {
        std::ostringstream oss;
        oss << "ConversationMemory initialized: max_messages=" << config.max_messages
            << ", max_tokens=" << config.max_tokens;
        LOG_DEBUG(oss.str());
    }

    void add_message(ConversationMessage msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(msg));
        prune_if_needed();
    }

    void add_turn(const std::string& user_text, const std::string& reply_text) {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(ConversationMessage::user(user_text));
        if (!reply_text.empty()) {
            messages_.push_back(ConversationMessage::assistant(reply_text));
        }
        prune_if_needed();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    ConversationContext get_messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ConversationContext result;
        result.reserve(messages_.size() + 1);
        result.push_back(system_message_);
        result.insert(result.end(), messages_.begin(), messages_.end());
        return result;
    }

    ConversationContext get_recent_messages(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        ConversationContext result;
        result.push_back(system_message_);

        size_t start = messages_.size() > n ? messages_.size() - n : 0;
        result.insert(result.end(), messages_.begin() + start, messages_.end());
        return result;
    }

    size_t message_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    size_t estimated_tokens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return estimated_tokens_locked();
    }

    bool is_empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.empty();
    }

    void set_system_prompt(const std::string& prompt) {
        std::lock_guard<std::mutex> lock(mutex_);
        system_message_.content = prompt;
    }

    std::string get_system_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return system_message_.content;
    }

private:
    size_t estimated_tokens_locked() const {
        size_t total = system_message_.estimated_tokens();
        for (const auto& msg : messages_) {
            total += msg.estimated_tokens();
        }
        return total;
    }

    void prune_if_needed() {
        // Prune by message count
        while (messages_.size() > config_.max_messages) {
            messages_.erase(messages_.begin());
        }

        // Prune by token count, always keeping the newest message
        while (estimated_tokens_locked() > config_.max_tokens && messages_.size() > 1) {
            LOG_DEBUG("Pruning oldest message (max tokens exceeded)");
            messages_.erase(messages_.begin());
        }
    }

    ConversationConfig config_;
    mutable std::mutex mutex_;
    ConversationMessage system_message_;
    std::vector<ConversationMessage> messages_;
};

// =============================================================================
// Public Interface
// =============================================================================

ConversationMemory::ConversationMemory(const ConversationConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

ConversationMemory::~ConversationMemory() = default;

void ConversationMemory::add_user_message(const std::string& content) {
    impl_->add_message(ConversationMessage::user(content));
}

void ConversationMemory::add_assistant_message(const std::string& content) {
    impl_->add_message(ConversationMessage::assistant(content));
}

void ConversationMemory::add_turn(const std::string& user_text, const std::string& reply_text) {
    impl_->add_turn(user_text, reply_text);
}

void ConversationMemory::clear() {
    impl_->clear();
}

ConversationContext ConversationMemory::get_messages() const {
    return impl_->get_messages();
}

ConversationContext ConversationMemory::get_recent_messages(size_t n) const {
    return impl_->get_recent_messages(n);
}

size_t ConversationMemory::message_count() const {
    return impl_->message_count();
}

size_t ConversationMemory::estimated_tokens() const {
    return impl_->estimated_tokens();
}

bool ConversationMemory::is_empty() const {
    return impl_->is_empty();
}

void ConversationMemory::set_system_prompt(const std::string& prompt) {
    impl_->set_system_prompt(prompt);
}

std::string ConversationMemory::get_system_prompt() const {
    return impl_->get_system_prompt();
}

} // namespace memory
} // namespace samaira
