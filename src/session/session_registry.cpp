/**
 * @file session_registry.cpp
 * @brief Session table with per-entry locking and retention sweep
 */

#include "session/session_registry.h"
#include "logger.h"
#include <cstdio>
#include <random>
#include <unordered_map>

namespace samaira {
namespace session {

// =============================================================================
// SessionEntry
// =============================================================================

SessionEntry::SessionEntry(const std::string& id, const memory::ConversationConfig& memory_config)
    : id_(id)
    , memory_(std::make_unique<memory::ConversationMemory>(memory_config))
    , last_activity_(Clock::now()) {}

bool SessionEntry::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_;
}

TimePoint SessionEntry::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

void SessionEntry::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = Clock::now();
}

// =============================================================================
// SessionRegistry
// =============================================================================

class SessionRegistry::Impl {
public:
    explicit Impl(const SessionRegistryConfig& config) : config_(config) {}

    Result<Attachment> attach(const std::optional<std::string>& requested_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (attached_count_locked() >= config_.max_sessions) {
            Logger::warn("[Session] Rejecting start: " + std::to_string(config_.max_sessions) +
                         " sessions already attached");
            return make_capacity_error("Server is at capacity (" +
                                       std::to_string(config_.max_sessions) + " sessions)");
        }

        if (requested_id && !requested_id->empty()) {
            auto it = entries_.find(*requested_id);
            if (it != entries_.end()) {
                auto entry = it->second;
                std::lock_guard<std::mutex> entry_lock(entry->mutex_);
                if (entry->attached_) {
                    return make_protocol_error("Session " + *requested_id +
                                               " is already attached to another connection");
                }
                entry->attached_ = true;
                entry->last_activity_ = Clock::now();
                LOG_SESSION("Resumed session " + entry->id_ + " (" +
                            std::to_string(entry->memory_->message_count()) + " messages)");
                return Attachment{entry, true};
            }
            LOG_SESSION("Unknown session " + *requested_id + ", creating a new one");
        }

        std::string id = generate_id();
        while (entries_.count(id) > 0) {
            id = generate_id();
        }
        auto entry = std::make_shared<SessionEntry>(id, config_.memory);
        entry->attached_ = true;
        entries_[id] = entry;
        LOG_SESSION("Created session " + id);
        return Attachment{entry, false};
    }

    void detach(const std::string& session_id) {
        std::shared_ptr<SessionEntry> entry = find(session_id);
        if (!entry) return;

        std::lock_guard<std::mutex> entry_lock(entry->mutex_);
        entry->attached_ = false;
        entry->last_activity_ = Clock::now();
        LOG_SESSION("Detached session " + session_id);
    }

    size_t cleanup_expired(Duration retention) {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimePoint now = Clock::now();
        size_t removed = 0;

        for (auto it = entries_.begin(); it != entries_.end();) {
            bool expired = false;
            {
                std::lock_guard<std::mutex> entry_lock(it->second->mutex_);
                expired = !it->second->attached_ && now - it->second->last_activity_ >= retention;
            }
            if (expired) {
                LOG_SESSION("Expired session " + it->first);
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::shared_ptr<SessionEntry> find(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(session_id);
        return it == entries_.end() ? nullptr : it->second;
    }

    size_t attached_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attached_count_locked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    const SessionRegistryConfig& config() const { return config_; }

private:
    size_t attached_count_locked() const {
        size_t count = 0;
        for (const auto& kv : entries_) {
            if (kv.second->attached()) count++;
        }
        return count;
    }

    SessionRegistryConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionEntry>> entries_;
};

SessionRegistry::SessionRegistry(const SessionRegistryConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

SessionRegistry::~SessionRegistry() = default;

Result<Attachment> SessionRegistry::attach(const std::optional<std::string>& requested_id) {
    return impl_->attach(requested_id);
}

void SessionRegistry::detach(const std::string& session_id) {
    impl_->detach(session_id);
}

size_t SessionRegistry::cleanup_expired() {
    return impl_->cleanup_expired(std::chrono::minutes(impl_->config().retention_minutes));
}

size_t SessionRegistry::cleanup_expired(Duration retention) {
    return impl_->cleanup_expired(retention);
}

std::shared_ptr<SessionEntry> SessionRegistry::find(const std::string& session_id) const {
    return impl_->find(session_id);
}

size_t SessionRegistry::attached_count() const {
    return impl_->attached_count();
}

size_t SessionRegistry::size() const {
    return impl_->size();
}

std::string SessionRegistry::generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    const uint64_t hi = gen();
    const uint64_t lo = gen();

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace session
} // namespace samaira
