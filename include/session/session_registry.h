#pragma once

/**
 * @file session_registry.h
 * @brief Process-wide table of sessions keyed by session id
 *
 * The only state shared across connections. Each entry carries its own
 * mutex; the registry lock is held only for lookups and insertion.
 * A session id is attached to at most one connection at a time. Detached
 * entries keep their conversation context until the retention sweep.
 */

#include "core/types.h"
#include "errors.h"
#include "memory/conversation_memory.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace samaira {
namespace session {

struct SessionRegistryConfig {
    size_t max_sessions = constants::server::MAX_SESSIONS;
    int retention_minutes = constants::server::SESSION_RETENTION_MINUTES;
    memory::ConversationConfig memory;
};

/**
 * @brief One session: identity, conversation context and attachment
 */
class SessionEntry {
public:
    SessionEntry(const std::string& id, const memory::ConversationConfig& memory_config);

    const std::string& id() const { return id_; }
    memory::ConversationMemory& memory() { return *memory_; }

    bool attached() const;
    TimePoint last_activity() const;
    void touch();

private:
    friend class SessionRegistry;

    std::string id_;
    std::unique_ptr<memory::ConversationMemory> memory_;

    mutable std::mutex mutex_;
    bool attached_ = false;
    TimePoint last_activity_;
};

/**
 * @brief A successful attach
 */
struct Attachment {
    std::shared_ptr<SessionEntry> entry;
    bool resumed = false;  ///< The requested id existed and its context was kept
};

class SessionRegistry {
public:
    explicit SessionRegistry(const SessionRegistryConfig& config = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Attach a connection to a session
     *
     * A known, detached id is resumed. An unknown or absent id creates a new
     * entry under a fresh id.
     *
     * @return ProtocolViolation if the id is already attached,
     *         CapacityExceeded if max_sessions connections are attached
     */
    Result<Attachment> attach(const std::optional<std::string>& requested_id);

    /// Release the connection's hold; the entry is kept for the retention window
    void detach(const std::string& session_id);

    /**
     * @brief Remove detached entries idle longer than the retention window
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    /// Same, with an explicit retention window
    size_t cleanup_expired(Duration retention);

    std::shared_ptr<SessionEntry> find(const std::string& session_id) const;

    size_t attached_count() const;
    size_t size() const;

    /// Random 128-bit id in 8-4-4-4-12 hex form
    static std::string generate_id();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace session
} // namespace samaira
