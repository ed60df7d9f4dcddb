#pragma once

/**
 * @file voice_server.h
 * @brief Websocket accept loop, per-connection threads, retention sweep
 */

#include "core/config.h"
#include "errors.h"
#include "session/turn_controller.h"
#include <cstdint>
#include <memory>

namespace samaira {
namespace server {

class VoiceServer {
public:
    VoiceServer(const Config& config, session::Engines engines);
    ~VoiceServer();

    VoiceServer(const VoiceServer&) = delete;
    VoiceServer& operator=(const VoiceServer&) = delete;

    /**
     * @brief Bind and listen on server.host:server.port
     * @return TransportClosed if the address cannot be bound
     */
    Result<void> start();

    /**
     * @brief Accept connections until stop(); then close every connection
     *        and wait for their threads
     */
    void run();

    /// Async-signal-safe: flags the loop and unblocks accept()
    void stop();

    /// Port actually bound (useful when configured as 0)
    uint16_t port() const;

    size_t active_connections() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace server
} // namespace samaira
