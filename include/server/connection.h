#pragma once

/**
 * @file connection.h
 * @brief One websocket connection: handshake, read loop, outbound sink
 *
 * The connection thread reads client frames and feeds the session's turn
 * controller. Controller and pipeline threads write through send(), which
 * serializes writes on the socket.
 */

#include "core/config.h"
#include "protocol/message_sink.h"
#include "session/session_registry.h"
#include "session/turn_controller.h"
#include "vad/vad_interface.h"
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include <string>

namespace samaira {
namespace server {

/**
 * @brief Everything a connection shares with the rest of the server
 */
struct ServerContext {
    const Config& config;
    session::SessionRegistry& registry;
    session::Engines engines;
    std::function<std::unique_ptr<vad::IVAD>()> make_vad;
};

class Connection : public protocol::IMessageSink {
public:
    Connection(boost::asio::ip::tcp::socket socket, const ServerContext& context);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Upgrade, then serve messages until the peer goes away
     *
     * Blocks. On return the session's controller is closed and the session
     * is detached.
     */
    void run();

    bool send(const protocol::ServerMessage& message) override;

    /// Shut the socket down from any thread; run() returns soon after
    void close();

    /// run() has returned
    bool finished() const;

    const std::string& remote() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace server
} // namespace samaira
