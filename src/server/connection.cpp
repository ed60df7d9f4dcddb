/**
 * @file connection.cpp
 * @brief Websocket connection serving one session
 */

#include "server/connection.h"
#include "logger.h"
#include "protocol/codec.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <mutex>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace samaira {
namespace server {

namespace {

/// Largest inbound message; an audio_chunk is a few KB
constexpr size_t MAX_MESSAGE_BYTES = 1 << 20;

std::string endpoint_string(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

bool is_normal_close(const beast::error_code& ec) {
    return ec == websocket::error::closed || ec == net::error::eof ||
           ec == net::error::connection_reset || ec == net::error::operation_aborted ||
           ec == net::error::not_connected || ec == net::error::broken_pipe;
}

} // anonymous namespace

class Connection::Impl {
public:
    Impl(Connection& owner, tcp::socket socket, const ServerContext& context)
        : owner_(owner)
        , context_(context)
        , remote_(endpoint_string(socket))
        , ws_(std::move(socket))
        , frame_samples_(context.config.audio.samples_per_frame())
        , closed_(false)
        , finished_(false)
        , close_requested_(false) {}

    void run() {
        try {
            if (upgrade()) {
                LOG_NET("Connection opened from " + remote_);
                read_loop();
            }
        } catch (const beast::system_error& e) {
            if (!is_normal_close(e.code())) {
                Logger::warn("[Net] Connection " + remote_ + " failed: " + e.code().message());
            }
        } catch (const std::exception& e) {
            Logger::error("[Net] Connection " + remote_ + " error: " + e.what());
        }

        teardown();
    }

    bool send(const protocol::ServerMessage& message) {
        std::string text = protocol::encode(message);

        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_) return false;

        beast::error_code ec;
        ws_.text(true);
        ws_.write(net::buffer(text), ec);
        if (ec) {
            closed_ = true;
            if (!is_normal_close(ec)) {
                Logger::warn("[Net] Write to " + remote_ + " failed: " + ec.message());
            }
            shutdown_socket();
            return false;
        }
        return true;
    }

    void close() {
        shutdown_socket();
    }

    bool finished() const { return finished_.load(); }

    const std::string& remote() const { return remote_; }

private:
    // =========================================================================
    // Handshake
    // =========================================================================

    /// Read the HTTP request; only an upgrade on the configured path is accepted
    bool upgrade() {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(ws_.next_layer(), buffer, req);

        const std::string& path = context_.config.server.path;
        std::string target(req.target());
        if (!websocket::is_upgrade(req) || target != path) {
            Logger::warn("[Net] Rejecting " + std::string(req.method_string()) + " " + target +
                         " from " + remote_);
            http::response<http::string_body> res{http::status::not_found, req.version()};
            res.set(http::field::server, "samaira");
            res.set(http::field::content_type, "text/plain");
            res.body() = "Websocket endpoint is " + path + "\n";
            res.keep_alive(false);
            res.prepare_payload();
            beast::error_code ec;
            http::write(ws_.next_layer(), res, ec);
            return false;
        }

        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "samaira");
            }));
        ws_.read_message_max(MAX_MESSAGE_BYTES);
        ws_.accept(req);
        return true;
    }

    // =========================================================================
    // Inbound
    // =========================================================================

    void read_loop() {
        while (!close_requested_) {
            beast::flat_buffer buffer;
            beast::error_code ec;
            ws_.read(buffer, ec);
            if (ec) {
                if (!is_normal_close(ec)) {
                    Logger::warn("[Net] Read from " + remote_ + " failed: " + ec.message());
                }
                break;
            }

            if (!ws_.got_text()) {
                reject(make_protocol_error("Binary frames are not supported"));
                continue;
            }
            handle_text(beast::buffers_to_string(buffer.data()));
        }

        if (close_requested_) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!closed_) {
                beast::error_code ec;
                ws_.close(websocket::close_code::try_again_later, ec);
                closed_ = true;
            }
        }
    }

    void handle_text(const std::string& text) {
        auto decoded = protocol::decode_client(text, frame_samples_);
        if (!decoded) {
            reject(decoded.error());
            return;
        }
        std::visit([this](auto& message) { on_message(message); }, decoded.value());
    }

    void on_message(protocol::Start& start) {
        if (controller_) {
            reject(make_protocol_error("Session " + entry_->id() + " already started on this connection"));
            return;
        }

        auto attached = context_.registry.attach(start.session_id);
        if (!attached) {
            reject(attached.error());
            if (attached.error().type == ErrorType::CapacityExceeded) {
                close_requested_ = true;
            }
            return;
        }

        entry_ = attached.value().entry;
        send(protocol::SessionAssigned{entry_->id(), attached.value().resumed});

        controller_ = std::make_unique<session::TurnController>(
            session::TurnControllerConfig::from(context_.config),
            context_.make_vad(),
            context_.engines,
            entry_->memory(),
            owner_,
            entry_->id());
        controller_->set_idle_timeout_callback([this] { shutdown_socket(); });
        LOG_NET("Session " + entry_->id() + " bound to " + remote_);
    }

    void on_message(protocol::AudioChunk& chunk) {
        if (!controller_) {
            reject(make_protocol_error("audio_chunk received before start"));
            return;
        }
        entry_->touch();
        controller_->post_audio(std::move(chunk.frame));
    }

    void on_message(protocol::Stop&) {
        if (controller_) {
            controller_->post_stop();
        }
    }

    void reject(const Error& error) {
        Logger::warn("[Net] " + std::string(error_kind_name(error.type)) + " from " + remote_ +
                     ": " + error.message);
        send(protocol::ErrorMessage::from(error));
    }

    // =========================================================================
    // Teardown
    // =========================================================================

    void teardown() {
        if (controller_) {
            controller_->close();
            controller_.reset();
        }
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            closed_ = true;
        }
        shutdown_socket();
        if (entry_) {
            context_.registry.detach(entry_->id());
            entry_.reset();
        }
        LOG_NET("Connection closed: " + remote_);
        finished_ = true;
    }

    void shutdown_socket() {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).shutdown(tcp::socket::shutdown_both, ec);
    }

    Connection& owner_;
    const ServerContext& context_;
    std::string remote_;
    websocket::stream<tcp::socket> ws_;
    size_t frame_samples_;

    std::mutex write_mutex_;
    bool closed_;
    std::atomic<bool> finished_;
    bool close_requested_;

    std::shared_ptr<session::SessionEntry> entry_;
    std::unique_ptr<session::TurnController> controller_;
};

Connection::Connection(tcp::socket socket, const ServerContext& context)
    : impl_(std::make_unique<Impl>(*this, std::move(socket), context)) {}

Connection::~Connection() = default;

void Connection::run() {
    impl_->run();
}

bool Connection::send(const protocol::ServerMessage& message) {
    return impl_->send(message);
}

void Connection::close() {
    impl_->close();
}

bool Connection::finished() const {
    return impl_->finished();
}

const std::string& Connection::remote() const {
    return impl_->remote();
}

} // namespace server
} // namespace samaira
