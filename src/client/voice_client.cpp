/**
 * @file voice_client.cpp
 * @brief Websocket voice client
 */

#include "client/voice_client.h"
#include "client/audio_io.h"
#include "client/playback_sequencer.h"
#include "client/resampler.h"
#include "logger.h"
#include "path_utils.h"
#include "protocol/codec.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace samaira {
namespace client {

namespace {

/// Capture queue poll interval
constexpr int READ_BLOCK_TIMEOUT_MS = 100;

} // anonymous namespace

Result<WsUrl> parse_ws_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return make_config_error("Unsupported server URL (expected ws://): " + url);
    }

    WsUrl out;
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.target = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (out.port.empty() || out.port.find_first_not_of("0123456789") != std::string::npos) {
            return make_config_error("Invalid port in server URL: " + url);
        }
    }
    out.host = authority;
    if (out.host.empty()) {
        return make_config_error("Missing host in server URL: " + url);
    }
    return out;
}

class VoiceClient::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config)
        , ws_(ioc_)
        , sequencer_(audio_)
        , session_file_(expand_path(config.client.session_file))
        , stop_requested_(false)
        , closed_(false)
        , listening_(true) {
        audio_.set_playback_finished_callback([this] { sequencer_.on_playback_finished(); });
        sequencer_.set_caught_up_callback([this](uint64_t turn) {
            LOG_AUDIO("Playback caught up for turn " + std::to_string(turn));
            // A later turn may already be queued behind this one
            if (sequencer_.is_idle()) {
                listening_ = true;
            }
        });
    }

    ~Impl() {
        close();
        if (reader_.joinable()) {
            reader_.join();
        }
        audio_.stop();
    }

    Result<void> connect() {
        auto url = parse_ws_url(config_.client.server_url);
        if (!url) return url.error();
        const WsUrl& target = url.value();

        try {
            tcp::resolver resolver{ioc_};
            auto const results = resolver.resolve(target.host, target.port);
            net::connect(ws_.next_layer(), results.begin(), results.end());

            ws_.set_option(websocket::stream_base::decorator(
                [](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent, "samaira-client");
                }));
            ws_.handshake(target.host + ":" + target.port, target.target);
        } catch (const beast::system_error& e) {
            return make_error(ErrorType::TransportClosed,
                              "Could not connect to " + config_.client.server_url + ": " + e.code().message());
        }
        LOG_NET("Connected to " + config_.client.server_url);

        protocol::Start start;
        std::string saved = read_first_line(session_file_);
        if (!saved.empty()) {
            start.session_id = saved;
        }
        if (!send(start)) {
            return make_error(ErrorType::TransportClosed, "Connection closed before start");
        }

        reader_ = std::thread([this] { read_loop(); });
        return {};
    }

    Result<void> run() {
        if (!audio_.start(config_.client.input_device, config_.client.output_device,
                          config_.audio.sample_rate)) {
            return make_fatal_error("Could not open audio devices");
        }

        ResamplerConfig rcfg;
        rcfg.input_rate = audio_.input_sample_rate();
        rcfg.output_rate = config_.audio.sample_rate;
        rcfg.frame_ms = config_.audio.frame_ms;
        Resampler resampler(rcfg);
        Logger::info("Listening (capture " + std::to_string(rcfg.input_rate) + " Hz). Press Ctrl-C to quit.");

        std::vector<float> block;
        while (!stop_requested_ && !closed_) {
            if (!audio_.read_block(block, READ_BLOCK_TIMEOUT_MS)) {
                continue;
            }
            for (auto& frame : resampler.push(block)) {
                // Frames captured while the reply plays are dropped
                if (!listening_) continue;
                if (!send(protocol::AudioChunk{std::move(frame)})) break;
            }
        }

        if (stop_requested_ && !closed_) {
            Logger::info("Stopping");
            send(protocol::Stop{});
            sequencer_.clear();
            audio_.stop_playback();
        }
        close();
        if (reader_.joinable()) {
            reader_.join();
        }
        audio_.stop();
        return {};
    }

    void request_stop() {
        stop_requested_ = true;
    }

private:
    bool send(const protocol::ClientMessage& message) {
        std::string text = protocol::encode(message);
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_) return false;

        beast::error_code ec;
        ws_.text(true);
        ws_.write(net::buffer(text), ec);
        if (ec) {
            Logger::warn("[Net] Send failed: " + ec.message());
            closed_ = true;
            return false;
        }
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_) return;
        closed_ = true;

        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
        if (ec && ec != websocket::error::closed) {
            LOG_NET("Close: " + ec.message());
            beast::get_lowest_layer(ws_).shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    void read_loop() {
        beast::flat_buffer buffer;
        while (true) {
            beast::error_code ec;
            ws_.read(buffer, ec);
            if (ec) {
                if (!closed_.exchange(true)) {
                    Logger::warn("[Net] Connection closed by server: " + ec.message());
                }
                break;
            }

            std::string text = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());

            auto decoded = protocol::decode_server(text);
            if (!decoded) {
                Logger::warn("[Net] Ignoring message: " + decoded.error().message);
                continue;
            }
            std::visit([this](auto& msg) { on_message(msg); }, decoded.value());
        }
    }

    void on_message(protocol::SessionAssigned& msg) {
        LOG_SESSION(std::string(msg.resumed ? "Resumed" : "Assigned") + " session " + msg.session_id);
        if (!session_file_.empty() && !write_text_file(session_file_, msg.session_id)) {
            Logger::warn("Could not save session id to " + session_file_);
        }
    }

    void on_message(protocol::VadState& msg) {
        LOG_VAD(msg.speech ? "speech" : "silence");
    }

    void on_message(protocol::SttFinal& msg) {
        std::cout << "\nYou: " << msg.text << "\nAssistant: " << std::flush;
    }

    void on_message(protocol::ReplyToken& msg) {
        std::cout << msg.text << std::flush;
    }

    void on_message(protocol::TtsChunk& msg) {
        if (msg.format != protocol::PCM16_FORMAT) {
            Logger::warn("[Net] Dropping tts_chunk in unsupported format " + msg.format);
            return;
        }
        listening_ = false;

        PlaybackChunk chunk;
        chunk.turn = msg.turn;
        chunk.seq = msg.seq;
        chunk.sample_rate = msg.sample_rate;
        chunk.samples = std::move(msg.audio);
        sequencer_.push(std::move(chunk));
    }

    void on_message(protocol::TurnDone& msg) {
        std::cout << std::endl;
        sequencer_.mark_turn_done(msg.turn);
    }

    void on_message(protocol::ErrorMessage& msg) {
        Logger::error("Server error (" + std::string(error_kind_name(msg.kind)) + "): " + msg.message +
                      (msg.retryable ? " [retryable]" : ""));
    }

    const Config& config_;
    net::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
    AudioIO audio_;
    PlaybackSequencer sequencer_;
    std::string session_file_;

    std::mutex write_mutex_;
    std::thread reader_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> closed_;
    std::atomic<bool> listening_;
};

VoiceClient::VoiceClient(const Config& config) : impl_(std::make_unique<Impl>(config)) {}
VoiceClient::~VoiceClient() = default;

Result<void> VoiceClient::connect() {
    return impl_->connect();
}

Result<void> VoiceClient::run() {
    return impl_->run();
}

void VoiceClient::request_stop() {
    impl_->request_stop();
}

} // namespace client
} // namespace samaira
