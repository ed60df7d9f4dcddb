#pragma once

/**
 * @file voice_client.h
 * @brief Websocket client: microphone up, synthesized speech down
 *
 * The capture loop runs on the caller's thread; a reader thread handles
 * server messages. Outgoing audio pauses from the first tts_chunk of a
 * turn until the Playback Sequencer reports it has caught up, so the
 * assistant does not hear itself.
 */

#include "core/config.h"
#include "errors.h"
#include <memory>
#include <string>

namespace samaira {
namespace client {

/// Parsed ws:// URL
struct WsUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

/**
 * @brief Split ws://host[:port][/path]
 * @return InvalidConfig for other schemes (wss is not supported) or an empty host
 */
Result<WsUrl> parse_ws_url(const std::string& url);

class VoiceClient {
public:
    explicit VoiceClient(const Config& config);
    ~VoiceClient();

    VoiceClient(const VoiceClient&) = delete;
    VoiceClient& operator=(const VoiceClient&) = delete;

    /// Resolve, connect, upgrade and send `start`
    Result<void> connect();

    /**
     * @brief Start audio and stream until request_stop() or the server closes
     * @return EngineFatal if audio devices could not be opened
     */
    Result<void> run();

    /// Async-signal-safe; run() sends `stop` and closes
    void request_stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace client
} // namespace samaira
