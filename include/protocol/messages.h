#pragma once

/**
 * @file messages.h
 * @brief Closed set of duplex wire messages
 *
 * Every message is a JSON object with a string `type`. Client and server
 * directions are separate variants so each end handles its inbound set
 * exhaustively.
 */

#include "core/types.h"
#include "errors.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace samaira {
namespace protocol {

/// Audio format tag carried by tts_chunk
constexpr const char* PCM16_FORMAT = "pcm_s16le";

// =============================================================================
// Client -> Server
// =============================================================================

/// Begin or resume a session
struct Start {
    std::optional<std::string> session_id;
};

/// One Audio Frame (base64 PCM16 on the wire, field `data`)
struct AudioChunk {
    AudioFrame frame;
};

/// Cancel the current turn, keep the session
struct Stop {};

using ClientMessage = std::variant<Start, AudioChunk, Stop>;

// =============================================================================
// Server -> Client
// =============================================================================

/// Assigns or confirms the session id
struct SessionAssigned {
    std::string session_id;
    bool resumed = false;
};

/// UI feedback only
struct VadState {
    bool speech = false;
};

struct SttFinal {
    uint64_t turn = 0;
    std::string text;
};

struct ReplyToken {
    uint64_t turn = 0;
    std::string text;
};

struct TtsChunk {
    uint64_t turn = 0;
    uint64_t seq = 0;
    int sample_rate = audio::SAMPLE_RATE;
    std::string format = PCM16_FORMAT;
    AudioBuffer audio;
};

struct TurnDone {
    uint64_t turn = 0;
};

struct ErrorMessage {
    std::string message;
    ErrorType kind = ErrorType::None;
    bool retryable = false;

    static ErrorMessage from(const Error& error) {
        return ErrorMessage{error.message, error.type, is_retryable(error.type)};
    }
};

using ServerMessage = std::variant<SessionAssigned, VadState, SttFinal, ReplyToken,
                                   TtsChunk, TurnDone, ErrorMessage>;

/// Wire `type` of a server message
const char* message_type(const ServerMessage& message);

/// Wire `type` of a client message
const char* message_type(const ClientMessage& message);

} // namespace protocol
} // namespace samaira
