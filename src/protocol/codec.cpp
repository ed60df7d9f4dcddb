/**
 * @file codec.cpp
 * @brief Wire message <-> JSON text
 */

#include "protocol/codec.h"
#include "protocol/base64.h"
#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

namespace samaira {
namespace protocol {

// =============================================================================
// Type names
// =============================================================================

namespace {

constexpr uint64_t MAX_SAMPLE_RATE = 192000;

struct ServerTypeName {
    const char* operator()(const SessionAssigned&) const { return "session"; }
    const char* operator()(const VadState&) const { return "vad_state"; }
    const char* operator()(const SttFinal&) const { return "stt_final"; }
    const char* operator()(const ReplyToken&) const { return "reply_token"; }
    const char* operator()(const TtsChunk&) const { return "tts_chunk"; }
    const char* operator()(const TurnDone&) const { return "turn_done"; }
    const char* operator()(const ErrorMessage&) const { return "error"; }
};

struct ClientTypeName {
    const char* operator()(const Start&) const { return "start"; }
    const char* operator()(const AudioChunk&) const { return "audio_chunk"; }
    const char* operator()(const Stop&) const { return "stop"; }
};

// =============================================================================
// Encoders
// =============================================================================

json to_json(const SessionAssigned& m) {
    return {{"type", "session"}, {"session_id", m.session_id}, {"resumed", m.resumed}};
}

json to_json(const VadState& m) {
    return {{"type", "vad_state"}, {"state", m.speech ? "speech" : "silence"}};
}

json to_json(const SttFinal& m) {
    return {{"type", "stt_final"}, {"turn", m.turn}, {"text", m.text}};
}

json to_json(const ReplyToken& m) {
    return {{"type", "reply_token"}, {"turn", m.turn}, {"text", m.text}};
}

json to_json(const TtsChunk& m) {
    return {
        {"type", "tts_chunk"},
        {"turn", m.turn},
        {"seq", m.seq},
        {"format", m.format},
        {"sample_rate", m.sample_rate},
        {"audio", base64_encode_pcm16(m.audio)}
    };
}

json to_json(const TurnDone& m) {
    return {{"type", "turn_done"}, {"turn", m.turn}};
}

json to_json(const ErrorMessage& m) {
    return {
        {"type", "error"},
        {"message", m.message},
        {"kind", error_kind_name(m.kind)},
        {"retryable", m.retryable}
    };
}

json to_json(const Start& m) {
    json j = {{"type", "start"}};
    if (m.session_id) {
        j["session_id"] = *m.session_id;
    } else {
        j["session_id"] = nullptr;
    }
    return j;
}

json to_json(const AudioChunk& m) {
    return {{"type", "audio_chunk"}, {"data", base64_encode_pcm16(m.frame)}};
}

json to_json(const Stop&) {
    return {{"type", "stop"}};
}

// =============================================================================
// Field access
// =============================================================================

Result<std::string> require_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return make_protocol_error(std::string("Missing or non-string field '") + key + "'");
    }
    return it->get<std::string>();
}

Result<uint64_t> require_uint(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) {
        return make_protocol_error(std::string("Missing or invalid field '") + key + "'");
    }
    return it->get<uint64_t>();
}

/// Absent yields `fallback`; present with any other type is a violation
Result<uint64_t> optional_uint(const json& j, const char* key, uint64_t fallback = 0) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_unsigned()) {
        return make_protocol_error(std::string("Field '") + key + "' must be a non-negative integer");
    }
    return it->get<uint64_t>();
}

Result<std::string> optional_string(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_string()) {
        return make_protocol_error(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<Error> check_optional_bool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_boolean()) {
        return make_protocol_error(std::string("Field '") + key + "' must be a boolean");
    }
    return std::nullopt;
}

bool optional_bool(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->get<bool>();
}

Result<json> parse_object(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return make_protocol_error("Malformed JSON");
    }
    if (!j.is_object()) {
        return make_protocol_error("Message must be a JSON object");
    }
    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        return make_protocol_error("Message has no string 'type'");
    }
    return j;
}

} // anonymous namespace

const char* message_type(const ServerMessage& message) {
    return std::visit(ServerTypeName{}, message);
}

const char* message_type(const ClientMessage& message) {
    return std::visit(ClientTypeName{}, message);
}

ErrorType error_kind_from_name(const std::string& name) {
    if (name == "transport_closed") return ErrorType::TransportClosed;
    if (name == "engine_transient") return ErrorType::EngineTransient;
    if (name == "engine_fatal") return ErrorType::EngineFatal;
    if (name == "protocol_violation") return ErrorType::ProtocolViolation;
    if (name == "capacity_exceeded") return ErrorType::CapacityExceeded;
    if (name == "turn_timeout") return ErrorType::TurnTimeout;
    if (name == "cancelled") return ErrorType::Cancelled;
    if (name == "invalid_config") return ErrorType::InvalidConfig;
    return ErrorType::EngineFatal;
}

std::string encode(const ServerMessage& message) {
    return std::visit([](const auto& m) { return to_json(m).dump(); }, message);
}

std::string encode(const ClientMessage& message) {
    return std::visit([](const auto& m) { return to_json(m).dump(); }, message);
}

// =============================================================================
// Decoders
// =============================================================================

Result<ClientMessage> decode_client(const std::string& text, size_t expected_frame_samples) {
    auto parsed = parse_object(text);
    if (!parsed) return parsed.error();
    const json& j = parsed.value();
    const std::string type = j["type"].get<std::string>();

    if (type == "start") {
        Start start;
        auto it = j.find("session_id");
        if (it != j.end() && !it->is_null()) {
            if (!it->is_string()) {
                return make_protocol_error("start.session_id must be a string or null");
            }
            std::string id = it->get<std::string>();
            if (!id.empty()) {
                start.session_id = std::move(id);
            }
        }
        return ClientMessage{std::move(start)};
    }

    if (type == "audio_chunk") {
        auto data = require_string(j, "data");
        if (!data) return data.error();
        auto samples = base64_decode_pcm16(data.value());
        if (!samples) return samples.error();
        if (expected_frame_samples != 0 && samples.value().size() != expected_frame_samples) {
            return make_protocol_error("audio_chunk has " + std::to_string(samples.value().size()) +
                                       " samples, expected " + std::to_string(expected_frame_samples));
        }
        return ClientMessage{AudioChunk{std::move(samples.value())}};
    }

    if (type == "stop") {
        return ClientMessage{Stop{}};
    }

    return make_protocol_error("Unknown message type: " + type);
}

Result<ServerMessage> decode_server(const std::string& text) {
    auto parsed = parse_object(text);
    if (!parsed) return parsed.error();
    const json& j = parsed.value();
    const std::string type = j["type"].get<std::string>();

    if (type == "session") {
        auto id = require_string(j, "session_id");
        if (!id) return id.error();
        if (auto bad = check_optional_bool(j, "resumed")) return *bad;
        SessionAssigned m;
        m.session_id = id.value();
        m.resumed = optional_bool(j, "resumed");
        return ServerMessage{std::move(m)};
    }

    if (type == "vad_state") {
        auto state = require_string(j, "state");
        if (!state) return state.error();
        if (state.value() != "speech" && state.value() != "silence") {
            return make_protocol_error("vad_state.state must be 'speech' or 'silence'");
        }
        return ServerMessage{VadState{state.value() == "speech"}};
    }

    if (type == "stt_final" || type == "reply_token") {
        auto text_field = require_string(j, "text");
        if (!text_field) return text_field.error();
        auto turn = optional_uint(j, "turn");
        if (!turn) return turn.error();
        if (type == "stt_final") {
            return ServerMessage{SttFinal{turn.value(), text_field.value()}};
        }
        return ServerMessage{ReplyToken{turn.value(), text_field.value()}};
    }

    if (type == "tts_chunk") {
        auto seq = require_uint(j, "seq");
        if (!seq) return seq.error();
        auto turn = optional_uint(j, "turn");
        if (!turn) return turn.error();
        auto format = optional_string(j, "format", PCM16_FORMAT);
        if (!format) return format.error();
        if (format.value() != PCM16_FORMAT) {
            return make_protocol_error("Unsupported tts_chunk format: " + format.value());
        }
        auto rate = optional_uint(j, "sample_rate", audio::SAMPLE_RATE);
        if (!rate) return rate.error();
        if (rate.value() == 0 || rate.value() > MAX_SAMPLE_RATE) {
            return make_protocol_error("tts_chunk.sample_rate out of range: " +
                                       std::to_string(rate.value()));
        }
        auto audio_field = require_string(j, "audio");
        if (!audio_field) return audio_field.error();
        auto samples = base64_decode_pcm16(audio_field.value());
        if (!samples) return samples.error();

        TtsChunk m;
        m.turn = turn.value();
        m.seq = seq.value();
        m.format = format.value();
        m.sample_rate = static_cast<int>(rate.value());
        m.audio = std::move(samples.value());
        return ServerMessage{std::move(m)};
    }

    if (type == "turn_done") {
        auto turn = optional_uint(j, "turn");
        if (!turn) return turn.error();
        return ServerMessage{TurnDone{turn.value()}};
    }

    if (type == "error") {
        auto message = optional_string(j, "message", "");
        if (!message) return message.error();
        auto kind = optional_string(j, "kind", "");
        if (!kind) return kind.error();
        if (auto bad = check_optional_bool(j, "retryable")) return *bad;

        ErrorMessage m;
        m.message = message.value();
        m.kind = error_kind_from_name(kind.value());
        m.retryable = optional_bool(j, "retryable");
        return ServerMessage{std::move(m)};
    }

    return make_protocol_error("Unknown message type: " + type);
}

} // namespace protocol
} // namespace samaira
