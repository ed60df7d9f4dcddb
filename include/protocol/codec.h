#pragma once

/**
 * @file codec.h
 * @brief JSON text encoding and decoding of wire messages
 */

#include "protocol/messages.h"
#include "errors.h"
#include <string>

namespace samaira {
namespace protocol {

std::string encode(const ServerMessage& message);
std::string encode(const ClientMessage& message);

/**
 * @brief Parse one inbound client text frame
 * @param text JSON object text
 * @param expected_frame_samples Required audio_chunk length; 0 accepts any non-empty frame
 * @return Message, or ProtocolViolation for malformed JSON, an unknown tag or a bad payload
 */
Result<ClientMessage> decode_client(const std::string& text, size_t expected_frame_samples = 0);

/**
 * @brief Parse one inbound server text frame (client side)
 *
 * Unknown tags are a ProtocolViolation.
 */
Result<ServerMessage> decode_server(const std::string& text);

/// Wire string to error kind; unknown strings map to EngineFatal
ErrorType error_kind_from_name(const std::string& name);

} // namespace protocol
} // namespace samaira
