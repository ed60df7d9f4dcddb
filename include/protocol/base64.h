#pragma once

/**
 * @file base64.h
 * @brief Base64 transport of little-endian PCM16 audio
 */

#include "core/types.h"
#include "errors.h"
#include <string>

namespace samaira {
namespace protocol {

/// Encode samples as little-endian bytes, then base64 (with padding)
std::string base64_encode_pcm16(const AudioBuffer& samples);

/**
 * @brief Decode base64 to little-endian PCM16 samples
 *
 * Rejects invalid characters, misplaced padding, a length that is not a
 * multiple of four, and an odd byte count (ProtocolViolation).
 */
Result<AudioBuffer> base64_decode_pcm16(const std::string& encoded);

} // namespace protocol
} // namespace samaira
