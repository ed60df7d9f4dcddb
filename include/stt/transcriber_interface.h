#pragma once

/**
 * @file transcriber_interface.h
 * @brief Speech-to-Text interface
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include <string>
#include <vector>

namespace samaira {
namespace stt {

/**
 * @brief Batch transcriber: whole utterance in, text out
 *
 * One call per turn; the turn controller never overlaps calls for a
 * session, but different sessions may call concurrently.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @param frames Speech frames of the utterance, in order
     * @param language_hint Language code ("hi", "en", ...); empty = auto
     * @param cancel Polled during decoding
     * @return Transcript, or EngineTransient / EngineFatal / Cancelled
     */
    virtual Result<Transcript> transcribe(const std::vector<AudioFrame>& frames,
                                          const std::string& language_hint,
                                          const CancellationToken& cancel) = 0;

    virtual bool is_ready() const = 0;
};

/// Concatenate frames into one contiguous buffer
inline AudioBuffer flatten_frames(const std::vector<AudioFrame>& frames) {
    size_t total = 0;
    for (const auto& f : frames) total += f.size();
    AudioBuffer out;
    out.reserve(total);
    for (const auto& f : frames) out.insert(out.end(), f.begin(), f.end());
    return out;
}

} // namespace stt
} // namespace samaira
