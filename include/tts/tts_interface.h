#pragma once

/**
 * @file tts_interface.h
 * @brief Text-to-Speech interface
 *
 * Defines the abstract interface for synthesizers so the streaming bridge
 * can run against Piper or a scripted test double.
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include <string>

namespace samaira {
namespace tts {

/**
 * @brief TTS engine statistics
 */
struct Stats {
    size_t spans_synthesized = 0;
    size_t failures = 0;
    int64_t avg_synthesis_ms = 0;
    bool engine_ready = false;
};

/**
 * @brief Abstract synthesizer
 *
 * Implementations must be safe to call from several threads at once; the
 * bridge keeps more than one span in flight.
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    /**
     * @brief Synthesize one span as a stream of audio chunks
     * @param span Prepared text (never empty)
     * @param on_chunk Called with each chunk in order, from the calling thread
     * @param cancel Polled; a cancelled call returns Cancelled promptly
     * @return Ok, EngineTransient, EngineFatal or Cancelled
     */
    virtual Result<void> synthesize(const std::string& span,
                                    const AudioChunkCallback& on_chunk,
                                    const CancellationToken& cancel) = 0;

    /// Sample rate of the chunks passed to on_chunk
    virtual int sample_rate() const = 0;

    virtual bool is_ready() const = 0;

    virtual Stats get_stats() const = 0;
};

} // namespace tts
} // namespace samaira
