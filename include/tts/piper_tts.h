#pragma once

/**
 * @file piper_tts.h
 * @brief Piper synthesizer: one subprocess per span, raw PCM streamed back
 *
 * Features:
 * - Binary lookup (configured path, common install dirs, then PATH)
 * - Voice sample rate read from the voice's .onnx.json
 * - Output resampled to the pipeline rate with configurable gain
 * - Chunks of at most max_chunk_ms, emitted while piper is still speaking
 * - Cancellation kills the child
 */

#include "core/config.h"
#include "core/constants.h"
#include "tts/tts_interface.h"
#include <memory>
#include <string>

namespace samaira {
namespace tts {

/**
 * @brief Configuration for Piper TTS
 */
struct PiperConfig {
    /// Path to Piper voice model (.onnx file)
    std::string voice_path;

    /// Path to espeak-ng data directory (empty = platform default)
    std::string espeak_data_path;

    /// Custom piper binary path (empty = auto-detect)
    std::string piper_path;

    /// Output gain multiplier
    float output_gain = 1.0f;

    /// Rate of emitted chunks
    int output_sample_rate = audio::SAMPLE_RATE;

    /// Longest chunk handed to on_chunk
    int max_chunk_ms = constants::tts::MAX_CHUNK_MS;

    /// Kill piper if it produced no audio within this time
    int first_byte_timeout_ms = constants::tts::FIRST_BYTE_TIMEOUT_MS;

    static PiperConfig from(const config::TTSConfig& config);
};

/**
 * @brief Piper TTS implementation
 */
class PiperSynthesizer : public ISynthesizer {
public:
    explicit PiperSynthesizer(const PiperConfig& config);
    ~PiperSynthesizer() override;

    // Non-copyable
    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    /**
     * Missing binary or voice is EngineFatal. A non-zero exit, a crash or no
     * audio within first_byte_timeout_ms is EngineTransient.
     */
    Result<void> synthesize(const std::string& span,
                            const AudioChunkCallback& on_chunk,
                            const CancellationToken& cancel) override;

    int sample_rate() const override;
    bool is_ready() const override;
    Stats get_stats() const override;

    /// Rate piper produces for the configured voice
    int voice_sample_rate() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace samaira
