#pragma once

/**
 * @file resampler.h
 * @brief Capture-rate float audio to fixed 16 kHz PCM16 frames
 *
 * Linear interpolation with a carry buffer: frame boundaries depend only on
 * the total number of output samples, never on how capture blocks arrive.
 */

#include "core/types.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace samaira {
namespace client {

struct ResamplerConfig {
    int input_rate = 48000;
    int output_rate = audio::SAMPLE_RATE;
    int frame_ms = audio::FRAME_DURATION_MS;
};

/**
 * @brief Quantize one float sample to PCM16
 *
 * Clamps to [-1, 1], scales negatives by 32768 and positives by 32767,
 * then rounds to nearest.
 */
Sample float_to_pcm16(float s);

/**
 * @brief Streaming resampler and framer
 *
 * Not thread-safe; owned by the capture side of the client.
 */
class Resampler {
public:
    /// @throws std::invalid_argument on non-positive rates or frame duration
    explicit Resampler(const ResamplerConfig& config);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    /**
     * @brief Feed one capture block
     * @param samples Native-rate float samples (may be null when count is 0)
     * @param count Number of samples
     * @return Complete frames, zero or more, in order
     *
     * Null, empty or non-finite blocks are dropped with a warning and leave
     * the carry state untouched.
     */
    std::vector<AudioFrame> push(const float* samples, size_t count);

    std::vector<AudioFrame> push(const std::vector<float>& block) {
        return push(block.data(), block.size());
    }

    /// Discard carry state (start of a new session)
    void reset();

    /// Samples per output frame (480 at 16 kHz / 30 ms)
    size_t frame_samples() const;

    /// Output samples waiting for a full frame
    size_t pending_samples() const;

    /// Capture blocks rejected since construction
    uint64_t dropped_blocks() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace client
} // namespace samaira
