#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the Samaira voice pipeline
 *
 * Fundamental audio, timing and transcript types shared by server and client.
 */

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <functional>

namespace samaira {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Single frame of audio (fixed duration, see audio::FRAME_DURATION_MS)
using AudioFrame = std::vector<Sample>;

/// Variable-length audio buffer
using AudioBuffer = std::vector<Sample>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Current timestamp in milliseconds (for logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Audio Format Constants
// =============================================================================

namespace audio {
    constexpr int SAMPLE_RATE = 16000;           // Hz
    constexpr int FRAME_DURATION_MS = 30;        // ms per frame
    constexpr int SAMPLES_PER_FRAME = (SAMPLE_RATE * FRAME_DURATION_MS) / 1000; // 480
    constexpr int BYTES_PER_SAMPLE = sizeof(Sample);
    constexpr int BYTES_PER_FRAME = SAMPLES_PER_FRAME * BYTES_PER_SAMPLE;

    /// Convert milliseconds to samples at the pipeline rate
    constexpr size_t ms_to_samples(int ms, int sample_rate = SAMPLE_RATE) {
        return (static_cast<size_t>(ms) * static_cast<size_t>(sample_rate)) / 1000;
    }

    /// Convert samples to milliseconds at the pipeline rate
    constexpr int samples_to_ms(size_t samples, int sample_rate = SAMPLE_RATE) {
        return static_cast<int>((samples * 1000) / static_cast<size_t>(sample_rate));
    }
}

// =============================================================================
// Void result (config save, warmup)
// =============================================================================

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, ""}; }
    static VoidResult failure(std::string err) { return {false, std::move(err)}; }
};

// =============================================================================
// Speech/Transcript Types
// =============================================================================

/// Result of speech-to-text transcription
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int64_t audio_duration_ms = 0;
    int token_count = 0;

    bool empty() const { return text.empty(); }
};

/// Conversation message roles
enum class MessageRole {
    System,
    User,
    Assistant
};

// =============================================================================
// Callback Types
// =============================================================================

/// One language-model token
using TokenCallback = std::function<void(const std::string& token)>;

/// One synthesized audio chunk
using AudioChunkCallback = std::function<void(AudioBuffer chunk)>;

} // namespace samaira
