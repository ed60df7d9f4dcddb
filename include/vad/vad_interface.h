#pragma once

/**
 * @file vad_interface.h
 * @brief Voice Activity Detection interface
 *
 * Defines the abstract interface for VAD implementations so the turn
 * controller can be driven by the energy detector or a scripted test double.
 */

#include "core/types.h"
#include <memory>

namespace samaira {
namespace vad {

/**
 * @brief VAD events emitted during processing
 */
enum class Event {
    None,           ///< No boundary on this frame
    SpeechStart,    ///< First speech frame of an utterance
    UtteranceEnd    ///< Trailing silence reached the end threshold (edge-triggered)
};

/**
 * @brief Per-frame output: stateless classification plus boundary event
 */
struct FrameResult {
    bool is_speech = false;
    Event event = Event::None;
};

/**
 * @brief VAD statistics for debugging
 */
struct Stats {
    bool in_utterance = false;      ///< At least one speech frame since the last boundary
    float current_rms = 0.0f;
    float threshold = 0.0f;
    int64_t silence_duration_ms = 0;  ///< Contiguous silence since the last speech frame
    int64_t speech_duration_ms = 0;
};

/**
 * @brief Abstract VAD interface
 */
class IVAD {
public:
    virtual ~IVAD() = default;

    /**
     * @brief Classify one frame and advance boundary tracking
     * @param frame Audio frame, in arrival order
     */
    virtual FrameResult process(const AudioFrame& frame) = 0;

    /**
     * @brief Forget the current utterance (after a forced cut or a cancelled turn)
     */
    virtual void reset() = 0;

    virtual Stats get_stats() const = 0;

    /**
     * @brief Whether the current utterance has seen speech
     */
    virtual bool is_speech() const = 0;
};

/**
 * @brief Convert Event to string for logging
 */
inline const char* event_to_string(Event event) {
    switch (event) {
        case Event::None: return "None";
        case Event::SpeechStart: return "SpeechStart";
        case Event::UtteranceEnd: return "UtteranceEnd";
    }
    return "Unknown";
}

} // namespace vad
} // namespace samaira
