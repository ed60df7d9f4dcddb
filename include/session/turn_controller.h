#pragma once

/**
 * @file turn_controller.h
 * @brief Per-session turn state machine
 *
 * Idle -> Capturing (first speech frame)
 * Capturing -> Transcribing (utterance end, or the utterance cap)
 * Transcribing -> Generating (non-empty transcript; empty returns to Idle)
 * Generating -> Speaking (first span handed to the synthesizer)
 * Speaking -> Idle (last chunk sent, token stream ended)
 *
 * All state is owned by one worker thread that consumes a typed event
 * queue. The transcribe/generate/speak pipeline of the active turn runs on
 * a second thread and reports back through the same queue. Frames that
 * arrive while a turn is in flight are held and replayed through the VAD
 * once the controller is Idle again.
 */

#include "bridge/streaming_bridge.h"
#include "core/config.h"
#include "core/types.h"
#include "llm/language_model_interface.h"
#include "memory/conversation_memory.h"
#include "protocol/message_sink.h"
#include "stt/transcriber_interface.h"
#include "tts/tts_interface.h"
#include "vad/vad_interface.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace samaira {
namespace session {

/**
 * @brief Turn controller state enumeration
 */
enum class TurnState {
    Idle,          ///< Listening, no speech yet
    Capturing,     ///< Speech detected, accumulating the utterance
    Transcribing,  ///< Utterance submitted to the transcriber
    Generating,    ///< Transcript sent, reply tokens streaming
    Speaking       ///< Synthesized chunks being produced
};

const char* state_to_string(TurnState state);

struct TurnControllerConfig {
    int sample_rate = audio::SAMPLE_RATE;
    int frame_ms = audio::FRAME_DURATION_MS;
    int max_utterance_ms = constants::turn::MAX_UTTERANCE_MS;
    int max_held_ms = constants::turn::MAX_HELD_MS;
    int max_turn_ms = constants::turn::MAX_TURN_MS;
    int idle_timeout_ms = constants::server::IDLE_TIMEOUT_MS;
    int retry_backoff_ms = constants::retry::BACKOFF_MS;
    std::string language = "hi";
    size_t context_messages = constants::memory::MAX_HISTORY_MESSAGES;
    bridge::StreamingBridgeConfig bridge;

    static TurnControllerConfig from(const Config& config);
};

/**
 * @brief Shared engines; must outlive every controller
 */
struct Engines {
    stt::ITranscriber& transcriber;
    llm::ILanguageModel& model;
    tts::ISynthesizer& synthesizer;
};

struct TurnStats {
    TurnState state = TurnState::Idle;
    uint64_t frames_received = 0;
    uint64_t frames_held = 0;        ///< Currently held
    uint64_t frames_dropped = 0;     ///< Held frames discarded on overflow
    uint64_t turns_started = 0;
    uint64_t turns_completed = 0;    ///< Reached turn_done without error
    uint64_t turns_discarded = 0;    ///< Empty transcript
    uint64_t turns_failed = 0;
};

class TurnController {
public:
    using IdleTimeoutCallback = std::function<void()>;

    /**
     * @param vad Detector for this session (owned)
     * @param memory Conversation context of the session entry (outlives the controller)
     * @param sink Outbound channel of the connection
     */
    TurnController(const TurnControllerConfig& config,
                   std::unique_ptr<vad::IVAD> vad,
                   Engines engines,
                   memory::ConversationMemory& memory,
                   protocol::IMessageSink& sink,
                   const std::string& session_id);

    /// Closes the controller if still open
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    // =========================================================================
    // Events (thread-safe, non-blocking)
    // =========================================================================

    void post_audio(AudioFrame frame);

    /// Cancel the in-flight turn without an error; no-op when Idle
    void post_stop();

    /**
     * @brief Connection closed: cancel the turn, release buffers, send nothing more
     *
     * Blocks until the worker and the pipeline thread have exited.
     */
    void close();

    /// Invoked once, from the worker thread, when no audio arrived for idle_timeout_ms
    void set_idle_timeout_callback(IdleTimeoutCallback callback);

    // =========================================================================
    // Query
    // =========================================================================

    TurnState state() const;
    TurnStats get_stats() const;

    /**
     * @brief Wait until every posted event is handled, no turn is in flight
     *        and no frames are held
     * @return False on timeout
     */
    bool wait_until_quiescent(int timeout_ms);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace session
} // namespace samaira
