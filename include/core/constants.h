#pragma once

/**
 * @file constants.h
 * @brief System-wide defaults and tuning parameters
 *
 * Every configurable default is defined here so config structs and
 * components agree on the same values.
 */

#include <cstddef>

namespace samaira {
namespace constants {

// =============================================================================
// VAD (Voice Activity Detection) Constants
// =============================================================================

namespace vad {
    /// Base RMS threshold for speech (normalized 0-1), scaled by aggressiveness
    constexpr float BASE_THRESHOLD = 0.01f;

    /// Default aggressiveness level (0 = most permissive, 3 = most aggressive)
    constexpr int DEFAULT_AGGRESSIVENESS = 2;

    /// Threshold multiplier per aggressiveness level
    constexpr float AGGRESSIVENESS_MULTIPLIERS[4] = {1.0f, 1.5f, 2.25f, 3.0f};

    /// Contiguous trailing silence that ends an utterance (ms)
    constexpr int END_SILENCE_MS = 600;
}

// =============================================================================
// Turn Controller Constants
// =============================================================================

namespace turn {
    /// Hard cap on one utterance before transcription is forced (ms)
    constexpr int MAX_UTTERANCE_MS = 20000;

    /// Cap on audio held while a turn is in flight (ms)
    constexpr int MAX_HELD_MS = 10000;

    /// Maximum duration of one turn, transcription through last chunk (ms)
    constexpr int MAX_TURN_MS = 60000;

    /// Worker wake-up interval for timeout checks (ms)
    constexpr int POLL_INTERVAL_MS = 50;
}

// =============================================================================
// Streaming Bridge Constants
// =============================================================================

namespace bridge {
    /// Longest synthesis span before a forced cut at whitespace
    constexpr size_t MAX_SPAN_CHARS = 200;

    /// Synthesis spans in flight at once
    constexpr int SYNTHESIS_LOOKAHEAD = 2;
}

// =============================================================================
// Retry Constants
// =============================================================================

namespace retry {
    /// Wait before the single retry of a transient engine failure (ms)
    constexpr int BACKOFF_MS = 250;
}

// =============================================================================
// Server / Session Constants
// =============================================================================

namespace server {
    constexpr const char* DEFAULT_HOST = "127.0.0.1";
    constexpr int DEFAULT_PORT = 8000;
    constexpr const char* DEFAULT_PATH = "/ws/voice";

    /// Concurrently attached sessions
    constexpr int MAX_SESSIONS = 32;

    /// No audio for this long closes the session (ms)
    constexpr int IDLE_TIMEOUT_MS = 60000;

    /// Detached conversation contexts are kept this long (minutes)
    constexpr int SESSION_RETENTION_MINUTES = 30;

    /// Interval of the retention sweep (ms)
    constexpr int SWEEP_INTERVAL_MS = 60000;
}

// =============================================================================
// LLM (Language Model) Constants
// =============================================================================

namespace llm {
    constexpr int DEFAULT_TIMEOUT_MS = 30000;
    constexpr int CONNECT_TIMEOUT_MS = 1000;
    constexpr int DEFAULT_MAX_TOKENS = 256;
    constexpr float DEFAULT_TEMPERATURE = 0.4f;
}

// =============================================================================
// TTS (Text-to-Speech) Constants
// =============================================================================

namespace tts {
    /// Piper's native output rate (Hz)
    constexpr int PIPER_SAMPLE_RATE = 22050;

    /// Longest audio chunk emitted per tts_chunk message (ms)
    constexpr int MAX_CHUNK_MS = 500;

    /// Time to wait for the first PCM byte from piper (ms)
    constexpr int FIRST_BYTE_TIMEOUT_MS = 5000;
}

// =============================================================================
// Conversation Memory Constants
// =============================================================================

namespace memory {
    constexpr size_t MAX_HISTORY_MESSAGES = 20;
    constexpr size_t MAX_HISTORY_TOKENS = 2000;

    /// Approximate tokens per character (for estimation)
    constexpr float TOKENS_PER_CHAR = 0.25f;
}

} // namespace constants
} // namespace samaira
