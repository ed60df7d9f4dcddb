#pragma once

/**
 * @file config.h
 * @brief Unified configuration for server and client
 *
 * One JSON file configures both executables. It supports:
 * - JSON file loading
 * - Default values for every missing key
 * - Validation
 */

#include "types.h"
#include "constants.h"
#include "errors.h"
#include <string>
#include <vector>

namespace samaira {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Websocket server and session lifecycle
 */
struct ServerConfig {
    std::string host = constants::server::DEFAULT_HOST;
    int port = constants::server::DEFAULT_PORT;
    std::string path = constants::server::DEFAULT_PATH;
    int max_sessions = constants::server::MAX_SESSIONS;
    int idle_timeout_ms = constants::server::IDLE_TIMEOUT_MS;
    int session_retention_minutes = constants::server::SESSION_RETENTION_MINUTES;
};

/**
 * @brief Pipeline audio format
 */
struct AudioConfig {
    int sample_rate = audio::SAMPLE_RATE;
    int frame_ms = audio::FRAME_DURATION_MS;

    size_t samples_per_frame() const {
        return audio::ms_to_samples(frame_ms, sample_rate);
    }
};

/**
 * @brief VAD configuration
 */
struct VADConfig {
    int aggressiveness = constants::vad::DEFAULT_AGGRESSIVENESS;
    float base_threshold = constants::vad::BASE_THRESHOLD;
    int end_silence_ms = constants::vad::END_SILENCE_MS;
};

/**
 * @brief Turn controller limits
 */
struct TurnConfig {
    int max_utterance_ms = constants::turn::MAX_UTTERANCE_MS;
    int max_held_ms = constants::turn::MAX_HELD_MS;
    int max_turn_ms = constants::turn::MAX_TURN_MS;
};

/**
 * @brief Streaming bridge span policy
 */
struct BridgeConfig {
    size_t max_span_chars = constants::bridge::MAX_SPAN_CHARS;
    int synthesis_lookahead = constants::bridge::SYNTHESIS_LOOKAHEAD;
};

struct RetryConfig {
    int backoff_ms = constants::retry::BACKOFF_MS;
};

/**
 * @brief STT (Speech-to-Text) configuration
 */
struct STTConfig {
    std::string model_path;
    std::string language = "hi";
    std::string initial_prompt;
    int threads = 4;
    bool use_gpu = true;
};

/**
 * @brief LLM configuration
 */
struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5:7b";
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
    int connect_timeout_ms = constants::llm::CONNECT_TIMEOUT_MS;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    float temperature = constants::llm::DEFAULT_TEMPERATURE;
    std::string system_prompt = "You are Samaira, a friendly financial assistant. "
                                "Reply in short spoken sentences in the user's language. "
                                "No markdown, no lists.";
};

/**
 * @brief TTS configuration
 */
struct TTSConfig {
    std::string piper_path;  // Empty = search PATH
    std::string voice_path;
    std::string espeak_data_path;  // Empty = platform default
    float output_gain = 1.0f;
    int sample_rate = audio::SAMPLE_RATE;
};

/**
 * @brief Conversation memory configuration
 */
struct MemoryConfig {
    size_t max_messages = constants::memory::MAX_HISTORY_MESSAGES;
    size_t max_tokens = constants::memory::MAX_HISTORY_TOKENS;
};

/**
 * @brief Capture/playback client
 */
struct ClientConfig {
    std::string server_url = "ws://127.0.0.1:8000/ws/voice";
    std::string input_device = "default";
    std::string output_device = "default";
    std::string session_file = "~/.samaira_session";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // Empty = console only
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete configuration
 */
struct SamairaConfig {
    ServerConfig server;
    AudioConfig audio;
    VADConfig vad;
    TurnConfig turn;
    BridgeConfig bridge;
    RetryConfig retry;
    STTConfig stt;
    LLMConfig llm;
    TTSConfig tts;
    MemoryConfig memory;
    ClientConfig client;
    LoggingConfig logging;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config or InvalidConfig error
     */
    static Result<SamairaConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from JSON text (used by load and tests)
     */
    static Result<SamairaConfig> parse(const std::string& text);

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    /**
     * @brief Create with default values
     */
    static SamairaConfig defaults();

    /**
     * @brief Validate configuration
     * @return One message per problem; empty if valid
     */
    std::vector<std::string> validate() const;
};

} // namespace config

// Convenience alias
using Config = config::SamairaConfig;

/// Default config location when no path is given on the command line
constexpr const char* DEFAULT_CONFIG_PATH = "config/samaira.json";

} // namespace samaira
