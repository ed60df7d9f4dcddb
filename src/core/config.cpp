/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace samaira {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    if (j.contains(name) && j[name].is_object()) {
        return j[name];
    }
    return empty;
}

ServerConfig parse_server_config(const json& j) {
    ServerConfig config;
    const auto& s = section(j, "server");
    config.host = get_or_default(s, "host", config.host);
    config.port = get_or_default(s, "port", config.port);
    config.path = get_or_default(s, "path", config.path);
    config.max_sessions = get_or_default(s, "max_sessions", config.max_sessions);
    config.idle_timeout_ms = get_or_default(s, "idle_timeout_ms", config.idle_timeout_ms);
    config.session_retention_minutes =
        get_or_default(s, "session_retention_minutes", config.session_retention_minutes);
    return config;
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    const auto& a = section(j, "audio");
    config.sample_rate = get_or_default(a, "sample_rate", config.sample_rate);
    config.frame_ms = get_or_default(a, "frame_ms", config.frame_ms);
    return config;
}

VADConfig parse_vad_config(const json& j) {
    VADConfig config;
    const auto& v = section(j, "vad");
    config.aggressiveness = get_or_default(v, "aggressiveness", config.aggressiveness);
    config.base_threshold = get_or_default(v, "base_threshold", config.base_threshold);
    config.end_silence_ms = get_or_default(v, "end_silence_ms", config.end_silence_ms);
    return config;
}

TurnConfig parse_turn_config(const json& j) {
    TurnConfig config;
    const auto& t = section(j, "turn");
    config.max_utterance_ms = get_or_default(t, "max_utterance_ms", config.max_utterance_ms);
    config.max_held_ms = get_or_default(t, "max_held_ms", config.max_held_ms);
    config.max_turn_ms = get_or_default(t, "max_turn_ms", config.max_turn_ms);
    return config;
}

BridgeConfig parse_bridge_config(const json& j) {
    BridgeConfig config;
    const auto& b = section(j, "bridge");
    config.max_span_chars = get_or_default(b, "max_span_chars", config.max_span_chars);
    config.synthesis_lookahead = get_or_default(b, "synthesis_lookahead", config.synthesis_lookahead);
    return config;
}

RetryConfig parse_retry_config(const json& j) {
    RetryConfig config;
    const auto& r = section(j, "retry");
    config.backoff_ms = get_or_default(r, "backoff_ms", config.backoff_ms);
    return config;
}

STTConfig parse_stt_config(const json& j) {
    STTConfig config;
    const auto& stt = section(j, "stt");
    config.model_path = expand_path(get_or_default(stt, "model_path", config.model_path));
    config.language = get_or_default(stt, "language", config.language);
    config.initial_prompt = get_or_default(stt, "initial_prompt", config.initial_prompt);
    config.threads = get_or_default(stt, "threads", config.threads);
    config.use_gpu = get_or_default(stt, "use_gpu", config.use_gpu);
    return config;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    const auto& llm = section(j, "llm");
    config.endpoint = get_or_default(llm, "endpoint", config.endpoint);
    config.model_name = get_or_default(llm, "model_name", config.model_name);
    config.timeout_ms = get_or_default(llm, "timeout_ms", config.timeout_ms);
    config.connect_timeout_ms = get_or_default(llm, "connect_timeout_ms", config.connect_timeout_ms);
    config.max_tokens = get_or_default(llm, "max_tokens", config.max_tokens);
    config.temperature = get_or_default(llm, "temperature", config.temperature);
    config.system_prompt = get_or_default(llm, "system_prompt", config.system_prompt);
    return config;
}

TTSConfig parse_tts_config(const json& j) {
    TTSConfig config;
    const auto& tts = section(j, "tts");
    config.piper_path = expand_path(get_or_default(tts, "piper_path", config.piper_path));
    config.voice_path = expand_path(get_or_default(tts, "voice_path", config.voice_path));
    config.espeak_data_path = expand_path(get_or_default(tts, "espeak_data_path", config.espeak_data_path));
    config.output_gain = get_or_default(tts, "output_gain", config.output_gain);
    config.sample_rate = get_or_default(tts, "sample_rate", config.sample_rate);
    return config;
}

MemoryConfig parse_memory_config(const json& j) {
    MemoryConfig config;
    const auto& memory = section(j, "memory");
    config.max_messages = get_or_default(memory, "max_messages", config.max_messages);
    config.max_tokens = get_or_default(memory, "max_tokens", config.max_tokens);
    return config;
}

ClientConfig parse_client_config(const json& j) {
    ClientConfig config;
    const auto& c = section(j, "client");
    config.server_url = get_or_default(c, "server_url", config.server_url);
    config.input_device = get_or_default(c, "input_device", config.input_device);
    config.output_device = get_or_default(c, "output_device", config.output_device);
    config.session_file = expand_path(get_or_default(c, "session_file", config.session_file));
    return config;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    const auto& l = section(j, "logging");
    config.level = get_or_default(l, "level", config.level);
    config.file = expand_path(get_or_default(l, "file", config.file));
    return config;
}

json server_config_to_json(const ServerConfig& config) {
    return {
        {"host", config.host},
        {"port", config.port},
        {"path", config.path},
        {"max_sessions", config.max_sessions},
        {"idle_timeout_ms", config.idle_timeout_ms},
        {"session_retention_minutes", config.session_retention_minutes}
    };
}

json audio_config_to_json(const AudioConfig& config) {
    return {
        {"sample_rate", config.sample_rate},
        {"frame_ms", config.frame_ms}
    };
}

json vad_config_to_json(const VADConfig& config) {
    return {
        {"aggressiveness", config.aggressiveness},
        {"base_threshold", config.base_threshold},
        {"end_silence_ms", config.end_silence_ms}
    };
}

json turn_config_to_json(const TurnConfig& config) {
    return {
        {"max_utterance_ms", config.max_utterance_ms},
        {"max_held_ms", config.max_held_ms},
        {"max_turn_ms", config.max_turn_ms}
    };
}

json bridge_config_to_json(const BridgeConfig& config) {
    return {
        {"max_span_chars", config.max_span_chars},
        {"synthesis_lookahead", config.synthesis_lookahead}
    };
}

json stt_config_to_json(const STTConfig& config) {
    return {
        {"model_path", config.model_path},
        {"language", config.language},
        {"initial_prompt", config.initial_prompt},
        {"threads", config.threads},
        {"use_gpu", config.use_gpu}
    };
}

json llm_config_to_json(const LLMConfig& config) {
    return {
        {"endpoint", config.endpoint},
        {"model_name", config.model_name},
        {"timeout_ms", config.timeout_ms},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"max_tokens", config.max_tokens},
        {"temperature", config.temperature},
        {"system_prompt", config.system_prompt}
    };
}

json tts_config_to_json(const TTSConfig& config) {
    return {
        {"piper_path", config.piper_path},
        {"voice_path", config.voice_path},
        {"espeak_data_path", config.espeak_data_path},
        {"output_gain", config.output_gain},
        {"sample_rate", config.sample_rate}
    };
}

json client_config_to_json(const ClientConfig& config) {
    return {
        {"server_url", config.server_url},
        {"input_device", config.input_device},
        {"output_device", config.output_device},
        {"session_file", config.session_file}
    };
}

bool is_supported_frame_ms(int ms) {
    return ms == 10 || ms == 20 || ms == 30;
}

bool is_supported_sample_rate(int rate) {
    return rate == 8000 || rate == 16000 || rate == 32000 || rate == 48000;
}

} // anonymous namespace

// =============================================================================
// SamairaConfig Implementation
// =============================================================================

Result<SamairaConfig> SamairaConfig::parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return make_config_error("Config root must be a JSON object");
        }

        SamairaConfig config;
        config.server = parse_server_config(j);
        config.audio = parse_audio_config(j);
        config.vad = parse_vad_config(j);
        config.turn = parse_turn_config(j);
        config.bridge = parse_bridge_config(j);
        config.retry = parse_retry_config(j);
        config.stt = parse_stt_config(j);
        config.llm = parse_llm_config(j);
        config.tts = parse_tts_config(j);
        config.memory = parse_memory_config(j);
        config.client = parse_client_config(j);
        config.logging = parse_logging_config(j);

        auto problems = config.validate();
        if (!problems.empty()) {
            std::ostringstream oss;
            oss << "Config validation failed: ";
            for (size_t i = 0; i < problems.size(); ++i) {
                if (i > 0) oss << "; ";
                oss << problems[i];
            }
            return make_config_error(oss.str());
        }
        return config;

    } catch (const json::exception& e) {
        return make_config_error(std::string("JSON parse error: ") + e.what());
    }
}

Result<SamairaConfig> SamairaConfig::load(const std::string& path) {
    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        return make_config_error("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result) {
        Logger::info("Configuration loaded from: " + path);
    }
    return result;
}

VoidResult SamairaConfig::save(const std::string& path) const {
    try {
        json j;

        j["server"] = server_config_to_json(server);
        j["audio"] = audio_config_to_json(audio);
        j["vad"] = vad_config_to_json(vad);
        j["turn"] = turn_config_to_json(turn);
        j["bridge"] = bridge_config_to_json(bridge);
        j["retry"] = {{"backoff_ms", retry.backoff_ms}};
        j["stt"] = stt_config_to_json(stt);
        j["llm"] = llm_config_to_json(llm);
        j["tts"] = tts_config_to_json(tts);
        j["memory"] = {{"max_messages", memory.max_messages}, {"max_tokens", memory.max_tokens}};
        j["client"] = client_config_to_json(client);
        j["logging"] = {{"level", logging.level}, {"file", logging.file}};

        std::ofstream file(expand_path(path));
        if (!file.is_open()) {
            return VoidResult::failure("Failed to open file for writing: " + path);
        }

        file << j.dump(2);
        Logger::info("Configuration saved to: " + path);
        return VoidResult::ok_result();

    } catch (const json::exception& e) {
        return VoidResult::failure(std::string("Error saving config: ") + e.what());
    }
}

SamairaConfig SamairaConfig::defaults() {
    return SamairaConfig{};  // All defaults are set in struct definitions
}

std::vector<std::string> SamairaConfig::validate() const {
    std::vector<std::string> errors;

    // Server
    if (server.port <= 0 || server.port > 65535) {
        errors.push_back("server.port must be between 1 and 65535");
    }
    if (server.path.empty() || server.path[0] != '/') {
        errors.push_back("server.path must start with '/'");
    }
    if (server.max_sessions < 1) {
        errors.push_back("server.max_sessions must be at least 1");
    }
    if (server.idle_timeout_ms <= 0) {
        errors.push_back("server.idle_timeout_ms must be positive");
    }
    if (server.session_retention_minutes <= 0) {
        errors.push_back("server.session_retention_minutes must be positive");
    }

    // Audio / VAD
    if (!is_supported_sample_rate(audio.sample_rate)) {
        errors.push_back("audio.sample_rate must be 8000, 16000, 32000 or 48000");
    }
    if (!is_supported_frame_ms(audio.frame_ms)) {
        errors.push_back("audio.frame_ms must be 10, 20 or 30");
    }
    if (vad.aggressiveness < 0 || vad.aggressiveness > 3) {
        errors.push_back("vad.aggressiveness must be between 0 and 3");
    }
    if (vad.base_threshold <= 0.0f || vad.base_threshold > 1.0f) {
        errors.push_back("vad.base_threshold must be between 0 and 1");
    }
    if (vad.end_silence_ms <= 0) {
        errors.push_back("vad.end_silence_ms must be positive");
    }

    // Turn limits
    if (turn.max_utterance_ms <= 0) {
        errors.push_back("turn.max_utterance_ms must be positive");
    }
    if (turn.max_held_ms <= 0) {
        errors.push_back("turn.max_held_ms must be positive");
    }
    if (turn.max_turn_ms <= 0) {
        errors.push_back("turn.max_turn_ms must be positive");
    }

    // Bridge / retry
    if (bridge.max_span_chars == 0) {
        errors.push_back("bridge.max_span_chars must be positive");
    }
    if (bridge.synthesis_lookahead < 1) {
        errors.push_back("bridge.synthesis_lookahead must be at least 1");
    }
    if (retry.backoff_ms < 0) {
        errors.push_back("retry.backoff_ms must not be negative");
    }

    // Engines
    if (llm.endpoint.empty()) {
        errors.push_back("llm.endpoint is required");
    }
    if (llm.timeout_ms <= 0 || llm.connect_timeout_ms <= 0) {
        errors.push_back("llm timeouts must be positive");
    }
    if (stt.threads < 1) {
        errors.push_back("stt.threads must be at least 1");
    }
    if (tts.sample_rate <= 0) {
        errors.push_back("tts.sample_rate must be positive");
    }

    return errors;
}

} // namespace config
} // namespace samaira
