#include "stt/whisper_transcriber.h"
#include "logger.h"
#include <whisper.h>
#include <atomic>
#include <chrono>
#include <sstream>

namespace samaira {
namespace stt {

namespace {

bool abort_requested(void* user_data) {
    return static_cast<const std::atomic<bool>*>(user_data)->load();
}

} // anonymous namespace

class WhisperTranscriber::Impl {
public:
    Impl(const config::STTConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_STT("Failed to load whisper model: " + config_.model_path);
            return;
        }

        LOG_STT("Model loaded: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const std::vector<AudioFrame>& frames,
                                  const std::string& language_hint,
                                  const CancellationToken& cancel) {
        if (!ctx_) {
            return make_fatal_error("Whisper model not loaded (" +
                                    (config_.model_path.empty() ? std::string("no model_path")
                                                                : config_.model_path) + ")");
        }

        Transcript result;
        AudioBuffer segment = flatten_frames(frames);
        result.audio_duration_ms = audio::samples_to_ms(segment.size(), audio::SAMPLE_RATE);
        if (segment.empty()) {
            return result;
        }

        auto start = std::chrono::steady_clock::now();

        const std::string language = language_hint.empty() ? std::string("auto") : language_hint;

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = language.c_str();
        params.n_threads = config_.threads;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = true;
        if (!config_.initial_prompt.empty()) {
            params.initial_prompt = config_.initial_prompt.c_str();
        }
        params.abort_callback = abort_requested;
        params.abort_callback_user_data =
            const_cast<void*>(static_cast<const void*>(cancel.flag()));

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        whisper_state* state = whisper_init_state(ctx_);
        if (!state) {
            return make_transient_error("Failed to allocate whisper state");
        }

        int ret = whisper_full_with_state(ctx_, state, params, pcmf32.data(),
                                          static_cast<int>(pcmf32.size()));
        if (cancel.is_cancelled()) {
            whisper_free_state(state);
            return make_cancelled_error("Transcription cancelled");
        }
        if (ret != 0) {
            whisper_free_state(state);
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            return make_transient_error(oss.str());
        }

        int n_segments = whisper_full_n_segments_from_state(state);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;

        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text_from_state(state, i);

            int n_tokens = whisper_full_n_tokens_from_state(state, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p_from_state(state, i, j);
            }
        }
        whisper_free_state(state);

        result.text = text;
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.token_count = total_tokens;
        result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        LOG_STT("Transcribed " + std::to_string(result.audio_duration_ms) + "ms in " +
                std::to_string(result.processing_ms) + "ms: \"" + result.text + "\"");
        return result;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    config::STTConfig config_;
    whisper_context* ctx_;
};

WhisperTranscriber::WhisperTranscriber(const config::STTConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

WhisperTranscriber::~WhisperTranscriber() = default;

Result<Transcript> WhisperTranscriber::transcribe(const std::vector<AudioFrame>& frames,
                                                  const std::string& language_hint,
                                                  const CancellationToken& cancel) {
    return impl_->transcribe(frames, language_hint, cancel);
}

bool WhisperTranscriber::is_ready() const {
    return impl_->is_ready();
}

} // namespace stt
} // namespace samaira
