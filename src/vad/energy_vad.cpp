/**
 * @file energy_vad.cpp
 * @brief Energy-based VAD implementation
 */

#include "vad/energy_vad.h"
#include "logger.h"
#include <cmath>
#include <algorithm>
#include <sstream>

namespace samaira {
namespace vad {

EnergyVADConfig EnergyVADConfig::from(const Config& config) {
    EnergyVADConfig c;
    c.aggressiveness = config.vad.aggressiveness;
    c.base_threshold = config.vad.base_threshold;
    c.end_silence_ms = config.vad.end_silence_ms;
    c.sample_rate = config.audio.sample_rate;
    return c;
}

float effective_threshold(const EnergyVADConfig& config) {
    int level = std::clamp(config.aggressiveness, 0, 3);
    return config.base_threshold * constants::vad::AGGRESSIVENESS_MULTIPLIERS[level];
}

float compute_rms(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;

    double sum_sq = 0.0;
    for (Sample s : frame) {
        double normalized = static_cast<double>(s) / 32768.0;
        sum_sq += normalized * normalized;
    }

    return static_cast<float>(std::sqrt(sum_sq / frame.size()));
}

/**
 * @brief Implementation details for EnergyVAD
 */
class EnergyVAD::Impl {
public:
    explicit Impl(const EnergyVADConfig& config)
        : config_(config)
        , threshold_(effective_threshold(config))
        , end_silence_samples_(audio::ms_to_samples(config.end_silence_ms, config.sample_rate))
        , in_utterance_(false)
        , speech_samples_(0)
        , silence_samples_(0)
        , current_rms_(0.0f)
    {
        std::ostringstream oss;
        oss << "EnergyVAD initialized: aggressiveness=" << config.aggressiveness
            << ", threshold=" << threshold_
            << ", end_silence=" << config.end_silence_ms << "ms";
        LOG_VAD(oss.str());
    }

    FrameResult process(const AudioFrame& frame) {
        FrameResult result;
        if (frame.empty()) {
            return result;
        }

        current_rms_ = compute_rms(frame);
        result.is_speech = current_rms_ > threshold_;

        if (result.is_speech) {
            if (!in_utterance_) {
                in_utterance_ = true;
                speech_samples_ = 0;
                result.event = Event::SpeechStart;
                log_state_transition("SpeechStart");
            }
            speech_samples_ += frame.size();
            silence_samples_ = 0;
            return result;
        }

        // Silence before any speech is discarded without ever ending an utterance
        if (!in_utterance_) {
            return result;
        }

        silence_samples_ += frame.size();
        if (silence_samples_ >= end_silence_samples_) {
            log_state_transition("UtteranceEnd");
            result.event = Event::UtteranceEnd;
            in_utterance_ = false;
            speech_samples_ = 0;
            silence_samples_ = 0;
        }
        return result;
    }

    void reset() {
        in_utterance_ = false;
        speech_samples_ = 0;
        silence_samples_ = 0;
    }

    Stats get_stats() const {
        Stats stats;
        stats.in_utterance = in_utterance_;
        stats.current_rms = current_rms_;
        stats.threshold = threshold_;
        stats.speech_duration_ms = audio::samples_to_ms(speech_samples_, config_.sample_rate);
        stats.silence_duration_ms = audio::samples_to_ms(silence_samples_, config_.sample_rate);
        return stats;
    }

    bool is_speech() const {
        return in_utterance_;
    }

private:
    void log_state_transition(const char* event) const {
        std::ostringstream oss;
        oss << event
            << " rms=" << current_rms_
            << " threshold=" << threshold_
            << " speech_ms=" << audio::samples_to_ms(speech_samples_, config_.sample_rate)
            << " silence_ms=" << audio::samples_to_ms(silence_samples_, config_.sample_rate);
        LOG_VAD(oss.str());
    }

    EnergyVADConfig config_;
    float threshold_;
    size_t end_silence_samples_;

    bool in_utterance_;
    size_t speech_samples_;
    size_t silence_samples_;
    float current_rms_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

EnergyVAD::EnergyVAD(const EnergyVADConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

EnergyVAD::~EnergyVAD() = default;

FrameResult EnergyVAD::process(const AudioFrame& frame) {
    return impl_->process(frame);
}

void EnergyVAD::reset() {
    impl_->reset();
}

Stats EnergyVAD::get_stats() const {
    return impl_->get_stats();
}

bool EnergyVAD::is_speech() const {
    return impl_->is_speech();
}

} // namespace vad
} // namespace samaira
