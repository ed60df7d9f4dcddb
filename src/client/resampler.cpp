/**
 * @file resampler.cpp
 * @brief Linear-interpolation resampler with exact framing
 */

#include "client/resampler.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace samaira {
namespace client {

Sample float_to_pcm16(float s) {
    float clamped = std::clamp(s, -1.0f, 1.0f);
    double scaled = clamped < 0.0f ? clamped * 32768.0 : clamped * 32767.0;
    long rounded = std::lround(scaled);
    rounded = std::clamp(rounded, -32768L, 32767L);
    return static_cast<Sample>(rounded);
}

class Resampler::Impl {
public:
    explicit Impl(const ResamplerConfig& config)
        : config_(config)
        , step_(0.0)
        , frame_samples_(0)
        , position_(0.0)
        , prev_sample_(0.0f)
        , dropped_blocks_(0)
    {
        if (config.input_rate <= 0 || config.output_rate <= 0 || config.frame_ms <= 0) {
            throw std::invalid_argument("Resampler rates and frame duration must be positive");
        }
        step_ = static_cast<double>(config.input_rate) / config.output_rate;
        frame_samples_ = audio::ms_to_samples(config.frame_ms, config.output_rate);
        carry_.reserve(frame_samples_ * 2);

        LOG_AUDIO("Resampler " + std::to_string(config.input_rate) + " Hz -> " +
                  std::to_string(config.output_rate) + " Hz, " +
                  std::to_string(frame_samples_) + " samples/frame");
    }

    std::vector<AudioFrame> push(const float* samples, size_t count) {
        std::vector<AudioFrame> frames;

        if (samples == nullptr || count == 0) {
            dropped_blocks_++;
            Logger::warn("[Audio] Dropping empty capture block");
            return frames;
        }
        for (size_t i = 0; i < count; ++i) {
            if (!std::isfinite(samples[i])) {
                dropped_blocks_++;
                Logger::warn("[Audio] Dropping capture block with non-finite sample at index " +
                             std::to_string(i));
                return frames;
            }
        }

        // position_ is relative to samples[0]; -1 addresses the previous block's last sample
        const double last = static_cast<double>(count - 1);
        while (position_ <= last) {
            double base = std::floor(position_);
            long idx = static_cast<long>(base);
            double frac = position_ - base;

            float s0 = sample_at(samples, idx);
            float s1 = sample_at(samples, std::min<long>(idx + 1, static_cast<long>(count) - 1));
            double value = s0 + (s1 - s0) * frac;

            carry_.push_back(float_to_pcm16(static_cast<float>(value)));
            position_ += step_;
        }
        position_ -= static_cast<double>(count);
        prev_sample_ = samples[count - 1];

        while (carry_.size() >= frame_samples_) {
            frames.emplace_back(carry_.begin(), carry_.begin() + frame_samples_);
            carry_.erase(carry_.begin(), carry_.begin() + frame_samples_);
        }
        return frames;
    }

    void reset() {
        carry_.clear();
        position_ = 0.0;
        prev_sample_ = 0.0f;
    }

    size_t frame_samples() const { return frame_samples_; }
    size_t pending_samples() const { return carry_.size(); }
    uint64_t dropped_blocks() const { return dropped_blocks_; }

private:
    float sample_at(const float* samples, long idx) const {
        return idx < 0 ? prev_sample_ : samples[idx];
    }

    ResamplerConfig config_;
    double step_;
    size_t frame_samples_;

    double position_;
    float prev_sample_;
    AudioBuffer carry_;
    uint64_t dropped_blocks_;
};

Resampler::Resampler(const ResamplerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

Resampler::~Resampler() = default;

std::vector<AudioFrame> Resampler::push(const float* samples, size_t count) {
    return impl_->push(samples, count);
}

void Resampler::reset() {
    impl_->reset();
}

size_t Resampler::frame_samples() const {
    return impl_->frame_samples();
}

size_t Resampler::pending_samples() const {
    return impl_->pending_samples();
}

uint64_t Resampler::dropped_blocks() const {
    return impl_->dropped_blocks();
}

} // namespace client
} // namespace samaira
