#pragma once

/**
 * @file energy_vad.h
 * @brief Energy-based Voice Activity Detection
 *
 * Features:
 * - Per-frame RMS classification against a fixed threshold
 * - Aggressiveness levels that scale the threshold
 * - Edge-triggered utterance end after a trailing-silence threshold
 * - Silence-only streams never end an utterance
 */

#include "vad_interface.h"
#include "core/config.h"
#include "core/constants.h"
#include <memory>

namespace samaira {
namespace vad {

/**
 * @brief Configuration for energy-based VAD
 */
struct EnergyVADConfig {
    /// 0 (most permissive) to 3 (most aggressive); fixed for the detector's lifetime
    int aggressiveness = constants::vad::DEFAULT_AGGRESSIVENESS;

    /// RMS threshold at aggressiveness 0 (normalized 0-1)
    float base_threshold = constants::vad::BASE_THRESHOLD;

    /// Trailing silence that ends an utterance (ms)
    int end_silence_ms = constants::vad::END_SILENCE_MS;

    /// Sample rate of incoming frames
    int sample_rate = audio::SAMPLE_RATE;

    static EnergyVADConfig from(const Config& config);
};

/**
 * @brief Effective RMS threshold for a config (base scaled by aggressiveness)
 */
float effective_threshold(const EnergyVADConfig& config);

/**
 * @brief Normalized RMS energy of one frame
 */
float compute_rms(const AudioFrame& frame);

/**
 * @brief Energy-based VAD implementation
 */
class EnergyVAD : public IVAD {
public:
    explicit EnergyVAD(const EnergyVADConfig& config = {});
    ~EnergyVAD() override;

    EnergyVAD(const EnergyVAD&) = delete;
    EnergyVAD& operator=(const EnergyVAD&) = delete;

    // IVAD interface
    FrameResult process(const AudioFrame& frame) override;
    void reset() override;
    Stats get_stats() const override;
    bool is_speech() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vad
} // namespace samaira
