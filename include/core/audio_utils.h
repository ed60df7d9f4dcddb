#pragma once

/**
 * @file audio_utils.h
 * @brief Whole-buffer PCM16 helpers shared by synthesis and playback
 */

#include "core/types.h"

namespace samaira {

/// Linear-interpolation resampler for whole PCM16 buffers
AudioBuffer resample_linear(const AudioBuffer& input, int from_rate, int to_rate);

/// Multiply by gain, saturating at the int16 range
void apply_gain(AudioBuffer& samples, float gain);

} // namespace samaira
