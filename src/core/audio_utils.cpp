#include "core/audio_utils.h"
#include <algorithm>
#include <cmath>

namespace samaira {

AudioBuffer resample_linear(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(std::lround(interpolated)));
    }

    return output;
}

void apply_gain(AudioBuffer& samples, float gain) {
    if (gain == 1.0f) return;
    for (auto& s : samples) {
        float v = static_cast<float>(s) * gain;
        v = std::max(-32768.0f, std::min(32767.0f, v));
        s = static_cast<Sample>(v);
    }
}

} // namespace samaira
