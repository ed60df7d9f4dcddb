/**
 * Energy VAD: per-frame classification, edge-triggered utterance end,
 * silence-only streams, aggressiveness scaling.
 * Run from build dir: ./test_vad
 */

#include "vad/energy_vad.h"
#include <cmath>
#include <iostream>

using namespace samaira;
using namespace samaira::vad;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

AudioFrame frame_with_amplitude(Sample amplitude) {
    AudioFrame frame(audio::SAMPLES_PER_FRAME);
    for (size_t i = 0; i < frame.size(); ++i) {
        frame[i] = (i % 2 == 0) ? amplitude : static_cast<Sample>(-amplitude);
    }
    return frame;
}

bool near(float a, float b) {
    return std::fabs(a - b) < 1e-5f;
}

} // anonymous namespace

int main() {
    const AudioFrame speech = frame_with_amplitude(6000);   // rms ~0.18
    const AudioFrame silence(audio::SAMPLES_PER_FRAME, 0);

    // --- Threshold scaling ---
    EnergyVADConfig cfg;
    cfg.base_threshold = 0.01f;
    for (int level = 0; level <= 3; ++level) {
        cfg.aggressiveness = level;
        static const float expected[4] = {0.01f, 0.015f, 0.0225f, 0.03f};
        ASSERT(near(effective_threshold(cfg), expected[level]));
    }
    ASSERT(near(compute_rms(silence), 0.0f));
    ASSERT(near(compute_rms(frame_with_amplitude(16384)), 0.5f));
    ASSERT(compute_rms(AudioFrame{}) == 0.0f);

    // A soft frame is speech at level 0 but not at level 3
    {
        const AudioFrame soft = frame_with_amplitude(655);  // rms ~0.02
        EnergyVADConfig permissive;
        permissive.aggressiveness = 0;
        EnergyVADConfig strict;
        strict.aggressiveness = 3;
        EnergyVAD a(permissive);
        EnergyVAD b(strict);
        ASSERT(a.process(soft).is_speech);
        ASSERT(!b.process(soft).is_speech);
    }

    // --- Silence-only stream never ends an utterance ---
    {
        EnergyVAD vad;
        for (int i = 0; i < 500; ++i) {
            FrameResult r = vad.process(silence);
            ASSERT(!r.is_speech);
            ASSERT(r.event == Event::None);
        }
        ASSERT(!vad.is_speech());
    }

    // --- Speech then 600 ms of silence: exactly one edge ---
    {
        EnergyVAD vad;  // 600 ms default
        FrameResult first = vad.process(speech);
        ASSERT(first.is_speech);
        ASSERT(first.event == Event::SpeechStart);
        for (int i = 0; i < 39; ++i) {
            FrameResult r = vad.process(speech);
            ASSERT(r.event == Event::None);
        }
        ASSERT(vad.is_speech());

        int ends = 0;
        int end_index = -1;
        for (int i = 0; i < 25; ++i) {
            FrameResult r = vad.process(silence);
            if (r.event == Event::UtteranceEnd) {
                ends++;
                end_index = i;
            }
        }
        ASSERT(ends == 1);
        ASSERT(end_index == 19);  // 20 frames x 30 ms = 600 ms
        ASSERT(!vad.is_speech());
    }

    // --- Speech resets the silence counter ---
    {
        EnergyVAD vad;
        vad.process(speech);
        for (int i = 0; i < 19; ++i) {
            ASSERT(vad.process(silence).event == Event::None);
        }
        ASSERT(vad.get_stats().silence_duration_ms == 570);
        vad.process(speech);
        ASSERT(vad.get_stats().silence_duration_ms == 0);
        for (int i = 0; i < 19; ++i) {
            ASSERT(vad.process(silence).event == Event::None);
        }
        ASSERT(vad.process(silence).event == Event::UtteranceEnd);
    }

    // --- Shorter threshold, reset ---
    {
        EnergyVADConfig quick;
        quick.end_silence_ms = 90;
        EnergyVAD vad(quick);
        vad.process(speech);
        vad.process(silence);
        vad.reset();
        ASSERT(!vad.is_speech());
        // After reset the old utterance cannot end
        for (int i = 0; i < 10; ++i) {
            ASSERT(vad.process(silence).event == Event::None);
        }
        ASSERT(vad.process(speech).event == Event::SpeechStart);
        vad.process(silence);
        vad.process(silence);
        ASSERT(vad.process(silence).event == Event::UtteranceEnd);
    }

    // --- Config mapping ---
    {
        Config config;
        config.vad.aggressiveness = 1;
        config.vad.end_silence_ms = 450;
        EnergyVADConfig mapped = EnergyVADConfig::from(config);
        ASSERT(mapped.aggressiveness == 1);
        ASSERT(mapped.end_silence_ms == 450);
        ASSERT(mapped.sample_rate == 16000);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All VAD tests passed.\n";
    return 0;
}
