/**
 * Resampler/Framer: fixed frame size regardless of capture block sizes.
 * Run from build dir: ./test_resampler
 */

#include "client/resampler.h"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace samaira;
using namespace samaira::client;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

std::vector<float> ramp(size_t n) {
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<float>(i % 1000) / 1000.0f - 0.5f;
    }
    return out;
}

/// Feed `input` in blocks whose sizes cycle through `sizes`
std::vector<AudioFrame> feed(Resampler& r, const std::vector<float>& input, const std::vector<size_t>& sizes) {
    std::vector<AudioFrame> frames;
    size_t pos = 0;
    size_t k = 0;
    while (pos < input.size()) {
        size_t n = std::min(sizes[k++ % sizes.size()], input.size() - pos);
        auto out = r.push(input.data() + pos, n);
        frames.insert(frames.end(), out.begin(), out.end());
        pos += n;
    }
    return frames;
}

} // anonymous namespace

int main() {
    // --- float_to_pcm16 ---
    ASSERT(float_to_pcm16(0.0f) == 0);
    ASSERT(float_to_pcm16(1.0f) == 32767);
    ASSERT(float_to_pcm16(-1.0f) == -32768);
    ASSERT(float_to_pcm16(2.5f) == 32767);
    ASSERT(float_to_pcm16(-7.0f) == -32768);
    ASSERT(float_to_pcm16(0.25f) == 8192);   // 8191.75 rounds up
    ASSERT(float_to_pcm16(-0.5f) == -16384);

    // --- 48 kHz -> 16 kHz: frame size fixed, block size irrelevant ---
    {
        ResamplerConfig cfg;
        cfg.input_rate = 48000;
        Resampler whole(cfg);
        Resampler jagged(cfg);
        ASSERT(whole.frame_samples() == 480);

        std::vector<float> input = ramp(48000);  // one second
        auto a = feed(whole, input, {48000});
        auto b = feed(jagged, input, {1, 7, 333, 512, 2, 4096, 960});

        ASSERT(a.size() == 33);  // 16000 / 480 = 33 rem 160
        ASSERT(a.size() == b.size());
        for (const auto& f : a) ASSERT(f.size() == 480);
        for (const auto& f : b) ASSERT(f.size() == 480);
        ASSERT(a == b);
        ASSERT(whole.pending_samples() == 160);
        ASSERT(jagged.pending_samples() == 160);

        // Integer ratio picks every third input sample
        ASSERT(a[0][1] == float_to_pcm16(input[3]));
        ASSERT(a[1][0] == float_to_pcm16(input[1440]));
    }

    // --- 44.1 kHz: non-integer ratio still yields whole frames only ---
    {
        ResamplerConfig cfg;
        cfg.input_rate = 44100;
        Resampler r(cfg);
        std::vector<float> input = ramp(44100 * 2);
        auto frames = feed(r, input, {441, 512, 1024, 13});
        size_t total = frames.size() * 480 + r.pending_samples();
        ASSERT(total >= 31999 && total <= 32001);
        for (const auto& f : frames) ASSERT(f.size() == 480);
    }

    // --- 16 kHz passthrough with a 20 ms frame ---
    {
        ResamplerConfig cfg;
        cfg.input_rate = 16000;
        cfg.frame_ms = 20;
        Resampler r(cfg);
        ASSERT(r.frame_samples() == 320);
        std::vector<float> input(640, 0.5f);
        auto frames = r.push(input);
        ASSERT(frames.size() == 2);
        ASSERT(frames[1][319] == float_to_pcm16(0.5f));
    }

    // --- Bad blocks are dropped without touching carry state ---
    {
        ResamplerConfig cfg;
        cfg.input_rate = 48000;
        Resampler r(cfg);
        std::vector<float> part(300, 0.1f);
        r.push(part);
        size_t pending = r.pending_samples();
        ASSERT(pending == 100);

        ASSERT(r.push(nullptr, 0).empty());
        std::vector<float> empty;
        ASSERT(r.push(empty).empty());
        std::vector<float> bad(100, 0.1f);
        bad[50] = std::numeric_limits<float>::quiet_NaN();
        ASSERT(r.push(bad).empty());
        bad[50] = std::numeric_limits<float>::infinity();
        ASSERT(r.push(bad).empty());

        ASSERT(r.pending_samples() == pending);
        ASSERT(r.dropped_blocks() == 4);

        r.reset();
        ASSERT(r.pending_samples() == 0);
    }

    // --- Invalid configuration ---
    {
        bool threw = false;
        try {
            ResamplerConfig cfg;
            cfg.input_rate = 0;
            Resampler r(cfg);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT(threw);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All resampler tests passed.\n";
    return 0;
}
