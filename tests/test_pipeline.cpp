/**
 * End-to-end pipeline over the wire codec with deterministic engines:
 * client frames in, server messages out, played back through the sequencer.
 * Asserts:
 * - A reply streams as stt_final, reply_tokens, tts_chunks (seq 0..n-1), turn_done.
 * - Everything the server sends survives encode/decode on the client side.
 * - A resumed session keeps its conversation context across connections.
 *
 * Run from build dir: ./test_pipeline
 * No whisper/PortAudio/Ollama/Piper required.
 */

#include "client/playback_sequencer.h"
#include "protocol/codec.h"
#include "session/session_registry.h"
#include "session/turn_controller.h"
#include "vad/energy_vad.h"
#include "stub_engines.h"
#include <iostream>
#include <string>

using namespace samaira;
using namespace samaira::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

class FakeDevice : public client::IPlaybackSink {
public:
    void play(const AudioBuffer& samples, int sample_rate) override {
        played.push_back(samples.empty() ? -1 : samples[0]);
        rates.push_back(sample_rate);
    }
    std::vector<int> played;
    std::vector<int> rates;
};

session::TurnControllerConfig fast_config() {
    session::TurnControllerConfig cfg;
    cfg.retry_backoff_ms = 5;
    cfg.bridge.retry_backoff_ms = 5;
    return cfg;
}

/// Frames go through the same encode/decode path the server uses
void send_frames(session::TurnController& controller, const AudioFrame& frame, int count) {
    std::string wire = protocol::encode(protocol::ClientMessage{protocol::AudioChunk{frame}});
    for (int i = 0; i < count; ++i) {
        auto decoded = protocol::decode_client(wire, audio::SAMPLES_PER_FRAME);
        ASSERT(decoded.is_ok());
        if (!decoded) continue;
        auto* chunk = std::get_if<protocol::AudioChunk>(&decoded.value());
        ASSERT(chunk != nullptr);
        if (chunk) controller.post_audio(chunk->frame);
    }
}

void speak(session::TurnController& controller) {
    send_frames(controller, speech_frame(), 40);
    send_frames(controller, silence_frame(), 25);
}

/// Client side: decode everything the server sent
std::vector<protocol::ServerMessage> receive(const RecordingSink& sink) {
    std::vector<protocol::ServerMessage> out;
    for (const auto& message : sink.messages()) {
        auto decoded = protocol::decode_server(protocol::encode(message));
        ASSERT(decoded.is_ok());
        if (decoded) out.push_back(decoded.value());
    }
    return out;
}

} // anonymous namespace

int main() {
    session::SessionRegistry registry;

    // --- Streamed reply, played back in order ---
    std::string session_id;
    {
        StubTranscriber stt("SIP kya hai");
        StubModel model({"SIP ", "ek ", "accha ", "option ", "hai"});
        StubSynthesizer synth(3);
        synth.set_marker("SIP ek accha option hai", 7);
        RecordingSink sink;

        auto attached = registry.attach(std::nullopt);
        ASSERT(attached.is_ok());
        auto entry = attached.value().entry;
        ASSERT(!attached.value().resumed);
        session_id = entry->id();

        session::TurnController controller(fast_config(), std::make_unique<vad::EnergyVAD>(),
                                           session::Engines{stt, model, synth},
                                           entry->memory(), sink, session_id);
        speak(controller);
        ASSERT(controller.wait_until_quiescent(3000));

        auto received = receive(sink);
        std::vector<std::string> types;
        for (const auto& m : received) types.push_back(protocol::message_type(m));
        ASSERT((types == std::vector<std::string>{"vad_state", "vad_state", "stt_final",
                                                  "reply_token", "reply_token", "reply_token",
                                                  "reply_token", "reply_token",
                                                  "tts_chunk", "tts_chunk", "tts_chunk",
                                                  "turn_done"}));

        FakeDevice device;
        client::PlaybackSequencer sequencer(device);
        int caught_up = 0;
        sequencer.set_caught_up_callback([&](uint64_t turn) {
            ASSERT(turn == 1);
            caught_up++;
        });

        std::string reply;
        uint64_t expected_seq = 0;
        for (const auto& m : received) {
            if (auto* final_text = std::get_if<protocol::SttFinal>(&m)) {
                ASSERT(final_text->text == "SIP kya hai");
            } else if (auto* token = std::get_if<protocol::ReplyToken>(&m)) {
                ASSERT(token->turn == 1);
                reply += token->text;
            } else if (auto* chunk = std::get_if<protocol::TtsChunk>(&m)) {
                ASSERT(chunk->seq == expected_seq++);
                ASSERT(chunk->format == protocol::PCM16_FORMAT);
                client::PlaybackChunk pc;
                pc.turn = chunk->turn;
                pc.seq = chunk->seq;
                pc.sample_rate = chunk->sample_rate;
                pc.samples = chunk->audio;
                sequencer.push(std::move(pc));
            } else if (auto* done = std::get_if<protocol::TurnDone>(&m)) {
                sequencer.mark_turn_done(done->turn);
            }
        }
        ASSERT(reply == "SIP ek accha option hai");

        for (int i = 0; i < 10 && !sequencer.is_idle(); ++i) {
            sequencer.on_playback_finished();
        }
        ASSERT(sequencer.is_idle());
        ASSERT((device.played == std::vector<int>{7, 7, 7}));
        ASSERT(device.rates.size() == 3 && device.rates[0] == audio::SAMPLE_RATE);
        ASSERT(caught_up == 1);

        controller.close();
        registry.detach(session_id);
    }

    // --- Reconnect with the stored id: context carries over ---
    {
        StubTranscriber stt("Aur koi option?");
        StubModel model({"Haan, ", "FD bhi."});
        StubSynthesizer synth(1);
        RecordingSink sink;

        auto attached = registry.attach(session_id);
        ASSERT(attached.is_ok());
        ASSERT(attached.value().resumed);
        auto entry = attached.value().entry;
        ASSERT(entry->id() == session_id);
        ASSERT(entry->memory().message_count() == 2);

        session::TurnController controller(fast_config(), std::make_unique<vad::EnergyVAD>(),
                                           session::Engines{stt, model, synth},
                                           entry->memory(), sink, session_id);
        speak(controller);
        ASSERT(controller.wait_until_quiescent(3000));

        auto context = model.last_context();
        ASSERT(context.size() == 3);
        if (context.size() == 3) {
            ASSERT(context[0].role == MessageRole::System);
            ASSERT(context[1].content == "SIP kya hai");
            ASSERT(context[2].content == "SIP ek accha option hai");
        }
        ASSERT(model.last_user_text() == "Aur koi option?");
        ASSERT(entry->memory().message_count() == 4);

        // Turn ids are per connection
        auto finals = sink.of_type<protocol::SttFinal>();
        ASSERT(finals.size() == 1 && finals[0].turn == 1);

        controller.close();
        registry.detach(session_id);
    }

    // --- Two connections on separate sessions do not share context ---
    {
        StubTranscriber stt;
        StubModel model;
        StubSynthesizer synth(1);
        RecordingSink sink;

        auto attached = registry.attach(std::nullopt);
        ASSERT(attached.is_ok());
        auto entry = attached.value().entry;
        ASSERT(entry->id() != session_id);
        ASSERT(entry->memory().message_count() == 0);
        registry.detach(entry->id());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All pipeline tests passed.\n";
    return 0;
}
