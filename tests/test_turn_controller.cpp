/**
 * Turn controller: utterance capture, held audio during replies, stop,
 * close, retries and the turn/idle/held-audio limits.
 * Run from build dir: ./test_turn_controller
 */

#include "session/turn_controller.h"
#include "vad/energy_vad.h"
#include "stub_engines.h"
#include <iostream>
#include <thread>

using namespace samaira;
using namespace samaira::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

session::TurnControllerConfig fast_config() {
    session::TurnControllerConfig cfg;
    cfg.retry_backoff_ms = 5;
    cfg.bridge.retry_backoff_ms = 5;
    return cfg;
}

struct Harness {
    explicit Harness(const session::TurnControllerConfig& cfg = fast_config()) {
        controller = std::make_unique<session::TurnController>(
            cfg, std::make_unique<vad::EnergyVAD>(),
            session::Engines{stt, model, synth}, memory, sink, "test-session");
    }

    void speak(int speech_frames, int silence_frames) {
        for (int i = 0; i < speech_frames; ++i) controller->post_audio(speech_frame());
        for (int i = 0; i < silence_frames; ++i) controller->post_audio(silence_frame());
    }

    StubTranscriber stt;
    StubModel model;
    StubSynthesizer synth{1};
    memory::ConversationMemory memory;
    RecordingSink sink;
    std::unique_ptr<session::TurnController> controller;
};

int index_of(const std::vector<std::string>& types, const std::string& type, int nth = 0) {
    for (size_t i = 0; i < types.size(); ++i) {
        if (types[i] == type && nth-- == 0) return static_cast<int>(i);
    }
    return -1;
}

} // anonymous namespace

int main() {
    // --- One utterance, one reply ---
    {
        Harness h;
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));

        ASSERT(h.stt.calls() == 1);
        ASSERT(h.stt.frame_counts().size() == 1 && h.stt.frame_counts()[0] == 40);
        ASSERT(h.stt.last_language() == "hi");

        auto types = h.sink.types();
        ASSERT((types == std::vector<std::string>{"vad_state", "vad_state", "stt_final",
                                                  "reply_token", "reply_token", "tts_chunk",
                                                  "turn_done"}));
        auto vad = h.sink.of_type<protocol::VadState>();
        ASSERT(vad.size() == 2 && vad[0].speech && !vad[1].speech);
        auto finals = h.sink.of_type<protocol::SttFinal>();
        ASSERT(finals.size() == 1 && finals[0].text == "SIP kya hai" && finals[0].turn == 1);
        ASSERT(h.sink.of_type<protocol::TurnDone>()[0].turn == 1);

        auto stats = h.controller->get_stats();
        ASSERT(stats.state == session::TurnState::Idle);
        ASSERT(stats.frames_received == 65);
        ASSERT(stats.turns_started == 1);
        ASSERT(stats.turns_completed == 1);
        ASSERT(stats.frames_held == 0);
        ASSERT(h.memory.message_count() == 2);
    }

    // --- Stop while Idle is a no-op, repeatedly ---
    {
        Harness h;
        h.controller->post_stop();
        h.controller->post_stop();
        ASSERT(h.controller->wait_until_quiescent(1000));
        ASSERT(h.sink.messages().empty());
        ASSERT(h.controller->state() == session::TurnState::Idle);
    }

    // --- Stop while Capturing discards the utterance ---
    {
        Harness h;
        h.speak(10, 0);
        ASSERT(eventually([&] { return h.controller->state() == session::TurnState::Capturing; }, 1000));
        h.controller->post_stop();
        h.speak(0, 25);
        ASSERT(h.controller->wait_until_quiescent(1000));
        ASSERT(h.stt.calls() == 0);
        ASSERT(h.controller->state() == session::TurnState::Idle);
    }

    // --- Speech during a reply is held and becomes the next turn ---
    {
        Harness h;
        Gate gate;
        h.synth.set_gate(&gate);
        h.model.set_tokens({"Theek hai. ", "Aur kuch?"});

        h.speak(40, 25);
        ASSERT(eventually([&] { return h.controller->state() == session::TurnState::Speaking; }, 2000));

        h.stt.reply_next("Aur batao");
        h.speak(40, 25);
        // Five trailing silence frames of the first utterance are held as well
        ASSERT(eventually([&] { return h.controller->get_stats().frames_held == 70; }, 2000));
        ASSERT(h.stt.calls() == 1);
        ASSERT(h.controller->state() == session::TurnState::Speaking);

        gate.open();
        ASSERT(h.controller->wait_until_quiescent(5000));

        ASSERT(h.stt.calls() == 2);
        ASSERT(h.stt.max_concurrent() == 1);
        ASSERT(h.stt.frame_counts().size() == 2 && h.stt.frame_counts()[1] == 40);
        ASSERT(h.sink.count<protocol::TurnDone>() == 2);
        ASSERT(h.sink.count<protocol::ErrorMessage>() == 0);

        auto types = h.sink.types();
        ASSERT(index_of(types, "turn_done", 0) < index_of(types, "stt_final", 1));
        auto finals = h.sink.of_type<protocol::SttFinal>();
        ASSERT(finals.size() == 2 && finals[1].text == "Aur batao" && finals[1].turn == 2);
        ASSERT(h.controller->get_stats().turns_completed == 2);
    }

    // --- Transient transcription failure: retried, user never sees it ---
    {
        Harness h;
        h.stt.fail_next(make_transient_error("whisper busy"));
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.stt.calls() == 2);
        ASSERT(h.sink.count<protocol::ErrorMessage>() == 0);
        ASSERT(h.sink.count<protocol::SttFinal>() == 1);
        ASSERT(h.sink.count<protocol::TurnDone>() == 1);
    }

    // --- Transient twice: one retryable error, no turn_done ---
    {
        Harness h;
        h.stt.fail_next(make_transient_error("whisper busy"));
        h.stt.fail_next(make_transient_error("whisper still busy"));
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.stt.calls() == 2);
        auto errors = h.sink.of_type<protocol::ErrorMessage>();
        ASSERT(errors.size() == 1);
        ASSERT(errors[0].kind == ErrorType::EngineTransient);
        ASSERT(errors[0].retryable);
        ASSERT(h.sink.count<protocol::SttFinal>() == 0);
        ASSERT(h.sink.count<protocol::TurnDone>() == 0);
        ASSERT(h.controller->get_stats().turns_failed == 1);
        ASSERT(h.controller->state() == session::TurnState::Idle);
    }

    // --- Fatal transcription failure is not retried ---
    {
        Harness h;
        h.stt.fail_next(make_fatal_error("model file missing"));
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.stt.calls() == 1);
        auto errors = h.sink.of_type<protocol::ErrorMessage>();
        ASSERT(errors.size() == 1 && errors[0].kind == ErrorType::EngineFatal && !errors[0].retryable);
    }

    // --- Model failure after stt_final: error precedes turn_done ---
    {
        Harness h;
        h.model.fail_next(make_fatal_error("model not found"));
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        auto types = h.sink.types();
        ASSERT(index_of(types, "stt_final") >= 0);
        ASSERT(index_of(types, "error") >= 0);
        ASSERT(index_of(types, "error") < index_of(types, "turn_done"));
        ASSERT(h.sink.count<protocol::TurnDone>() == 1);
        ASSERT(types.back() == "turn_done");
    }

    // --- Empty transcript: discarded silently ---
    {
        Harness h;
        h.stt.reply_next("[BLANK_AUDIO]");
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT((h.sink.types() == std::vector<std::string>{"vad_state", "vad_state"}));
        ASSERT(h.model.calls() == 0);
        ASSERT(h.controller->get_stats().turns_discarded == 1);
        ASSERT(h.memory.message_count() == 0);
    }

    // --- Stop mid-reply: turn_done, no error, partial reply kept ---
    {
        Harness h;
        h.model.hang_after_tokens(true);
        h.speak(40, 25);
        ASSERT(h.sink.wait_for_count<protocol::ReplyToken>(2, 3000));
        h.controller->post_stop();
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.model.cancelled() == 1);
        ASSERT(h.sink.count<protocol::ErrorMessage>() == 0);
        ASSERT(h.sink.count<protocol::TurnDone>() == 1);
        ASSERT(h.sink.count<protocol::TtsChunk>() == 0);
        ASSERT(h.memory.message_count() == 2);
        ASSERT(h.controller->state() == session::TurnState::Idle);
    }

    // --- Connection closed mid-generation ---
    {
        Harness h;
        h.model.hang_after_tokens(true);
        h.speak(40, 25);
        ASSERT(h.sink.wait_for_count<protocol::ReplyToken>(2, 3000));

        h.sink.close();
        auto start = std::chrono::steady_clock::now();
        h.controller->close();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ASSERT(elapsed < 1000);
        ASSERT(h.model.cancelled() == 1);
        ASSERT(h.sink.sends_after_close() == 0);

        // Further events are ignored
        h.speak(5, 0);
        h.controller->post_stop();
        h.controller->close();
        ASSERT(h.sink.sends_after_close() == 0);
    }

    // --- Turn exceeding max_turn_ms ---
    {
        auto cfg = fast_config();
        cfg.max_turn_ms = 200;
        Harness h(cfg);
        h.model.hang_after_tokens(true);
        h.speak(40, 25);
        ASSERT(h.controller->wait_until_quiescent(3000));
        auto errors = h.sink.of_type<protocol::ErrorMessage>();
        ASSERT(errors.size() == 1 && errors[0].kind == ErrorType::TurnTimeout);
        ASSERT(errors[0].retryable);
        auto types = h.sink.types();
        ASSERT(index_of(types, "error") < index_of(types, "turn_done"));
        ASSERT(h.controller->get_stats().turns_failed == 1);
    }

    // --- Held audio over max_held_ms: oldest dropped, one error ---
    {
        auto cfg = fast_config();
        cfg.max_held_ms = 300;
        Harness h(cfg);
        Gate gate;
        h.synth.set_gate(&gate);

        h.speak(40, 25);
        ASSERT(eventually([&] { return h.controller->state() == session::TurnState::Speaking; }, 2000));

        // 5 trailing silence frames + 20 speech frames, 10 fit
        h.speak(20, 0);
        ASSERT(eventually([&] { return h.controller->get_stats().frames_dropped == 15; }, 2000));
        h.speak(5, 0);
        ASSERT(eventually([&] { return h.controller->get_stats().frames_dropped == 20; }, 2000));
        ASSERT(h.controller->get_stats().frames_held == 10);

        auto errors = h.sink.of_type<protocol::ErrorMessage>();
        ASSERT(errors.size() == 1 && errors[0].kind == ErrorType::CapacityExceeded);

        gate.open();
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.sink.count<protocol::TurnDone>() == 1);
        // Replayed speech with no end yet
        ASSERT(h.controller->state() == session::TurnState::Capturing);
    }

    // --- Utterance cap forces transcription ---
    {
        auto cfg = fast_config();
        cfg.max_utterance_ms = 300;
        Harness h(cfg);
        h.speak(15, 0);
        ASSERT(h.controller->wait_until_quiescent(3000));
        ASSERT(h.stt.calls() == 1);
        ASSERT(h.stt.frame_counts()[0] == 10);
        // The five frames after the cap start a new utterance
        ASSERT(h.controller->state() == session::TurnState::Capturing);
        ASSERT(h.sink.count<protocol::VadState>() == 3);
    }

    // --- Idle timeout ---
    {
        auto cfg = fast_config();
        cfg.idle_timeout_ms = 100;
        Harness h(cfg);
        std::atomic<int> fired{0};
        h.controller->set_idle_timeout_callback([&] { fired++; });
        ASSERT(eventually([&] { return fired.load() == 1; }, 2000));
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        ASSERT(fired.load() == 1);
        auto errors = h.sink.of_type<protocol::ErrorMessage>();
        ASSERT(errors.size() == 1 && errors[0].kind == ErrorType::TransportClosed);
    }

    // --- state_to_string ---
    {
        ASSERT(std::string(session::state_to_string(session::TurnState::Idle)) == "Idle");
        ASSERT(std::string(session::state_to_string(session::TurnState::Speaking)) == "Speaking");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All turn controller tests passed.\n";
    return 0;
}
