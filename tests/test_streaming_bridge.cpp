/**
 * Streaming bridge: immediate reply tokens, span synthesis, seq ordering
 * under out-of-order completion, retry and failure paths.
 * Run from build dir: ./test_streaming_bridge
 */

#include "bridge/streaming_bridge.h"
#include "stub_engines.h"
#include <iostream>
#include <thread>

using namespace samaira;
using namespace samaira::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

bridge::StreamingBridgeConfig fast_config(int lookahead = 2) {
    bridge::StreamingBridgeConfig cfg;
    cfg.synthesis_lookahead = lookahead;
    cfg.retry_backoff_ms = 5;
    return cfg;
}

memory::ConversationContext context() {
    return {memory::ConversationMessage::system("Be brief.")};
}

/// seq values of every tts_chunk are 0..n-1 in send order
bool seqs_contiguous(const RecordingSink& sink) {
    auto chunks = sink.of_type<protocol::TtsChunk>();
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].seq != i) return false;
    }
    return true;
}

} // anonymous namespace

int main() {
    // --- Token fan-out: five tokens, one flushed span ---
    {
        StubModel model({"SIP ", "ek ", "accha ", "option ", "hai"});
        StubSynthesizer synth(2);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        int speaking = 0;

        auto result = bridge.run(1, context(), "SIP kaisa hai?", sink, cancel, [&] { speaking++; });
        ASSERT(result.ok());
        ASSERT(result.tokens == 5);
        ASSERT(result.reply_text == "SIP ek accha option hai");
        ASSERT(result.spans == 1);
        ASSERT(result.chunks_sent == 2);
        ASSERT(speaking == 1);

        auto tokens = sink.of_type<protocol::ReplyToken>();
        ASSERT(tokens.size() == 5);
        std::string joined;
        for (const auto& t : tokens) {
            ASSERT(t.turn == 1);
            joined += t.text;
        }
        ASSERT(joined == "SIP ek accha option hai");
        ASSERT((synth.spans() == std::vector<std::string>{"SIP ek accha option hai"}));
        ASSERT(seqs_contiguous(sink));
        ASSERT(model.last_user_text() == "SIP kaisa hai?");
        ASSERT(model.last_context().size() == 1);

        // All reply tokens precede the first chunk here: the only span is the flush
        auto types = sink.types();
        ASSERT(types.size() == 7);
        ASSERT(types[4] == "reply_token" && types[5] == "tts_chunk");
    }

    // --- Spans finishing out of order still go out in span order ---
    {
        StubModel model({"Pehla vaakya hai. ", "Doosra. ", "Teesra."});
        StubSynthesizer synth(2);
        synth.set_marker("Pehla vaakya hai.", 1);
        synth.set_marker("Doosra.", 2);
        synth.set_marker("Teesra.", 3);
        synth.set_delay("Pehla vaakya hai.", 150);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config(3));
        CancellationToken cancel;

        auto result = bridge.run(7, context(), "q", sink, cancel);
        ASSERT(result.ok());
        ASSERT(result.spans == 3);
        ASSERT(synth.completion_order().size() == 3);
        ASSERT(synth.completion_order()[0] != "Pehla vaakya hai.");

        auto chunks = sink.of_type<protocol::TtsChunk>();
        ASSERT(chunks.size() == 6);
        ASSERT(seqs_contiguous(sink));
        const Sample expected[6] = {1, 1, 2, 2, 3, 3};
        for (size_t i = 0; i < chunks.size() && i < 6; ++i) {
            ASSERT(chunks[i].audio[0] == expected[i]);
            ASSERT(chunks[i].turn == 7);
            ASSERT(chunks[i].format == "pcm_s16le");
        }
    }

    // --- Look-ahead bounds concurrent synthesis ---
    {
        StubModel model({"Ek. ", "Do. ", "Teen. ", "Char. ", "Paanch."});
        StubSynthesizer synth(1);
        synth.set_delay("Ek.", 30);
        synth.set_delay("Do.", 30);
        synth.set_delay("Teen.", 30);
        RecordingSink sink;
        bridge::StreamingBridge strict(model, synth, fast_config(1));
        CancellationToken cancel;
        ASSERT(strict.run(1, context(), "q", sink, cancel).ok());
        ASSERT(synth.max_concurrent() == 1);
        ASSERT(sink.count<protocol::TtsChunk>() == 5);
        ASSERT(seqs_contiguous(sink));

        StubSynthesizer synth2(1);
        synth2.set_delay("Ek.", 30);
        synth2.set_delay("Do.", 30);
        synth2.set_delay("Teen.", 30);
        RecordingSink sink2;
        bridge::StreamingBridge wide(model, synth2, fast_config(2));
        CancellationToken cancel2;
        ASSERT(wide.run(1, context(), "q", sink2, cancel2).ok());
        ASSERT(synth2.max_concurrent() <= 2);
        ASSERT(seqs_contiguous(sink2));
    }

    // --- Unspeakable span consumes no seq ---
    {
        StubModel model({"Theek hai. ", "**"});
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(result.ok());
        ASSERT(synth.calls() == 1);
        ASSERT(result.chunks_sent == 1);
        ASSERT(sink.count<protocol::ReplyToken>() == 2);  // tokens are sent unmodified
    }

    // --- Transient synthesis failure is retried once ---
    {
        StubModel model({"Haan."});
        StubSynthesizer synth(2);
        synth.fail_next(make_transient_error("piper crashed"));
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(result.ok());
        ASSERT(synth.calls() == 2);
        ASSERT(sink.count<protocol::TtsChunk>() == 2);
        ASSERT(seqs_contiguous(sink));
    }

    // --- Fatal synthesis failure stops the turn ---
    {
        StubModel model({"Ek. ", "Do. ", "Teen."});
        StubSynthesizer synth(1);
        synth.fail_next(make_fatal_error("voice missing"));
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config(1));
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(!result.ok());
        ASSERT(result.error->type == ErrorType::EngineFatal);
        ASSERT(cancel.is_cancelled());
        ASSERT(sink.count<protocol::TtsChunk>() == 0);
        ASSERT(!result.reply_text.empty());  // partial reply kept
    }

    // --- Model: transient before the first token is retried ---
    {
        StubModel model({"Ji ", "haan."});
        model.fail_next(make_transient_error("connection refused"));
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(result.ok());
        ASSERT(model.calls() == 2);
        ASSERT(sink.count<protocol::ReplyToken>() == 2);
    }

    // --- Model: failure after tokens is surfaced, not retried ---
    {
        StubModel model({"Ji ", "haan ", "bilkul."});
        model.fail_after(1, make_transient_error("stream reset"));
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(!result.ok());
        ASSERT(result.error->type == ErrorType::EngineTransient);
        ASSERT(model.calls() == 1);
        ASSERT(result.reply_text == "Ji ");
        ASSERT(sink.count<protocol::ReplyToken>() == 1);
    }

    // --- Model: fatal is never retried ---
    {
        StubModel model;
        model.fail_next(make_fatal_error("model not found"));
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        auto result = bridge.run(1, context(), "q", sink, cancel);
        ASSERT(result.error && result.error->type == ErrorType::EngineFatal);
        ASSERT(model.calls() == 1);
        ASSERT(sink.messages().empty());
    }

    // --- External cancellation ends the run promptly ---
    {
        StubModel model({"Soch ", "raha hoon. "});
        model.hang_after_tokens(true);
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;

        bridge::BridgeResult result;
        std::thread runner([&] { result = bridge.run(1, context(), "q", sink, cancel); });
        ASSERT(sink.wait_for_count<protocol::ReplyToken>(2, 2000));
        cancel.cancel();
        runner.join();
        ASSERT(result.error && result.error->type == ErrorType::Cancelled);
        ASSERT(model.cancelled() == 1);
        ASSERT(result.reply_text == "Soch raha hoon. ");
    }

    // --- Empty reply ---
    {
        StubModel model(std::vector<std::string>{});
        StubSynthesizer synth(1);
        RecordingSink sink;
        bridge::StreamingBridge bridge(model, synth, fast_config());
        CancellationToken cancel;
        int speaking = 0;
        auto result = bridge.run(1, context(), "q", sink, cancel, [&] { speaking++; });
        ASSERT(result.ok());
        ASSERT(result.chunks_sent == 0);
        ASSERT(speaking == 0);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All streaming bridge tests passed.\n";
    return 0;
}
