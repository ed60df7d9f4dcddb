/**
 * @file streaming_bridge.cpp
 * @brief Token fan-out, span synthesis and seq ordering
 */

#include "bridge/streaming_bridge.h"
#include "core/retry.h"
#include "logger.h"
#include "text/speech_text.h"
#include "text/span_segmenter.h"
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <sstream>

namespace samaira {
namespace bridge {

namespace {

/// One span being synthesized; chunks are buffered until it reaches the head
struct SpanJob {
    std::string text;
    size_t index = 0;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<AudioBuffer> chunks;
    bool produced = false;
    bool done = false;
    Result<void> status;

    std::future<void> worker;
};

} // anonymous namespace

class StreamingBridge::Impl {
public:
    Impl(llm::ILanguageModel& model, tts::ISynthesizer& synthesizer,
         const StreamingBridgeConfig& config)
        : model_(model)
        , synthesizer_(synthesizer)
        , config_(config)
    {
        if (config_.synthesis_lookahead < 1) {
            config_.synthesis_lookahead = 1;
        }
    }

    BridgeResult run(uint64_t turn_id,
                     const memory::ConversationContext& context,
                     const std::string& user_text,
                     protocol::IMessageSink& sink,
                     const CancellationToken& cancel,
                     const std::function<void()>& on_speaking) {
        TurnRun turn(turn_id, sink, cancel, on_speaking, config_);
        BridgeResult result;

        auto on_token = [&](const std::string& token) {
            if (cancel.is_cancelled() || token.empty()) return;

            result.reply_text += token;
            result.tokens++;
            sink.send(protocol::ReplyToken{turn_id, token});

            for (auto& span : turn.segmenter.push(token)) {
                submit_span(turn, span);
            }
            drain(turn, false);
        };

        LOG_TRACE(turn_id, "generate", "user_chars=" + std::to_string(user_text.size()));

        Result<void> generated = retry_transient(
            "Language model", config_.retry_backoff_ms, cancel,
            [&] { return model_.generate(context, user_text, on_token, cancel); },
            [&] { return result.tokens == 0; });

        if (generated.is_ok() && !turn.failed()) {
            for (auto& span : turn.segmenter.flush()) {
                submit_span(turn, span);
            }
            while (!turn.jobs.empty() && !turn.failed()) {
                drain(turn, true);
            }
        }

        if (!generated.is_ok() && !turn.failed()) {
            turn.fail(generated.error());
        }
        if (cancel.is_cancelled() && !turn.failed()) {
            turn.fail(make_cancelled_error());
        }

        // A failure already cancelled the token; wait for in-flight spans to stop
        for (auto& job : turn.jobs) {
            if (job->worker.valid()) job->worker.wait();
        }

        result.spans = turn.spans_submitted;
        result.chunks_sent = turn.next_seq;
        result.error = turn.error;

        std::ostringstream oss;
        oss << "tokens=" << result.tokens << " spans=" << result.spans
            << " chunks=" << result.chunks_sent
            << " status=" << (result.error ? error_kind_name(result.error->type) : "ok");
        LOG_TRACE(turn_id, "speak", oss.str());
        return result;
    }

private:
    struct TurnRun {
        TurnRun(uint64_t id, protocol::IMessageSink& s, const CancellationToken& c,
                const std::function<void()>& speaking, const StreamingBridgeConfig& config)
            : turn_id(id), sink(s), cancel(c), on_speaking(speaking)
            , segmenter(config.max_span_chars) {}

        bool failed() const { return error.has_value(); }

        /// First failure wins; cancelling stops the model and the other spans
        void fail(const Error& e) {
            if (!error) error = e;
            cancel.cancel();
        }

        uint64_t turn_id;
        protocol::IMessageSink& sink;
        const CancellationToken& cancel;
        const std::function<void()>& on_speaking;
        text::SpanSegmenter segmenter;

        std::deque<std::shared_ptr<SpanJob>> jobs;
        size_t spans_submitted = 0;
        uint64_t next_seq = 0;
        bool speaking = false;
        std::optional<Error> error;
    };

    void submit_span(TurnRun& turn, const std::string& raw_span) {
        if (turn.failed() || turn.cancel.is_cancelled()) return;

        std::string prepared = text::prepare_text_for_speech(raw_span);
        if (prepared.empty()) {
            LOG_BRIDGE("Skipping unspeakable span: \"" + raw_span + "\"");
            return;
        }

        // Bounded look-ahead: wait for the head span to finish before adding more
        while (static_cast<int>(turn.jobs.size()) >= config_.synthesis_lookahead && !turn.failed()) {
            drain(turn, true);
        }
        if (turn.failed()) return;

        auto job = std::make_shared<SpanJob>();
        job->text = prepared;
        job->index = turn.spans_submitted++;

        if (!turn.speaking) {
            turn.speaking = true;
            if (turn.on_speaking) turn.on_speaking();
        }

        LOG_BRIDGE("Span " + std::to_string(job->index) + ": \"" + prepared + "\"");
        // The job outlives its worker: run() waits on every future before returning
        SpanJob* raw = job.get();
        const CancellationToken cancel = turn.cancel;
        job->worker = std::async(std::launch::async, [this, raw, cancel] {
            synthesize_span(*raw, cancel);
        });
        turn.jobs.push_back(std::move(job));
    }

    void synthesize_span(SpanJob& job, const CancellationToken& cancel) {
        auto emit = [&job](AudioBuffer chunk) {
            if (chunk.empty()) return;
            {
                std::lock_guard<std::mutex> lock(job.mutex);
                job.chunks.push_back(std::move(chunk));
                job.produced = true;
            }
            job.cv.notify_all();
        };

        Result<void> status = retry_transient(
            "Synthesis", config_.retry_backoff_ms, cancel,
            [&] { return synthesizer_.synthesize(job.text, emit, cancel); },
            [&] {
                std::lock_guard<std::mutex> lock(job.mutex);
                return !job.produced;
            });

        {
            std::lock_guard<std::mutex> lock(job.mutex);
            job.status = status;
            job.done = true;
        }
        job.cv.notify_all();
    }

    /**
     * @brief Send the head span's available chunks; retire finished spans
     * @param block Wait until the head span makes progress
     */
    void drain(TurnRun& turn, bool block) {
        while (!turn.jobs.empty() && !turn.failed()) {
            auto job = turn.jobs.front();
            std::deque<AudioBuffer> ready;
            bool done = false;
            Result<void> status;
            {
                std::unique_lock<std::mutex> lock(job->mutex);
                if (block) {
                    job->cv.wait(lock, [&] { return !job->chunks.empty() || job->done; });
                }
                ready.swap(job->chunks);
                done = job->done;
                status = job->status;
            }

            for (auto& chunk : ready) {
                if (turn.cancel.is_cancelled()) break;
                protocol::TtsChunk msg;
                msg.turn = turn.turn_id;
                msg.seq = turn.next_seq++;
                msg.sample_rate = synthesizer_.sample_rate();
                msg.audio = std::move(chunk);
                turn.sink.send(msg);
            }

            if (!done) {
                if (ready.empty() || !block) return;
                continue;
            }

            if (!status.is_ok()) {
                Logger::error("[Bridge] Span " + std::to_string(job->index) +
                              " failed: " + status.error().message);
                turn.fail(status.error());
                return;
            }
            if (job->worker.valid()) job->worker.get();
            turn.jobs.pop_front();
            if (block) return;
        }
    }

    llm::ILanguageModel& model_;
    tts::ISynthesizer& synthesizer_;
    StreamingBridgeConfig config_;
};

StreamingBridge::StreamingBridge(llm::ILanguageModel& model,
                                 tts::ISynthesizer& synthesizer,
                                 const StreamingBridgeConfig& config)
    : impl_(std::make_unique<Impl>(model, synthesizer, config)) {}

StreamingBridge::~StreamingBridge() = default;

BridgeResult StreamingBridge::run(uint64_t turn_id,
                                  const memory::ConversationContext& context,
                                  const std::string& user_text,
                                  protocol::IMessageSink& sink,
                                  const CancellationToken& cancel,
                                  const std::function<void()>& on_speaking) {
    return impl_->run(turn_id, context, user_text, sink, cancel, on_speaking);
}

} // namespace bridge
} // namespace samaira
