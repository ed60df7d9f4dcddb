/**
 * @file turn_controller.cpp
 * @brief Turn state machine, event loop and turn pipeline
 */

#include "session/turn_controller.h"
#include "core/cancellation.h"
#include "core/retry.h"
#include "logger.h"
#include "stt/transcript_filter.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <variant>

namespace samaira {
namespace session {

const char* state_to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "Idle";
        case TurnState::Capturing: return "Capturing";
        case TurnState::Transcribing: return "Transcribing";
        case TurnState::Generating: return "Generating";
        case TurnState::Speaking: return "Speaking";
    }
    return "Unknown";
}

TurnControllerConfig TurnControllerConfig::from(const Config& config) {
    TurnControllerConfig c;
    c.sample_rate = config.audio.sample_rate;
    c.frame_ms = config.audio.frame_ms;
    c.max_utterance_ms = config.turn.max_utterance_ms;
    c.max_held_ms = config.turn.max_held_ms;
    c.max_turn_ms = config.turn.max_turn_ms;
    c.idle_timeout_ms = config.server.idle_timeout_ms;
    c.retry_backoff_ms = config.retry.backoff_ms;
    c.language = config.stt.language;
    c.context_messages = config.memory.max_messages;
    c.bridge.max_span_chars = config.bridge.max_span_chars;
    c.bridge.synthesis_lookahead = config.bridge.synthesis_lookahead;
    c.bridge.retry_backoff_ms = config.retry.backoff_ms;
    return c;
}

namespace {

// =============================================================================
// Events
// =============================================================================

struct AudioEvent { AudioFrame frame; };
struct StopEvent {};
struct CloseEvent {};
struct TranscriptReadyEvent { uint64_t turn; };
struct SpeakingStartedEvent { uint64_t turn; };

enum class TurnOutcome { Completed, Discarded, Failed, Cancelled };

struct TurnFinishedEvent {
    uint64_t turn;
    TurnOutcome outcome;
};

using Event = std::variant<AudioEvent, StopEvent, CloseEvent, TranscriptReadyEvent,
                           SpeakingStartedEvent, TurnFinishedEvent>;

/**
 * @brief Drops every message once the connection is gone
 */
class GuardedSink : public protocol::IMessageSink {
public:
    explicit GuardedSink(protocol::IMessageSink& inner) : inner_(inner), closed_(false) {}

    bool send(const protocol::ServerMessage& message) override {
        if (closed_.load()) return false;
        return inner_.send(message);
    }

    void close() { closed_.store(true); }

private:
    protocol::IMessageSink& inner_;
    std::atomic<bool> closed_;
};

/**
 * @brief The one turn in flight; shared with its pipeline thread
 */
struct ActiveTurn {
    uint64_t id = 0;
    CancellationToken cancel;
    std::atomic<bool> stopped{false};
    std::atomic<bool> timed_out{false};
    TimePoint started = Clock::now();
    std::thread worker;
};

} // anonymous namespace

class TurnController::Impl {
public:
    Impl(const TurnControllerConfig& config,
         std::unique_ptr<vad::IVAD> vad,
         Engines engines,
         memory::ConversationMemory& memory,
         protocol::IMessageSink& sink,
         const std::string& session_id)
        : config_(config)
        , vad_(std::move(vad))
        , engines_(engines)
        , memory_(memory)
        , sink_(sink)
        , session_id_(session_id)
        , bridge_(engines.model, engines.synthesizer, config.bridge)
        , state_(TurnState::Idle)
        , closing_(false)
        , closed_(false)
        , processing_(false)
        , quiescent_(true)
        , utterance_samples_(0)
        , held_samples_(0)
        , held_overflow_reported_(false)
        , last_audio_(Clock::now())
        , idle_fired_(false)
        , turn_counter_(0)
    {
        max_utterance_samples_ = audio::ms_to_samples(config.max_utterance_ms, config.sample_rate);
        max_held_samples_ = audio::ms_to_samples(config.max_held_ms, config.sample_rate);

        worker_ = std::thread([this] { run(); });
        LOG_SESSION("Turn controller started for session " + session_id_);
    }

    ~Impl() {
        close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void post_audio(AudioFrame frame) {
        post(AudioEvent{std::move(frame)});
    }

    void post_stop() {
        post(StopEvent{});
    }

    void close() {
        bool expected = false;
        if (!closed_.compare_exchange_strong(expected, true)) {
            return;
        }

        sink_.close();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            closing_ = true;
            events_.clear();
            events_.push_back(CloseEvent{});
            if (active_cancel_) {
                active_cancel_->cancel();
            }
        }
        queue_cv_.notify_all();

        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
        LOG_SESSION("Turn controller closed for session " + session_id_);
    }

    void set_idle_timeout_callback(IdleTimeoutCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        idle_timeout_callback_ = std::move(callback);
    }

    TurnState state() const {
        return state_.load();
    }

    TurnStats get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        TurnStats stats = stats_;
        stats.state = state_.load();
        return stats;
    }

    bool wait_until_quiescent(int timeout_ms) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return quiescent_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return events_.empty() && !processing_ && quiescent_;
        });
    }

private:
    // =========================================================================
    // Event loop (worker thread)
    // =========================================================================

    void post(Event event) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (closing_) return;
            events_.push_back(std::move(event));
        }
        queue_cv_.notify_one();
    }

    void run() {
        const auto poll = std::chrono::milliseconds(constants::turn::POLL_INTERVAL_MS);
        while (true) {
            std::optional<Event> event;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait_for(lock, poll, [this] { return !events_.empty(); });
                if (!events_.empty()) {
                    event = std::move(events_.front());
                    events_.pop_front();
                    processing_ = true;
                }
            }

            if (event) {
                if (std::holds_alternative<CloseEvent>(*event)) {
                    break;
                }
                handle(*event);
            }
            check_timeouts();
            publish_status();
        }

        shutdown();
        publish_status();
    }

    void handle(Event& event) {
        if (auto* audio = std::get_if<AudioEvent>(&event)) {
            on_audio(std::move(audio->frame));
        } else if (std::holds_alternative<StopEvent>(event)) {
            on_stop();
        } else if (auto* ready = std::get_if<TranscriptReadyEvent>(&event)) {
            if (active_ && active_->id == ready->turn && state_ == TurnState::Transcribing) {
                set_state(TurnState::Generating);
            }
        } else if (auto* speaking = std::get_if<SpeakingStartedEvent>(&event)) {
            if (active_ && active_->id == speaking->turn && state_ == TurnState::Generating) {
                set_state(TurnState::Speaking);
            }
        } else if (auto* finished = std::get_if<TurnFinishedEvent>(&event)) {
            on_turn_finished(*finished);
        }
    }

    void publish_status() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            processing_ = false;
            quiescent_ = !active_ && held_.empty();
        }
        quiescent_cv_.notify_all();
    }

    // =========================================================================
    // Audio
    // =========================================================================

    void on_audio(AudioFrame frame) {
        last_audio_ = Clock::now();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_received++;
        }

        if (active_) {
            hold(std::move(frame));
            return;
        }
        process_frame(frame);
    }

    void process_frame(const AudioFrame& frame) {
        vad::FrameResult result = vad_->process(frame);

        switch (state_.load()) {
            case TurnState::Idle:
                if (result.is_speech) {
                    set_state(TurnState::Capturing);
                    sink_.send(protocol::VadState{true});
                    append_utterance(frame);
                    check_utterance_cap();
                }
                break;

            case TurnState::Capturing:
                if (result.is_speech) {
                    append_utterance(frame);
                }
                if (result.event == vad::Event::UtteranceEnd) {
                    sink_.send(protocol::VadState{false});
                    dispatch_turn("utterance_end");
                } else {
                    check_utterance_cap();
                }
                break;

            case TurnState::Transcribing:
            case TurnState::Generating:
            case TurnState::Speaking:
                // Unreachable: frames are held while a turn is in flight
                break;
        }
    }

    void append_utterance(const AudioFrame& frame) {
        utterance_.push_back(frame);
        utterance_samples_ += frame.size();
    }

    void check_utterance_cap() {
        if (utterance_samples_ >= max_utterance_samples_) {
            LOG_TURN("Utterance reached " + std::to_string(config_.max_utterance_ms) +
                     "ms cap, forcing transcription");
            vad_->reset();
            sink_.send(protocol::VadState{false});
            dispatch_turn("max_utterance");
        }
    }

    void hold(AudioFrame frame) {
        held_samples_ += frame.size();
        held_.push_back(std::move(frame));

        uint64_t dropped = 0;
        while (held_samples_ > max_held_samples_ && held_.size() > 1) {
            held_samples_ -= held_.front().size();
            held_.pop_front();
            dropped++;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_held = held_.size();
            stats_.frames_dropped += dropped;
        }

        if (dropped > 0 && !held_overflow_reported_) {
            held_overflow_reported_ = true;
            Logger::warn("[Turn] Held audio exceeded " + std::to_string(config_.max_held_ms) +
                         "ms; dropping oldest frames");
            sink_.send(protocol::ErrorMessage::from(make_capacity_error(
                "Audio received during the reply exceeded " +
                std::to_string(config_.max_held_ms) + "ms; oldest audio was dropped")));
        }
    }

    /// Feed held frames through the VAD until a new turn starts or none remain
    void replay_held() {
        while (!held_.empty() && !active_) {
            AudioFrame frame = std::move(held_.front());
            held_.pop_front();
            held_samples_ -= frame.size();
            process_frame(frame);
        }
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.frames_held = held_.size();
    }

    // =========================================================================
    // Turn lifecycle
    // =========================================================================

    void dispatch_turn(const char* reason) {
        auto turn = std::make_shared<ActiveTurn>();
        turn->id = ++turn_counter_;
        turn->started = Clock::now();

        std::vector<AudioFrame> frames;
        frames.swap(utterance_);
        const int64_t audio_ms = audio::samples_to_ms(utterance_samples_, config_.sample_rate);
        utterance_samples_ = 0;
        held_overflow_reported_ = false;

        std::ostringstream oss;
        oss << "frames=" << frames.size() << " audio_ms=" << audio_ms << " reason=" << reason;
        LOG_TRACE(turn->id, "capture", oss.str());

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_cancel_ = turn->cancel;
        }
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.turns_started++;
        }

        active_ = turn;
        set_state(TurnState::Transcribing);
        turn->worker = std::thread([this, turn, frames = std::move(frames), audio_ms]() mutable {
            run_pipeline(*turn, std::move(frames), audio_ms);
        });
    }

    void on_stop() {
        if (active_) {
            LOG_TURN("Stop received, cancelling turn " + std::to_string(active_->id));
            active_->stopped = true;
            active_->cancel.cancel();
            return;
        }
        if (state_ == TurnState::Capturing) {
            LOG_TURN("Stop received while capturing, discarding utterance");
            utterance_.clear();
            utterance_samples_ = 0;
            vad_->reset();
            set_state(TurnState::Idle);
        }
        // Idle: nothing to cancel
    }

    void on_turn_finished(const TurnFinishedEvent& finished) {
        if (!active_ || active_->id != finished.turn) {
            return;
        }
        if (active_->worker.joinable()) {
            active_->worker.join();
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            switch (finished.outcome) {
                case TurnOutcome::Completed: stats_.turns_completed++; break;
                case TurnOutcome::Discarded: stats_.turns_discarded++; break;
                case TurnOutcome::Failed: stats_.turns_failed++; break;
                case TurnOutcome::Cancelled: break;
            }
        }

        active_.reset();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_cancel_.reset();
        }

        set_state(TurnState::Idle);
        last_audio_ = Clock::now();
        replay_held();
    }

    void check_timeouts() {
        if (active_) {
            if (!active_->timed_out && ms_since(active_->started) > config_.max_turn_ms) {
                Logger::warn("[Turn] Turn " + std::to_string(active_->id) + " exceeded " +
                             std::to_string(config_.max_turn_ms) + "ms, cancelling");
                active_->timed_out = true;
                active_->cancel.cancel();
            }
            return;
        }

        if (!idle_fired_ && ms_since(last_audio_) > config_.idle_timeout_ms) {
            idle_fired_ = true;
            LOG_SESSION("Session " + session_id_ + " idle for " +
                        std::to_string(config_.idle_timeout_ms) + "ms, closing");
            sink_.send(protocol::ErrorMessage{"Session closed after " +
                                              std::to_string(config_.idle_timeout_ms) +
                                              "ms without audio",
                                              ErrorType::TransportClosed, false});
            IdleTimeoutCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = idle_timeout_callback_;
            }
            if (callback) callback();
        }
    }

    void shutdown() {
        if (active_) {
            active_->cancel.cancel();
            if (active_->worker.joinable()) {
                active_->worker.join();
            }
            active_.reset();
        }
        held_.clear();
        held_samples_ = 0;
        utterance_.clear();
        utterance_samples_ = 0;
        set_state(TurnState::Idle);
    }

    void set_state(TurnState next) {
        TurnState prev = state_.exchange(next);
        if (prev != next) {
            LOG_TURN(std::string(state_to_string(prev)) + " -> " + state_to_string(next));
        }
    }

    // =========================================================================
    // Turn pipeline (pipeline thread)
    // =========================================================================

    void run_pipeline(ActiveTurn& turn, std::vector<AudioFrame> frames, int64_t audio_ms) {
        const uint64_t id = turn.id;
        bool transcript_sent = false;
        std::optional<Error> failure;
        TurnOutcome outcome = TurnOutcome::Completed;

        auto started = Clock::now();
        Result<Transcript> transcribed = retry_transient(
            "Transcription", config_.retry_backoff_ms, turn.cancel,
            [&] { return engines_.transcriber.transcribe(frames, config_.language, turn.cancel); });
        frames.clear();
        frames.shrink_to_fit();

        if (turn.cancel.is_cancelled()) {
            failure = make_cancelled_error();
        } else if (!transcribed) {
            failure = transcribed.error();
        }

        if (!failure) {
            std::string text = stt::filter_transcript(transcribed.value().text, audio_ms);
            LOG_TRACE(id, "transcribe", "ms=" + std::to_string(ms_since(started)) +
                      " chars=" + std::to_string(text.size()));

            if (text.empty()) {
                LOG_TURN("Discarding turn " + std::to_string(id) + ": empty transcript");
                post(TurnFinishedEvent{id, TurnOutcome::Discarded});
                return;
            }

            sink_.send(protocol::SttFinal{id, text});
            transcript_sent = true;
            post(TranscriptReadyEvent{id});

            auto context = memory_.get_recent_messages(config_.context_messages);
            bridge::BridgeResult reply = bridge_.run(
                id, context, text, sink_, turn.cancel,
                [this, id] { post(SpeakingStartedEvent{id}); });

            // Partial replies stay in the context; they were already shown
            memory_.add_turn(text, reply.reply_text);
            if (reply.error) {
                failure = reply.error;
            }
        }

        if (failure && failure->type == ErrorType::Cancelled) {
            if (turn.timed_out) {
                failure = make_timeout_error("Turn exceeded " + std::to_string(config_.max_turn_ms) + "ms");
            } else {
                // stop or connection close: silent
                failure.reset();
                outcome = TurnOutcome::Cancelled;
            }
        }

        if (failure) {
            outcome = TurnOutcome::Failed;
            Logger::error("[Turn] Turn " + std::to_string(id) + " failed (" +
                          error_kind_name(failure->type) + "): " + failure->message);
            sink_.send(protocol::ErrorMessage::from(*failure));
        }
        if (transcript_sent) {
            sink_.send(protocol::TurnDone{id});
        }

        const char* status = outcome == TurnOutcome::Completed ? "completed"
                           : outcome == TurnOutcome::Cancelled ? "cancelled" : "failed";
        LOG_TRACE(id, "done", std::string("status=") + status +
                  " total_ms=" + std::to_string(ms_since(turn.started)));
        post(TurnFinishedEvent{id, outcome});
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    TurnControllerConfig config_;
    std::unique_ptr<vad::IVAD> vad_;
    Engines engines_;
    memory::ConversationMemory& memory_;
    GuardedSink sink_;
    std::string session_id_;
    bridge::StreamingBridge bridge_;

    std::atomic<TurnState> state_;

    // Event queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable quiescent_cv_;
    std::deque<Event> events_;
    bool closing_;
    std::atomic<bool> closed_;
    bool processing_;
    bool quiescent_;
    std::optional<CancellationToken> active_cancel_;

    // Worker-owned state
    std::vector<AudioFrame> utterance_;
    size_t utterance_samples_;
    size_t max_utterance_samples_ = 0;
    std::deque<AudioFrame> held_;
    size_t held_samples_;
    size_t max_held_samples_ = 0;
    bool held_overflow_reported_;
    TimePoint last_audio_;
    bool idle_fired_;
    uint64_t turn_counter_;
    std::shared_ptr<ActiveTurn> active_;

    std::mutex callback_mutex_;
    IdleTimeoutCallback idle_timeout_callback_;

    mutable std::mutex stats_mutex_;
    TurnStats stats_;

    std::thread worker_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

TurnController::TurnController(const TurnControllerConfig& config,
                               std::unique_ptr<vad::IVAD> vad,
                               Engines engines,
                               memory::ConversationMemory& memory,
                               protocol::IMessageSink& sink,
                               const std::string& session_id)
    : impl_(std::make_unique<Impl>(config, std::move(vad), engines, memory, sink, session_id)) {}

TurnController::~TurnController() = default;

void TurnController::post_audio(AudioFrame frame) {
    impl_->post_audio(std::move(frame));
}

void TurnController::post_stop() {
    impl_->post_stop();
}

void TurnController::close() {
    impl_->close();
}

void TurnController::set_idle_timeout_callback(IdleTimeoutCallback callback) {
    impl_->set_idle_timeout_callback(std::move(callback));
}

TurnState TurnController::state() const {
    return impl_->state();
}

TurnStats TurnController::get_stats() const {
    return impl_->get_stats();
}

bool TurnController::wait_until_quiescent(int timeout_ms) {
    return impl_->wait_until_quiescent(timeout_ms);
}

} // namespace session
} // namespace samaira
