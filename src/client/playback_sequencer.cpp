/**
 * @file playback_sequencer.cpp
 * @brief Ordered playback of tts_chunk audio
 */

#include "client/playback_sequencer.h"
#include "logger.h"
#include <map>
#include <mutex>
#include <vector>

namespace samaira {
namespace client {

class PlaybackSequencer::Impl {
public:
    explicit Impl(IPlaybackSink& sink)
        : sink_(sink)
        , oldest_turn_(0)
        , current_turn_(0)
        , playing_(false)
        , dropped_chunks_(0) {}

    void push(PlaybackChunk chunk) {
        Actions actions;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (chunk.turn < oldest_turn_) {
                dropped_chunks_++;
                Logger::warn("[Audio] Dropping chunk from stale turn " + std::to_string(chunk.turn));
                return;
            }

            TurnQueue& queue = turns_[chunk.turn];
            if (chunk.seq < queue.next_seq || queue.pending.count(chunk.seq) > 0) {
                dropped_chunks_++;
                Logger::warn("[Audio] Dropping duplicate chunk turn=" + std::to_string(chunk.turn) +
                             " seq=" + std::to_string(chunk.seq));
                return;
            }

            if (chunk.seq != queue.next_seq) {
                LOG_AUDIO("Buffering out-of-order chunk seq=" + std::to_string(chunk.seq) +
                          " (expecting " + std::to_string(queue.next_seq) + ")");
            }
            if (turns_.begin()->first != chunk.turn) {
                LOG_AUDIO("Queueing turn " + std::to_string(chunk.turn) + " behind turn " +
                          std::to_string(turns_.begin()->first));
            }
            queue.pending.emplace(chunk.seq, std::move(chunk));
            advance(actions);
        }
        run(actions);
    }

    void on_playback_finished() {
        Actions actions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!playing_) return;
            playing_ = false;
            advance(actions);
        }
        run(actions);
    }

    void mark_turn_done(uint64_t turn) {
        Actions actions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (turn < oldest_turn_) {
                Logger::warn("[Audio] Ignoring turn_done for stale turn " + std::to_string(turn));
                return;
            }

            TurnQueue& queue = turns_[turn];
            queue.done = true;

            // All chunks precede turn_done on an ordered channel; a gap now is permanent
            if (!queue.pending.empty() && queue.pending.begin()->first != queue.next_seq) {
                Logger::warn("[Audio] Missing chunk seq=" + std::to_string(queue.next_seq) +
                             " of turn " + std::to_string(turn) + " at turn_done, skipping gap");
                queue.next_seq = queue.pending.begin()->first;
            }
            advance(actions);
        }
        run(actions);
    }

    void set_caught_up_callback(CaughtUpCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        caught_up_ = std::move(callback);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : turns_) {
            entry.second.pending.clear();
        }
    }

    bool is_idle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !playing_ && queued() == 0;
    }

    PlaybackStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        PlaybackStats stats;
        stats.current_turn = current_turn_;
        stats.queued = queued();
        stats.playing = playing_;
        stats.dropped_chunks = dropped_chunks_;
        auto it = turns_.find(current_turn_);
        if (it != turns_.end()) {
            stats.next_seq = it->second.next_seq;
            stats.turn_done = it->second.done;
        }
        return stats;
    }

private:
    struct TurnQueue {
        std::map<uint64_t, PlaybackChunk> pending;
        uint64_t next_seq = 0;
        bool done = false;
    };

    /// Work decided under the lock, performed after releasing it
    struct Actions {
        bool play = false;
        PlaybackChunk chunk;
        CaughtUpCallback caught_up;
        std::vector<uint64_t> finished_turns;
    };

    size_t queued() const {
        size_t n = 0;
        for (const auto& entry : turns_) n += entry.second.pending.size();
        return n;
    }

    /// Play the oldest turn's next chunk; retire turns that are done and drained
    void advance(Actions& actions) {
        while (!playing_ && !turns_.empty()) {
            auto front = turns_.begin();
            const uint64_t turn = front->first;
            TurnQueue& queue = front->second;
            current_turn_ = turn;
            oldest_turn_ = turn;

            auto it = queue.pending.find(queue.next_seq);
            if (it != queue.pending.end()) {
                actions.play = true;
                actions.chunk = std::move(it->second);
                queue.pending.erase(it);
                queue.next_seq++;
                playing_ = true;
                return;
            }

            if (!queue.done || !queue.pending.empty()) {
                return;
            }

            turns_.erase(front);
            oldest_turn_ = turn + 1;
            actions.finished_turns.push_back(turn);
            actions.caught_up = caught_up_;
        }
    }

    void run(Actions& actions) {
        if (actions.play) {
            sink_.play(actions.chunk.samples, actions.chunk.sample_rate);
        }
        if (actions.caught_up) {
            for (uint64_t turn : actions.finished_turns) {
                actions.caught_up(turn);
            }
        }
    }

    IPlaybackSink& sink_;
    mutable std::mutex mutex_;

    std::map<uint64_t, TurnQueue> turns_;   ///< By turn id; the first is the one playing
    uint64_t oldest_turn_;                   ///< Turns below this are stale
    uint64_t current_turn_;
    bool playing_;
    uint64_t dropped_chunks_;
    CaughtUpCallback caught_up_;
};

PlaybackSequencer::PlaybackSequencer(IPlaybackSink& sink)
    : impl_(std::make_unique<Impl>(sink)) {}

PlaybackSequencer::~PlaybackSequencer() = default;

void PlaybackSequencer::push(PlaybackChunk chunk) {
    impl_->push(std::move(chunk));
}

void PlaybackSequencer::on_playback_finished() {
    impl_->on_playback_finished();
}

void PlaybackSequencer::mark_turn_done(uint64_t turn) {
    impl_->mark_turn_done(turn);
}

void PlaybackSequencer::set_caught_up_callback(CaughtUpCallback callback) {
    impl_->set_caught_up_callback(std::move(callback));
}

void PlaybackSequencer::clear() {
    impl_->clear();
}

bool PlaybackSequencer::is_idle() const {
    return impl_->is_idle();
}

PlaybackStats PlaybackSequencer::get_stats() const {
    return impl_->get_stats();
}

} // namespace client
} // namespace samaira
