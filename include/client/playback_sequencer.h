#pragma once

/**
 * @file playback_sequencer.h
 * @brief Strict sequence-number ordering of received synthesized audio
 *
 * Chunks are played one at a time in seq order, turn by turn. Playback
 * advances only when the sink reports the current chunk finished. Once a
 * turn's turn_done arrived and all its chunks played, the caught-up callback
 * fires for that turn.
 */

#include "core/types.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace samaira {
namespace client {

/// One received tts_chunk, already decoded to samples
struct PlaybackChunk {
    uint64_t turn = 0;
    uint64_t seq = 0;
    int sample_rate = audio::SAMPLE_RATE;
    AudioBuffer samples;
};

/**
 * @brief Audio output the sequencer drives
 *
 * play() must not block; the owner calls on_playback_finished() when the
 * chunk has drained from the device.
 */
class IPlaybackSink {
public:
    virtual ~IPlaybackSink() = default;
    virtual void play(const AudioBuffer& samples, int sample_rate) = 0;
};

struct PlaybackStats {
    uint64_t current_turn = 0;
    uint64_t next_seq = 0;
    size_t queued = 0;
    bool playing = false;
    bool turn_done = false;
    uint64_t dropped_chunks = 0;
};

class PlaybackSequencer {
public:
    using CaughtUpCallback = std::function<void(uint64_t turn)>;

    explicit PlaybackSequencer(IPlaybackSink& sink);
    ~PlaybackSequencer();

    PlaybackSequencer(const PlaybackSequencer&) = delete;
    PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

    /**
     * @brief Queue a chunk; starts playback if it is the expected next one
     *
     * Chunks of a newer turn queue behind the turn still playing. Chunks of
     * a turn that already finished, and duplicates, are dropped with a warning.
     */
    void push(PlaybackChunk chunk);

    /// The sink finished the chunk it was last given
    void on_playback_finished();

    /// turn_done received for `turn`
    void mark_turn_done(uint64_t turn);

    /// Fired once per turn when turn_done arrived and everything has played
    void set_caught_up_callback(CaughtUpCallback callback);

    /// Drop all queued audio (local stop)
    void clear();

    bool is_idle() const;
    PlaybackStats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace client
} // namespace samaira
