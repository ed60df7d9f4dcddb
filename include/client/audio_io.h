#pragma once

/**
 * @file audio_io.h
 * @brief PortAudio capture and playback for the client
 *
 * Capture opens the input device at its native rate as float32 and queues
 * each block for the capture thread. Playback is int16 mono; each chunk
 * handed to play() is played to completion and then reported finished.
 *
 * Thread Safety:
 * - PortAudio callbacks run on PortAudio's thread
 * - read_block() and play() are safe to call from any thread
 * - The playback-finished callback runs on a dedicated notifier thread,
 *   never from inside the audio callback
 */

#include "client/playback_sequencer.h"
#include "core/types.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace samaira {
namespace client {

class AudioIO : public IPlaybackSink {
public:
    using PlaybackFinishedCallback = std::function<void()>;

    AudioIO();
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /**
     * @brief Open and start both streams
     * @param input_device Device name, index, or "default"
     * @param output_device Device name, index, or "default"
     * @param output_rate Playback rate; the device default is used if unsupported
     * @return True if both streams are running
     */
    bool start(const std::string& input_device,
               const std::string& output_device,
               int output_rate = audio::SAMPLE_RATE);

    /// Native capture rate chosen for the input device
    int input_sample_rate() const;

    /**
     * @brief Wait up to timeout_ms for the next captured block
     * @return False on timeout or after stop()
     */
    bool read_block(std::vector<float>& block, int timeout_ms);

    /// Queue one chunk; resampled to the output rate if needed
    void play(const AudioBuffer& samples, int sample_rate) override;

    void set_playback_finished_callback(PlaybackFinishedCallback callback);

    /// Stop playback immediately and clear the queue
    void stop_playback();

    /// Stop all audio I/O and close streams
    void stop();

    /// Print all available audio devices
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace client
} // namespace samaira
