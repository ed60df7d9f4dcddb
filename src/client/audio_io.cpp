#include "client/audio_io.h"
#include "core/audio_utils.h"
#include "logger.h"
#include <portaudio.h>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace samaira {
namespace client {

namespace {

/// Captured blocks kept when the capture thread falls behind
constexpr size_t MAX_QUEUED_BLOCKS = 100;

/// Frames per PortAudio buffer (let the host choose)
constexpr unsigned long FRAMES_PER_BUFFER = paFramesPerBufferUnspecified;

} // anonymous namespace

class AudioIO::Impl {
public:
    Impl() : input_stream_(nullptr), output_stream_(nullptr), input_rate_(0), output_rate_(audio::SAMPLE_RATE),
             initialized_(false), running_(false), play_pos_(0), finished_chunks_(0) {}

    ~Impl() {
        stop();
    }

    bool start(const std::string& input_device, const std::string& output_device, int output_rate) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int input_idx = find_device(input_device, true);
        if (input_idx < 0) {
            Logger::error("Input device not found: " + input_device);
            stop();
            return false;
        }
        int output_idx = find_device(output_device, false);
        if (output_idx < 0) {
            Logger::error("Output device not found: " + output_device);
            stop();
            return false;
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name
                << " @ " << input_info->defaultSampleRate << " Hz";
        Logger::info(dev_oss.str());
        std::ostringstream dev_oss2;
        dev_oss2 << "Using output device: [" << output_idx << "] " << output_info->name;
        Logger::info(dev_oss2.str());

        // Capture: float32 mono at the device's native rate
        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;
        input_rate_ = static_cast<int>(input_info->defaultSampleRate);

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, input_rate_,
                            FRAMES_PER_BUFFER, paClipOff, capture_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        // Playback: int16 mono, pipeline rate if the device accepts it
        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        output_rate_ = output_rate;
        if (Pa_IsFormatSupported(nullptr, &output_params, output_rate_) != paFormatIsSupported) {
            output_rate_ = static_cast<int>(output_info->defaultSampleRate);
            Logger::info("Output device does not support " + std::to_string(output_rate) +
                         " Hz, playing at " + std::to_string(output_rate_) + " Hz");
        }

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, output_rate_,
                            FRAMES_PER_BUFFER, paClipOff, playback_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        running_ = true;
        notifier_ = std::thread([this] { notify_loop(); });

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err);
            err_oss << " (Error code: " << err << ")";
            Logger::error(err_oss.str());
            stop();
            return false;
        }

        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        return true;
    }

    int input_sample_rate() const { return input_rate_; }

    bool read_block(std::vector<float>& block, int timeout_ms) {
        std::unique_lock<std::mutex> lock(input_queue_mutex_);
        input_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !input_queue_.empty() || !running_;
        });
        if (input_queue_.empty()) return false;
        block = std::move(input_queue_.front());
        input_queue_.pop_front();
        return true;
    }

    void play(const AudioBuffer& samples, int sample_rate) {
        AudioBuffer converted = resample_linear(samples, sample_rate, output_rate_);
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.push_back(std::move(converted));
    }

    void set_playback_finished_callback(PlaybackFinishedCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        finished_callback_ = std::move(callback);
    }

    void stop_playback() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.clear();
        play_pos_ = 0;
    }

    void stop() {
        bool was_running = running_.exchange(false);
        input_cv_.notify_all();
        if (notifier_.joinable()) {
            notifier_.join();
        }

        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }

        {
            std::lock_guard<std::mutex> lock(input_queue_mutex_);
            input_queue_.clear();
        }
        stop_playback();

        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
        if (was_running) {
            LOG_AUDIO("Audio streams stopped");
        }
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
            oss << " " << info->defaultSampleRate << " Hz";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        auto usable = [is_input](const PaDeviceInfo* info) {
            return info && (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0);
        };

        // Numeric device index
        bool numeric = !name.empty() && name.find_first_not_of("0123456789") == std::string::npos;
        if (numeric) {
            int device_idx = std::stoi(name);
            if (device_idx >= 0 && device_idx < num_devices && usable(Pa_GetDeviceInfo(device_idx))) {
                return device_idx;
            }
            return -1;
        }

        // Exact name, then substring
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (usable(info) && name == info->name) return i;
        }
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (usable(info) && std::string(info->name).find(name) != std::string::npos) return i;
        }
        return -1;
    }

    static int capture_callback(const void* input, void*,
                                unsigned long frame_count,
                                const PaStreamCallbackTimeInfo*,
                                PaStreamCallbackFlags status_flags,
                                void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) return paContinue;
        if (status_flags & paInputOverflow) {
            self->overflows_++;
        }

        const float* in = static_cast<const float*>(input);
        {
            std::lock_guard<std::mutex> lock(self->input_queue_mutex_);
            // Limit queue size to prevent memory issues
            if (self->input_queue_.size() < MAX_QUEUED_BLOCKS) {
                self->input_queue_.emplace_back(in, in + frame_count);
            }
        }
        self->input_cv_.notify_one();
        return paContinue;
    }

    static int playback_callback(const void*, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo*,
                                 PaStreamCallbackFlags,
                                 void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);
        unsigned long written = 0;

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        while (written < frame_count && !self->playback_queue_.empty()) {
            const AudioBuffer& chunk = self->playback_queue_.front();
            size_t available = chunk.size() - self->play_pos_;
            size_t n = std::min<size_t>(available, frame_count - written);
            std::memcpy(out + written, chunk.data() + self->play_pos_, n * sizeof(Sample));
            written += n;
            self->play_pos_ += n;

            if (self->play_pos_ >= chunk.size()) {
                self->playback_queue_.pop_front();
                self->play_pos_ = 0;
                self->finished_chunks_++;
            }
        }

        // Output silence for the rest
        if (written < frame_count) {
            std::memset(out + written, 0, (frame_count - written) * sizeof(Sample));
        }
        return paContinue;
    }

    /// Report finished chunks outside the audio callback
    void notify_loop() {
        uint64_t reported = 0;
        while (running_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            uint64_t finished = finished_chunks_.load();
            if (overflows_.exchange(0) > 0) {
                Logger::warn("Input overflow");
            }
            while (reported < finished) {
                reported++;
                PlaybackFinishedCallback callback;
                {
                    std::lock_guard<std::mutex> lock(callback_mutex_);
                    callback = finished_callback_;
                }
                if (callback) callback();
            }
        }
    }

    PaStream* input_stream_;
    PaStream* output_stream_;
    int input_rate_;
    int output_rate_;
    bool initialized_;
    std::atomic<bool> running_;

    std::mutex input_queue_mutex_;
    std::condition_variable input_cv_;
    std::deque<std::vector<float>> input_queue_;
    std::atomic<uint64_t> overflows_{0};

    std::mutex playback_mutex_;
    std::deque<AudioBuffer> playback_queue_;
    size_t play_pos_;
    std::atomic<uint64_t> finished_chunks_;

    std::mutex callback_mutex_;
    PlaybackFinishedCallback finished_callback_;
    std::thread notifier_;
};

AudioIO::AudioIO() : pimpl_(std::make_unique<Impl>()) {}
AudioIO::~AudioIO() = default;

bool AudioIO::start(const std::string& input_device, const std::string& output_device, int output_rate) {
    return pimpl_->start(input_device, output_device, output_rate);
}

int AudioIO::input_sample_rate() const {
    return pimpl_->input_sample_rate();
}

bool AudioIO::read_block(std::vector<float>& block, int timeout_ms) {
    return pimpl_->read_block(block, timeout_ms);
}

void AudioIO::play(const AudioBuffer& samples, int sample_rate) {
    pimpl_->play(samples, sample_rate);
}

void AudioIO::set_playback_finished_callback(PlaybackFinishedCallback callback) {
    pimpl_->set_playback_finished_callback(std::move(callback));
}

void AudioIO::stop_playback() {
    pimpl_->stop_playback();
}

void AudioIO::stop() {
    pimpl_->stop();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace client
} // namespace samaira
