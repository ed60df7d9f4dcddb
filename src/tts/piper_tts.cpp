/**
 * @file piper_tts.cpp
 * @brief Piper TTS implementation
 */

#include "tts/piper_tts.h"
#include "core/audio_utils.h"
#include "logger.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <fstream>
#include <mutex>
#include <sstream>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace samaira {
namespace tts {

PiperConfig PiperConfig::from(const config::TTSConfig& config) {
    PiperConfig c;
    c.voice_path = config.voice_path;
    c.espeak_data_path = config.espeak_data_path;
    c.piper_path = config.piper_path;
    c.output_gain = config.output_gain;
    c.output_sample_rate = config.sample_rate;
    return c;
}

namespace {

/// Reads audio.sample_rate from "<voice>.json"; Piper's default if absent
int read_voice_sample_rate(const std::string& voice_path) {
    std::ifstream file(voice_path + ".json");
    if (!file.is_open()) {
        return constants::tts::PIPER_SAMPLE_RATE;
    }
    json voice = json::parse(file, nullptr, false);
    if (voice.is_discarded() || !voice.contains("audio") || !voice["audio"].is_object()) {
        return constants::tts::PIPER_SAMPLE_RATE;
    }
    return voice["audio"].value("sample_rate", constants::tts::PIPER_SAMPLE_RATE);
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Owns one piper child and its pipes
struct PiperProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    ~PiperProcess() {
        close_fd(stdin_fd);
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        if (pid > 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }

    /// Kill the child and reap it
    void terminate() {
        if (pid > 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            pid = -1;
        }
    }

    /// Wait for a normal exit; returns the raw wait status
    int wait_exit() {
        int status = 0;
        if (pid > 0) {
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
            pid = -1;
        }
        return status;
    }
};

} // anonymous namespace

/**
 * @brief Implementation details for PiperSynthesizer
 */
class PiperSynthesizer::Impl {
public:
    explicit Impl(const PiperConfig& config)
        : config_(config)
        , total_synthesis_ms_(0)
    {
        config_.voice_path = expand_path(config_.voice_path);
        espeak_data_ = config_.espeak_data_path.empty() ? default_espeak_data_path()
                                                        : expand_path(config_.espeak_data_path);
        piper_path_ = find_executable(expand_path(config_.piper_path), "piper",
                                      {"/usr/local/bin", "/usr/bin", "/opt/piper", "/opt/piper/bin"});
        voice_rate_ = read_voice_sample_rate(config_.voice_path);

        std::ostringstream oss;
        oss << "Piper: binary=" << (piper_path_.empty() ? "(not found)" : piper_path_)
            << ", voice=" << config_.voice_path
            << ", voice_rate=" << voice_rate_
            << ", output_rate=" << config_.output_sample_rate
            << ", gain=" << config_.output_gain;
        LOG_TTS(oss.str());
    }

    Result<void> synthesize(const std::string& span,
                            const AudioChunkCallback& on_chunk,
                            const CancellationToken& cancel) {
        if (piper_path_.empty()) {
            record(false, 0);
            return make_fatal_error("Piper binary not found");
        }
        if (config_.voice_path.empty() || !file_exists(config_.voice_path)) {
            record(false, 0);
            return make_fatal_error("Piper voice model not found: " + config_.voice_path);
        }

        auto start = std::chrono::steady_clock::now();
        PiperProcess proc;
        auto spawned = spawn(proc);
        if (!spawned) {
            record(false, 0);
            return spawned;
        }

        json request;
        request["text"] = span;
        std::string json_input = request.dump() + "\n";
        ssize_t written = write(proc.stdin_fd, json_input.c_str(), json_input.size());
        close_fd(proc.stdin_fd);
        if (written != static_cast<ssize_t>(json_input.size())) {
            record(false, 0);
            return make_transient_error("Failed to write text to piper");
        }

        std::string stderr_text;
        auto streamed = stream_output(proc, on_chunk, cancel, start, stderr_text);
        if (!streamed) {
            proc.terminate();
            if (streamed.error().type != ErrorType::Cancelled) {
                record(false, 0);
            }
            return streamed;
        }

        int status = proc.wait_exit();
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::ostringstream oss;
            oss << "Piper failed: ";
            if (WIFEXITED(status))
                oss << "exit " << WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                oss << "signal " << WTERMSIG(status);
            else
                oss << "status " << status;
            if (!stderr_text.empty())
                oss << " stderr=\"" << stderr_text << "\"";
            LOG_TTS(oss.str());
            record(false, 0);
            if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
                return make_fatal_error(oss.str());
            }
            return make_transient_error(oss.str());
        }

        int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        record(true, ms);
        LOG_TTS("Synthesized " + std::to_string(span.size()) + " chars in " +
                std::to_string(ms) + "ms");
        return {};
    }

    int sample_rate() const { return config_.output_sample_rate; }

    bool is_ready() const {
        return !piper_path_.empty() && file_exists(config_.voice_path);
    }

    Stats get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        Stats stats = stats_;
        stats.avg_synthesis_ms = stats_.spans_synthesized > 0
            ? total_synthesis_ms_ / static_cast<int64_t>(stats_.spans_synthesized) : 0;
        stats.engine_ready = is_ready();
        return stats;
    }

    int voice_sample_rate() const { return voice_rate_; }

private:
    Result<void> spawn(PiperProcess& proc) {
        int in_pipe[2] = {-1, -1};
        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (pipe(in_pipe) == -1 || pipe(out_pipe) == -1 || pipe(err_pipe) == -1) {
            for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
                if (fd >= 0) close(fd);
            }
            return make_transient_error("Failed to create pipes for piper");
        }

        pid_t pid = fork();
        if (pid == -1) {
            for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
                close(fd);
            }
            return make_transient_error("Failed to fork piper");
        }

        if (pid == 0) {
            dup2(in_pipe[0], STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
                close(fd);
            }
            execl(piper_path_.c_str(), "piper",
                  "--model", config_.voice_path.c_str(),
                  "--espeak_data", espeak_data_.c_str(),
                  "--json-input",
                  "--output_raw",
                  "--quiet",
                  nullptr);
            _exit(127);
        }

        close(in_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[1]);
        proc.pid = pid;
        proc.stdin_fd = in_pipe[1];
        proc.stdout_fd = out_pipe[0];
        proc.stderr_fd = err_pipe[0];
        return {};
    }

    /// Read raw PCM until EOF, emitting chunks of at most max_chunk_ms
    Result<void> stream_output(PiperProcess& proc, const AudioChunkCallback& on_chunk,
                               const CancellationToken& cancel,
                               std::chrono::steady_clock::time_point start,
                               std::string& stderr_text) {
        const size_t chunk_bytes = static_cast<size_t>(
            audio::ms_to_samples(config_.max_chunk_ms, voice_rate_)) * sizeof(Sample);
        std::string pcm;
        bool got_audio = false;

        char buf[4096];
        while (proc.stdout_fd >= 0) {
            if (cancel.is_cancelled()) {
                return make_cancelled_error("Synthesis cancelled");
            }
            if (!got_audio) {
                auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start).count();
                if (waited > config_.first_byte_timeout_ms) {
                    return make_transient_error("Piper produced no audio within " +
                                                std::to_string(config_.first_byte_timeout_ms) + "ms");
                }
            }

            struct pollfd fds[2];
            nfds_t nfds = 0;
            fds[nfds++] = {proc.stdout_fd, POLLIN, 0};
            if (proc.stderr_fd >= 0) {
                fds[nfds++] = {proc.stderr_fd, POLLIN, 0};
            }

            int ready = poll(fds, nfds, constants::turn::POLL_INTERVAL_MS);
            if (ready < 0) {
                if (errno == EINTR) continue;
                return make_transient_error("poll on piper output failed");
            }
            if (ready == 0) continue;

            if (nfds > 1 && (fds[1].revents & (POLLIN | POLLHUP))) {
                ssize_t n = read(proc.stderr_fd, buf, sizeof(buf));
                if (n <= 0) {
                    close_fd(proc.stderr_fd);
                } else if (stderr_text.size() < 1024) {
                    stderr_text.append(buf, static_cast<size_t>(n));
                }
            }

            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(proc.stdout_fd, buf, sizeof(buf));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) {
                    close_fd(proc.stdout_fd);
                    break;
                }
                got_audio = true;
                pcm.append(buf, static_cast<size_t>(n));

                while (pcm.size() >= chunk_bytes) {
                    emit(pcm.substr(0, chunk_bytes), on_chunk);
                    pcm.erase(0, chunk_bytes);
                }
            }
        }

        if (cancel.is_cancelled()) {
            return make_cancelled_error("Synthesis cancelled");
        }
        pcm.resize(pcm.size() - pcm.size() % sizeof(Sample));
        if (!pcm.empty()) {
            emit(pcm, on_chunk);
        }

        while (!stderr_text.empty() && (stderr_text.back() == '\n' || stderr_text.back() == '\r')) {
            stderr_text.pop_back();
        }
        return {};
    }

    void emit(const std::string& bytes, const AudioChunkCallback& on_chunk) {
        AudioBuffer samples(bytes.size() / sizeof(Sample));
        for (size_t i = 0; i < samples.size(); i++) {
            auto lo = static_cast<uint8_t>(bytes[2 * i]);
            auto hi = static_cast<uint8_t>(bytes[2 * i + 1]);
            samples[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
        }
        AudioBuffer out = resample_linear(samples, voice_rate_, config_.output_sample_rate);
        apply_gain(out, config_.output_gain);
        if (!out.empty() && on_chunk) {
            on_chunk(std::move(out));
        }
    }

    void record(bool ok, int64_t ms) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (ok) {
            stats_.spans_synthesized++;
            total_synthesis_ms_ += ms;
        } else {
            stats_.failures++;
        }
    }

    PiperConfig config_;
    std::string piper_path_;
    std::string espeak_data_;
    int voice_rate_ = constants::tts::PIPER_SAMPLE_RATE;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    int64_t total_synthesis_ms_;
};

PiperSynthesizer::PiperSynthesizer(const PiperConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

PiperSynthesizer::~PiperSynthesizer() = default;

Result<void> PiperSynthesizer::synthesize(const std::string& span,
                                          const AudioChunkCallback& on_chunk,
                                          const CancellationToken& cancel) {
    return impl_->synthesize(span, on_chunk, cancel);
}

int PiperSynthesizer::sample_rate() const {
    return impl_->sample_rate();
}

bool PiperSynthesizer::is_ready() const {
    return impl_->is_ready();
}

Stats PiperSynthesizer::get_stats() const {
    return impl_->get_stats();
}

int PiperSynthesizer::voice_sample_rate() const {
    return impl_->voice_sample_rate();
}

} // namespace tts
} // namespace samaira
