#pragma once

/**
 * @file whisper_transcriber.h
 * @brief whisper.cpp transcriber
 */

#include "core/config.h"
#include "stt/transcriber_interface.h"
#include <memory>
#include <string>

namespace samaira {
namespace stt {

/**
 * @brief Loads one whisper model and shares it across sessions
 *
 * Each call decodes with its own whisper_state, so sessions may
 * transcribe concurrently against the same model.
 */
class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const config::STTConfig& config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    /// EngineFatal if the model failed to load, EngineTransient if decoding failed
    Result<Transcript> transcribe(const std::vector<AudioFrame>& frames,
                                  const std::string& language_hint,
                                  const CancellationToken& cancel) override;

    bool is_ready() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace stt
} // namespace samaira
