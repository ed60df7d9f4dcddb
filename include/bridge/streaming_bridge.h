#pragma once

/**
 * @file streaming_bridge.h
 * @brief Language-model tokens and synthesized audio to ordered wire messages
 *
 * Every token is forwarded as reply_token at once. Tokens are also cut into
 * synthesis spans; up to `synthesis_lookahead` spans synthesize concurrently,
 * and their chunks are numbered in span order, so the per-turn seq is the
 * total order regardless of which synthesis finishes first.
 */

#include "core/cancellation.h"
#include "core/constants.h"
#include "errors.h"
#include "llm/language_model_interface.h"
#include "memory/conversation_memory.h"
#include "protocol/message_sink.h"
#include "tts/tts_interface.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace samaira {
namespace bridge {

struct StreamingBridgeConfig {
    size_t max_span_chars = constants::bridge::MAX_SPAN_CHARS;
    int synthesis_lookahead = constants::bridge::SYNTHESIS_LOOKAHEAD;
    int retry_backoff_ms = constants::retry::BACKOFF_MS;
};

/**
 * @brief What one turn's generation produced
 */
struct BridgeResult {
    std::string reply_text;      ///< Every token received, even on failure
    size_t tokens = 0;
    size_t spans = 0;
    uint64_t chunks_sent = 0;
    std::optional<Error> error;  ///< Set if the turn did not complete

    bool ok() const { return !error.has_value(); }
};

class StreamingBridge {
public:
    StreamingBridge(llm::ILanguageModel& model,
                    tts::ISynthesizer& synthesizer,
                    const StreamingBridgeConfig& config = {});
    ~StreamingBridge();

    StreamingBridge(const StreamingBridge&) = delete;
    StreamingBridge& operator=(const StreamingBridge&) = delete;

    /**
     * @brief Generate and speak one reply; blocks until finished
     *
     * No message for this turn is sent after run() returns. On a model or
     * synthesis failure the turn's token is cancelled so in-flight work stops.
     *
     * @param on_speaking Invoked once, when the first span goes to the synthesizer
     */
    BridgeResult run(uint64_t turn_id,
                     const memory::ConversationContext& context,
                     const std::string& user_text,
                     protocol::IMessageSink& sink,
                     const CancellationToken& cancel,
                     const std::function<void()>& on_speaking = {});

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bridge
} // namespace samaira
