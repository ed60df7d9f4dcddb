#pragma once

/**
 * @file ollama_client.h
 * @brief Streaming chat client for an Ollama /api/chat endpoint
 */

#include "core/config.h"
#include "llm/language_model_interface.h"
#include <memory>
#include <string>

namespace samaira {
namespace llm {

/**
 * @brief libcurl POST with `stream: true`; each NDJSON line carries one token
 *
 * Stateless between calls: one curl handle per request, so sessions may
 * generate concurrently.
 */
class OllamaClient : public ILanguageModel {
public:
    explicit OllamaClient(const config::LLMConfig& config);
    ~OllamaClient() override;

    OllamaClient(const OllamaClient&) = delete;
    OllamaClient& operator=(const OllamaClient&) = delete;

    /**
     * Connection failures, timeouts and HTTP 5xx are EngineTransient.
     * HTTP 4xx and an unusable endpoint are EngineFatal.
     */
    Result<void> generate(const memory::ConversationContext& context,
                          const std::string& user_text,
                          const TokenCallback& on_token,
                          const CancellationToken& cancel) override;

    bool is_ready() const override;

    /// Request body for one turn (exposed for tests)
    std::string build_request(const memory::ConversationContext& context,
                              const std::string& user_text) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Incremental NDJSON splitter for the streamed response body
 *
 * Feed raw body bytes; every complete line is parsed. Tokens go to the
 * callback in order. An `error` field or a malformed line is recorded.
 */
class ChatStreamParser {
public:
    explicit ChatStreamParser(TokenCallback on_token);

    void feed(const char* data, size_t size);

    /// Parse a trailing line that had no newline
    void finish();

    bool done() const { return done_; }
    size_t tokens() const { return tokens_; }
    const std::string& error() const { return error_; }

private:
    void parse_line(const std::string& line);

    TokenCallback on_token_;
    std::string pending_;
    bool done_ = false;
    size_t tokens_ = 0;
    std::string error_;
};

} // namespace llm
} // namespace samaira
