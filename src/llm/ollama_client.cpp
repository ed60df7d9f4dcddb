#include "llm/ollama_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace samaira {
namespace llm {

// =============================================================================
// ChatStreamParser
// =============================================================================

ChatStreamParser::ChatStreamParser(TokenCallback on_token) : on_token_(std::move(on_token)) {}

void ChatStreamParser::feed(const char* data, size_t size) {
    pending_.append(data, size);

    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        parse_line(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
}

void ChatStreamParser::finish() {
    if (!pending_.empty()) {
        parse_line(pending_);
        pending_.clear();
    }
}

void ChatStreamParser::parse_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    json chunk = json::parse(line, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object()) {
        if (error_.empty()) error_ = "Malformed stream line: " + line.substr(0, 120);
        return;
    }

    if (chunk.contains("error") && chunk["error"].is_string()) {
        if (error_.empty()) error_ = chunk["error"].get<std::string>();
        return;
    }

    if (chunk.contains("message") && chunk["message"].is_object()) {
        const json& message = chunk["message"];
        if (message.contains("content") && message["content"].is_string()) {
            std::string token = message["content"].get<std::string>();
            if (!token.empty()) {
                tokens_++;
                if (on_token_) on_token_(token);
            }
        }
    }

    if (chunk.value("done", false)) {
        done_ = true;
    }
}

// =============================================================================
// OllamaClient
// =============================================================================

namespace {

std::once_flag curl_init_flag;

struct TransferState {
    CURL* curl = nullptr;
    ChatStreamParser* parser = nullptr;
    const std::atomic<bool>* cancelled = nullptr;
    long http_status = 0;
    std::string error_body;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t total_size = size * nmemb;

    if (state->http_status == 0) {
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &state->http_status);
    }
    if (state->http_status >= 400) {
        state->error_body.append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    state->parser->feed(static_cast<char*>(contents), total_size);
    return total_size;
}

int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    return state->cancelled->load() ? 1 : 0;
}

bool is_transient_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

class OllamaClient::Impl {
public:
    Impl(const config::LLMConfig& config) : config_(config) {
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        if (config_.endpoint.find("/api/chat") == std::string::npos) {
            Logger::warn("[LLM] Endpoint does not look like an Ollama /api/chat URL: " +
                         config_.endpoint);
        }
    }

    std::string build_request(const memory::ConversationContext& context,
                              const std::string& user_text) const {
        json messages = json::array();
        for (const auto& msg : context) {
            messages.push_back({{"role", memory::role_name(msg.role)}, {"content", msg.content}});
        }
        messages.push_back({{"role", "user"}, {"content", user_text}});

        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["stream"] = true;
        request["options"] = {
            {"temperature", config_.temperature},
            {"num_predict", config_.max_tokens}
        };
        return request.dump();
    }

    Result<void> generate(const memory::ConversationContext& context,
                          const std::string& user_text,
                          const TokenCallback& on_token,
                          const CancellationToken& cancel) {
        if (config_.endpoint.empty() || config_.model_name.empty()) {
            return make_fatal_error("LLM endpoint or model not configured");
        }

        std::string request_json = build_request(context, user_text);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_transient_error("Failed to initialize CURL");
        }

        ChatStreamParser parser([&](const std::string& token) {
            if (!cancel.is_cancelled()) on_token(token);
        });

        TransferState state;
        state.curl = curl;
        state.parser = &parser;
        state.cancelled = cancel.flag();

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        LOG_LLM("Streaming chat request to " + config_.endpoint + " (" +
                std::to_string(context.size()) + " context messages)");
        CURLcode res = curl_easy_perform(curl);
        if (state.http_status == 0) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &state.http_status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (cancel.is_cancelled()) {
            return make_cancelled_error("Generation cancelled");
        }

        if (res != CURLE_OK) {
            std::string message = std::string("LLM request failed: ") + curl_easy_strerror(res);
            LOG_LLM(message);
            if (is_transient_curl_error(res)) {
                return make_transient_error(message);
            }
            return make_fatal_error(message);
        }

        if (state.http_status >= 500) {
            return make_transient_error("LLM server error " + std::to_string(state.http_status) +
                                        ": " + state.error_body.substr(0, 200));
        }
        if (state.http_status >= 400) {
            return make_fatal_error("LLM request rejected " + std::to_string(state.http_status) +
                                    ": " + state.error_body.substr(0, 200));
        }

        parser.finish();
        if (!parser.error().empty()) {
            LOG_LLM("Stream error: " + parser.error());
            return make_transient_error("LLM stream error: " + parser.error());
        }
        if (!parser.done()) {
            return make_transient_error("LLM stream ended before completion");
        }

        std::ostringstream oss;
        oss << "Stream complete: " << parser.tokens() << " tokens";
        LOG_LLM(oss.str());
        return {};
    }

    bool is_ready() const {
        return !config_.endpoint.empty() && !config_.model_name.empty();
    }

private:
    config::LLMConfig config_;
};

OllamaClient::OllamaClient(const config::LLMConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

OllamaClient::~OllamaClient() = default;

Result<void> OllamaClient::generate(const memory::ConversationContext& context,
                                    const std::string& user_text,
                                    const TokenCallback& on_token,
                                    const CancellationToken& cancel) {
    return impl_->generate(context, user_text, on_token, cancel);
}

bool OllamaClient::is_ready() const {
    return impl_->is_ready();
}

std::string OllamaClient::build_request(const memory::ConversationContext& context,
                                        const std::string& user_text) const {
    return impl_->build_request(context, user_text);
}

} // namespace llm
} // namespace samaira
