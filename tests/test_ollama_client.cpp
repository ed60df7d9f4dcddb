/**
 * Ollama chat client: NDJSON stream parsing, request body, error mapping.
 * The only network use is a refused connection on localhost.
 * Run from build dir: ./test_ollama_client
 */

#include "llm/ollama_client.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace samaira;
using namespace samaira::llm;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

void feed(ChatStreamParser& p, const std::string& s) {
    p.feed(s.data(), s.size());
}

} // anonymous namespace

int main() {
    // --- Tokens in order, split across arbitrary reads ---
    {
        std::vector<std::string> tokens;
        ChatStreamParser parser([&](const std::string& t) { tokens.push_back(t); });
        std::string body =
            R"({"message":{"role":"assistant","content":"SIP "},"done":false})" "\n"
            R"({"message":{"role":"assistant","content":"ek "},"done":false})" "\n"
            R"({"message":{"role":"assistant","content":""},"done":false})" "\n"
            R"({"message":{"role":"assistant","content":"accha"},"done":false})" "\n"
            R"({"message":{"role":"assistant","content":""},"done":true,"eval_count":3})" "\n";
        for (size_t i = 0; i < body.size(); i += 7) {
            feed(parser, body.substr(i, 7));
        }
        parser.finish();
        ASSERT((tokens == std::vector<std::string>{"SIP ", "ek ", "accha"}));
        ASSERT(parser.tokens() == 3);
        ASSERT(parser.done());
        ASSERT(parser.error().empty());
    }

    // --- Trailing line without newline ---
    {
        int count = 0;
        ChatStreamParser parser([&](const std::string&) { count++; });
        feed(parser, R"({"message":{"content":"hi"},"done":true})");
        ASSERT(count == 0);
        parser.finish();
        ASSERT(count == 1);
        ASSERT(parser.done());
    }

    // --- Server-reported error and garbage ---
    {
        ChatStreamParser parser(nullptr);
        feed(parser, "{\"error\":\"model 'x' not found\"}\n");
        ASSERT(parser.error() == "model 'x' not found");
        ASSERT(!parser.done());

        ChatStreamParser garbage(nullptr);
        feed(garbage, "<html>502</html>\n");
        ASSERT(!garbage.error().empty());
    }

    // --- Request body ---
    {
        config::LLMConfig cfg;
        cfg.model_name = "qwen2.5:7b";
        cfg.max_tokens = 99;
        OllamaClient client(cfg);

        memory::ConversationContext ctx = {
            memory::ConversationMessage::system("Be brief."),
            memory::ConversationMessage::user("Namaste"),
            memory::ConversationMessage::assistant("Namaste ji"),
        };
        json req = json::parse(client.build_request(ctx, "SIP kya hai?"));
        ASSERT(req["model"] == "qwen2.5:7b");
        ASSERT(req["stream"] == true);
        ASSERT(req["options"]["num_predict"] == 99);
        ASSERT(req["messages"].size() == 4);
        ASSERT(req["messages"][0]["role"] == "system");
        ASSERT(req["messages"][3]["role"] == "user");
        ASSERT(req["messages"][3]["content"] == "SIP kya hai?");
    }

    // --- Error mapping ---
    {
        config::LLMConfig unset;
        unset.endpoint = "";
        OllamaClient misconfigured(unset);
        auto r = misconfigured.generate({}, "x", [](const std::string&) {}, CancellationToken());
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::EngineFatal);

        config::LLMConfig refused;
        refused.endpoint = "http://127.0.0.1:1/api/chat";
        refused.connect_timeout_ms = 500;
        refused.timeout_ms = 1000;
        OllamaClient down(refused);
        int tokens = 0;
        auto d = down.generate({}, "x", [&](const std::string&) { tokens++; }, CancellationToken());
        ASSERT(d.is_error());
        ASSERT(d.error().type == ErrorType::EngineTransient);
        ASSERT(tokens == 0);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All Ollama client tests passed.\n";
    return 0;
}
