/**
 * Conversation memory: system prompt first, turn append, pruning.
 * Run from build dir: ./test_conversation_memory
 */

#include "memory/conversation_memory.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using namespace samaira;
using namespace samaira::memory;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    ConversationConfig cfg;
    cfg.max_messages = 4;
    cfg.system_prompt = "Be brief.";

    // --- Turns ---
    {
        ConversationMemory mem(cfg);
        ASSERT(mem.is_empty());
        mem.add_turn("SIP kya hai?", "SIP ek investment plan hai.");
        ASSERT(mem.message_count() == 2);

        auto msgs = mem.get_messages();
        ASSERT(msgs.size() == 3);
        ASSERT(msgs[0].role == MessageRole::System && msgs[0].content == "Be brief.");
        ASSERT(msgs[1].role == MessageRole::User);
        ASSERT(msgs[2].role == MessageRole::Assistant);

        // Failed before any token: only the user text is kept
        mem.add_turn("Aur?", "");
        ASSERT(mem.message_count() == 3);
        ASSERT(mem.get_messages().back().role == MessageRole::User);
    }

    // --- Pruning by count keeps the newest ---
    {
        ConversationMemory mem(cfg);
        for (int i = 0; i < 5; ++i) {
            mem.add_turn("q" + std::to_string(i), "a" + std::to_string(i));
        }
        ASSERT(mem.message_count() == 4);
        auto msgs = mem.get_messages();
        ASSERT(msgs[0].role == MessageRole::System);
        ASSERT(msgs[1].content == "q3");
        ASSERT(msgs.back().content == "a4");

        auto recent = mem.get_recent_messages(2);
        ASSERT(recent.size() == 3);
        ASSERT(recent[0].role == MessageRole::System);
        ASSERT(recent[1].content == "q4");

        mem.clear();
        ASSERT(mem.is_empty());
        ASSERT(mem.get_system_prompt() == "Be brief.");
    }

    // --- Pruning by tokens ---
    {
        ConversationConfig small;
        small.max_messages = 100;
        small.max_tokens = 40;
        ConversationMemory mem(small);
        std::string long_text(100, 'x');  // ~29 tokens each
        mem.add_turn(long_text, long_text);
        mem.add_turn(long_text, long_text);
        ASSERT(mem.message_count() == 1);
        ASSERT(mem.estimated_tokens() <= 40);
    }

    // --- JSON export ---
    {
        ConversationMemory mem(cfg);
        mem.add_turn("Namaste", "Namaste ji");
        auto arr = nlohmann::json::parse(context_to_json(mem.get_messages()));
        ASSERT(arr.is_array() && arr.size() == 3);
        ASSERT(arr[0]["role"] == "system");
        ASSERT(arr[1]["role"] == "user" && arr[1]["content"] == "Namaste");
        ASSERT(arr[2]["role"] == "assistant");
        ASSERT(std::string(role_name(MessageRole::Assistant)) == "assistant");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All conversation memory tests passed.\n";
    return 0;
}
