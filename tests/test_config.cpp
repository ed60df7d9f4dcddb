/**
 * Configuration: defaults, overrides, path expansion, validation.
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include "path_utils.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace samaira;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

bool has_problem(const Config& config, const std::string& fragment) {
    for (const auto& p : config.validate()) {
        if (p.find(fragment) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

int main() {
    // --- Defaults ---
    {
        auto parsed = Config::parse("{}");
        ASSERT(parsed.is_ok());
        const Config& c = parsed.value();
        ASSERT(c.server.port == 8000);
        ASSERT(c.server.path == "/ws/voice");
        ASSERT(c.server.max_sessions == 32);
        ASSERT(c.audio.sample_rate == 16000);
        ASSERT(c.audio.frame_ms == 30);
        ASSERT(c.audio.samples_per_frame() == 480);
        ASSERT(c.vad.aggressiveness == 2);
        ASSERT(c.vad.end_silence_ms == 600);
        ASSERT(c.turn.max_utterance_ms == 20000);
        ASSERT(c.bridge.synthesis_lookahead == 2);
        ASSERT(c.retry.backoff_ms == 250);
        ASSERT(c.stt.language == "hi");
        ASSERT(Config::defaults().validate().empty());
    }

    // --- Overrides and ~ expansion ---
    {
        setenv("HOME", "/home/tester", 1);
        auto parsed = Config::parse(R"({
            "server": {"port": 9001, "max_sessions": 4},
            "audio": {"frame_ms": 20},
            "vad": {"aggressiveness": 3},
            "turn": {"max_turn_ms": 5000},
            "stt": {"model_path": "~/models/ggml-small.bin", "language": "en"},
            "client": {"session_file": "~/.samaira_session"},
            "unknown_section": {"ignored": true}
        })");
        ASSERT(parsed.is_ok());
        const Config& c = parsed.value();
        ASSERT(c.server.port == 9001);
        ASSERT(c.server.max_sessions == 4);
        ASSERT(c.server.host == "127.0.0.1");
        ASSERT(c.audio.samples_per_frame() == 320);
        ASSERT(c.vad.aggressiveness == 3);
        ASSERT(c.turn.max_turn_ms == 5000);
        ASSERT(c.turn.max_held_ms == 10000);
        ASSERT(c.stt.model_path == "/home/tester/models/ggml-small.bin");
        ASSERT(c.stt.language == "en");
        ASSERT(c.client.session_file == "/home/tester/.samaira_session");
        ASSERT(expand_path("~") == "/home/tester");
        ASSERT(expand_path("/abs/path") == "/abs/path");
    }

    // --- Validation ---
    {
        Config c;
        c.vad.aggressiveness = 4;
        ASSERT(has_problem(c, "aggressiveness"));
        c = Config();
        c.audio.frame_ms = 25;
        ASSERT(has_problem(c, "frame_ms"));
        c = Config();
        c.bridge.synthesis_lookahead = 0;
        ASSERT(has_problem(c, "synthesis_lookahead"));
        c = Config();
        c.server.max_sessions = 0;
        ASSERT(has_problem(c, "max_sessions"));
        c = Config();
        c.turn.max_held_ms = -1;
        ASSERT(has_problem(c, "max_held_ms"));
        c = Config();
        c.server.port = 70000;
        ASSERT(has_problem(c, "port"));

        auto rejected = Config::parse(R"({"vad": {"aggressiveness": 9}})");
        ASSERT(rejected.is_error());
        ASSERT(rejected.error().type == ErrorType::InvalidConfig);
    }

    // --- Malformed input ---
    {
        ASSERT(Config::parse("{not json").is_error());
        ASSERT(Config::parse("[1, 2]").is_error());
        ASSERT(Config::parse(R"({"server": {"port": "eighty"}})").is_error());
        ASSERT(Config::load("/nonexistent/samaira.json").is_error());
    }

    // --- Save and load ---
    {
        Config c;
        c.server.port = 8123;
        c.llm.model_name = "llama3";
        const std::string path = "/tmp/samaira_test_config.json";
        ASSERT(c.save(path).ok());
        auto loaded = Config::load(path);
        ASSERT(loaded.is_ok());
        ASSERT(loaded.value().server.port == 8123);
        ASSERT(loaded.value().llm.model_name == "llama3");
        std::remove(path.c_str());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
