#include "core/config.h"
#include "llm/ollama_client.h"
#include "logger.h"
#include "path_utils.h"
#include "server/voice_server.h"
#include "stt/whisper_transcriber.h"
#include "tts/piper_tts.h"
#include <csignal>
#include <iostream>
#include <string>

namespace samaira {

static server::VoiceServer* g_server = nullptr;

void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

} // namespace samaira

int main(int argc, char* argv[]) {
    samaira::Logger::initialize(samaira::LogLevel::INFO);

    std::string config_path = samaira::DEFAULT_CONFIG_PATH;
    bool verbose = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [config.json] [--verbose]\n";
            return 0;
        } else {
            config_path = arg;
        }
    }

    auto loaded = samaira::Config::load(config_path);
    if (!loaded) {
        samaira::Logger::error(loaded.error().message);
        samaira::Logger::shutdown();
        return 1;
    }
    const samaira::Config& config = loaded.value();

    samaira::Logger::shutdown();
    samaira::Logger::initialize(
        verbose ? samaira::LogLevel::DEBUG : samaira::parse_log_level(config.logging.level),
        samaira::expand_path(config.logging.file));

    // Engines are shared by every session
    samaira::stt::WhisperTranscriber transcriber(config.stt);
    samaira::llm::OllamaClient model(config.llm);
    samaira::tts::PiperSynthesizer synthesizer(samaira::tts::PiperConfig::from(config.tts));

    if (!transcriber.is_ready()) {
        samaira::Logger::warn("Transcriber not ready; turns will fail with engine_fatal");
    }
    if (!synthesizer.is_ready()) {
        samaira::Logger::warn("Synthesizer not ready; turns will fail with engine_fatal");
    }

    samaira::server::VoiceServer server(config, {transcriber, model, synthesizer});
    auto started = server.start();
    if (!started) {
        samaira::Logger::error(started.error().message);
        samaira::Logger::shutdown();
        return 1;
    }

    samaira::g_server = &server;
    std::signal(SIGINT, samaira::signal_handler);
    std::signal(SIGTERM, samaira::signal_handler);
    // A client vanishing mid-write must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    server.run();

    samaira::g_server = nullptr;
    samaira::Logger::info("Server stopped");
    samaira::Logger::shutdown();
    return 0;
}
