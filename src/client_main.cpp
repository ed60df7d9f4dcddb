#include "client/audio_io.h"
#include "client/voice_client.h"
#include "core/config.h"
#include "logger.h"
#include "path_utils.h"
#include <csignal>
#include <iostream>
#include <string>

namespace samaira {

static client::VoiceClient* g_client = nullptr;

void signal_handler(int) {
    if (g_client) {
        g_client->request_stop();
    }
}

} // namespace samaira

int main(int argc, char* argv[]) {
    samaira::Logger::initialize(samaira::LogLevel::INFO);

    std::string config_path = samaira::DEFAULT_CONFIG_PATH;
    bool verbose = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            samaira::client::AudioIO::list_devices();
            samaira::Logger::shutdown();
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [config.json] [--verbose] [--list-devices]\n";
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

    samaira::client::VoiceClient client(config);
    auto connected = client.connect();
    if (!connected) {
        samaira::Logger::error(connected.error().message);
        samaira::Logger::shutdown();
        return 1;
    }

    samaira::g_client = &client;
    std::signal(SIGINT, samaira::signal_handler);
    std::signal(SIGTERM, samaira::signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    auto finished = client.run();
    samaira::g_client = nullptr;
    if (!finished) {
        samaira::Logger::error(finished.error().message);
        samaira::Logger::shutdown();
        return 1;
    }

    samaira::Logger::info("Client stopped");
    samaira::Logger::shutdown();
    return 0;
}
