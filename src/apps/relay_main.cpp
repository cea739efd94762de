#include <duet/core/config.hpp>
#include <duet/core/logger.hpp>
#include <duet/signaling/relay.hpp>
#include <duet/signaling/relay_server.hpp>
#include <duet/signaling/room_registry.hpp>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>

using namespace duet;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--port <port>] [--verbose]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    int port_override = 0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            port_override = std::atoi(argv[++i]);
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            printUsage(argv[0]);
            return 1;
        }
    }

    auto& config = core::config();
    if (!config_path.empty()) {
        auto loaded = config.loadFromFile(config_path);
        if (!loaded) {
            std::cerr << "Failed to load config " << config_path << ": " << loaded.error().what() << std::endl;
            return 1;
        }
    }

    auto level = core::parseLogLevel(config.value<std::string>("log.level", "info"));
    core::Logger::setLevel(verbose ? core::LogLevel::DEBUG : level.value_or(core::LogLevel::INFO));

    signaling::RelayServer::Options options;
    options.host = config.value<std::string>("relay.host", options.host);
    options.port = static_cast<int>(config.value<int64_t>("relay.port", options.port));
    options.max_payload = static_cast<unsigned int>(config.value<int64_t>("relay.max_payload", options.max_payload));
    options.idle_timeout = static_cast<unsigned short>(config.value<int64_t>("relay.idle_timeout", options.idle_timeout));
    if (port_override > 0) {
        options.port = port_override;
    }

    // SIGINT/SIGTERM diterima oleh thread khusus lewat sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    signaling::RoomRegistry registry;
    signaling::SignalingRelay relay(registry);
    auto server = signaling::RelayServer::create(relay, options);

    std::thread signal_thread([&signals, &server]() {
        int signum = 0;
        if (sigwait(&signals, &signum) == 0) {
            core::Logger::info("Signal {} received, shutting down...", strsignal(signum));
            server->stop();
        }
    });

    core::Logger::info("Starting duet relay on {}:{}", options.host, options.port);
    auto result = server->run();

    if (signal_thread.joinable()) {
        if (result) {
            signal_thread.join();
        }
        else {
            // Loop gagal start: bangunkan thread sinyal sendiri
            pthread_kill(signal_thread.native_handle(), SIGTERM);
            signal_thread.join();
        }
    }

    if (!result) {
        core::Logger::error("Relay stopped with error: {}", result.error().what());
        return 1;
    }

    auto stats = registry.getStats();
    core::Logger::info("Relay stopped. Rooms created: {}, joins: {}, messages relayed: {}",
        stats.rooms_created, stats.joins, relay.getStats().messages_relayed);
    return 0;
}
