#include <duet/core/config.hpp>
#include <duet/core/event.hpp>
#include <duet/core/logger.hpp>
#include <duet/call/call_controller.hpp>
#include <duet/call/media.hpp>
#include <duet/call/relay_client.hpp>
#include <duet/call/rtc_peer_connection.hpp>

#include <iostream>
#include <memory>
#include <string>

#include <uv.h>

using namespace duet;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " (--host | --join <link>) [--config <file>] [--verbose]" << std::endl;
}

std::string describeStartError(const core::Error& error) {
    switch (error.code()) {
        case core::ErrorCode::PermissionDenied:
        case core::ErrorCode::DeviceNotFound:
        case core::ErrorCode::DeviceBusy:
            return call::mediaErrorMessage(error.code());
        default:
            return error.what();
    }
}

void printCommands() {
    std::cout << "Commands: m = mute/unmute audio, v = video on/off, q = end call" << std::endl;
}

// Daftar ICE server dari client.ice_servers, default STUN publik Google
call::PeerConnectionConfig loadPeerConfig(const core::Config& config) {
    auto servers = config.get<core::ConfigListPtr>("client.ice_servers");
    if (!servers) {
        return call::PeerConnectionConfig::defaults();
    }

    call::PeerConnectionConfig peer;
    for (const auto& item : servers.value()->items) {
        const auto* node = std::get_if<core::ConfigNodePtr>(&item);
        if (!node) {
            core::Logger::warn("Ignoring malformed entry in client.ice_servers");
            continue;
        }

        auto urls = (*node)->get<std::string>("urls");
        if (!urls) {
            core::Logger::warn("Ignoring ICE server without urls");
            continue;
        }

        call::IceServer server;
        server.urls = urls.value();
        if (auto username = (*node)->get<std::string>("username")) {
            server.username = username.value();
        }
        if (auto credential = (*node)->get<std::string>("credential")) {
            server.credential = credential.value();
        }
        peer.ice_servers.push_back(std::move(server));
    }
    return peer;
}

// Handle stdin dan sinyal. Dideklarasikan sebelum EventLoop supaya masih
// hidup saat destructor loop menutupnya.
struct ConsoleHandles {
    union {
        uv_tty_t tty;
        uv_pipe_t pipe;
    } input;
    uv_signal_t sigint;
    uv_signal_t sigterm;
    std::string line;
    std::weak_ptr<call::CallController> controller;
};

void handleCommand(ConsoleHandles& console, const std::string& command) {
    auto controller = console.controller.lock();
    if (!controller || command.empty()) {
        return;
    }

    if (command == "m") {
        if (auto muted = controller->muteAudio()) {
            std::cout << (*muted ? "Audio muted" : "Audio unmuted") << std::endl;
        }
    }
    else if (command == "v") {
        if (auto disabled = controller->disableVideo()) {
            std::cout << (*disabled ? "Video disabled" : "Video enabled") << std::endl;
        }
    }
    else if (command == "q") {
        controller->end();
    }
    else {
        printCommands();
    }
}

void onAlloc(uv_handle_t*, size_t suggested_size, uv_buf_t* buf) {
    buf->base = new char[suggested_size];
    buf->len = suggested_size;
}

void onStdin(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* console = static_cast<ConsoleHandles*>(stream->data);

    if (nread > 0) {
        console->line.append(buf->base, static_cast<size_t>(nread));
        size_t newline;
        while ((newline = console->line.find('\n')) != std::string::npos) {
            std::string command = console->line.substr(0, newline);
            console->line.erase(0, newline + 1);
            if (!command.empty() && command.back() == '\r') {
                command.pop_back();
            }
            handleCommand(*console, command);
        }
    }
    else if (nread < 0) {
        // EOF di stdin mengakhiri panggilan
        uv_read_stop(stream);
        if (auto controller = console->controller.lock()) {
            controller->end();
        }
    }

    delete[] buf->base;
}

void onSignal(uv_signal_t* handle, int signum) {
    auto* console = static_cast<ConsoleHandles*>(handle->data);
    core::Logger::info("Signal {} received, ending call...", signum);
    if (auto controller = console->controller.lock()) {
        controller->end();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string join_link;
    bool host = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host") {
            host = true;
        }
        else if (arg == "--join" && i + 1 < argc) {
            join_link = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
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

    if (host == !join_link.empty()) {
        printUsage(argv[0]);
        return 1;
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

    call::CallOptions options;
    options.link_base = config.value<std::string>("client.link_base", options.link_base);
    options.peer = loadPeerConfig(config);

    ConsoleHandles console;
    core::EventLoop loop;

    auto relay = std::make_shared<call::RelayClient>(
        loop, config.value<std::string>("client.relay_url", "ws://127.0.0.1:8080"));
    auto controller = call::CallController::create(
        loop, options, std::make_shared<call::LocalMediaDevices>(), relay, call::createRtcPeerConnection);
    console.controller = controller;

    controller->setNoticeCallback([](const call::Notice& notice) {
        std::cout << "* " << notice.text << std::endl;
    });
    controller->setConnectionPathCallback([](call::ConnectionPath path) {
        std::cout << "* Connection: " << call::connectionPathToString(path) << std::endl;
    });
    controller->setStateCallback([&loop](call::NegotiationState state) {
        if (state == call::NegotiationState::Ended) {
            loop.stop();
        }
    });

    uv_signal_init(loop.handle(), &console.sigint);
    uv_signal_init(loop.handle(), &console.sigterm);
    console.sigint.data = &console;
    console.sigterm.data = &console;
    uv_signal_start(&console.sigint, onSignal, SIGINT);
    uv_signal_start(&console.sigterm, onSignal, SIGTERM);

    uv_stream_t* input = nullptr;
    if (uv_guess_handle(0) == UV_TTY) {
        uv_tty_init(loop.handle(), &console.input.tty, 0, 1);
        input = reinterpret_cast<uv_stream_t*>(&console.input.tty);
    }
    else {
        uv_pipe_init(loop.handle(), &console.input.pipe, 0);
        uv_pipe_open(&console.input.pipe, 0);
        input = reinterpret_cast<uv_stream_t*>(&console.input.pipe);
    }
    input->data = &console;
    uv_read_start(input, onAlloc, onStdin);

    if (host) {
        auto link = controller->host();
        if (!link) {
            std::cerr << describeStartError(link.error()) << std::endl;
            return 1;
        }
        std::cout << "Share this link: " << link.value() << std::endl;
    }
    else {
        auto joined = controller->join(join_link);
        if (!joined) {
            std::cerr << describeStartError(joined.error()) << std::endl;
            return 1;
        }
    }

    printCommands();
    loop.run();

    core::Logger::info("Call finished");
    return 0;
}
