#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <optional>

#include <duet/core/error.hpp>
#include <duet/signaling/relay.hpp>

namespace duet::signaling {

// Room id of a /ws/video/<room> request path, trailing slash optional.
// Validation of the id itself is left to the registry.
std::optional<std::string> roomFromRequestPath(std::string_view path);

// WebSocket listener for the relay at /ws/video/<room>/
class RelayServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        int port = 8080;
        unsigned int max_payload = 64 * 1024;
        unsigned short idle_timeout = 120; // seconds
    };

    virtual ~RelayServer() = default;

    // Blocks until stop() is called. Fails if the port cannot be bound.
    virtual core::Result<void> run() = 0;

    // Thread-safe
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    // Bound port once listening; useful when Options::port is 0
    virtual int port() const = 0;

    static std::unique_ptr<RelayServer> create(SignalingRelay& relay, Options options);
};

} // namespace duet::signaling
