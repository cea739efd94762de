#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

#include <duet/core/error.hpp>

namespace duet::signaling {

// WebSocket Frame Types (RFC 6455)
enum class WebSocketOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// WebSocket Frame
struct WebSocketFrame {
    bool fin = true;
    WebSocketOpcode opcode = WebSocketOpcode::TEXT;
    bool masked = false;
    uint32_t mask = 0;
    std::vector<uint8_t> payload;

    std::vector<uint8_t> serialize() const;

    // Parse one frame from the front of data. Returns nullopt while the
    // buffer holds an incomplete frame; consumed is set on success.
    static std::optional<WebSocketFrame> parse(const uint8_t* data, size_t size, size_t& consumed);

    static WebSocketFrame text(std::string_view message);
    static WebSocketFrame close(uint16_t code, std::string_view reason = {});
    static WebSocketFrame pong(std::vector<uint8_t> payload);

    std::string payloadText() const;

    // Close frame payload; 1005 when no status code is present
    uint16_t closeCode() const;
    std::string closeReason() const;

    bool isControl() const { return static_cast<uint8_t>(opcode) >= 0x8; }
};

// ws://host[:port][/path]
struct WebSocketUrl {
    std::string host;
    uint16_t port = 80;
    std::string path;   // without trailing slash, may be empty

    static core::Result<WebSocketUrl> parse(std::string_view url);
};

// Client side of the opening handshake
std::string generateWebSocketKey();
std::string buildHandshakeRequest(const std::string& host, uint16_t port,
                                  const std::string& path, const std::string& key);

// Parse the status line of a handshake response, e.g. "HTTP/1.1 101 Switching Protocols"
std::optional<int> parseHandshakeStatus(std::string_view response);

} // namespace duet::signaling
