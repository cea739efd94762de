#include "duet/signaling/websocket.hpp"

#include <cstring>
#include <random>
#include <sstream>

namespace duet::signaling {

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64Encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 6) & 0x3F]);
        out.push_back(kBase64Chars[n & 0x3F]);
    }

    if (i < size) {
        uint32_t n = data[i] << 16;
        if (i + 1 < size) n |= data[i + 1] << 8;
        out.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        out.push_back(i + 1 < size ? kBase64Chars[(n >> 6) & 0x3F] : '=');
        out.push_back('=');
    }

    return out;
}

} // namespace

std::vector<uint8_t> WebSocketFrame::serialize() const {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);

    // First byte: FIN + RSV + Opcode
    frame.push_back((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

    // Second byte: MASK + Payload length
    uint8_t second_byte = masked ? 0x80 : 0x00;
    uint64_t size = payload.size();

    if (size < 126) {
        frame.push_back(second_byte | static_cast<uint8_t>(size));
    } else if (size < 65536) {
        frame.push_back(second_byte | 126);
        frame.push_back((size >> 8) & 0xFF);
        frame.push_back(size & 0xFF);
    } else {
        frame.push_back(second_byte | 127);
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back((size >> shift) & 0xFF);
        }
    }

    if (!masked) {
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    uint8_t key[4] = {
        static_cast<uint8_t>((mask >> 24) & 0xFF),
        static_cast<uint8_t>((mask >> 16) & 0xFF),
        static_cast<uint8_t>((mask >> 8) & 0xFF),
        static_cast<uint8_t>(mask & 0xFF)
    };
    frame.insert(frame.end(), key, key + 4);

    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(payload[i] ^ key[i % 4]);
    }

    return frame;
}

std::optional<WebSocketFrame> WebSocketFrame::parse(const uint8_t* data, size_t size, size_t& consumed) {
    if (size < 2) {
        return std::nullopt;
    }

    WebSocketFrame frame;
    frame.fin = (data[0] & 0x80) != 0;
    frame.opcode = static_cast<WebSocketOpcode>(data[0] & 0x0F);
    frame.masked = (data[1] & 0x80) != 0;

    uint8_t payload_len = data[1] & 0x7F;
    size_t header_size = 2;
    uint64_t payload_size = payload_len;

    // Extended payload length
    if (payload_len == 126) {
        if (size < 4) return std::nullopt;
        payload_size = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_size = 4;
    } else if (payload_len == 127) {
        if (size < 10) return std::nullopt;
        payload_size = 0;
        for (int i = 2; i < 10; ++i) {
            payload_size = (payload_size << 8) | data[i];
        }
        header_size = 10;
    }

    uint8_t key[4] = {0, 0, 0, 0};
    if (frame.masked) {
        if (size < header_size + 4) return std::nullopt;
        std::memcpy(key, data + header_size, 4);
        frame.mask = (static_cast<uint32_t>(key[0]) << 24) | (key[1] << 16) | (key[2] << 8) | key[3];
        header_size += 4;
    }

    if (size - header_size < payload_size) {
        return std::nullopt;
    }

    frame.payload.resize(static_cast<size_t>(payload_size));
    for (size_t i = 0; i < frame.payload.size(); ++i) {
        uint8_t byte = data[header_size + i];
        frame.payload[i] = frame.masked ? byte ^ key[i % 4] : byte;
    }

    consumed = header_size + static_cast<size_t>(payload_size);
    return frame;
}

WebSocketFrame WebSocketFrame::text(std::string_view message) {
    WebSocketFrame frame;
    frame.opcode = WebSocketOpcode::TEXT;
    frame.payload.assign(message.begin(), message.end());
    return frame;
}

WebSocketFrame WebSocketFrame::close(uint16_t code, std::string_view reason) {
    WebSocketFrame frame;
    frame.opcode = WebSocketOpcode::CLOSE;
    frame.payload.push_back((code >> 8) & 0xFF);
    frame.payload.push_back(code & 0xFF);
    frame.payload.insert(frame.payload.end(), reason.begin(), reason.end());
    return frame;
}

WebSocketFrame WebSocketFrame::pong(std::vector<uint8_t> payload) {
    WebSocketFrame frame;
    frame.opcode = WebSocketOpcode::PONG;
    frame.payload = std::move(payload);
    return frame;
}

std::string WebSocketFrame::payloadText() const {
    return std::string(payload.begin(), payload.end());
}

uint16_t WebSocketFrame::closeCode() const {
    if (payload.size() < 2) {
        return 1005;
    }
    return static_cast<uint16_t>((payload[0] << 8) | payload[1]);
}

std::string WebSocketFrame::closeReason() const {
    if (payload.size() <= 2) {
        return {};
    }
    return std::string(payload.begin() + 2, payload.end());
}

core::Result<WebSocketUrl> WebSocketUrl::parse(std::string_view url) {
    constexpr std::string_view scheme = "ws://";
    if (url.substr(0, scheme.size()) != scheme) {
        return {core::ErrorCode::InvalidAddress, "Only ws:// relay URLs are supported: " + std::string(url)};
    }
    url.remove_prefix(scheme.size());

    WebSocketUrl result;

    auto slash = url.find('/');
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        result.path = std::string(url.substr(slash));
        while (!result.path.empty() && result.path.back() == '/') {
            result.path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        std::string port_text(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        try {
            int port = std::stoi(port_text);
            if (port <= 0 || port > 65535) {
                return {core::ErrorCode::InvalidAddress, "Port out of range: " + port_text};
            }
            result.port = static_cast<uint16_t>(port);
        }
        catch (const std::exception&) {
            return {core::ErrorCode::InvalidAddress, "Invalid port: " + port_text};
        }
    }

    if (authority.empty()) {
        return {core::ErrorCode::InvalidAddress, "Missing host in relay URL"};
    }
    result.host = std::string(authority);
    return result;
}

std::string generateWebSocketKey() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 255);

    uint8_t nonce[16];
    for (auto& byte : nonce) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return base64Encode(nonce, sizeof(nonce));
}

std::string buildHandshakeRequest(const std::string& host, uint16_t port,
                                  const std::string& path, const std::string& key) {
    std::ostringstream request;
    request << "GET " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n"
            << "Host: " << host << ":" << port << "\r\n"
            << "Upgrade: websocket\r\n"
            << "Connection: Upgrade\r\n"
            << "Sec-WebSocket-Key: " << key << "\r\n"
            << "Sec-WebSocket-Version: 13\r\n"
            << "\r\n";
    return request.str();
}

std::optional<int> parseHandshakeStatus(std::string_view response) {
    auto line_end = response.find("\r\n");
    std::string_view line = response.substr(0, line_end);

    if (line.substr(0, 5) != "HTTP/") {
        return std::nullopt;
    }

    auto space = line.find(' ');
    if (space == std::string_view::npos || line.size() < space + 4) {
        return std::nullopt;
    }

    int status = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        char c = line[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        status = status * 10 + (c - '0');
    }
    return status;
}

} // namespace duet::signaling
