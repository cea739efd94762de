#include <duet/call/relay_client.hpp>
#include <duet/core/logger.hpp>

#include <algorithm>
#include <cstring>

namespace duet::call {

using core::Logger;
using signaling::WebSocketFrame;
using signaling::WebSocketOpcode;

namespace {

// Abnormal closure, never sent on the wire
constexpr int kCloseAbnormal = 1006;

constexpr size_t kMaxHandshakeSize = 16 * 1024;

struct WriteRequest {
    uv_write_t req;
    std::vector<uint8_t> data;
};

} // namespace

struct RelayClient::Connection {
    uv_tcp_t tcp;
    uv_connect_t connect_req;
    RelayClient* owner = nullptr;
    char read_buffer[64 * 1024];
};

struct RelayClient::Resolve {
    uv_getaddrinfo_t req;
    RelayClient* owner = nullptr;
};

RelayClient::RelayClient(core::EventLoop& loop, std::string relay_url)
    : loop_(loop)
    , relay_url_(std::move(relay_url))
    , rng_(std::random_device{}()) {
}

RelayClient::~RelayClient() {
    teardown(false);
}

core::Result<void> RelayClient::connect(const std::string& room_id) {
    if (state_ != State::Idle) {
        return {core::ErrorCode::InvalidState, "Relay client already used"};
    }

    auto url = signaling::WebSocketUrl::parse(relay_url_);
    if (!url) {
        return url.error();
    }
    url_ = url.value();
    path_ = url_.path + "/ws/video/" + room_id + "/";

    auto* resolve = new Resolve{};
    resolve->owner = this;
    resolve->req.data = resolve;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port = std::to_string(url_.port);
    int result = uv_getaddrinfo(loop_.handle(), &resolve->req, &RelayClient::onResolved,
                                url_.host.c_str(), port.c_str(), &hints);
    if (result != 0) {
        delete resolve;
        return {core::ErrorCode::InvalidAddress,
                "Cannot resolve " + url_.host + ": " + uv_strerror(result)};
    }

    resolve_ = resolve;
    state_ = State::Resolving;
    Logger::info("Connecting to relay {}:{}{}", url_.host, url_.port, path_);
    return {};
}

bool RelayClient::send(const signaling::SignalMessage& message) {
    if (state_ != State::Open) {
        Logger::warn("Relay not open, dropping {}",
            signaling::messageKindToString(signaling::kindOf(message)));
        return false;
    }
    return writeFrame(WebSocketFrame::text(signaling::toJson(message)));
}

void RelayClient::close() {
    if (state_ == State::Closed) {
        return;
    }

    bool graceful = state_ == State::Open;
    if (graceful) {
        writeFrame(WebSocketFrame::close(signaling::kCloseNormal, "call ended"));
    }

    teardown(graceful);
    state_ = State::Closed;
    Logger::debug("Relay connection closed locally");
}

void RelayClient::onResolved(uv_getaddrinfo_t* req, int status, struct addrinfo* result) {
    auto* resolve = static_cast<Resolve*>(req->data);
    RelayClient* self = resolve->owner;
    delete resolve;

    if (!self) {
        uv_freeaddrinfo(result);
        return;
    }
    self->resolve_ = nullptr;

    if (status < 0 || !result) {
        uv_freeaddrinfo(result);
        self->fail(kCloseAbnormal, std::string("Cannot resolve relay host: ") + uv_strerror(status));
        return;
    }

    auto* connection = new Connection{};
    connection->owner = self;
    connection->tcp.data = connection;
    connection->connect_req.data = connection;
    uv_tcp_init(self->loop_.handle(), &connection->tcp);
    self->connection_ = connection;
    self->state_ = State::Connecting;

    int error = uv_tcp_connect(&connection->connect_req, &connection->tcp,
                               result->ai_addr, &RelayClient::onConnected);
    uv_freeaddrinfo(result);

    if (error != 0) {
        self->fail(kCloseAbnormal, std::string("Cannot connect to relay: ") + uv_strerror(error));
    }
}

void RelayClient::onConnected(uv_connect_t* req, int status) {
    auto* connection = static_cast<Connection*>(req->data);
    RelayClient* self = connection->owner;
    if (!self) {
        return;
    }

    if (status < 0) {
        self->fail(kCloseAbnormal, std::string("Cannot connect to relay: ") + uv_strerror(status));
        return;
    }

    self->state_ = State::Handshaking;
    std::string request = signaling::buildHandshakeRequest(
        self->url_.host, self->url_.port, self->path_, signaling::generateWebSocketKey());

    auto* write = new WriteRequest{};
    write->req.data = write;
    write->data.assign(request.begin(), request.end());
    uv_buf_t buf = uv_buf_init(reinterpret_cast<char*>(write->data.data()),
                               static_cast<unsigned int>(write->data.size()));

    int error = uv_write(&write->req, reinterpret_cast<uv_stream_t*>(&connection->tcp), &buf, 1,
        [](uv_write_t* req, int) {
            delete static_cast<WriteRequest*>(req->data);
        });
    if (error != 0) {
        delete write;
        self->fail(kCloseAbnormal, std::string("Handshake write failed: ") + uv_strerror(error));
        return;
    }

    uv_read_start(reinterpret_cast<uv_stream_t*>(&connection->tcp),
                  &RelayClient::onAlloc, &RelayClient::onRead);
}

void RelayClient::onAlloc(uv_handle_t* handle, size_t, uv_buf_t* buf) {
    auto* connection = static_cast<Connection*>(handle->data);
    buf->base = connection->read_buffer;
    buf->len = sizeof(connection->read_buffer);
}

void RelayClient::onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* connection = static_cast<Connection*>(stream->data);
    RelayClient* self = connection->owner;
    if (!self) {
        return;
    }

    if (nread < 0) {
        self->fail(kCloseAbnormal, nread == UV_EOF
            ? "Relay closed the connection"
            : std::string("Relay read failed: ") + uv_strerror(static_cast<int>(nread)));
        return;
    }

    if (nread > 0) {
        self->handleData(buf->base, static_cast<size_t>(nread));
    }
}

void RelayClient::handleData(const char* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);

    if (state_ == State::Handshaking) {
        static const char kTerminator[] = "\r\n\r\n";
        auto end = std::search(buffer_.begin(), buffer_.end(), kTerminator, kTerminator + 4);
        if (end == buffer_.end()) {
            if (buffer_.size() > kMaxHandshakeSize) {
                fail(kCloseAbnormal, "Oversized handshake response");
            }
            return;
        }

        std::string response(buffer_.begin(), end);
        buffer_.erase(buffer_.begin(), end + 4);

        auto status = signaling::parseHandshakeStatus(response);
        if (!status || *status != 101) {
            fail(kCloseAbnormal, "Relay rejected handshake with status " +
                (status ? std::to_string(*status) : std::string("unknown")));
            return;
        }

        state_ = State::Open;
        Logger::info("Relay connection open");
        if (on_open_) {
            on_open_();
        }
    }

    while (state_ == State::Open && !buffer_.empty()) {
        size_t consumed = 0;
        auto frame = WebSocketFrame::parse(buffer_.data(), buffer_.size(), consumed);
        if (!frame) {
            break;
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
        handleFrame(*frame);
    }
}

void RelayClient::handleFrame(const WebSocketFrame& frame) {
    switch (frame.opcode) {
        case WebSocketOpcode::TEXT: {
            if (!frame.fin) {
                Logger::warn("Fragmented relay message ignored");
                return;
            }
            std::string text = frame.payloadText();
            auto message = signaling::fromJson(text);
            if (!message) {
                Logger::warn("Relay sent unusable message {}: {}", text, message.error().what());
                return;
            }
            if (on_message_) {
                on_message_(message.value());
            }
            break;
        }

        case WebSocketOpcode::CLOSE: {
            int code = frame.closeCode();
            std::string reason = frame.closeReason();
            writeFrame(WebSocketFrame::close(static_cast<uint16_t>(code == 1005 ? signaling::kCloseNormal : code)));
            fail(code, reason);
            break;
        }

        case WebSocketOpcode::PING:
            writeFrame(WebSocketFrame::pong(frame.payload));
            break;

        case WebSocketOpcode::PONG:
        case WebSocketOpcode::BINARY:
        case WebSocketOpcode::CONTINUATION:
            break;
    }
}

bool RelayClient::writeFrame(WebSocketFrame frame) {
    if (!connection_) {
        return false;
    }

    // Client frames are always masked
    frame.masked = true;
    frame.mask = static_cast<uint32_t>(rng_());

    auto* write = new WriteRequest{};
    write->req.data = write;
    write->data = frame.serialize();
    uv_buf_t buf = uv_buf_init(reinterpret_cast<char*>(write->data.data()),
                               static_cast<unsigned int>(write->data.size()));

    int error = uv_write(&write->req, reinterpret_cast<uv_stream_t*>(&connection_->tcp), &buf, 1,
        [](uv_write_t* req, int status) {
            if (status < 0 && status != UV_ECANCELED) {
                Logger::warn("Relay write failed: {}", uv_strerror(status));
            }
            delete static_cast<WriteRequest*>(req->data);
        });

    if (error != 0) {
        delete write;
        Logger::warn("Relay write failed: {}", uv_strerror(error));
        return false;
    }
    return true;
}

void RelayClient::fail(int code, const std::string& reason) {
    if (state_ == State::Closed) {
        return;
    }

    teardown(false);
    state_ = State::Closed;
    Logger::info("Relay connection closed ({}): {}", code, reason);

    if (on_close_) {
        on_close_(code, reason);
    }
}

void RelayClient::teardown(bool graceful) {
    if (resolve_) {
        resolve_->owner = nullptr;
        uv_cancel(reinterpret_cast<uv_req_t*>(&resolve_->req));
        resolve_ = nullptr;
    }

    if (connection_) {
        Connection* connection = connection_;
        connection_ = nullptr;
        connection->owner = nullptr;

        auto* handle = reinterpret_cast<uv_handle_t*>(&connection->tcp);
        auto close_connection = [](uv_handle_t* handle) {
            delete static_cast<Connection*>(handle->data);
        };

        if (!uv_is_closing(handle)) {
            uv_read_stop(reinterpret_cast<uv_stream_t*>(&connection->tcp));

            // Shutdown flushes queued writes such as the close frame
            auto* shutdown = graceful ? new uv_shutdown_t{} : nullptr;
            if (shutdown) {
                shutdown->data = connection;
                int error = uv_shutdown(shutdown, reinterpret_cast<uv_stream_t*>(&connection->tcp),
                    [](uv_shutdown_t* req, int) {
                        auto* connection = static_cast<Connection*>(req->data);
                        delete req;
                        uv_close(reinterpret_cast<uv_handle_t*>(&connection->tcp), [](uv_handle_t* handle) {
                            delete static_cast<Connection*>(handle->data);
                        });
                    });
                if (error == 0) {
                    buffer_.clear();
                    return;
                }
                delete shutdown;
            }
            uv_close(handle, close_connection);
        }
    }

    buffer_.clear();
}

} // namespace duet::call
