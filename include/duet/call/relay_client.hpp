#pragma once

#include <functional>
#include <random>
#include <string>
#include <vector>

#include <duet/core/error.hpp>
#include <duet/core/event.hpp>
#include <duet/signaling/message.hpp>
#include <duet/signaling/websocket.hpp>

namespace duet::call {

// Participant side of the signaling connection
class RelayChannel {
public:
    using OpenCallback = std::function<void()>;
    using MessageCallback = std::function<void(const signaling::SignalMessage&)>;
    using CloseCallback = std::function<void(int code, const std::string& reason)>;

    virtual ~RelayChannel() = default;

    // Asynchronous; the outcome arrives through the callbacks
    virtual core::Result<void> connect(const std::string& room_id) = 0;

    virtual bool send(const signaling::SignalMessage& message) = 0;

    // Local close. The close callback only reports closes initiated by the
    // relay or by the network.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    void setOpenCallback(OpenCallback callback) { on_open_ = std::move(callback); }
    void setMessageCallback(MessageCallback callback) { on_message_ = std::move(callback); }
    void setCloseCallback(CloseCallback callback) { on_close_ = std::move(callback); }

protected:
    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;
};

// WebSocket client on the libuv loop. All callbacks run on the loop thread.
class RelayClient : public RelayChannel {
public:
    RelayClient(core::EventLoop& loop, std::string relay_url);
    ~RelayClient() override;

    // Non-copyable
    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    core::Result<void> connect(const std::string& room_id) override;
    bool send(const signaling::SignalMessage& message) override;
    void close() override;
    bool isOpen() const override { return state_ == State::Open; }

private:
    enum class State {
        Idle,
        Resolving,
        Connecting,
        Handshaking,
        Open,
        Closed
    };

    struct Connection;
    struct Resolve;

    static void onResolved(uv_getaddrinfo_t* req, int status, struct addrinfo* result);
    static void onConnected(uv_connect_t* req, int status);
    static void onAlloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);

    void handleData(const char* data, size_t size);
    void handleFrame(const signaling::WebSocketFrame& frame);
    bool writeFrame(signaling::WebSocketFrame frame);

    // Remote or network close: tears down and reports once
    void fail(int code, const std::string& reason);
    void teardown(bool graceful);

    core::EventLoop& loop_;
    std::string relay_url_;
    signaling::WebSocketUrl url_;
    std::string path_;

    State state_ = State::Idle;
    Connection* connection_ = nullptr;
    Resolve* resolve_ = nullptr;
    std::vector<uint8_t> buffer_;
    std::mt19937 rng_;
};

} // namespace duet::call
