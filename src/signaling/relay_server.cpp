#include <duet/signaling/relay_server.hpp>
#include <duet/core/logger.hpp>

#include <atomic>
#include <unordered_set>

#include <uWebSockets/App.h>

namespace duet::signaling {

using core::Logger;

namespace {

class UwsParticipant;

struct SocketData {
    std::string room;
    std::shared_ptr<UwsParticipant> participant;
};

using Socket = uWS::WebSocket<false, true, SocketData>;

// Binds a uWS socket to the registry's participant interface. The socket
// pointer is only valid until the close handler runs.
class UwsParticipant : public ParticipantConnection {
public:
    explicit UwsParticipant(Socket* ws)
        : ws_(ws), id_(generateConnectionId()) {}

    const std::string& id() const override { return id_; }

    void send(const std::string& text) override {
        if (!ws_ || closing_) {
            return;
        }
        if (ws_->send(text, uWS::OpCode::TEXT) == Socket::DROPPED) {
            Logger::warn("Backpressure limit reached, dropped message for {}", id_);
        }
    }

    void close(int code, std::string_view reason) override {
        if (!ws_ || closing_) {
            return;
        }
        closing_ = true;
        ws_->end(code, reason);
    }

    void detach() { ws_ = nullptr; }

private:
    Socket* ws_;
    std::string id_;
    bool closing_ = false;
};

class RelayServerImpl : public RelayServer {
public:
    RelayServerImpl(SignalingRelay& relay, Options options)
        : relay_(relay), options_(std::move(options)) {}

    ~RelayServerImpl() override {
        stop();
    }

    core::Result<void> run() override {
        if (running_) {
            return {core::ErrorCode::InvalidState, "Relay server already running"};
        }

        uWS::App app;
        addRoute(app, "/ws/video/*");

        bool listening = false;
        app.listen(options_.host, options_.port, [this, &listening](auto* listen_socket) {
            if (listen_socket) {
                listen_socket_ = listen_socket;
                port_ = us_socket_local_port(0, reinterpret_cast<us_socket_t*>(listen_socket));
                listening = true;
                Logger::info("Relay listening on {}:{}", options_.host, port_.load());
            }
        });

        if (!listening) {
            return {core::ErrorCode::NetworkError,
                    "Failed to listen on " + options_.host + ":" + std::to_string(options_.port)};
        }

        loop_ = uWS::Loop::get();
        running_ = true;
        if (stop_requested_) {
            shutdown();
        }

        app.run();

        running_ = false;
        loop_ = nullptr;
        Logger::info("Relay stopped");
        return {};
    }

    void stop() override {
        stop_requested_ = true;

        uWS::Loop* loop = loop_;
        if (loop) {
            loop->defer([this]() { shutdown(); });
        }
    }

    bool isRunning() const override {
        return running_;
    }

    int port() const override {
        return port_;
    }

private:
    void addRoute(uWS::App& app, const std::string& pattern) {
        app.ws<SocketData>(pattern, {
            .maxPayloadLength = options_.max_payload,
            .idleTimeout = options_.idle_timeout,
            .upgrade = [](auto* res, auto* req, auto* context) {
                auto room = roomFromRequestPath(req->getUrl());
                if (!room) {
                    res->writeStatus("404 Not Found")->end("Unknown endpoint");
                    return;
                }
                res->template upgrade<SocketData>(
                    {.room = std::move(*room)},
                    req->getHeader("sec-websocket-key"),
                    req->getHeader("sec-websocket-protocol"),
                    req->getHeader("sec-websocket-extensions"),
                    context);
            },
            .open = [this](auto* ws) {
                auto* data = ws->getUserData();
                data->participant = std::make_shared<UwsParticipant>(ws);
                sockets_.insert(ws);

                Logger::debug("{} connected for room {}", data->participant->id(), data->room);
                // A rejection ends the socket and destroys *data before open() returns
                relay_.open(data->room, data->participant);
            },
            .message = [this](auto* ws, std::string_view message, uWS::OpCode op_code) {
                auto* data = ws->getUserData();
                if (op_code != uWS::OpCode::TEXT) {
                    Logger::debug("Ignoring binary frame from {}", data->participant->id());
                    return;
                }
                relay_.handleText(data->participant, message);
            },
            .close = [this](auto* ws, int code, std::string_view reason) {
                auto* data = ws->getUserData();
                sockets_.erase(ws);

                if (data->participant) {
                    Logger::debug("{} closed ({} {})", data->participant->id(), code, reason);
                    data->participant->detach();
                    relay_.disconnect(data->participant);
                }
            }
        });
    }

    // Runs on the loop thread
    void shutdown() {
        if (listen_socket_) {
            us_listen_socket_close(0, listen_socket_);
            listen_socket_ = nullptr;
        }

        // end() re-enters the close handler, which mutates sockets_
        std::vector<Socket*> open(sockets_.begin(), sockets_.end());
        for (auto* ws : open) {
            ws->end(kCloseGoingAway, "server shutting down");
        }
    }

    SignalingRelay& relay_;
    Options options_;

    us_listen_socket_t* listen_socket_ = nullptr;
    std::unordered_set<Socket*> sockets_;
    std::atomic<uWS::Loop*> loop_{nullptr};
    std::atomic<int> port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace

std::optional<std::string> roomFromRequestPath(std::string_view path) {
    constexpr std::string_view kPrefix = "/ws/video/";

    if (auto query = path.find('?'); query != std::string_view::npos) {
        path = path.substr(0, query);
    }
    if (path.substr(0, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }

    path.remove_prefix(kPrefix.size());
    if (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path.empty() || path.find('/') != std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(path);
}

std::unique_ptr<RelayServer> RelayServer::create(SignalingRelay& relay, Options options) {
    return std::make_unique<RelayServerImpl>(relay, std::move(options));
}

} // namespace duet::signaling
