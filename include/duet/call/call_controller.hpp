#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <duet/core/error.hpp>
#include <duet/core/event.hpp>
#include <duet/call/media.hpp>
#include <duet/call/negotiation.hpp>
#include <duet/call/peer_connection.hpp>
#include <duet/call/relay_client.hpp>

namespace duet::call {

struct CallOptions {
    std::string link_base = "http://localhost:8080/video_call/";
    PeerConnectionConfig peer = PeerConnectionConfig::defaults();
    MediaConstraints media;

    // Delay between transport connected and the first connection path
    // report, then the period of the reports while the call lasts
    std::chrono::milliseconds path_check_delay{1000};
    std::chrono::milliseconds path_check_interval{30000};
};

// Drives one call for one participant. Runs on the event loop thread;
// transport callbacks are marshalled onto the loop before they reach the
// negotiation session.
class CallController : public std::enable_shared_from_this<CallController> {
public:
    using StateCallback = std::function<void(NegotiationState)>;
    using NoticeCallback = std::function<void(const Notice&)>;
    using PathCallback = std::function<void(ConnectionPath)>;

    static std::shared_ptr<CallController> create(core::EventLoop& loop,
                                                  CallOptions options,
                                                  std::shared_ptr<MediaDevices> devices,
                                                  std::shared_ptr<RelayChannel> relay,
                                                  PeerConnectionFactory factory);

    ~CallController();

    // Non-copyable
    CallController(const CallController&) = delete;
    CallController& operator=(const CallController&) = delete;

    // Host flow: new room, returns the link to share
    core::Result<std::string> host();

    // Joiner flow: room taken from a shared link
    core::Result<void> join(std::string_view link);

    // Idempotent, safe from any state
    void end();

    // Flip the enabled flag of the local track. Returns true when the track
    // is now muted/disabled, nullopt when there is no such track.
    std::optional<bool> muteAudio();
    std::optional<bool> disableVideo();

    NegotiationState state() const { return session_.state; }
    const NegotiationSession& session() const { return session_; }
    std::optional<std::string> shareLink() const { return share_link_; }
    ConnectionPath connectionPath() const;

    void setStateCallback(StateCallback callback) { on_state_change_ = std::move(callback); }
    void setNoticeCallback(NoticeCallback callback) { on_notice_ = std::move(callback); }
    void setConnectionPathCallback(PathCallback callback) { on_connection_path_ = std::move(callback); }

private:
    CallController(core::EventLoop& loop,
                   CallOptions options,
                   std::shared_ptr<MediaDevices> devices,
                   std::shared_ptr<RelayChannel> relay,
                   PeerConnectionFactory factory);

    core::Result<void> start(const std::string& room_id);

    void dispatch(NegotiationEvent event);
    void execute(const Effect& effect);
    void postEvent(NegotiationEvent event);

    void onRelayMessage(const signaling::SignalMessage& message);

    template<typename F>
    void withPeer(const char* operation, F&& action);

    void scheduleConnectionPathCheck(std::chrono::milliseconds delay);

    core::EventLoop& loop_;
    CallOptions options_;
    std::shared_ptr<MediaDevices> devices_;
    std::shared_ptr<RelayChannel> relay_;
    PeerConnectionFactory factory_;

    std::unique_ptr<MediaCapture> media_;
    std::shared_ptr<PeerConnection> peer_;

    NegotiationSession session_;
    std::deque<NegotiationEvent> pending_;
    bool dispatching_ = false;
    bool path_checks_armed_ = false;

    std::optional<std::string> share_link_;

    StateCallback on_state_change_;
    NoticeCallback on_notice_;
    PathCallback on_connection_path_;
};

} // namespace duet::call
