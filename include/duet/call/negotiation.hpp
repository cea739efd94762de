#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <duet/call/peer_connection.hpp>
#include <duet/signaling/message.hpp>

namespace duet::call {

enum class NegotiationState {
    Idle,
    Joining,
    WaitingForPeer,
    HaveLocalOffer,
    HaveRemoteOffer,
    Connected,
    Ended
};

std::string negotiationStateToString(NegotiationState state);

enum class Role {
    Unassigned,
    Initiator,  // first joiner, sends the offer
    Responder
};

std::string roleToString(Role role);

enum class NoticeKind {
    Info,
    Capacity,
    Permission,
    Transport,
    PeerEnded
};

struct Notice {
    NoticeKind kind = NoticeKind::Info;
    std::string text;
};

// Client-side negotiation state. Values are never mutated in place by
// applyEvent(); each transition returns a new session.
struct NegotiationSession {
    NegotiationState state = NegotiationState::Idle;
    Role role = Role::Unassigned;
    std::string room_id;

    bool offer_requested = false;
    bool answer_requested = false;

    std::optional<SessionDescription> local_description;   // set once sent to the peer
    std::optional<SessionDescription> remote_description;

    std::vector<IceCandidate> outgoing_candidates;          // awaiting transmission
    std::vector<IceCandidate> pending_remote_candidates;    // awaiting a remote description

    std::optional<Notice> end_notice;

    bool isEnded() const { return state == NegotiationState::Ended; }
};

namespace event {

struct Start { std::string room_id; };
struct Joined { signaling::JoinRole role; };
struct RoomStatus { int count = 0; };
struct RemoteOffer { SessionDescription description; };
struct RemoteAnswer { SessionDescription description; };
struct RemoteCandidate { IceCandidate candidate; };
struct LocalDescription { SessionDescription description; };
struct LocalCandidate { IceCandidate candidate; };
struct TransportChanged { TransportState state; };
struct PeerDisconnected {};
struct CallEnded {};
struct RoomFull {};
struct RelayClosed { int code = 1000; std::string reason; };
struct LocalEnd {};

} // namespace event

using NegotiationEvent = std::variant<
    event::Start,
    event::Joined,
    event::RoomStatus,
    event::RemoteOffer,
    event::RemoteAnswer,
    event::RemoteCandidate,
    event::LocalDescription,
    event::LocalCandidate,
    event::TransportChanged,
    event::PeerDisconnected,
    event::CallEnded,
    event::RoomFull,
    event::RelayClosed,
    event::LocalEnd
>;

std::string eventName(const NegotiationEvent& event);

namespace effect {

struct CreateOffer {};
struct CreateAnswer {};
struct ApplyRemoteDescription { SessionDescription description; };
struct AddRemoteCandidate { IceCandidate candidate; };
struct Send { signaling::SignalMessage message; };
struct ReleaseMedia {};
struct ClosePeerConnection {};
struct CloseRelay {};
struct Notify { Notice notice; };

} // namespace effect

using Effect = std::variant<
    effect::CreateOffer,
    effect::CreateAnswer,
    effect::ApplyRemoteDescription,
    effect::AddRemoteCandidate,
    effect::Send,
    effect::ReleaseMedia,
    effect::ClosePeerConnection,
    effect::CloseRelay,
    effect::Notify
>;

struct Transition {
    NegotiationSession session;
    std::vector<Effect> effects;
};

// Pure transition function. Messages that are invalid in the current state
// are protocol violations: they are logged and leave the session unchanged.
Transition applyEvent(const NegotiationSession& session, const NegotiationEvent& event);

} // namespace duet::call
