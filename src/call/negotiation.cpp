#include <duet/call/negotiation.hpp>
#include <duet/core/logger.hpp>

namespace duet::call {

using core::Logger;

namespace {

bool hasJoinedRelay(NegotiationState state) {
    switch (state) {
        case NegotiationState::WaitingForPeer:
        case NegotiationState::HaveLocalOffer:
        case NegotiationState::HaveRemoteOffer:
        case NegotiationState::Connected:
            return true;
        default:
            return false;
    }
}

Notice info(std::string text) {
    return Notice{NoticeKind::Info, std::move(text)};
}

class Transitioner {
public:
    explicit Transitioner(const NegotiationSession& current)
        : current_(current), next_{current, {}} {}

    Transition operator()(const event::Start& e) {
        if (current_.state != NegotiationState::Idle) {
            return violation("start", "call already started");
        }
        next_.session.state = NegotiationState::Joining;
        next_.session.room_id = e.room_id;
        return std::move(next_);
    }

    Transition operator()(const event::Joined& e) {
        if (current_.state != NegotiationState::Joining) {
            return violation("join acknowledgement", "not joining");
        }
        next_.session.state = NegotiationState::WaitingForPeer;
        next_.session.role = e.role == signaling::JoinRole::First ? Role::Initiator : Role::Responder;
        notify(info(next_.session.role == Role::Initiator
            ? "Waiting for peer to join..."
            : "Joined call, waiting for connection..."));
        return std::move(next_);
    }

    Transition operator()(const event::RoomStatus& e) {
        if (current_.isEnded() || e.count < 2) {
            return std::move(next_);
        }
        if (current_.state != NegotiationState::WaitingForPeer) {
            return std::move(next_);
        }

        if (current_.role == Role::Initiator && !current_.offer_requested) {
            next_.session.offer_requested = true;
            next_.effects.push_back(effect::CreateOffer{});
            notify(info("Peer joined, starting call..."));
        }
        else if (current_.role == Role::Responder) {
            notify(info("Another person has joined the call..."));
        }
        return std::move(next_);
    }

    Transition operator()(const event::RemoteOffer& e) {
        bool acceptable_state = current_.state == NegotiationState::Idle ||
                                current_.state == NegotiationState::WaitingForPeer;
        if (!acceptable_state || current_.role == Role::Initiator) {
            return violation("offer", "only a waiting responder accepts offers");
        }

        next_.session.state = NegotiationState::HaveRemoteOffer;
        next_.session.role = Role::Responder;
        next_.session.answer_requested = true;
        applyRemoteDescription(e.description);
        next_.effects.push_back(effect::CreateAnswer{});
        notify(info("Receiving call..."));
        return std::move(next_);
    }

    Transition operator()(const event::RemoteAnswer& e) {
        if (current_.state != NegotiationState::HaveLocalOffer) {
            return violation("answer", "no local offer pending");
        }

        next_.session.state = NegotiationState::Connected;
        applyRemoteDescription(e.description);
        notify(info("Call connected!"));
        return std::move(next_);
    }

    Transition operator()(const event::RemoteCandidate& e) {
        if (current_.isEnded()) {
            return std::move(next_);
        }
        if (current_.remote_description) {
            next_.effects.push_back(effect::AddRemoteCandidate{e.candidate});
        }
        else {
            next_.session.pending_remote_candidates.push_back(e.candidate);
        }
        return std::move(next_);
    }

    Transition operator()(const event::LocalDescription& e) {
        if (current_.isEnded()) {
            return std::move(next_);
        }
        if (e.description.type == SdpType::Offer) {
            if (current_.state != NegotiationState::WaitingForPeer || !current_.offer_requested) {
                return violation("local offer", "offer was not requested");
            }
            next_.session.state = NegotiationState::HaveLocalOffer;
            next_.session.local_description = e.description;
            send(signaling::OfferMessage{e.description.toJson()});
        }
        else {
            if (current_.state != NegotiationState::HaveRemoteOffer || !current_.answer_requested) {
                return violation("local answer", "answer was not requested");
            }
            next_.session.state = NegotiationState::Connected;
            next_.session.local_description = e.description;
            send(signaling::AnswerMessage{e.description.toJson()});
        }

        // Candidates gathered before the description went out follow it
        for (const auto& candidate : current_.outgoing_candidates) {
            send(signaling::IceCandidateMessage{candidate.toJson()});
        }
        next_.session.outgoing_candidates.clear();
        return std::move(next_);
    }

    Transition operator()(const event::LocalCandidate& e) {
        if (current_.isEnded()) {
            return std::move(next_);
        }
        if (current_.local_description) {
            send(signaling::IceCandidateMessage{e.candidate.toJson()});
        }
        else {
            next_.session.outgoing_candidates.push_back(e.candidate);
        }
        return std::move(next_);
    }

    Transition operator()(const event::TransportChanged& e) {
        if (current_.isEnded()) {
            return std::move(next_);
        }

        switch (e.state) {
            case TransportState::Connecting:
                notify(info("Connecting to peer..."));
                break;
            case TransportState::Connected:
                notify(info("Connected! Video and audio should start playing."));
                break;
            case TransportState::Disconnected:
                notify(Notice{NoticeKind::Transport, "Peer disconnected"});
                break;
            case TransportState::Failed:
                return end(Notice{NoticeKind::Transport, "Connection failed. Please try again."}, false);
            case TransportState::New:
            case TransportState::Closed:
                break;
        }
        return std::move(next_);
    }

    Transition operator()(const event::PeerDisconnected&) {
        return end(Notice{NoticeKind::PeerEnded, "Other person has left the call"}, false);
    }

    Transition operator()(const event::CallEnded&) {
        return end(Notice{NoticeKind::PeerEnded, "Call has been ended"}, false);
    }

    Transition operator()(const event::RoomFull&) {
        return end(Notice{NoticeKind::Capacity, "Room is full. Please try again later."}, false);
    }

    Transition operator()(const event::RelayClosed& e) {
        if (e.code == signaling::kCloseRoomFull) {
            return (*this)(event::RoomFull{});
        }
        if (e.code == signaling::kCloseInvalidRoom) {
            return end(Notice{NoticeKind::Capacity, "Invalid room."}, false);
        }
        return end(Notice{NoticeKind::Transport, "Connection closed."}, false);
    }

    Transition operator()(const event::LocalEnd&) {
        return end(std::nullopt, hasJoinedRelay(current_.state));
    }

private:
    Transition violation(const char* what, const char* why) {
        Logger::warn("Protocol violation: {} discarded in state {} ({})",
            what, negotiationStateToString(current_.state), why);
        return Transition{current_, {}};
    }

    // Remote candidates queued so far are applied right after the description
    void applyRemoteDescription(const SessionDescription& description) {
        next_.session.remote_description = description;
        next_.effects.push_back(effect::ApplyRemoteDescription{description});
        for (const auto& candidate : current_.pending_remote_candidates) {
            next_.effects.push_back(effect::AddRemoteCandidate{candidate});
        }
        next_.session.pending_remote_candidates.clear();
    }

    Transition end(std::optional<Notice> notice, bool notify_peer) {
        if (current_.isEnded()) {
            return Transition{current_, {}};
        }

        if (notify_peer) {
            send(signaling::CallEndedMessage{});
        }
        next_.effects.push_back(effect::ReleaseMedia{});
        next_.effects.push_back(effect::ClosePeerConnection{});
        next_.effects.push_back(effect::CloseRelay{});
        if (notice) {
            notify(*notice);
        }

        next_.session.state = NegotiationState::Ended;
        next_.session.outgoing_candidates.clear();
        next_.session.pending_remote_candidates.clear();
        next_.session.end_notice = std::move(notice);
        return std::move(next_);
    }

    void send(signaling::SignalMessage message) {
        next_.effects.push_back(effect::Send{std::move(message)});
    }

    void notify(Notice notice) {
        next_.effects.push_back(effect::Notify{std::move(notice)});
    }

    const NegotiationSession& current_;
    Transition next_;
};

} // namespace

std::string negotiationStateToString(NegotiationState state) {
    switch (state) {
        case NegotiationState::Idle: return "idle";
        case NegotiationState::Joining: return "joining";
        case NegotiationState::WaitingForPeer: return "waiting-for-peer";
        case NegotiationState::HaveLocalOffer: return "have-local-offer";
        case NegotiationState::HaveRemoteOffer: return "have-remote-offer";
        case NegotiationState::Connected: return "connected";
        case NegotiationState::Ended: return "ended";
    }
    return "unknown";
}

std::string roleToString(Role role) {
    switch (role) {
        case Role::Unassigned: return "unassigned";
        case Role::Initiator: return "initiator";
        case Role::Responder: return "responder";
    }
    return "unknown";
}

std::string eventName(const NegotiationEvent& event) {
    static const char* names[] = {
        "start", "joined", "room-status", "remote-offer", "remote-answer",
        "remote-candidate", "local-description", "local-candidate",
        "transport-changed", "peer-disconnected", "call-ended", "room-full",
        "relay-closed", "local-end"
    };
    return names[event.index()];
}

Transition applyEvent(const NegotiationSession& session, const NegotiationEvent& event) {
    return std::visit(Transitioner{session}, event);
}

} // namespace duet::call
