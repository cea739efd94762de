#include "duet/signaling/relay.hpp"
#include "duet/core/logger.hpp"

namespace duet::signaling {

using core::Logger;

SignalingRelay::SignalingRelay(RoomRegistry& registry)
    : registry_(registry) {
}

core::Result<JoinRole> SignalingRelay::admit(const std::string& room_id, const ParticipantPtr& participant) {
    auto result = registry_.join(room_id, participant, [&](JoinRole role) {
        participant->send(toJson(JoinMessage{room_id, role}));
    });

    if (!result) {
        switch (result.error().code()) {
            case core::ErrorCode::RoomFull:
                participant->close(kCloseRoomFull, "room full");
                break;
            case core::ErrorCode::InvalidRoom:
                participant->close(kCloseInvalidRoom, "invalid room");
                break;
            default:
                Logger::warn("Rejecting {}: {}", participant->id(), result.error().what());
                participant->close(kCloseInvalidRoom, "join rejected");
                break;
        }
    }

    return result;
}

core::Result<JoinRole> SignalingRelay::open(std::string room_id, ParticipantPtr participant) {
    auto admitted = admit(room_id, participant);
    if (!admitted) {
        Logger::info("{} rejected from room {}: {}", participant->id(), room_id, admitted.error().what());
    }
    return admitted;
}

void SignalingRelay::relay(const std::string& room_id, const ParticipantPtr& sender, const SignalMessage& message) {
    forward(room_id, sender, kindOf(message), toJson(message));
}

void SignalingRelay::forward(const std::string& room_id, const ParticipantPtr& sender,
                             MessageKind kind, const std::string& text) {
    std::size_t delivered = registry_.sendToOthers(room_id, sender, text);
    messages_relayed_ += delivered;

    if (delivered == 0) {
        Logger::debug("No recipient for {} in room {}", messageKindToString(kind), room_id);
    }
}

void SignalingRelay::broadcastRoomStatus(const std::string& room_id) {
    int count = static_cast<int>(registry_.memberCount(room_id));
    registry_.broadcast(room_id, toJson(RoomStatusMessage{count}));
}

void SignalingRelay::endCall(const std::string& room_id, const ParticipantPtr& sender) {
    if (!registry_.endCall(room_id, sender, toJson(CallEndedMessage{}))) {
        Logger::warn("{} tried to end call in room {} without being a member", sender->id(), room_id);
        return;
    }
    calls_ended_++;
}

void SignalingRelay::disconnect(const ParticipantPtr& participant) {
    auto room_id = registry_.roomOf(participant);
    if (!room_id) {
        return;
    }
    registry_.leave(*room_id, participant);
}

void SignalingRelay::handleText(const ParticipantPtr& participant, std::string_view text) {
    auto decoded = fromJson(text);
    if (!decoded) {
        invalid_messages_++;
        if (decoded.error().code() == core::ErrorCode::InvalidData) {
            sendError(participant, "Invalid JSON format");
        }
        else {
            Logger::warn("Dropping message from {}: {}", participant->id(), decoded.error().what());
            sendError(participant, "Unsupported message type");
        }
        return;
    }

    auto room_id = registry_.roomOf(participant);
    if (!room_id) {
        Logger::warn("Message from {} outside of any room", participant->id());
        return;
    }

    const SignalMessage& message = decoded.value();
    switch (kindOf(message)) {
        case MessageKind::Join:
            // Roles are only assigned by admit()
            relay(*room_id, participant, JoinMessage{std::get<JoinMessage>(message).room, std::nullopt});
            break;

        // Forwarded as received, unknown fields included
        case MessageKind::Offer:
        case MessageKind::Answer:
        case MessageKind::IceCandidate:
            forward(*room_id, participant, kindOf(message), std::string(text));
            break;

        case MessageKind::CallEnded:
            endCall(*room_id, participant);
            break;

        case MessageKind::RoomStatus:
        case MessageKind::PeerDisconnected:
            Logger::warn("Ignoring relay-only message {} from {}",
                messageKindToString(kindOf(message)), participant->id());
            break;
    }
}

SignalingRelay::Stats SignalingRelay::getStats() const {
    Stats stats;
    stats.messages_relayed = messages_relayed_;
    stats.invalid_messages = invalid_messages_;
    stats.calls_ended = calls_ended_;
    return stats;
}

void SignalingRelay::sendError(const ParticipantPtr& participant, std::string_view error) {
    nlohmann::json reply = {{"error", std::string(error)}};
    participant->send(reply.dump());
}

} // namespace duet::signaling
