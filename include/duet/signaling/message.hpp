#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <variant>

#include <nlohmann/json.hpp>

#include <duet/core/error.hpp>

namespace duet::signaling {

// WebSocket close codes used by the relay
constexpr int kCloseNormal = 1000;
constexpr int kCloseGoingAway = 1001;
constexpr int kCloseInvalidRoom = 1008;
constexpr int kCloseRoomFull = 4000;

// Signaling message kinds
enum class MessageKind {
    Join,
    RoomStatus,
    Offer,
    Answer,
    IceCandidate,
    PeerDisconnected,
    CallEnded
};

// Position of a participant in the room, as decided by the registry.
// The first joiner initiates the negotiation.
enum class JoinRole {
    First,
    Second
};

struct JoinMessage {
    std::string room;
    std::optional<JoinRole> role; // set only on the relay's admission acknowledgement
};

struct RoomStatusMessage {
    int count = 0;
};

// Payloads below are opaque to the relay and carried verbatim.
struct OfferMessage {
    nlohmann::json description;
};

struct AnswerMessage {
    nlohmann::json description;
};

struct IceCandidateMessage {
    nlohmann::json candidate;
};

struct PeerDisconnectedMessage {};

struct CallEndedMessage {};

using SignalMessage = std::variant<
    JoinMessage,
    RoomStatusMessage,
    OfferMessage,
    AnswerMessage,
    IceCandidateMessage,
    PeerDisconnectedMessage,
    CallEndedMessage
>;

MessageKind kindOf(const SignalMessage& message);

// JSON text encoding used on the WebSocket
std::string toJson(const SignalMessage& message);
core::Result<SignalMessage> fromJson(std::string_view text);

// Utility functions
std::string messageKindToString(MessageKind kind);
std::optional<MessageKind> stringToMessageKind(std::string_view type);
std::string joinRoleToString(JoinRole role);
std::optional<JoinRole> stringToJoinRole(std::string_view role);

// Room ids are 1-64 characters of [A-Za-z0-9_-]
bool isValidRoomId(std::string_view room_id);

std::string generateConnectionId();

} // namespace duet::signaling
