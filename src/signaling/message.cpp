#include "duet/signaling/message.hpp"
#include "duet/core/logger.hpp"

#include <limits>
#include <random>
#include <sstream>

namespace duet::signaling {

namespace {

using json = nlohmann::json;

struct Encoder {
    json operator()(const JoinMessage& m) const {
        json j = {{"type", "join"}, {"room", m.room}};
        if (m.role) {
            j["role"] = joinRoleToString(*m.role);
        }
        return j;
    }

    json operator()(const RoomStatusMessage& m) const {
        return {{"type", "room-status"}, {"count", m.count}};
    }

    json operator()(const OfferMessage& m) const {
        return {{"type", "offer"}, {"offer", m.description}};
    }

    json operator()(const AnswerMessage& m) const {
        return {{"type", "answer"}, {"answer", m.description}};
    }

    json operator()(const IceCandidateMessage& m) const {
        return {{"type", "ice-candidate"}, {"candidate", m.candidate}};
    }

    json operator()(const PeerDisconnectedMessage&) const {
        return {{"type", "peer-disconnected"}};
    }

    json operator()(const CallEndedMessage&) const {
        return {{"type", "call-ended"}};
    }
};

// Payload shape is checked by the receiving client, not here
core::Result<json> requireField(const json& envelope, const char* field) {
    auto it = envelope.find(field);
    if (it == envelope.end() || it->is_null()) {
        return {core::ErrorCode::InvalidMessage,
                std::string("Missing field '") + field + "'"};
    }
    return *it;
}

bool countInRange(const json& count) {
    if (count.is_number_unsigned()) {
        return count.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    }
    auto value = count.get<int64_t>();
    return value >= 0 && value <= std::numeric_limits<int>::max();
}

} // namespace

MessageKind kindOf(const SignalMessage& message) {
    return std::visit([](const auto& m) -> MessageKind {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JoinMessage>) return MessageKind::Join;
        else if constexpr (std::is_same_v<T, RoomStatusMessage>) return MessageKind::RoomStatus;
        else if constexpr (std::is_same_v<T, OfferMessage>) return MessageKind::Offer;
        else if constexpr (std::is_same_v<T, AnswerMessage>) return MessageKind::Answer;
        else if constexpr (std::is_same_v<T, IceCandidateMessage>) return MessageKind::IceCandidate;
        else if constexpr (std::is_same_v<T, PeerDisconnectedMessage>) return MessageKind::PeerDisconnected;
        else return MessageKind::CallEnded;
    }, message);
}

std::string toJson(const SignalMessage& message) {
    return std::visit(Encoder{}, message).dump();
}

core::Result<SignalMessage> fromJson(std::string_view text) {
    json envelope = json::parse(text, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return {core::ErrorCode::InvalidData, "Invalid JSON format"};
    }

    auto type_it = envelope.find("type");
    if (type_it == envelope.end() || !type_it->is_string()) {
        return {core::ErrorCode::InvalidMessage, "Message has no type"};
    }

    auto kind = stringToMessageKind(type_it->get<std::string>());
    if (!kind) {
        return {core::ErrorCode::InvalidMessage,
                "Unsupported message type: " + type_it->get<std::string>()};
    }

    switch (*kind) {
        case MessageKind::Join: {
            JoinMessage join;
            join.room = envelope.value("room", std::string());
            if (auto role = envelope.find("role"); role != envelope.end() && role->is_string()) {
                join.role = stringToJoinRole(role->get<std::string>());
            }
            return SignalMessage{std::move(join)};
        }

        case MessageKind::RoomStatus: {
            auto count = envelope.find("count");
            if (count == envelope.end() || !count->is_number_integer()) {
                return {core::ErrorCode::InvalidMessage, "room-status without count"};
            }
            if (!countInRange(*count)) {
                return {core::ErrorCode::InvalidMessage, "room-status count out of range"};
            }
            return SignalMessage{RoomStatusMessage{count->get<int>()}};
        }

        case MessageKind::Offer: {
            auto description = requireField(envelope, "offer");
            if (!description) return description.error();
            return SignalMessage{OfferMessage{description.value()}};
        }

        case MessageKind::Answer: {
            auto description = requireField(envelope, "answer");
            if (!description) return description.error();
            return SignalMessage{AnswerMessage{description.value()}};
        }

        case MessageKind::IceCandidate: {
            auto candidate = requireField(envelope, "candidate");
            if (!candidate) return candidate.error();
            return SignalMessage{IceCandidateMessage{candidate.value()}};
        }

        case MessageKind::PeerDisconnected:
            return SignalMessage{PeerDisconnectedMessage{}};

        case MessageKind::CallEnded:
            return SignalMessage{CallEndedMessage{}};
    }

    return {core::ErrorCode::InvalidMessage, "Unhandled message type"};
}

std::string messageKindToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Join: return "join";
        case MessageKind::RoomStatus: return "room-status";
        case MessageKind::Offer: return "offer";
        case MessageKind::Answer: return "answer";
        case MessageKind::IceCandidate: return "ice-candidate";
        case MessageKind::PeerDisconnected: return "peer-disconnected";
        case MessageKind::CallEnded: return "call-ended";
    }
    return "unknown";
}

std::optional<MessageKind> stringToMessageKind(std::string_view type) {
    if (type == "join") return MessageKind::Join;
    if (type == "room-status" || type == "room_status") return MessageKind::RoomStatus;
    if (type == "offer") return MessageKind::Offer;
    if (type == "answer") return MessageKind::Answer;
    if (type == "ice-candidate") return MessageKind::IceCandidate;
    if (type == "peer-disconnected" || type == "peer_disconnected") return MessageKind::PeerDisconnected;
    if (type == "call-ended" || type == "call_ended" || type == "end_call") return MessageKind::CallEnded;
    return std::nullopt;
}

std::string joinRoleToString(JoinRole role) {
    return role == JoinRole::First ? "first" : "second";
}

std::optional<JoinRole> stringToJoinRole(std::string_view role) {
    if (role == "first") return JoinRole::First;
    if (role == "second") return JoinRole::Second;
    return std::nullopt;
}

bool isValidRoomId(std::string_view room_id) {
    if (room_id.empty() || room_id.size() > 64) {
        return false;
    }
    for (char c : room_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string generateConnectionId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << "client-";

    for (int i = 0; i < 12; ++i) {
        oss << std::hex << dis(gen);
    }

    return oss.str();
}

} // namespace duet::signaling
