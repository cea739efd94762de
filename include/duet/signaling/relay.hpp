#pragma once

#include <string>
#include <string_view>
#include <atomic>

#include <duet/core/error.hpp>
#include <duet/signaling/message.hpp>
#include <duet/signaling/room_registry.hpp>

namespace duet::signaling {

// Forwards signaling messages between the two members of a room.
// Offer, answer and candidate payloads are never inspected.
class SignalingRelay {
public:
    struct Stats {
        uint64_t messages_relayed = 0;
        uint64_t invalid_messages = 0;
        uint64_t calls_ended = 0;
    };

    explicit SignalingRelay(RoomRegistry& registry);

    // Non-copyable
    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    // Join the room, acknowledge the role, broadcast room-status.
    // Room-full and invalid-room rejections close the connection.
    core::Result<JoinRole> admit(const std::string& room_id, const ParticipantPtr& participant);

    // Entry point for a newly opened connection. Arguments are taken by
    // value: a rejection may close the socket synchronously and release the
    // caller's references before this returns.
    core::Result<JoinRole> open(std::string room_id, ParticipantPtr participant);

    void relay(const std::string& room_id, const ParticipantPtr& sender, const SignalMessage& message);

    void broadcastRoomStatus(const std::string& room_id);

    // Notify the other member with call-ended and destroy the room
    void endCall(const std::string& room_id, const ParticipantPtr& sender);

    // A dropped connection leaves its room
    void disconnect(const ParticipantPtr& participant);

    // Decode one client text frame and dispatch it
    void handleText(const ParticipantPtr& participant, std::string_view text);

    RoomRegistry& registry() { return registry_; }

    Stats getStats() const;

private:
    void forward(const std::string& room_id, const ParticipantPtr& sender,
                 MessageKind kind, const std::string& text);
    void sendError(const ParticipantPtr& participant, std::string_view error);

    RoomRegistry& registry_;

    std::atomic<uint64_t> messages_relayed_{0};
    std::atomic<uint64_t> invalid_messages_{0};
    std::atomic<uint64_t> calls_ended_{0};
};

} // namespace duet::signaling
