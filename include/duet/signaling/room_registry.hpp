#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <functional>
#include <optional>

#include <duet/core/error.hpp>
#include <duet/signaling/message.hpp>

namespace duet::signaling {

// One live WebSocket connection as seen by the registry.
// send() and close() must not block; they are invoked under the registry lock.
class ParticipantConnection {
public:
    virtual ~ParticipantConnection() = default;

    virtual const std::string& id() const = 0;
    virtual void send(const std::string& text) = 0;
    virtual void close(int code, std::string_view reason) = 0;
};

using ParticipantPtr = std::shared_ptr<ParticipantConnection>;

enum class RoomState {
    Empty,
    WaitingForPeer,
    Full
};

std::string roomStateToString(RoomState state);

// Rooms hold at most two participants. Rooms are created on first join and
// destroyed when the last participant leaves or the room is closed; a
// destroyed room reports RoomState::Empty.
class RoomRegistry {
public:
    static constexpr std::size_t kMaxParticipants = 2;

    using AdmitCallback = std::function<void(JoinRole)>;

    struct Stats {
        std::size_t active_rooms = 0;
        std::size_t active_participants = 0;
        uint64_t rooms_created = 0;
        uint64_t rooms_destroyed = 0;
        uint64_t joins = 0;
        uint64_t rejected_full = 0;
        uint64_t rejected_invalid = 0;
        uint64_t messages_delivered = 0;
    };

    RoomRegistry() = default;

    // Non-copyable
    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Admit a participant. on_admitted runs under the lock after the
    // participant is recorded and before room-status is broadcast.
    core::Result<JoinRole> join(const std::string& room_id,
                                const ParticipantPtr& participant,
                                const AdmitCallback& on_admitted = {});

    // Remove a participant. Remaining members receive peer-disconnected
    // followed by the new room-status. Returns false if not a member.
    bool leave(const std::string& room_id, const ParticipantPtr& participant);

    // Destroy the room and return the members it held. Connections are not closed.
    std::vector<ParticipantPtr> close(const std::string& room_id);

    // Deliver text to the other members and destroy the room in one step.
    // Returns false, without side effects, if sender is not a member.
    bool endCall(const std::string& room_id, const ParticipantPtr& sender, const std::string& text);

    // Deliver to every member except sender. Returns number of deliveries.
    std::size_t sendToOthers(const std::string& room_id,
                             const ParticipantPtr& sender,
                             const std::string& text);

    std::size_t broadcast(const std::string& room_id, const std::string& text);

    // Room the participant is currently in
    std::optional<std::string> roomOf(const ParticipantPtr& participant) const;

    std::vector<std::string> members(const std::string& room_id) const;
    std::size_t memberCount(const std::string& room_id) const;
    RoomState state(const std::string& room_id) const;
    bool contains(const std::string& room_id) const;
    std::size_t roomCount() const;
    std::vector<std::string> activeRooms() const;

    Stats getStats() const;

private:
    struct Room {
        std::string id;
        std::vector<ParticipantPtr> members;
    };

    std::size_t broadcastLocked(const Room& room, const std::string& text);
    std::string roomStatusLocked(const Room& room) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Room> rooms_;
    std::unordered_map<std::string, std::string> participant_to_room_;
    Stats stats_;
};

} // namespace duet::signaling
