#include "duet/signaling/room_registry.hpp"
#include "duet/core/logger.hpp"

#include <algorithm>

namespace duet::signaling {

using core::Logger;

std::string roomStateToString(RoomState state) {
    switch (state) {
        case RoomState::Empty: return "empty";
        case RoomState::WaitingForPeer: return "waiting-for-peer";
        case RoomState::Full: return "full";
    }
    return "unknown";
}

core::Result<JoinRole> RoomRegistry::join(const std::string& room_id,
                                          const ParticipantPtr& participant,
                                          const AdmitCallback& on_admitted) {
    if (!participant) {
        return {core::ErrorCode::InvalidArgument, "Null participant"};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!isValidRoomId(room_id)) {
        stats_.rejected_invalid++;
        return {core::ErrorCode::InvalidRoom, "Invalid room id: " + room_id};
    }

    if (participant_to_room_.count(participant->id())) {
        return {core::ErrorCode::InvalidState,
                "Participant " + participant->id() + " already joined a room"};
    }

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        Room room;
        room.id = room_id;
        it = rooms_.emplace(room_id, std::move(room)).first;
        stats_.rooms_created++;
        Logger::info("Room {} created", room_id);
    }

    Room& room = it->second;
    if (room.members.size() >= kMaxParticipants) {
        stats_.rejected_full++;
        Logger::info("Room {} is full, rejecting {}", room_id, participant->id());
        return {core::ErrorCode::RoomFull, "Room is full"};
    }

    room.members.push_back(participant);
    participant_to_room_[participant->id()] = room_id;
    stats_.joins++;

    JoinRole role = room.members.size() == 1 ? JoinRole::First : JoinRole::Second;
    Logger::info("{} joined room {} as {} ({} members)",
        participant->id(), room_id, joinRoleToString(role), room.members.size());

    if (on_admitted) {
        on_admitted(role);
    }

    broadcastLocked(room, roomStatusLocked(room));
    return role;
}

bool RoomRegistry::leave(const std::string& room_id, const ParticipantPtr& participant) {
    if (!participant) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }

    Room& room = it->second;
    auto member = std::find(room.members.begin(), room.members.end(), participant);
    if (member == room.members.end()) {
        return false;
    }

    room.members.erase(member);
    participant_to_room_.erase(participant->id());
    Logger::info("{} left room {}", participant->id(), room_id);

    if (room.members.empty()) {
        rooms_.erase(it);
        stats_.rooms_destroyed++;
        Logger::info("Room {} destroyed", room_id);
        return true;
    }

    broadcastLocked(room, toJson(PeerDisconnectedMessage{}));
    broadcastLocked(room, roomStatusLocked(room));
    return true;
}

std::vector<ParticipantPtr> RoomRegistry::close(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return {};
    }

    std::vector<ParticipantPtr> members = std::move(it->second.members);
    for (const auto& member : members) {
        participant_to_room_.erase(member->id());
    }
    rooms_.erase(it);
    stats_.rooms_destroyed++;

    Logger::info("Room {} closed ({} members released)", room_id, members.size());
    return members;
}

bool RoomRegistry::endCall(const std::string& room_id,
                           const ParticipantPtr& sender,
                           const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }

    auto& members = it->second.members;
    if (std::find(members.begin(), members.end(), sender) == members.end()) {
        return false;
    }

    for (const auto& member : members) {
        if (member != sender) {
            member->send(text);
            stats_.messages_delivered++;
        }
        participant_to_room_.erase(member->id());
    }
    rooms_.erase(it);
    stats_.rooms_destroyed++;

    Logger::info("Room {} ended by {}", room_id, sender->id());
    return true;
}

std::size_t RoomRegistry::sendToOthers(const std::string& room_id,
                                       const ParticipantPtr& sender,
                                       const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return 0;
    }

    std::size_t delivered = 0;
    for (const auto& member : it->second.members) {
        if (member != sender) {
            member->send(text);
            delivered++;
        }
    }
    stats_.messages_delivered += delivered;
    return delivered;
}

std::size_t RoomRegistry::broadcast(const std::string& room_id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return 0;
    }
    return broadcastLocked(it->second, text);
}

std::optional<std::string> RoomRegistry::roomOf(const ParticipantPtr& participant) const {
    if (!participant) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = participant_to_room_.find(participant->id());
    if (it == participant_to_room_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RoomRegistry::members(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    auto it = rooms_.find(room_id);
    if (it != rooms_.end()) {
        for (const auto& member : it->second.members) {
            ids.push_back(member->id());
        }
    }
    return ids;
}

std::size_t RoomRegistry::memberCount(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? 0 : it->second.members.size();
}

RoomState RoomRegistry::state(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return RoomState::Empty;
    }
    return it->second.members.size() >= kMaxParticipants ? RoomState::Full
                                                         : RoomState::WaitingForPeer;
}

bool RoomRegistry::contains(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.count(room_id) > 0;
}

std::size_t RoomRegistry::roomCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

std::vector<std::string> RoomRegistry::activeRooms() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        ids.push_back(id);
    }
    return ids;
}

RoomRegistry::Stats RoomRegistry::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats = stats_;
    stats.active_rooms = rooms_.size();
    stats.active_participants = participant_to_room_.size();
    return stats;
}

std::size_t RoomRegistry::broadcastLocked(const Room& room, const std::string& text) {
    for (const auto& member : room.members) {
        member->send(text);
    }
    stats_.messages_delivered += room.members.size();
    return room.members.size();
}

std::string RoomRegistry::roomStatusLocked(const Room& room) const {
    return toJson(RoomStatusMessage{static_cast<int>(room.members.size())});
}

} // namespace duet::signaling
