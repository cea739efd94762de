#pragma once

#include <string>
#include <string_view>

#include <duet/core/error.hpp>

namespace duet::call {

// Opaque room id for the host flow: "room-" followed by 9 base-36 characters
std::string generateRoomId();

// <link_base>?room=<id>
std::string makeShareLink(std::string_view link_base, std::string_view room_id);

// Extract and validate the room query parameter. A bare room id is accepted too.
core::Result<std::string> roomFromLink(std::string_view link);

} // namespace duet::call
