#include <duet/core/error.hpp>
#include <unordered_map>

namespace duet::core {

namespace {
    // Map untuk error messages
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},

        // Room / relay errors
        {ErrorCode::RoomFull, "Room is full"},
        {ErrorCode::InvalidRoom, "Invalid room identifier"},
        {ErrorCode::NotInRoom, "Participant is not in the room"},

        // Signaling errors
        {ErrorCode::ProtocolViolation, "Protocol violation"},
        {ErrorCode::InvalidMessage, "Invalid signaling message"},

        // Network errors
        {ErrorCode::NetworkError, "Network error"},
        {ErrorCode::ConnectionFailed, "Connection failed"},
        {ErrorCode::ConnectionClosed, "Connection closed"},
        {ErrorCode::InvalidAddress, "Invalid address"},

        // Media errors
        {ErrorCode::PermissionDenied, "Media access denied"},
        {ErrorCode::DeviceNotFound, "Media device not found"},
        {ErrorCode::DeviceBusy, "Media device busy"},

        // Transport errors
        {ErrorCode::TransportFailed, "Transport failed"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    // Map untuk error conditions
    const std::unordered_map<ErrorCode, std::errc> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::NetworkError, std::errc::network_unreachable},
        {ErrorCode::ConnectionFailed, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::PermissionDenied, std::errc::permission_denied},
        {ErrorCode::DeviceNotFound, std::errc::no_such_device},
        {ErrorCode::DeviceBusy, std::errc::device_or_resource_busy},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? std::make_error_condition(it->second)
                                        : std::error_condition(ev, *this);
}

} // namespace duet::core
