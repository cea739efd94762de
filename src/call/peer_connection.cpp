#include <duet/call/peer_connection.hpp>

#include <sstream>

namespace duet::call {

PeerConnectionConfig PeerConnectionConfig::defaults() {
    PeerConnectionConfig config;
    config.ice_servers = {
        {"stun:stun.l.google.com:19302", std::nullopt, std::nullopt},
        {"stun:stun1.l.google.com:19302", std::nullopt, std::nullopt},
        {"stun:stun2.l.google.com:19302", std::nullopt, std::nullopt},
        {"stun:stun3.l.google.com:19302", std::nullopt, std::nullopt},
        {"stun:stun4.l.google.com:19302", std::nullopt, std::nullopt},
    };
    return config;
}

std::string SessionDescription::typeString() const {
    return type == SdpType::Offer ? "offer" : "answer";
}

nlohmann::json SessionDescription::toJson() const {
    return {{"type", typeString()}, {"sdp", sdp}};
}

core::Result<SessionDescription> SessionDescription::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {core::ErrorCode::InvalidMessage, "Session description must be an object"};
    }

    auto type = json.find("type");
    auto sdp = json.find("sdp");
    if (type == json.end() || !type->is_string() || sdp == json.end() || !sdp->is_string()) {
        return {core::ErrorCode::InvalidMessage, "Session description needs type and sdp"};
    }

    SessionDescription description;
    const auto& type_name = type->get_ref<const std::string&>();
    if (type_name == "offer") {
        description.type = SdpType::Offer;
    }
    else if (type_name == "answer") {
        description.type = SdpType::Answer;
    }
    else {
        return {core::ErrorCode::NotSupported, "Unsupported session description type: " + type_name};
    }
    description.sdp = sdp->get<std::string>();
    return description;
}

nlohmann::json IceCandidate::toJson() const {
    return {
        {"candidate", candidate},
        {"sdpMid", sdp_mid},
        {"sdpMLineIndex", sdp_mline_index}
    };
}

core::Result<IceCandidate> IceCandidate::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {core::ErrorCode::InvalidMessage, "ICE candidate must be an object"};
    }

    auto candidate = json.find("candidate");
    if (candidate == json.end() || !candidate->is_string()) {
        return {core::ErrorCode::InvalidMessage, "ICE candidate without candidate line"};
    }

    IceCandidate result;
    result.candidate = candidate->get<std::string>();

    if (auto mid = json.find("sdpMid"); mid != json.end() && mid->is_string()) {
        result.sdp_mid = mid->get<std::string>();
    }
    if (auto index = json.find("sdpMLineIndex"); index != json.end() && index->is_number_integer()) {
        result.sdp_mline_index = index->get<int>();
    }
    return result;
}

bool operator==(const IceCandidate& a, const IceCandidate& b) {
    return a.candidate == b.candidate &&
           a.sdp_mid == b.sdp_mid &&
           a.sdp_mline_index == b.sdp_mline_index;
}

std::string transportStateToString(TransportState state) {
    switch (state) {
        case TransportState::New: return "new";
        case TransportState::Connecting: return "connecting";
        case TransportState::Connected: return "connected";
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Failed: return "failed";
        case TransportState::Closed: return "closed";
    }
    return "unknown";
}

CandidateType parseCandidateType(const std::string& candidate) {
    std::istringstream iss(candidate);
    std::string token;

    while (iss >> token) {
        if (token == "typ") {
            std::string type;
            iss >> type;
            if (type == "host") return CandidateType::Host;
            if (type == "srflx") return CandidateType::ServerReflexive;
            if (type == "prflx") return CandidateType::PeerReflexive;
            if (type == "relay") return CandidateType::Relayed;
            break;
        }
    }
    return CandidateType::Unknown;
}

std::string candidateTypeToString(CandidateType type) {
    switch (type) {
        case CandidateType::Host: return "host";
        case CandidateType::ServerReflexive: return "srflx";
        case CandidateType::PeerReflexive: return "prflx";
        case CandidateType::Relayed: return "relay";
        case CandidateType::Unknown: return "unknown";
    }
    return "unknown";
}

ConnectionPath classifyConnectionPath(CandidateType local, CandidateType remote) {
    if (local == CandidateType::Relayed || remote == CandidateType::Relayed) {
        return ConnectionPath::TurnRelay;
    }
    if (local == CandidateType::ServerReflexive || remote == CandidateType::ServerReflexive) {
        return ConnectionPath::Stun;
    }
    if (local == CandidateType::Host && remote == CandidateType::Host) {
        return ConnectionPath::DirectP2P;
    }
    return ConnectionPath::Unknown;
}

std::string connectionPathToString(ConnectionPath path) {
    switch (path) {
        case ConnectionPath::DirectP2P: return "Direct P2P";
        case ConnectionPath::Stun: return "STUN (NAT)";
        case ConnectionPath::TurnRelay: return "TURN Relay";
        case ConnectionPath::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace duet::call
