#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <utility>

#include <nlohmann/json.hpp>

#include <duet/core/error.hpp>

namespace duet::call {

class MediaCapture;

// ICE server configuration
struct IceServer {
    std::string urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;
};

// Peer connection configuration
struct PeerConnectionConfig {
    std::vector<IceServer> ice_servers;

    // The five public Google STUN servers
    static PeerConnectionConfig defaults();
};

// SDP session description types
enum class SdpType {
    Offer,
    Answer
};

// Session description
struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;

    std::string typeString() const;
    nlohmann::json toJson() const;

    static core::Result<SessionDescription> fromJson(const nlohmann::json& json);
};

// ICE candidate
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;

    nlohmann::json toJson() const;

    static core::Result<IceCandidate> fromJson(const nlohmann::json& json);
};

bool operator==(const IceCandidate& a, const IceCandidate& b);

// Connection states
enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

std::string transportStateToString(TransportState state);

enum class CandidateType {
    Host,
    ServerReflexive,
    PeerReflexive,
    Relayed,
    Unknown
};

// Reads the "typ" attribute of a candidate line
CandidateType parseCandidateType(const std::string& candidate);
std::string candidateTypeToString(CandidateType type);

// How media flows between the two participants
enum class ConnectionPath {
    DirectP2P,
    Stun,
    TurnRelay,
    Unknown
};

ConnectionPath classifyConnectionPath(CandidateType local, CandidateType remote);
std::string connectionPathToString(ConnectionPath path);

// Underlying real-time transport. createOffer/createAnswer generate the
// description and install it as local description, then report it through
// on_local_description. Callbacks may fire on a transport thread.
class PeerConnection {
public:
    using DescriptionCallback = std::function<void(const SessionDescription&)>;
    using CandidateCallback = std::function<void(const IceCandidate&)>;
    using StateCallback = std::function<void(TransportState)>;

    virtual ~PeerConnection() = default;

    virtual void createOffer() = 0;
    virtual void createAnswer() = 0;
    virtual void setRemoteDescription(const SessionDescription& description) = 0;
    virtual void addRemoteCandidate(const IceCandidate& candidate) = 0;
    virtual void close() = 0;

    // Candidate types of the nominated pair, once connected
    virtual std::optional<std::pair<CandidateType, CandidateType>> selectedCandidatePair() const = 0;

    void setDescriptionCallback(DescriptionCallback callback) { on_local_description_ = std::move(callback); }
    void setCandidateCallback(CandidateCallback callback) { on_local_candidate_ = std::move(callback); }
    void setStateCallback(StateCallback callback) { on_state_change_ = std::move(callback); }

protected:
    DescriptionCallback on_local_description_;
    CandidateCallback on_local_candidate_;
    StateCallback on_state_change_;
};

using PeerConnectionFactory =
    std::function<std::shared_ptr<PeerConnection>(const PeerConnectionConfig&, const MediaCapture&)>;

} // namespace duet::call
