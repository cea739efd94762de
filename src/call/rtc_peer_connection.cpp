#include <duet/call/rtc_peer_connection.hpp>
#include <duet/core/logger.hpp>

#include <mutex>
#include <random>
#include <unordered_map>

#include <rtc/rtc.hpp>

namespace duet::call {

using core::Logger;

namespace {

constexpr int kOpusPayloadType = 111;
constexpr int kVp8PayloadType = 96;

TransportState toTransportState(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return TransportState::New;
        case rtc::PeerConnection::State::Connecting: return TransportState::Connecting;
        case rtc::PeerConnection::State::Connected: return TransportState::Connected;
        case rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
        case rtc::PeerConnection::State::Failed: return TransportState::Failed;
        case rtc::PeerConnection::State::Closed: return TransportState::Closed;
    }
    return TransportState::Failed;
}

CandidateType toCandidateType(rtc::Candidate::Type type) {
    switch (type) {
        case rtc::Candidate::Type::Host: return CandidateType::Host;
        case rtc::Candidate::Type::ServerReflexive: return CandidateType::ServerReflexive;
        case rtc::Candidate::Type::PeerReflexive: return CandidateType::PeerReflexive;
        case rtc::Candidate::Type::Relayed: return CandidateType::Relayed;
        default: return CandidateType::Unknown;
    }
}

uint32_t randomSsrc() {
    static thread_local std::mt19937 gen(std::random_device{}());
    return std::uniform_int_distribution<uint32_t>(1, 0xFFFFFFFE)(gen);
}

class RtcPeerConnection : public PeerConnection {
public:
    RtcPeerConnection(const PeerConnectionConfig& config, const MediaCapture& media) {
        rtc::Configuration rtc_config;
        for (const auto& server : config.ice_servers) {
            rtc::IceServer ice_server(server.urls);
            if (server.username) ice_server.username = *server.username;
            if (server.credential) ice_server.password = *server.credential;
            rtc_config.iceServers.push_back(ice_server);
        }
        rtc_config.disableAutoNegotiation = true;

        pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

        pc_->onLocalDescription([this](rtc::Description description) {
            populateMidToIndexMap(description);

            SessionDescription local;
            local.type = description.type() == rtc::Description::Type::Answer ? SdpType::Answer : SdpType::Offer;
            local.sdp = std::string(description);

            if (on_local_description_) {
                on_local_description_(local);
            }
        });

        pc_->onLocalCandidate([this](rtc::Candidate candidate) {
            IceCandidate local;
            local.candidate = candidate.candidate();
            local.sdp_mid = candidate.mid();
            local.sdp_mline_index = mlineIndex(local.sdp_mid);

            if (on_local_candidate_) {
                on_local_candidate_(local);
            }
        });

        pc_->onStateChange([this](rtc::PeerConnection::State state) {
            if (on_state_change_) {
                on_state_change_(toTransportState(state));
            }
        });

        const std::string stream_id = "duet-stream";
        if (auto audio = media.audioTrack()) {
            rtc::Description::Audio description("audio", rtc::Description::Direction::SendRecv);
            description.addOpusCodec(kOpusPayloadType);
            description.addSSRC(randomSsrc(), audio->id(), stream_id, audio->id());
            tracks_.push_back(pc_->addTrack(description));
        }
        if (auto video = media.videoTrack()) {
            rtc::Description::Video description("video", rtc::Description::Direction::SendRecv);
            description.addVP8Codec(kVp8PayloadType);
            description.addSSRC(randomSsrc(), video->id(), stream_id, video->id());
            tracks_.push_back(pc_->addTrack(description));
        }

        Logger::debug("Peer connection created with {} ICE servers and {} tracks",
            config.ice_servers.size(), tracks_.size());
    }

    ~RtcPeerConnection() override {
        close();
    }

    void createOffer() override {
        pc_->setLocalDescription(rtc::Description::Type::Offer);
    }

    void createAnswer() override {
        pc_->setLocalDescription(rtc::Description::Type::Answer);
    }

    void setRemoteDescription(const SessionDescription& description) override {
        pc_->setRemoteDescription(rtc::Description(description.sdp, description.typeString()));
    }

    void addRemoteCandidate(const IceCandidate& candidate) override {
        pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;

        pc_->resetCallbacks();
        tracks_.clear();
        pc_->close();
        Logger::debug("Peer connection closed");
    }

    std::optional<std::pair<CandidateType, CandidateType>> selectedCandidatePair() const override {
        rtc::Candidate local;
        rtc::Candidate remote;
        if (closed_ || !pc_->getSelectedCandidatePair(&local, &remote)) {
            return std::nullopt;
        }
        return std::make_pair(toCandidateType(local.type()), toCandidateType(remote.type()));
    }

private:
    void populateMidToIndexMap(const rtc::Description& description) {
        std::lock_guard<std::mutex> lock(mutex_);
        mid_to_index_.clear();
        for (int i = 0; i < description.mediaCount(); ++i) {
            std::visit([this, i](auto* media) {
                mid_to_index_[media->mid()] = i;
            }, description.media(i));
        }
    }

    int mlineIndex(const std::string& mid) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mid_to_index_.find(mid);
        return it == mid_to_index_.end() ? 0 : it->second;
    }

    std::shared_ptr<rtc::PeerConnection> pc_;
    std::vector<std::shared_ptr<rtc::Track>> tracks_;
    std::unordered_map<std::string, int> mid_to_index_;
    std::mutex mutex_;
    bool closed_ = false;
};

} // namespace

std::shared_ptr<PeerConnection> createRtcPeerConnection(const PeerConnectionConfig& config,
                                                        const MediaCapture& media) {
    return std::make_shared<RtcPeerConnection>(config, media);
}

} // namespace duet::call
