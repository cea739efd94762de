#include <gtest/gtest.h>
#include <duet/call/call_controller.hpp>
#include <duet/call/room_link.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace duet::call::test {

using signaling::JoinRole;
using signaling::MessageKind;

namespace {

class FakeMediaDevices : public MediaDevices {
public:
    core::Result<std::unique_ptr<MediaCapture>> acquire(const MediaConstraints& constraints) override {
        acquisitions++;
        if (failure) {
            return {*failure, "fake device failure"};
        }
        audio = constraints.audio ? std::make_shared<MediaTrack>("audio-1", MediaKind::Audio, "mic") : nullptr;
        video = constraints.video ? std::make_shared<MediaTrack>("video-1", MediaKind::Video, "cam") : nullptr;
        return std::make_unique<MediaCapture>(audio, video);
    }

    std::optional<core::ErrorCode> failure;
    int acquisitions = 0;
    std::shared_ptr<MediaTrack> audio;
    std::shared_ptr<MediaTrack> video;
};

class FakeRelay : public RelayChannel {
public:
    core::Result<void> connect(const std::string& room_id) override {
        room = room_id;
        if (refuse) {
            return {core::ErrorCode::ConnectionFailed, "relay unreachable"};
        }
        open = true;
        return {};
    }

    bool send(const signaling::SignalMessage& message) override {
        if (!open) {
            return false;
        }
        sent.push_back(message);
        return true;
    }

    void close() override {
        open = false;
        closes++;
    }

    bool isOpen() const override { return open; }

    // Relay to client
    void deliver(const signaling::SignalMessage& message) {
        if (on_message_) on_message_(message);
    }

    void drop(int code, const std::string& reason) {
        open = false;
        if (on_close_) on_close_(code, reason);
    }

    std::vector<MessageKind> sentKinds() const {
        std::vector<MessageKind> kinds;
        for (const auto& message : sent) {
            kinds.push_back(signaling::kindOf(message));
        }
        return kinds;
    }

    std::optional<std::string> room;
    bool refuse = false;
    bool open = false;
    int closes = 0;
    std::vector<signaling::SignalMessage> sent;
};

// Answers synchronously like a transport on the same thread; the controller
// still receives the callbacks through the event loop.
class FakePeer : public PeerConnection {
public:
    void createOffer() override {
        log.push_back("createOffer");
        if (on_local_description_) on_local_description_({SdpType::Offer, "v=0\r\ns=fake-offer\r\n"});
    }

    void createAnswer() override {
        log.push_back("createAnswer");
        if (on_local_description_) on_local_description_({SdpType::Answer, "v=0\r\ns=fake-answer\r\n"});
    }

    void setRemoteDescription(const SessionDescription& description) override {
        log.push_back("setRemoteDescription:" + description.typeString());
        if (throw_on_remote) {
            throw std::runtime_error("malformed remote description");
        }
    }

    void addRemoteCandidate(const IceCandidate& candidate) override {
        log.push_back("addRemoteCandidate:" + candidate.candidate);
    }

    void close() override {
        log.push_back("close");
        closed = true;
    }

    std::optional<std::pair<CandidateType, CandidateType>> selectedCandidatePair() const override {
        return pair;
    }

    void emitCandidate(const std::string& line) {
        if (on_local_candidate_) on_local_candidate_({line, "0", 0});
    }

    void emitState(TransportState state) {
        if (on_state_change_) on_state_change_(state);
    }

    std::vector<std::string> log;
    bool closed = false;
    bool throw_on_remote = false;
    std::optional<std::pair<CandidateType, CandidateType>> pair;
};

nlohmann::json remoteOffer() {
    return {{"type", "offer"}, {"sdp", "v=0\r\ns=remote-offer\r\n"}};
}

nlohmann::json remoteAnswer() {
    return {{"type", "answer"}, {"sdp", "v=0\r\ns=remote-answer\r\n"}};
}

nlohmann::json remoteCandidate(const std::string& name) {
    return {{"candidate", name}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}};
}

} // namespace

class CallControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        devices_ = std::make_shared<FakeMediaDevices>();
        relay_ = std::make_shared<FakeRelay>();

        CallOptions options;
        options.link_base = "http://localhost:8080/video_call/";
        options.path_check_delay = std::chrono::milliseconds(1);
        options.path_check_interval = std::chrono::milliseconds(5);

        controller_ = CallController::create(loop_, options, devices_, relay_,
            [this](const PeerConnectionConfig& config, const MediaCapture& media) {
                EXPECT_EQ(config.ice_servers.size(), 5u);
                EXPECT_NE(media.audioTrack(), nullptr);
                if (factory_throws_) {
                    throw std::runtime_error("no transport");
                }
                peer_ = std::make_shared<FakePeer>();
                return peer_;
            });

        controller_->setNoticeCallback([this](const Notice& notice) { notices_.push_back(notice); });
        controller_->setStateCallback([this](NegotiationState state) { states_.push_back(state); });
    }

    void TearDown() override {
        controller_.reset();
    }

    // Drain callbacks marshalled onto the loop
    void pump() {
        loop_.processAll();
    }

    // Run the loop, timers included, for a while
    void runFor(std::chrono::milliseconds duration) {
        loop_.runAfter(duration, [this]() { loop_.stop(); });
        loop_.run();
    }

    // Host until the offer went out
    void hostUntilOffer() {
        ASSERT_TRUE(controller_->host().is_ok());
        relay_->deliver(signaling::JoinMessage{*relay_->room, JoinRole::First});
        relay_->deliver(signaling::RoomStatusMessage{1});
        relay_->deliver(signaling::RoomStatusMessage{2});
        pump();
    }

    void hostUntilConnected() {
        hostUntilOffer();
        relay_->deliver(signaling::AnswerMessage{remoteAnswer()});
        pump();
        ASSERT_EQ(controller_->state(), NegotiationState::Connected);
    }

    bool noticed(const std::string& text) const {
        for (const auto& notice : notices_) {
            if (notice.text == text) return true;
        }
        return false;
    }

    core::EventLoop loop_;
    std::shared_ptr<FakeMediaDevices> devices_;
    std::shared_ptr<FakeRelay> relay_;
    std::shared_ptr<FakePeer> peer_;
    std::shared_ptr<CallController> controller_;
    bool factory_throws_ = false;
    std::vector<Notice> notices_;
    std::vector<NegotiationState> states_;
};

TEST_F(CallControllerTest, HostCreatesRoomAndShareLink) {
    auto link = controller_->host();
    ASSERT_TRUE(link.is_ok());

    ASSERT_TRUE(relay_->room.has_value());
    EXPECT_EQ(relay_->room->rfind("room-", 0), 0u);
    EXPECT_EQ(link.value(), "http://localhost:8080/video_call/?room=" + *relay_->room);
    EXPECT_EQ(controller_->shareLink(), link.value());
    EXPECT_EQ(controller_->state(), NegotiationState::Joining);
    EXPECT_EQ(devices_->acquisitions, 1);
}

TEST_F(CallControllerTest, HostSendsOfferWhenPeerJoins) {
    hostUntilOffer();

    EXPECT_EQ(controller_->state(), NegotiationState::HaveLocalOffer);
    EXPECT_EQ(controller_->session().role, Role::Initiator);
    ASSERT_NE(peer_, nullptr);
    EXPECT_EQ(peer_->log, (std::vector<std::string>{"createOffer"}));
    EXPECT_EQ(relay_->sentKinds(), (std::vector<MessageKind>{MessageKind::Offer}));

    const auto& offer = std::get<signaling::OfferMessage>(relay_->sent[0]);
    EXPECT_EQ(offer.description["sdp"], "v=0\r\ns=fake-offer\r\n");
    EXPECT_TRUE(noticed("Waiting for peer to join..."));
    EXPECT_TRUE(noticed("Peer joined, starting call..."));
}

TEST_F(CallControllerTest, HostAppliesAnswer) {
    hostUntilConnected();

    EXPECT_EQ(peer_->log.back(), "setRemoteDescription:answer");
    EXPECT_TRUE(noticed("Call connected!"));
    EXPECT_EQ(states_.back(), NegotiationState::Connected);
}

TEST_F(CallControllerTest, JoinerAnswersOffer) {
    auto joined = controller_->join("http://localhost:8080/video_call/?room=r1");
    ASSERT_TRUE(joined.is_ok());
    EXPECT_EQ(relay_->room, "r1");
    EXPECT_EQ(controller_->shareLink(), "http://localhost:8080/video_call/?room=r1");

    relay_->deliver(signaling::JoinMessage{"r1", JoinRole::Second});
    relay_->deliver(signaling::RoomStatusMessage{2});
    relay_->deliver(signaling::OfferMessage{remoteOffer()});
    pump();

    EXPECT_EQ(controller_->state(), NegotiationState::Connected);
    EXPECT_EQ(controller_->session().role, Role::Responder);
    EXPECT_EQ(peer_->log, (std::vector<std::string>{"setRemoteDescription:offer", "createAnswer"}));
    EXPECT_EQ(relay_->sentKinds(), (std::vector<MessageKind>{MessageKind::Answer}));
}

TEST_F(CallControllerTest, JoinerBuffersEarlyCandidates) {
    ASSERT_TRUE(controller_->join("r1").is_ok());
    relay_->deliver(signaling::JoinMessage{"r1", JoinRole::Second});
    relay_->deliver(signaling::IceCandidateMessage{remoteCandidate("c1")});
    relay_->deliver(signaling::IceCandidateMessage{remoteCandidate("c2")});
    EXPECT_TRUE(peer_->log.empty());

    relay_->deliver(signaling::OfferMessage{remoteOffer()});
    pump();

    ASSERT_GE(peer_->log.size(), 3u);
    EXPECT_EQ(peer_->log[0], "setRemoteDescription:offer");
    EXPECT_EQ(peer_->log[1], "addRemoteCandidate:c1");
    EXPECT_EQ(peer_->log[2], "addRemoteCandidate:c2");
}

TEST_F(CallControllerTest, LocalCandidatesRelayedAfterDescription) {
    hostUntilOffer();

    peer_->emitCandidate("candidate:1 1 udp 2122260223 10.0.0.2 5000 typ host");
    pump();

    EXPECT_EQ(relay_->sentKinds(), (std::vector<MessageKind>{MessageKind::Offer, MessageKind::IceCandidate}));
}

TEST_F(CallControllerTest, JoinWithInvalidLink) {
    auto joined = controller_->join("http://localhost:8080/video_call/?room=bad%20room");
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code(), core::ErrorCode::InvalidRoom);
    EXPECT_EQ(devices_->acquisitions, 0);
    EXPECT_FALSE(relay_->room.has_value());
    EXPECT_EQ(controller_->state(), NegotiationState::Idle);
}

TEST_F(CallControllerTest, PermissionDeniedBeforeJoin) {
    devices_->failure = core::ErrorCode::PermissionDenied;

    auto joined = controller_->join("r1");
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code(), core::ErrorCode::PermissionDenied);

    // Nothing reached the relay
    EXPECT_FALSE(relay_->room.has_value());
    EXPECT_EQ(peer_, nullptr);
    EXPECT_EQ(controller_->state(), NegotiationState::Idle);
}

TEST_F(CallControllerTest, PeerConnectionCreationFailure) {
    factory_throws_ = true;

    auto link = controller_->host();
    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().code(), core::ErrorCode::TransportFailed);
    EXPECT_EQ(devices_->audio->state(), TrackState::Ended);
    EXPECT_FALSE(relay_->room.has_value());
}

TEST_F(CallControllerTest, RelayUnreachable) {
    relay_->refuse = true;

    auto link = controller_->host();
    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().code(), core::ErrorCode::ConnectionFailed);
    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_TRUE(noticed("Connection closed."));
    EXPECT_TRUE(peer_->closed);
    EXPECT_EQ(devices_->video->state(), TrackState::Ended);
}

TEST_F(CallControllerTest, StartTwiceRejected) {
    ASSERT_TRUE(controller_->join("r1").is_ok());

    auto again = controller_->join("r2");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code(), core::ErrorCode::InvalidState);
    EXPECT_EQ(relay_->room, "r1");
}

TEST_F(CallControllerTest, RoomFullEndsAttempt) {
    ASSERT_TRUE(controller_->join("r1").is_ok());

    relay_->drop(signaling::kCloseRoomFull, "room full");

    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    ASSERT_FALSE(notices_.empty());
    EXPECT_EQ(notices_.back().kind, NoticeKind::Capacity);
    EXPECT_EQ(notices_.back().text, "Room is full. Please try again later.");
    EXPECT_EQ(devices_->audio->state(), TrackState::Ended);
    EXPECT_TRUE(peer_->closed);
    EXPECT_TRUE(relay_->sent.empty());
}

TEST_F(CallControllerTest, EndInConnectedCall) {
    hostUntilConnected();
    auto sent_before = relay_->sent.size();

    controller_->end();

    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    ASSERT_EQ(relay_->sent.size(), sent_before + 1);
    EXPECT_EQ(signaling::kindOf(relay_->sent.back()), MessageKind::CallEnded);
    EXPECT_EQ(devices_->audio->state(), TrackState::Ended);
    EXPECT_EQ(devices_->video->state(), TrackState::Ended);
    EXPECT_TRUE(peer_->closed);
    EXPECT_EQ(relay_->closes, 1);

    // Second end is a no-op
    controller_->end();
    EXPECT_EQ(relay_->sent.size(), sent_before + 1);
    EXPECT_EQ(relay_->closes, 1);
    EXPECT_EQ(std::count(peer_->log.begin(), peer_->log.end(), "close"), 1);
}

TEST_F(CallControllerTest, EndBeforeStart) {
    controller_->end();
    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_TRUE(relay_->sent.empty());
}

TEST_F(CallControllerTest, PeerLeaves) {
    hostUntilConnected();

    relay_->deliver(signaling::PeerDisconnectedMessage{});

    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_TRUE(noticed("Other person has left the call"));
    EXPECT_TRUE(peer_->closed);
}

TEST_F(CallControllerTest, PeerEndsCall) {
    hostUntilConnected();

    relay_->deliver(signaling::CallEndedMessage{});

    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_TRUE(noticed("Call has been ended"));
    // The peer's call-ended is not echoed back
    EXPECT_NE(signaling::kindOf(relay_->sent.back()), MessageKind::CallEnded);
}

TEST_F(CallControllerTest, TransportFailureEndsCall) {
    hostUntilConnected();

    peer_->emitState(TransportState::Disconnected);
    pump();
    EXPECT_EQ(controller_->state(), NegotiationState::Connected);
    EXPECT_TRUE(noticed("Peer disconnected"));

    peer_->emitState(TransportState::Failed);
    pump();
    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_EQ(notices_.back().kind, NoticeKind::Transport);
    EXPECT_EQ(notices_.back().text, "Connection failed. Please try again.");
}

TEST_F(CallControllerTest, TransportExceptionEndsCall) {
    hostUntilOffer();
    peer_->throw_on_remote = true;

    relay_->deliver(signaling::AnswerMessage{remoteAnswer()});

    EXPECT_EQ(controller_->state(), NegotiationState::Ended);
    EXPECT_EQ(notices_.back().text, "Connection failed. Please try again.");
}

TEST_F(CallControllerTest, MalformedOfferDiscarded) {
    ASSERT_TRUE(controller_->join("r1").is_ok());
    relay_->deliver(signaling::JoinMessage{"r1", JoinRole::Second});

    relay_->deliver(signaling::OfferMessage{{{"type", "offer"}}});

    EXPECT_EQ(controller_->state(), NegotiationState::WaitingForPeer);
    EXPECT_TRUE(peer_->log.empty());
}

TEST_F(CallControllerTest, JoinWithoutRoleIgnored) {
    ASSERT_TRUE(controller_->join("r1").is_ok());

    relay_->deliver(signaling::JoinMessage{"r1", std::nullopt});

    EXPECT_EQ(controller_->state(), NegotiationState::Joining);
}

TEST_F(CallControllerTest, MuteAndDisableVideo) {
    EXPECT_FALSE(controller_->muteAudio().has_value());

    hostUntilConnected();

    EXPECT_EQ(controller_->muteAudio(), true);
    EXPECT_FALSE(devices_->audio->enabled());
    EXPECT_EQ(controller_->muteAudio(), false);
    EXPECT_TRUE(devices_->audio->enabled());

    EXPECT_EQ(controller_->disableVideo(), true);
    EXPECT_FALSE(devices_->video->enabled());

    // No renegotiation
    EXPECT_EQ(std::count(peer_->log.begin(), peer_->log.end(), "createOffer"), 1);
}

TEST_F(CallControllerTest, ConnectionPath) {
    EXPECT_EQ(controller_->connectionPath(), ConnectionPath::Unknown);

    hostUntilConnected();
    EXPECT_EQ(controller_->connectionPath(), ConnectionPath::Unknown);

    peer_->pair = std::make_pair(CandidateType::ServerReflexive, CandidateType::Host);
    EXPECT_EQ(controller_->connectionPath(), ConnectionPath::Stun);

    peer_->pair = std::make_pair(CandidateType::Host, CandidateType::Relayed);
    EXPECT_EQ(controller_->connectionPath(), ConnectionPath::TurnRelay);
}

TEST_F(CallControllerTest, ConnectionPathReportedUntilCallEnds) {
    std::vector<ConnectionPath> reports;
    controller_->setConnectionPathCallback([&](ConnectionPath path) { reports.push_back(path); });

    hostUntilConnected();
    peer_->pair = std::make_pair(CandidateType::Host, CandidateType::Host);
    peer_->emitState(TransportState::Connected);
    pump();

    runFor(std::chrono::milliseconds(60));
    ASSERT_GE(reports.size(), 2u);
    EXPECT_EQ(reports.front(), ConnectionPath::DirectP2P);

    // A later fallback to a relayed pair is picked up
    peer_->pair = std::make_pair(CandidateType::Host, CandidateType::Relayed);
    runFor(std::chrono::milliseconds(30));
    EXPECT_EQ(reports.back(), ConnectionPath::TurnRelay);

    // A repeated connected state does not start a second series
    peer_->emitState(TransportState::Connected);
    pump();

    controller_->end();
    auto count = reports.size();
    runFor(std::chrono::milliseconds(30));
    EXPECT_EQ(reports.size(), count);
}

TEST_F(CallControllerTest, CallbacksAfterDestructionAreHarmless) {
    hostUntilOffer();
    auto peer = peer_;

    controller_.reset();

    EXPECT_TRUE(peer->closed);
    EXPECT_EQ(signaling::kindOf(relay_->sent.back()), MessageKind::CallEnded);

    peer->emitState(TransportState::Failed);
    EXPECT_NO_THROW(pump());
}

} // namespace duet::call::test
