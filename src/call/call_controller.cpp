#include <duet/call/call_controller.hpp>
#include <duet/call/room_link.hpp>
#include <duet/core/logger.hpp>

namespace duet::call {

using core::Logger;

namespace {

// Abnormal closure reported when the relay cannot be reached at all
constexpr int kCloseAbnormal = 1006;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::shared_ptr<CallController> CallController::create(core::EventLoop& loop,
                                                       CallOptions options,
                                                       std::shared_ptr<MediaDevices> devices,
                                                       std::shared_ptr<RelayChannel> relay,
                                                       PeerConnectionFactory factory) {
    return std::shared_ptr<CallController>(
        new CallController(loop, std::move(options), std::move(devices), std::move(relay), std::move(factory)));
}

CallController::CallController(core::EventLoop& loop,
                               CallOptions options,
                               std::shared_ptr<MediaDevices> devices,
                               std::shared_ptr<RelayChannel> relay,
                               PeerConnectionFactory factory)
    : loop_(loop)
    , options_(std::move(options))
    , devices_(std::move(devices))
    , relay_(std::move(relay))
    , factory_(std::move(factory)) {
}

CallController::~CallController() {
    on_state_change_ = nullptr;
    on_notice_ = nullptr;
    on_connection_path_ = nullptr;
    end();

    relay_->setOpenCallback(nullptr);
    relay_->setMessageCallback(nullptr);
    relay_->setCloseCallback(nullptr);
}

core::Result<std::string> CallController::host() {
    std::string room_id = generateRoomId();

    auto started = start(room_id);
    if (!started) {
        return started.error();
    }

    share_link_ = makeShareLink(options_.link_base, room_id);
    Logger::info("Share this link to invite the other participant: {}", *share_link_);
    return *share_link_;
}

core::Result<void> CallController::join(std::string_view link) {
    auto room_id = roomFromLink(link);
    if (!room_id) {
        return room_id.error();
    }

    auto started = start(room_id.value());
    if (started) {
        share_link_ = makeShareLink(options_.link_base, room_id.value());
    }
    return started;
}

core::Result<void> CallController::start(const std::string& room_id) {
    if (session_.state != NegotiationState::Idle) {
        return {core::ErrorCode::InvalidState,
                "Call already in state " + negotiationStateToString(session_.state)};
    }
    if (!signaling::isValidRoomId(room_id)) {
        return {core::ErrorCode::InvalidRoom, "Invalid room id: " + room_id};
    }

    // Media first: a permission failure must not leave a room behind
    auto media = devices_->acquire(options_.media);
    if (!media) {
        Logger::error("Media acquisition failed: {}", media.error().what());
        return media.error();
    }
    media_ = std::move(media).value();

    try {
        peer_ = factory_(options_.peer, *media_);
    }
    catch (const std::exception& e) {
        media_->release();
        media_.reset();
        return {core::ErrorCode::TransportFailed, std::string("Cannot create peer connection: ") + e.what()};
    }

    std::weak_ptr<CallController> weak = weak_from_this();
    peer_->setDescriptionCallback([weak](const SessionDescription& description) {
        if (auto self = weak.lock()) {
            self->postEvent(event::LocalDescription{description});
        }
    });
    peer_->setCandidateCallback([weak](const IceCandidate& candidate) {
        Logger::debug("Local {} candidate gathered",
            candidateTypeToString(parseCandidateType(candidate.candidate)));
        if (auto self = weak.lock()) {
            self->postEvent(event::LocalCandidate{candidate});
        }
    });
    peer_->setStateCallback([weak](TransportState state) {
        if (auto self = weak.lock()) {
            self->postEvent(event::TransportChanged{state});
        }
    });

    relay_->setMessageCallback([weak](const signaling::SignalMessage& message) {
        if (auto self = weak.lock()) {
            self->onRelayMessage(message);
        }
    });
    relay_->setCloseCallback([weak](int code, const std::string& reason) {
        if (auto self = weak.lock()) {
            self->dispatch(event::RelayClosed{code, reason});
        }
    });

    dispatch(event::Start{room_id});

    auto connected = relay_->connect(room_id);
    if (!connected) {
        dispatch(event::RelayClosed{kCloseAbnormal, connected.error().what()});
        return connected.error();
    }
    return {};
}

void CallController::end() {
    dispatch(event::LocalEnd{});
}

std::optional<bool> CallController::muteAudio() {
    if (!media_ || !media_->audioTrack()) {
        return std::nullopt;
    }

    auto track = media_->audioTrack();
    track->setEnabled(!track->enabled());
    Logger::info("Audio {}", track->enabled() ? "unmuted" : "muted");
    return !track->enabled();
}

std::optional<bool> CallController::disableVideo() {
    if (!media_ || !media_->videoTrack()) {
        return std::nullopt;
    }

    auto track = media_->videoTrack();
    track->setEnabled(!track->enabled());
    Logger::info("Video {}", track->enabled() ? "enabled" : "disabled");
    return !track->enabled();
}

ConnectionPath CallController::connectionPath() const {
    if (!peer_) {
        return ConnectionPath::Unknown;
    }

    auto pair = peer_->selectedCandidatePair();
    if (!pair) {
        return ConnectionPath::Unknown;
    }
    return classifyConnectionPath(pair->first, pair->second);
}

template<typename F>
void CallController::withPeer(const char* operation, F&& action) {
    if (!peer_) {
        return;
    }

    try {
        action(*peer_);
    }
    catch (const std::exception& e) {
        Logger::error("Transport {} failed: {}", operation, e.what());
        dispatch(event::TransportChanged{TransportState::Failed});
    }
}

void CallController::dispatch(NegotiationEvent event) {
    pending_.push_back(std::move(event));
    if (dispatching_) {
        return;
    }

    dispatching_ = true;
    while (!pending_.empty()) {
        NegotiationEvent next = std::move(pending_.front());
        pending_.pop_front();

        NegotiationState previous = session_.state;
        Logger::debug("Event {} in state {}", eventName(next), negotiationStateToString(previous));

        Transition transition = applyEvent(session_, next);
        session_ = std::move(transition.session);

        for (const auto& effect : transition.effects) {
            execute(effect);
        }

        auto* transport = std::get_if<event::TransportChanged>(&next);
        if (transport && transport->state == TransportState::Connected &&
            !session_.isEnded() && !path_checks_armed_) {
            path_checks_armed_ = true;
            scheduleConnectionPathCheck(options_.path_check_delay);
        }

        if (session_.state != previous) {
            Logger::info("Call state {} -> {}",
                negotiationStateToString(previous), negotiationStateToString(session_.state));
            if (on_state_change_) {
                on_state_change_(session_.state);
            }
        }
    }
    dispatching_ = false;
}

void CallController::execute(const Effect& effect) {
    std::visit(overloaded{
        [this](const effect::CreateOffer&) {
            withPeer("createOffer", [](PeerConnection& peer) { peer.createOffer(); });
        },
        [this](const effect::CreateAnswer&) {
            withPeer("createAnswer", [](PeerConnection& peer) { peer.createAnswer(); });
        },
        [this](const effect::ApplyRemoteDescription& e) {
            withPeer("setRemoteDescription", [&e](PeerConnection& peer) {
                peer.setRemoteDescription(e.description);
            });
        },
        [this](const effect::AddRemoteCandidate& e) {
            withPeer("addRemoteCandidate", [&e](PeerConnection& peer) {
                peer.addRemoteCandidate(e.candidate);
            });
        },
        [this](const effect::Send& e) {
            relay_->send(e.message);
        },
        [this](const effect::ReleaseMedia&) {
            if (media_) {
                media_->release();
                media_.reset();
            }
        },
        [this](const effect::ClosePeerConnection&) {
            if (!peer_) {
                return;
            }
            auto peer = std::move(peer_);
            try {
                peer->close();
            }
            catch (const std::exception& e) {
                Logger::warn("Error closing peer connection: {}", e.what());
            }
            peer->setDescriptionCallback(nullptr);
            peer->setCandidateCallback(nullptr);
            peer->setStateCallback(nullptr);
        },
        [this](const effect::CloseRelay&) {
            relay_->close();
        },
        [this](const effect::Notify& e) {
            Logger::info("{}", e.notice.text);
            if (on_notice_) {
                on_notice_(e.notice);
            }
        }
    }, effect);
}

void CallController::postEvent(NegotiationEvent event) {
    std::weak_ptr<CallController> weak = weak_from_this();
    loop_.post([weak, event = std::move(event)]() mutable {
        if (auto self = weak.lock()) {
            self->dispatch(std::move(event));
        }
    });
}

void CallController::onRelayMessage(const signaling::SignalMessage& message) {
    std::visit(overloaded{
        [this](const signaling::JoinMessage& m) {
            if (m.role) {
                dispatch(event::Joined{*m.role});
            }
            else {
                Logger::debug("Ignoring join from peer for room {}", m.room);
            }
        },
        [this](const signaling::RoomStatusMessage& m) {
            dispatch(event::RoomStatus{m.count});
        },
        [this](const signaling::OfferMessage& m) {
            auto description = SessionDescription::fromJson(m.description);
            if (!description) {
                Logger::warn("Discarding malformed offer: {}", description.error().what());
                return;
            }
            dispatch(event::RemoteOffer{description.value()});
        },
        [this](const signaling::AnswerMessage& m) {
            auto description = SessionDescription::fromJson(m.description);
            if (!description) {
                Logger::warn("Discarding malformed answer: {}", description.error().what());
                return;
            }
            dispatch(event::RemoteAnswer{description.value()});
        },
        [this](const signaling::IceCandidateMessage& m) {
            auto candidate = IceCandidate::fromJson(m.candidate);
            if (!candidate) {
                Logger::warn("Discarding malformed candidate: {}", candidate.error().what());
                return;
            }
            dispatch(event::RemoteCandidate{candidate.value()});
        },
        [this](const signaling::PeerDisconnectedMessage&) {
            dispatch(event::PeerDisconnected{});
        },
        [this](const signaling::CallEndedMessage&) {
            dispatch(event::CallEnded{});
        }
    }, message);
}

// Re-arms itself until the call ends
void CallController::scheduleConnectionPathCheck(std::chrono::milliseconds delay) {
    std::weak_ptr<CallController> weak = weak_from_this();
    loop_.runAfter(delay, [weak]() {
        auto self = weak.lock();
        if (!self || self->session_.isEnded()) {
            return;
        }

        ConnectionPath path = self->connectionPath();
        Logger::info("Connection path: {}", connectionPathToString(path));
        if (self->on_connection_path_) {
            self->on_connection_path_(path);
        }
        self->scheduleConnectionPathCheck(self->options_.path_check_interval);
    });
}

} // namespace duet::call
