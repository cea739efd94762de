#pragma once

#include <memory>

#include <duet/call/media.hpp>
#include <duet/call/peer_connection.hpp>

namespace duet::call {

// libdatachannel-backed transport. The local audio and video tracks of
// media are announced as send-receive media sections.
std::shared_ptr<PeerConnection> createRtcPeerConnection(const PeerConnectionConfig& config,
                                                        const MediaCapture& media);

} // namespace duet::call
