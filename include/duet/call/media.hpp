#pragma once

#include <memory>
#include <string>
#include <atomic>
#include <filesystem>

#include <duet/core/error.hpp>

namespace duet::call {

enum class MediaKind {
    Audio,
    Video
};

enum class TrackState {
    Live,
    Ended
};

// Local capture track. Disabling a track keeps it negotiated; the transport
// sends silence or black frames while it is disabled.
class MediaTrack {
public:
    MediaTrack(std::string id, MediaKind kind, std::string device);

    const std::string& id() const { return id_; }
    MediaKind kind() const { return kind_; }
    const std::string& device() const { return device_; }

    bool enabled() const { return enabled_; }
    void setEnabled(bool enabled);

    TrackState state() const { return state_; }
    void stop();

private:
    std::string id_;
    MediaKind kind_;
    std::string device_;
    std::atomic<bool> enabled_{true};
    std::atomic<TrackState> state_{TrackState::Live};
};

struct MediaConstraints {
    bool audio = true;
    bool video = true;
};

// Exclusive handle on the local capture devices. release() stops every
// track and gives the devices back; it is safe to call more than once.
class MediaCapture {
public:
    MediaCapture(std::shared_ptr<MediaTrack> audio, std::shared_ptr<MediaTrack> video);
    virtual ~MediaCapture();

    // Non-copyable
    MediaCapture(const MediaCapture&) = delete;
    MediaCapture& operator=(const MediaCapture&) = delete;

    std::shared_ptr<MediaTrack> audioTrack() const { return audio_; }
    std::shared_ptr<MediaTrack> videoTrack() const { return video_; }

    void release();
    bool released() const { return released_; }

protected:
    virtual void releaseDevices() {}

private:
    std::shared_ptr<MediaTrack> audio_;
    std::shared_ptr<MediaTrack> video_;
    bool released_ = false;
};

// Source of capture handles. Failures map to PermissionDenied,
// DeviceNotFound or DeviceBusy.
class MediaDevices {
public:
    virtual ~MediaDevices() = default;

    virtual core::Result<std::unique_ptr<MediaCapture>> acquire(const MediaConstraints& constraints) = 0;
};

// Opens V4L2 and ALSA capture nodes and holds them open for the call
class LocalMediaDevices : public MediaDevices {
public:
    struct Options {
        std::filesystem::path video_device = "/dev/video0";
        std::filesystem::path audio_directory = "/dev/snd";
    };

    LocalMediaDevices();
    explicit LocalMediaDevices(Options options);

    core::Result<std::unique_ptr<MediaCapture>> acquire(const MediaConstraints& constraints) override;

private:
    Options options_;
};

std::string generateTrackId(MediaKind kind);

// User-facing text for a media acquisition error
std::string mediaErrorMessage(core::ErrorCode code);

} // namespace duet::call
