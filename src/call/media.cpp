#include <duet/call/media.hpp>
#include <duet/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <vector>
#include <algorithm>

#include <fcntl.h>
#include <unistd.h>

namespace duet::call {

using core::Logger;

namespace {

core::ErrorCode errnoToMediaError(int error) {
    switch (error) {
        case EACCES:
        case EPERM:
            return core::ErrorCode::PermissionDenied;
        case ENOENT:
        case ENODEV:
        case ENXIO:
            return core::ErrorCode::DeviceNotFound;
        case EBUSY:
            return core::ErrorCode::DeviceBusy;
        default:
            return core::ErrorCode::Unknown;
    }
}

core::Result<int> openDevice(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int error = errno;
        return {errnoToMediaError(error),
                "Cannot open " + path.string() + ": " + std::strerror(error)};
    }
    return fd;
}

// ALSA capture nodes are named pcmC<card>D<device>c
std::vector<std::filesystem::path> findCaptureNodes(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> nodes;
    std::error_code ec;

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("pcmC", 0) == 0 && name.back() == 'c') {
            nodes.push_back(entry.path());
        }
    }

    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

class DeviceCapture : public MediaCapture {
public:
    DeviceCapture(std::shared_ptr<MediaTrack> audio, std::shared_ptr<MediaTrack> video,
                  int audio_fd, int video_fd)
        : MediaCapture(std::move(audio), std::move(video))
        , audio_fd_(audio_fd)
        , video_fd_(video_fd) {}

    ~DeviceCapture() override {
        release();
    }

protected:
    void releaseDevices() override {
        for (int* fd : {&audio_fd_, &video_fd_}) {
            if (*fd >= 0) {
                ::close(*fd);
                *fd = -1;
            }
        }
    }

private:
    int audio_fd_;
    int video_fd_;
};

} // namespace

MediaTrack::MediaTrack(std::string id, MediaKind kind, std::string device)
    : id_(std::move(id))
    , kind_(kind)
    , device_(std::move(device)) {
}

void MediaTrack::setEnabled(bool enabled) {
    bool previous = enabled_.exchange(enabled);
    if (previous != enabled) {
        Logger::debug("MediaTrack {} {}", id_, enabled ? "enabled" : "disabled");
    }
}

void MediaTrack::stop() {
    if (state_.exchange(TrackState::Ended) != TrackState::Ended) {
        Logger::debug("MediaTrack {} stopped", id_);
    }
}

MediaCapture::MediaCapture(std::shared_ptr<MediaTrack> audio, std::shared_ptr<MediaTrack> video)
    : audio_(std::move(audio))
    , video_(std::move(video)) {
}

MediaCapture::~MediaCapture() = default;

void MediaCapture::release() {
    if (released_) {
        return;
    }
    released_ = true;

    if (audio_) audio_->stop();
    if (video_) video_->stop();
    releaseDevices();

    Logger::info("Media capture released");
}

LocalMediaDevices::LocalMediaDevices()
    : LocalMediaDevices(Options{}) {
}

LocalMediaDevices::LocalMediaDevices(Options options)
    : options_(std::move(options)) {
}

core::Result<std::unique_ptr<MediaCapture>> LocalMediaDevices::acquire(const MediaConstraints& constraints) {
    if (!constraints.audio && !constraints.video) {
        return {core::ErrorCode::InvalidArgument, "At least one of audio or video must be requested"};
    }

    int video_fd = -1;
    std::shared_ptr<MediaTrack> video;
    if (constraints.video) {
        auto fd = openDevice(options_.video_device);
        if (!fd) {
            return fd.error();
        }
        video_fd = fd.value();
        video = std::make_shared<MediaTrack>(generateTrackId(MediaKind::Video), MediaKind::Video,
                                             options_.video_device.string());
    }

    int audio_fd = -1;
    std::shared_ptr<MediaTrack> audio;
    if (constraints.audio) {
        auto nodes = findCaptureNodes(options_.audio_directory);
        if (nodes.empty()) {
            if (video_fd >= 0) ::close(video_fd);
            return {core::ErrorCode::DeviceNotFound,
                    "No capture device under " + options_.audio_directory.string()};
        }

        auto fd = openDevice(nodes.front());
        if (!fd) {
            if (video_fd >= 0) ::close(video_fd);
            return fd.error();
        }
        audio_fd = fd.value();
        audio = std::make_shared<MediaTrack>(generateTrackId(MediaKind::Audio), MediaKind::Audio,
                                             nodes.front().string());
    }

    Logger::info("Media capture acquired (audio: {}, video: {})",
        audio ? audio->device() : "none", video ? video->device() : "none");

    return std::unique_ptr<MediaCapture>(
        std::make_unique<DeviceCapture>(std::move(audio), std::move(video), audio_fd, video_fd));
}

std::string generateTrackId(MediaKind kind) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << (kind == MediaKind::Audio ? "audio-" : "video-");
    for (int i = 0; i < 8; ++i) {
        oss << std::hex << dis(gen);
    }
    return oss.str();
}

std::string mediaErrorMessage(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::PermissionDenied:
            return "Camera/microphone access denied. Please allow permissions and try again.";
        case core::ErrorCode::DeviceNotFound:
            return "No camera or microphone found.";
        case core::ErrorCode::DeviceBusy:
            return "Camera/microphone is already in use by another application.";
        default:
            return "Could not access camera or microphone.";
    }
}

} // namespace duet::call
