#pragma once

#include <functional>
#include <string>

namespace voicenote {

using PlaybackHandle = unsigned int;

struct PlaybackStatus {
    double positionSeconds = 0.0;
    double durationSeconds = 0.0;
    bool didJustFinish = false;
};

// Speaker output. Implementations throw DeviceError on failure.
class IPlaybackDevice {
public:
    using StatusCallback = std::function<void(const PlaybackStatus&)>;

    virtual ~IPlaybackDevice() = default;

    virtual PlaybackHandle Load(const std::string& location) = 0;
    virtual void Play(PlaybackHandle handle) = 0;
    virtual void Pause(PlaybackHandle handle) = 0;
    virtual void Seek(PlaybackHandle handle, double positionSeconds) = 0;

    // Replaces any callback previously set for the handle. Called from the
    // device's own thread.
    virtual void SetStatusCallback(PlaybackHandle handle, StatusCallback callback) = 0;

    // Releases the handle; unknown handles are ignored
    virtual void Unload(PlaybackHandle handle) = 0;
};

} // namespace voicenote
