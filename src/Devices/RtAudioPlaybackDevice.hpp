#pragma once

#include "IPlaybackDevice.hpp"

#include <RtAudio.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace voicenote {

struct PlaybackStream {
    std::vector<int16_t> samples;
    unsigned int sampleRate = 0;
    std::atomic<size_t> cursor{0};
    std::atomic<bool> playing{false};
    std::atomic<bool> finished{false};
    bool finishReported = false;
    IPlaybackDevice::StatusCallback callback;
    std::unique_ptr<RtAudio> audio;
};

// Plays WAV files through the default output device. Status for every
// playing handle is published from a single poller thread.
class RtAudioPlaybackDevice : public IPlaybackDevice {
public:
    explicit RtAudioPlaybackDevice(std::chrono::milliseconds statusInterval = std::chrono::milliseconds(100));
    ~RtAudioPlaybackDevice() override;

    PlaybackHandle Load(const std::string& location) override;
    void Play(PlaybackHandle handle) override;
    void Pause(PlaybackHandle handle) override;
    void Seek(PlaybackHandle handle, double positionSeconds) override;
    void SetStatusCallback(PlaybackHandle handle, StatusCallback callback) override;
    void Unload(PlaybackHandle handle) override;

private:
    PlaybackStream& Find(PlaybackHandle handle);
    void PollStatus();

    std::map<PlaybackHandle, std::unique_ptr<PlaybackStream>> _streams;
    PlaybackHandle _next_handle;
    std::chrono::milliseconds _status_interval;
    std::unique_ptr<std::thread> _poller;
    std::atomic<bool> _running;
    std::mutex _mutex;
};

} // namespace voicenote
