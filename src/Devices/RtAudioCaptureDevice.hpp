#pragma once

#include "ICaptureDevice.hpp"

#include <RtAudio.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voicenote {

class NoiseSuppressor;

struct CaptureData {
    std::vector<int16_t> audioData;
    std::atomic<bool> isRecording{false};
    unsigned int sampleRate = 0;
    std::mutex mutex;
};

struct CaptureOptions {
    unsigned int sampleRate = 48000;
    std::string outputDir = "/tmp";
    bool denoise = false;
};

// Records the default microphone into a WAV file. One session at a time.
class RtAudioCaptureDevice : public ICaptureDevice {
public:
    explicit RtAudioCaptureDevice(CaptureOptions options);
    ~RtAudioCaptureDevice() override;

    bool RequestPermission() override;
    CaptureHandle OpenSession() override;
    std::string Finalize(CaptureHandle handle) override;
    void Discard(CaptureHandle handle) override;

private:
    bool SelectInputDevice();
    void OpenStream();
    void CloseStream();
    std::string MakeOutputPath(CaptureHandle handle) const;

    CaptureOptions _options;
    CaptureData _capture_data;
    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    std::unique_ptr<NoiseSuppressor> _suppressor;
    bool _has_input_device;
    CaptureHandle _active_handle;
    CaptureHandle _next_handle;
    std::mutex _device_mutex;
};

} // namespace voicenote
