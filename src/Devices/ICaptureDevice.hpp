#pragma once

#include <string>

namespace voicenote {

using CaptureHandle = unsigned int;

// Microphone capture. Implementations throw DeviceError on failure.
class ICaptureDevice {
public:
    virtual ~ICaptureDevice() = default;

    virtual bool RequestPermission() = 0;

    // Opens and starts a capture session
    virtual CaptureHandle OpenSession() = 0;

    // Stops capture, persists the audio and returns its location. The handle
    // is released whether or not this throws.
    virtual std::string Finalize(CaptureHandle handle) = 0;

    // Stops capture and drops the audio. Never throws for unknown handles.
    virtual void Discard(CaptureHandle handle) = 0;
};

} // namespace voicenote
