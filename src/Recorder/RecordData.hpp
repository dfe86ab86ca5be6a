#pragma once

#include "../Devices/ICaptureDevice.hpp"
#include "../common/Clock.hpp"
#include "../common/Ticker.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace voicenote {

// Owned by the Recorder while a capture is active
struct RecordingSession {
    RecordingSession(CaptureHandle h, IClock::TimePoint start, uint64_t gen)
        : handle(h), startedAt(start), generation(gen) {}

    CaptureHandle handle;
    IClock::TimePoint startedAt;
    uint64_t generation;
    std::atomic<bool> autoStopped{false};
    std::atomic<unsigned int> elapsedSeconds{0};
    Ticker ticker;
};

// Handed to the caller by Recorder::Stop
struct RecordingResult {
    std::string location;
    unsigned int durationSeconds = 0;
    bool autoStopped = false;
};

} // namespace voicenote
