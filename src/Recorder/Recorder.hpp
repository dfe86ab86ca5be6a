#pragma once

#include "RecordData.hpp"
#include "../Devices/ICaptureDevice.hpp"
#include "../common/Clock.hpp"
#include "../common/VoiceErrors.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voicenote {

struct RecorderOptions {
    unsigned int maxDurationSeconds = 120;
    std::chrono::milliseconds tickInterval{100};
};

// Hold-to-record voice capture. At most one session exists at a time.
//
// Reaching the maximum duration only raises the session's autoStopped flag;
// the caller is expected to react to it and call Stop().
class Recorder {
public:
    enum class State {
        Idle,
        Starting,
        Recording
    };

    using DurationCallback = std::function<void(unsigned int elapsedSeconds, bool autoStopped)>;
    using ErrorCallback = std::function<void(ErrorKind kind, const std::string& message)>;

    static constexpr unsigned int MAX_DURATION_SECONDS = 120;

    Recorder(std::shared_ptr<ICaptureDevice> device,
             std::shared_ptr<IClock> clock = MakeSteadyClock(),
             RecorderOptions options = RecorderOptions());
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Tears down any previous session, then asks for the microphone and
    // opens a new one. Returns false on denial, device failure, or when a
    // Cancel/Teardown/newer Start overtook this call.
    bool Start();

    // Returns std::nullopt when nothing is recording or finalizing failed
    std::optional<RecordingResult> Stop();

    void Cancel();

    // Called when the owning screen goes away. Releases the session and
    // rejects further Start calls.
    void Teardown();

    State GetState() const;
    bool IsRecording() const;
    unsigned int GetElapsedSeconds() const;
    bool IsAutoStopped() const;

    void SetDurationCallback(DurationCallback callback);
    void SetErrorCallback(ErrorCallback callback);

private:
    void OnTick(uint64_t generation);
    void ReleaseSession(std::unique_ptr<RecordingSession> session);
    void ReportError(ErrorKind kind, const std::string& message);
    unsigned int ElapsedSeconds(const RecordingSession& session) const;

    std::shared_ptr<ICaptureDevice> _device;
    std::shared_ptr<IClock> _clock;
    RecorderOptions _options;

    std::unique_ptr<RecordingSession> _session;
    State _state;
    uint64_t _generation;
    bool _torn_down;

    DurationCallback _duration_callback;
    ErrorCallback _error_callback;
    mutable std::mutex _mutex;
};

const char* ToString(Recorder::State state);

} // namespace voicenote
