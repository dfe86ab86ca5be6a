#include "Recorder.hpp"
#include "../common/debug_log.hpp"

namespace voicenote {

const char* ToString(Recorder::State state) {
    switch (state) {
        case Recorder::State::Idle: return "Idle";
        case Recorder::State::Starting: return "Starting";
        case Recorder::State::Recording: return "Recording";
    }
    return "Unknown";
}

Recorder::Recorder(std::shared_ptr<ICaptureDevice> device,
                   std::shared_ptr<IClock> clock,
                   RecorderOptions options)
    : _device(std::move(device))
    , _clock(std::move(clock))
    , _options(options)
    , _state(State::Idle)
    , _generation(0)
    , _torn_down(false) {
    if (!_device) {
        throw std::invalid_argument("Recorder requires a capture device");
    }
    if (!_clock) {
        _clock = MakeSteadyClock();
    }
}

Recorder::~Recorder() {
    Teardown();
}

bool Recorder::Start() {
    std::unique_ptr<RecordingSession> previous;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_torn_down) {
            WARN_LOG("Recorder: start requested after teardown");
            return false;
        }
        previous = std::move(_session);
        generation = ++_generation;
        _state = State::Starting;
    }

    // The old session is gone from _session already; release its device
    // handle before the new one is opened
    if (previous) {
        DEBUG_LOG("Recorder: cleaning up previous recording" << DEBUG_LOG_ENDL);
        ReleaseSession(std::move(previous));
    }

    auto resetIfCurrent = [this, generation]() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_generation == generation) {
            _state = State::Idle;
        }
    };

    bool granted = false;
    try {
        granted = _device->RequestPermission();
    } catch (const std::exception& e) {
        ERROR_LOG("Recorder: permission request failed: " << e.what());
    }
    if (!granted) {
        resetIfCurrent();
        ReportError(ErrorKind::PermissionDenied,
                    "Please grant microphone permission to record voice messages.");
        return false;
    }

    CaptureHandle handle;
    try {
        handle = _device->OpenSession();
    } catch (const std::exception& e) {
        ERROR_LOG("Recorder: start recording error: " << e.what());
        resetIfCurrent();
        ReportError(ErrorKind::DeviceInitFailure, "Failed to start recording. Please try again.");
        return false;
    }

    auto session = std::make_unique<RecordingSession>(handle, _clock->Now(), generation);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_generation == generation && !_torn_down) {
            _session = std::move(session);
            _state = State::Recording;
            _session->ticker.Start(_options.tickInterval, [this, generation]() { OnTick(generation); });
            DEBUG_LOG("Recorder: recording started" << DEBUG_LOG_ENDL);
            return true;
        }
    }

    DEBUG_LOG("Recorder: start was overtaken, releasing capture handle " << handle << DEBUG_LOG_ENDL);
    ReleaseSession(std::move(session));
    return false;
}

std::optional<RecordingResult> Recorder::Stop() {
    std::unique_ptr<RecordingSession> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session) {
            WARN_LOG("Recorder: no active recording to stop");
            return std::nullopt;
        }
        session = std::move(_session);
        ++_generation;
        _state = State::Idle;
    }

    session->ticker.Stop();

    // Wall-clock duration, taken before the device spends time finalizing
    RecordingResult result;
    result.durationSeconds = ElapsedSeconds(*session);
    result.autoStopped = session->autoStopped;

    try {
        result.location = _device->Finalize(session->handle);
    } catch (const VoiceError& e) {
        ERROR_LOG("Recorder: stop recording error: " << e.what());
        ReportError(e.Kind(), e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        ERROR_LOG("Recorder: stop recording error: " << e.what());
        ReportError(ErrorKind::IOFailure, e.what());
        return std::nullopt;
    }

    if (result.location.empty()) {
        ERROR_LOG("Recorder: no location after recording");
        ReportError(ErrorKind::IOFailure, "Recording produced no file");
        return std::nullopt;
    }

    DEBUG_LOG("Recorder: recording stopped (" << result.location << ", "
              << result.durationSeconds << "s, autoStopped=" << result.autoStopped << ")" << DEBUG_LOG_ENDL);
    return result;
}

void Recorder::Cancel() {
    std::unique_ptr<RecordingSession> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_generation;
        _state = State::Idle;
        session = std::move(_session);
    }

    if (session) {
        ReleaseSession(std::move(session));
        DEBUG_LOG("Recorder: recording cancelled" << DEBUG_LOG_ENDL);
    }
}

void Recorder::Teardown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _torn_down = true;
    }
    Cancel();
}

void Recorder::ReleaseSession(std::unique_ptr<RecordingSession> session) {
    session->ticker.Stop();
    try {
        _device->Discard(session->handle);
    } catch (const std::exception& e) {
        ERROR_LOG("Recorder: failed to release capture handle " << session->handle << ": " << e.what());
    }
}

void Recorder::OnTick(uint64_t generation) {
    unsigned int elapsed;
    bool autoStopped;
    DurationCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || _session->generation != generation) {
            return;
        }

        elapsed = ElapsedSeconds(*_session);
        _session->elapsedSeconds = elapsed;
        if (elapsed >= _options.maxDurationSeconds && !_session->autoStopped) {
            DEBUG_LOG("Recorder: max duration reached, flagging auto-stop" << DEBUG_LOG_ENDL);
            _session->autoStopped = true;
        }
        autoStopped = _session->autoStopped;
        callback = _duration_callback;
    }

    if (callback) {
        callback(elapsed, autoStopped);
    }
}

unsigned int Recorder::ElapsedSeconds(const RecordingSession& session) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(_clock->Now() - session.startedAt).count();
    return elapsed > 0 ? static_cast<unsigned int>(elapsed) : 0;
}

void Recorder::ReportError(ErrorKind kind, const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _error_callback;
    }
    if (callback) {
        callback(kind, message);
    }
}

Recorder::State Recorder::GetState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

bool Recorder::IsRecording() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state == State::Recording;
}

unsigned int Recorder::GetElapsedSeconds() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->elapsedSeconds.load() : 0;
}

bool Recorder::IsAutoStopped() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->autoStopped.load() : false;
}

void Recorder::SetDurationCallback(DurationCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _duration_callback = std::move(callback);
}

void Recorder::SetErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _error_callback = std::move(callback);
}

} // namespace voicenote
