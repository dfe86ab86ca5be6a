#include "Player.hpp"
#include "../common/debug_log.hpp"

#include <cmath>

namespace voicenote {

namespace {

unsigned int WholeSeconds(double seconds) {
    return seconds > 0.0 ? static_cast<unsigned int>(std::floor(seconds)) : 0;
}

} // namespace

const char* ToString(Player::State state) {
    switch (state) {
        case Player::State::Idle: return "Idle";
        case Player::State::Loading: return "Loading";
        case Player::State::Playing: return "Playing";
    }
    return "Unknown";
}

Player::Player(std::shared_ptr<IPlaybackDevice> device)
    : _device(std::move(device))
    , _callback_guard(std::make_shared<CallbackGuard>())
    , _state(State::Idle)
    , _generation(0)
    , _torn_down(false) {
    if (!_device) {
        throw std::invalid_argument("Player requires a playback device");
    }
}

Player::~Player() {
    Teardown();
}

void Player::Play(const std::string& messageId, const std::string& sourceLocation, unsigned int durationHint) {
    std::unique_ptr<PlaybackSession> previous;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_torn_down) {
            WARN_LOG("Player: play requested after teardown");
            return;
        }
        // Implicit stop, even when the same message is playing
        previous = std::move(_session);
        generation = ++_generation;
        _state = State::Loading;
    }

    if (previous) {
        ReleaseSession(*previous);
        NotifyState(State::Idle, previous->messageId);
    }

    auto resetIfCurrent = [this, generation]() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_generation == generation) {
            _state = State::Idle;
        }
    };

    PlaybackHandle handle;
    try {
        handle = _device->Load(sourceLocation);
    } catch (const std::exception& e) {
        ERROR_LOG("Player: play error for " << messageId << ": " << e.what());
        resetIfCurrent();
        ReportError(ErrorKind::DeviceInitFailure, e.what());
        return;
    }

    // The session is installed before playback starts so a completion
    // reported from inside Play() is not lost
    bool installed = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_generation == generation && !_torn_down) {
            _session = std::make_unique<PlaybackSession>();
            _session->messageId = messageId;
            _session->handle = handle;
            _session->positionSeconds = 0;
            _session->durationSeconds = durationHint;
            _session->generation = generation;
            installed = true;
        }
    }

    if (!installed) {
        DEBUG_LOG("Player: play of " << messageId << " was overtaken, unloading" << DEBUG_LOG_ENDL);
        try {
            _device->Unload(handle);
        } catch (const std::exception& e) {
            ERROR_LOG("Player: unload error: " << e.what());
        }
        return;
    }

    try {
        std::shared_ptr<CallbackGuard> guard = _callback_guard;
        _device->SetStatusCallback(handle, [this, guard, generation](const PlaybackStatus& status) {
            std::lock_guard<std::recursive_mutex> lock(guard->mutex);
            if (guard->alive) {
                OnStatus(generation, status);
            }
        });
        _device->Play(handle);
    } catch (const std::exception& e) {
        std::unique_ptr<PlaybackSession> failed;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_session && _session->generation == generation) {
                failed = std::move(_session);
                _state = State::Idle;
            }
        }
        // Otherwise a Stop or a newer Play already released the handle
        if (failed) {
            ERROR_LOG("Player: play error for " << messageId << ": " << e.what());
            ReleaseSession(*failed);
            ReportError(ErrorKind::DeviceInitFailure, e.what());
        }
        return;
    }

    bool playing = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_session && _session->generation == generation) {
            _state = State::Playing;
            playing = true;
        }
    }

    if (playing) {
        DEBUG_LOG("Player: playing " << messageId << DEBUG_LOG_ENDL);
        NotifyState(State::Playing, messageId);
    }
}

void Player::Stop() {
    std::unique_ptr<PlaybackSession> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_generation;
        _state = State::Idle;
        session = std::move(_session);
    }

    if (session) {
        ReleaseSession(*session);
        DEBUG_LOG("Player: stopped " << session->messageId << DEBUG_LOG_ENDL);
        NotifyState(State::Idle, session->messageId);
    }
}

void Player::Toggle(const std::string& messageId, const std::string& sourceLocation, unsigned int durationHint) {
    bool isActive;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        isActive = _session && _session->messageId == messageId;
    }

    if (isActive) {
        Stop();
    } else {
        Play(messageId, sourceLocation, durationHint);
    }
}

void Player::Seek(unsigned int positionSeconds) {
    std::string messageId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session) {
            return;
        }
        messageId = _session->messageId;
    }
    Seek(messageId, positionSeconds);
}

void Player::Seek(const std::string& messageId, unsigned int positionSeconds) {
    PlaybackHandle handle;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || _session->messageId != messageId) {
            return;
        }
        // Shown right away; the next status tick carries the device position
        _session->positionSeconds = positionSeconds;
        handle = _session->handle;
    }

    try {
        _device->Seek(handle, static_cast<double>(positionSeconds));
    } catch (const std::exception& e) {
        ERROR_LOG("Player: seek error: " << e.what());
    }
}

VoiceMessageView Player::ViewFor(const std::string& messageId, const std::string& sourceLocation,
                                 unsigned int durationHint) {
    VoiceMessageView view;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_session && _session->messageId == messageId) {
            view.isPlaying = true;
            view.positionSeconds = _session->positionSeconds;
            view.durationSeconds = _session->durationSeconds;
        } else {
            view.durationSeconds = durationHint;
        }
    }

    view.onPlayPause = [this, messageId, sourceLocation, durationHint]() {
        Toggle(messageId, sourceLocation, durationHint);
    };
    view.onSeek = [this, messageId](unsigned int positionSeconds) {
        Seek(messageId, positionSeconds);
    };
    return view;
}

void Player::Teardown() {
    {
        std::lock_guard<std::recursive_mutex> lock(_callback_guard->mutex);
        _callback_guard->alive = false;
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _torn_down = true;
    }
    Stop();
}

void Player::OnStatus(uint64_t generation, const PlaybackStatus& status) {
    std::unique_ptr<PlaybackSession> finished;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || _session->generation != generation) {
            return;
        }

        _session->positionSeconds = WholeSeconds(status.positionSeconds);
        if (status.durationSeconds > 0.0) {
            _session->durationSeconds = WholeSeconds(status.durationSeconds);
        }

        if (status.didJustFinish) {
            finished = std::move(_session);
            ++_generation;
            _state = State::Idle;
        }
    }

    if (finished) {
        try {
            _device->Unload(finished->handle);
        } catch (const std::exception& e) {
            ERROR_LOG("Player: unload after completion failed: " << e.what());
        }
        DEBUG_LOG("Player: finished " << finished->messageId << DEBUG_LOG_ENDL);
        NotifyState(State::Idle, finished->messageId);
    }
}

void Player::ReleaseSession(const PlaybackSession& session) {
    try {
        _device->Pause(session.handle);
    } catch (const std::exception& e) {
        ERROR_LOG("Player: stop error: " << e.what());
    }
    try {
        _device->Unload(session.handle);
    } catch (const std::exception& e) {
        ERROR_LOG("Player: unload error: " << e.what());
    }
}

void Player::NotifyState(State state, const std::string& messageId) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _state_callback;
    }
    if (callback) {
        callback(state, messageId);
    }
}

void Player::ReportError(ErrorKind kind, const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _error_callback;
    }
    if (callback) {
        callback(kind, message);
    }
}

Player::State Player::GetState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

std::optional<std::string> Player::GetCurrentlyPlayingId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_session) {
        return std::nullopt;
    }
    return _session->messageId;
}

unsigned int Player::GetPosition() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->positionSeconds : 0;
}

unsigned int Player::GetDuration() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->durationSeconds : 0;
}

void Player::SetStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _state_callback = std::move(callback);
}

void Player::SetErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _error_callback = std::move(callback);
}

} // namespace voicenote
