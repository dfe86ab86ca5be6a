#pragma once

#include "PlaybackData.hpp"
#include "../Devices/IPlaybackDevice.hpp"
#include "../common/VoiceErrors.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voicenote {

// Plays voice messages one at a time. Starting any message stops whatever
// was playing before.
class Player {
public:
    enum class State {
        Idle,
        Loading,
        Playing
    };

    using StateCallback = std::function<void(State state, const std::string& messageId)>;
    using ErrorCallback = std::function<void(ErrorKind kind, const std::string& message)>;

    explicit Player(std::shared_ptr<IPlaybackDevice> device);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    void Play(const std::string& messageId, const std::string& sourceLocation, unsigned int durationHint);
    void Stop();

    // Stops the message if it is the one playing, plays it otherwise
    void Toggle(const std::string& messageId, const std::string& sourceLocation, unsigned int durationHint);

    // Seeks the active message; no-op when nothing plays
    void Seek(unsigned int positionSeconds);
    // No-op unless messageId is the active message
    void Seek(const std::string& messageId, unsigned int positionSeconds);

    VoiceMessageView ViewFor(const std::string& messageId, const std::string& sourceLocation,
                             unsigned int durationHint);

    // Called when the owning screen goes away
    void Teardown();

    State GetState() const;
    std::optional<std::string> GetCurrentlyPlayingId() const;
    unsigned int GetPosition() const;
    unsigned int GetDuration() const;

    void SetStateCallback(StateCallback callback);
    void SetErrorCallback(ErrorCallback callback);

private:
    // Shared with every status callback handed to the device. Teardown
    // clears `alive` under the mutex, so once it returns no callback is
    // running OnStatus and none will.
    struct CallbackGuard {
        std::recursive_mutex mutex;
        bool alive = true;
    };

    void OnStatus(uint64_t generation, const PlaybackStatus& status);
    void ReleaseSession(const PlaybackSession& session);
    void NotifyState(State state, const std::string& messageId);
    void ReportError(ErrorKind kind, const std::string& message);

    std::shared_ptr<IPlaybackDevice> _device;
    std::shared_ptr<CallbackGuard> _callback_guard;

    std::unique_ptr<PlaybackSession> _session;
    State _state;
    uint64_t _generation;
    bool _torn_down;

    StateCallback _state_callback;
    ErrorCallback _error_callback;
    mutable std::mutex _mutex;
};

const char* ToString(Player::State state);

} // namespace voicenote
