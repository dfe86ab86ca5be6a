#pragma once

#include "../Devices/IPlaybackDevice.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace voicenote {

// Owned by the Player while a message is playing
struct PlaybackSession {
    std::string messageId;
    PlaybackHandle handle = 0;
    unsigned int positionSeconds = 0;
    unsigned int durationSeconds = 0;
    uint64_t generation = 0;
};

// What a chat bubble needs to render one voice message. The bound actions
// capture the Player, which must outlive the view.
struct VoiceMessageView {
    bool isPlaying = false;
    unsigned int positionSeconds = 0;
    unsigned int durationSeconds = 0;
    std::function<void()> onPlayPause;
    std::function<void(unsigned int positionSeconds)> onSeek;
};

} // namespace voicenote
