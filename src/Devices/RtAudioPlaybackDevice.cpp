#include "RtAudioPlaybackDevice.hpp"
#include "../SavingWorkers/WavWorker.hpp"
#include "../common/PathUtils.hpp"
#include "../common/VoiceErrors.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace voicenote {

namespace {

int playback(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
             double streamTime, RtAudioStreamStatus status, void* userData)
{
    PlaybackStream* stream = static_cast<PlaybackStream*>(userData);
    int16_t* out = static_cast<int16_t*>(outputBuffer);

    if (status) {
        DEBUG_LOG("RtAudioPlaybackDevice: stream underflow detected" << DEBUG_LOG_ENDL);
    }

    size_t written = 0;
    if (stream->playing && !stream->finished) {
        const size_t cursor = stream->cursor.load();
        const size_t available = cursor < stream->samples.size() ? stream->samples.size() - cursor : 0;
        written = std::min<size_t>(available, nBufferFrames);
        std::memcpy(out, stream->samples.data() + cursor, written * sizeof(int16_t));
        stream->cursor = cursor + written;
        if (stream->cursor.load() >= stream->samples.size()) {
            stream->finished = true;
        }
    }

    std::memset(out + written, 0, (nBufferFrames - written) * sizeof(int16_t));
    return 0;
}

} // namespace

RtAudioPlaybackDevice::RtAudioPlaybackDevice(std::chrono::milliseconds statusInterval)
    : _next_handle(1)
    , _status_interval(statusInterval)
    , _running(true) {
    _poller = std::make_unique<std::thread>(&RtAudioPlaybackDevice::PollStatus, this);
}

RtAudioPlaybackDevice::~RtAudioPlaybackDevice() {
    _running = false;
    if (_poller && _poller->joinable()) {
        _poller->join();
    }

    std::lock_guard<std::mutex> lock(_mutex);
    for (auto& entry : _streams) {
        RtAudio& audio = *entry.second->audio;
        if (audio.isStreamRunning()) {
            audio.stopStream();
        }
        if (audio.isStreamOpen()) {
            audio.closeStream();
        }
    }
    _streams.clear();
}

PlaybackStream& RtAudioPlaybackDevice::Find(PlaybackHandle handle) {
    auto it = _streams.find(handle);
    if (it == _streams.end()) {
        throw DeviceError("Unknown playback handle " + std::to_string(handle));
    }
    return *it->second;
}

PlaybackHandle RtAudioPlaybackDevice::Load(const std::string& location) {
    WavWorker reader(StripFileScheme(location));
    if (!reader.Load()) {
        throw DeviceError("Could not load " + location);
    }

    auto stream = std::make_unique<PlaybackStream>();
    stream->samples = reader.GetAudioData();
    stream->sampleRate = reader.GetSampleRate();
    stream->audio = std::make_unique<RtAudio>(RtAudio::UNSPECIFIED,
        [](RtAudioErrorType type, const std::string& text) { ERROR_LOG("RtAudio: " << text); });

    RtAudio& audio = *stream->audio;
    if (audio.getDeviceIds().empty()) {
        throw DeviceError("No audio devices found");
    }

    RtAudio::StreamParameters parameters;
    parameters.deviceId = audio.getDefaultOutputDevice();
    parameters.nChannels = 1;
    parameters.firstChannel = 0;

    unsigned int bufferFrames = 512;
    if (audio.openStream(&parameters, nullptr, RTAUDIO_SINT16, stream->sampleRate,
                         &bufferFrames, &playback, stream.get()) != RTAUDIO_NO_ERROR) {
        throw DeviceError("Error opening playback stream: " + audio.getErrorText());
    }

    std::lock_guard<std::mutex> lock(_mutex);
    PlaybackHandle handle = _next_handle++;
    DEBUG_LOG("RtAudioPlaybackDevice: loaded " << location << " as handle " << handle << DEBUG_LOG_ENDL);
    _streams.emplace(handle, std::move(stream));
    return handle;
}

void RtAudioPlaybackDevice::Play(PlaybackHandle handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    PlaybackStream& stream = Find(handle);

    stream.playing = true;
    if (!stream.audio->isStreamRunning() && stream.audio->startStream() != RTAUDIO_NO_ERROR) {
        stream.playing = false;
        throw DeviceError("Error starting playback stream: " + stream.audio->getErrorText());
    }
}

void RtAudioPlaybackDevice::Pause(PlaybackHandle handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    PlaybackStream& stream = Find(handle);

    stream.playing = false;
    if (stream.audio->isStreamRunning()) {
        stream.audio->stopStream();
    }
}

void RtAudioPlaybackDevice::Seek(PlaybackHandle handle, double positionSeconds) {
    std::lock_guard<std::mutex> lock(_mutex);
    PlaybackStream& stream = Find(handle);

    const double target = std::max(0.0, positionSeconds) * stream.sampleRate;
    stream.cursor = std::min(static_cast<size_t>(target), stream.samples.size());
    stream.finished = stream.cursor.load() >= stream.samples.size();
    stream.finishReported = false;
}

void RtAudioPlaybackDevice::SetStatusCallback(PlaybackHandle handle, StatusCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    Find(handle).callback = std::move(callback);
}

void RtAudioPlaybackDevice::Unload(PlaybackHandle handle) {
    std::unique_ptr<PlaybackStream> stream;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _streams.find(handle);
        if (it == _streams.end()) {
            return;
        }
        stream = std::move(it->second);
        _streams.erase(it);
    }

    stream->playing = false;
    if (stream->audio->isStreamRunning()) {
        stream->audio->stopStream();
    }
    if (stream->audio->isStreamOpen()) {
        stream->audio->closeStream();
    }
    DEBUG_LOG("RtAudioPlaybackDevice: unloaded handle " << handle << DEBUG_LOG_ENDL);
}

void RtAudioPlaybackDevice::PollStatus() {
    while (_running) {
        std::this_thread::sleep_for(_status_interval);

        std::vector<std::pair<StatusCallback, PlaybackStatus>> pending;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (auto& entry : _streams) {
                PlaybackStream& stream = *entry.second;
                if (!stream.callback || stream.sampleRate == 0) {
                    continue;
                }

                const bool justFinished = stream.finished && !stream.finishReported;
                if (!stream.playing && !justFinished) {
                    continue;
                }
                if (stream.finished && stream.finishReported) {
                    continue;
                }

                PlaybackStatus status;
                status.positionSeconds = static_cast<double>(stream.cursor.load()) / stream.sampleRate;
                status.durationSeconds = static_cast<double>(stream.samples.size()) / stream.sampleRate;
                status.didJustFinish = justFinished;
                if (justFinished) {
                    stream.finishReported = true;
                }
                pending.emplace_back(stream.callback, status);
            }
        }

        // Callbacks may unload handles, so they run without the lock held
        for (auto& item : pending) {
            item.first(item.second);
        }
    }
}

} // namespace voicenote
