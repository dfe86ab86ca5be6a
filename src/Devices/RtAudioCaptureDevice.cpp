#include "RtAudioCaptureDevice.hpp"
#include "NoiseSuppressor.hpp"
#include "../SavingWorkers/WavWorker.hpp"
#include "../common/VoiceErrors.hpp"
#include "../common/debug_log.hpp"

#include <chrono>

namespace voicenote {

namespace {

int capture(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
            double streamTime, RtAudioStreamStatus status, void* userData)
{
    CaptureData* data = static_cast<CaptureData*>(userData);

    if (status) {
        DEBUG_LOG("RtAudioCaptureDevice: stream overflow detected" << DEBUG_LOG_ENDL);
    }

    if (data->isRecording && inputBuffer) {
        const int16_t* inputSamples = static_cast<const int16_t*>(inputBuffer);
        std::lock_guard<std::mutex> lock(data->mutex);
        data->audioData.insert(data->audioData.end(), inputSamples, inputSamples + nBufferFrames);
    }

    return 0;
}

} // namespace

RtAudioCaptureDevice::RtAudioCaptureDevice(CaptureOptions options)
    : _options(std::move(options))
    , _audio(RtAudio::UNSPECIFIED, [](RtAudioErrorType type, const std::string& text) {
          ERROR_LOG("RtAudio: " << text);
      })
    , _has_input_device(false)
    , _active_handle(0)
    , _next_handle(1) {
    _capture_data.sampleRate = _options.sampleRate;
    if (_options.denoise) {
        _suppressor = std::make_unique<NoiseSuppressor>();
    }
}

RtAudioCaptureDevice::~RtAudioCaptureDevice() {
    std::lock_guard<std::mutex> lock(_device_mutex);
    CloseStream();
}

bool RtAudioCaptureDevice::SelectInputDevice() {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        WARN_LOG("RtAudioCaptureDevice: no audio devices found");
        return false;
    }

    unsigned int deviceId = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(deviceId);

    if (info.inputChannels < 1) {
        DEBUG_LOG("RtAudioCaptureDevice: default device has no input channels, searching..." << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio.getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                deviceId = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        WARN_LOG("RtAudioCaptureDevice: no input devices found");
        return false;
    }

    bool rateSupported = false;
    for (unsigned int sr : info.sampleRates) {
        if (sr == _options.sampleRate) {
            rateSupported = true;
            break;
        }
    }
    if (!rateSupported && info.preferredSampleRate > 0) {
        DEBUG_LOG("RtAudioCaptureDevice: " << _options.sampleRate << " not supported, using "
                  << info.preferredSampleRate << DEBUG_LOG_ENDL);
        _capture_data.sampleRate = info.preferredSampleRate;
    }

    _parameters.deviceId = deviceId;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;

    DEBUG_LOG("RtAudioCaptureDevice: using input device " << info.name << DEBUG_LOG_ENDL);
    return true;
}

bool RtAudioCaptureDevice::RequestPermission() {
    std::lock_guard<std::mutex> lock(_device_mutex);
    // No permission prompt on the desktop: access is granted when a
    // microphone is present
    if (!_has_input_device) {
        _has_input_device = SelectInputDevice();
    }
    return _has_input_device;
}

void RtAudioCaptureDevice::OpenStream() {
    unsigned int bufferFrames = 256;

    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16, _capture_data.sampleRate,
                          &bufferFrames, &capture, &_capture_data) == RTAUDIO_NO_ERROR) {
        return;
    }

    const unsigned int fallbacks[] = {48000, 44100};
    for (unsigned int rate : fallbacks) {
        if (rate == _capture_data.sampleRate) {
            continue;
        }
        DEBUG_LOG("RtAudioCaptureDevice: retrying with sample rate " << rate << DEBUG_LOG_ENDL);
        if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16, rate,
                              &bufferFrames, &capture, &_capture_data) == RTAUDIO_NO_ERROR) {
            _capture_data.sampleRate = rate;
            return;
        }
    }

    throw DeviceError("Error opening capture stream: " + _audio.getErrorText());
}

void RtAudioCaptureDevice::CloseStream() {
    _capture_data.isRecording = false;
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
    _active_handle = 0;
}

CaptureHandle RtAudioCaptureDevice::OpenSession() {
    std::lock_guard<std::mutex> lock(_device_mutex);

    if (!_has_input_device && !(_has_input_device = SelectInputDevice())) {
        throw DeviceError("No input device available");
    }
    if (_active_handle != 0) {
        throw DeviceError("A capture session is already open");
    }

    {
        std::lock_guard<std::mutex> dataLock(_capture_data.mutex);
        _capture_data.audioData.clear();
    }

    OpenStream();

    _capture_data.isRecording = true;
    if (_audio.startStream() != RTAUDIO_NO_ERROR) {
        std::string error = _audio.getErrorText();
        CloseStream();
        throw DeviceError("Error starting capture stream: " + error);
    }

    _active_handle = _next_handle++;
    DEBUG_LOG("RtAudioCaptureDevice: session " << _active_handle << " started at "
              << _capture_data.sampleRate << " Hz" << DEBUG_LOG_ENDL);
    return _active_handle;
}

std::string RtAudioCaptureDevice::MakeOutputPath(CaptureHandle handle) const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string dir = _options.outputDir.empty() ? "." : _options.outputDir;
    if (dir.back() != '/') {
        dir += '/';
    }
    return dir + "voice-" + std::to_string(millis) + "-" + std::to_string(handle) + ".wav";
}

std::string RtAudioCaptureDevice::Finalize(CaptureHandle handle) {
    std::vector<int16_t> samples;
    unsigned int sampleRate;
    {
        std::lock_guard<std::mutex> lock(_device_mutex);
        if (handle == 0 || handle != _active_handle) {
            throw DeviceError("Unknown capture handle " + std::to_string(handle));
        }
        CloseStream();

        std::lock_guard<std::mutex> dataLock(_capture_data.mutex);
        samples.swap(_capture_data.audioData);
        sampleRate = _capture_data.sampleRate;
    }

    DEBUG_LOG("RtAudioCaptureDevice: recorded " << samples.size() << " samples" << DEBUG_LOG_ENDL);
    if (samples.empty()) {
        throw IOFailure("No audio data was recorded");
    }

    if (_suppressor) {
        samples = _suppressor->Process(samples, sampleRate);
    }

    WavWorker worker(MakeOutputPath(handle));
    worker.SetSampleRate(sampleRate);
    worker.SetAudioData(std::move(samples));
    if (!worker.Save()) {
        throw IOFailure("Could not write " + worker.GetFilename());
    }
    return worker.GetFilename();
}

void RtAudioCaptureDevice::Discard(CaptureHandle handle) {
    std::lock_guard<std::mutex> lock(_device_mutex);
    if (handle == 0 || handle != _active_handle) {
        return;
    }
    CloseStream();

    std::lock_guard<std::mutex> dataLock(_capture_data.mutex);
    _capture_data.audioData.clear();
    DEBUG_LOG("RtAudioCaptureDevice: session " << handle << " discarded" << DEBUG_LOG_ENDL);
}

} // namespace voicenote
