#include "NoiseSuppressor.hpp"
#include "../common/VoiceErrors.hpp"

#include <rnnoise.h>

#include <algorithm>
#include <cmath>

namespace voicenote {

namespace {

constexpr unsigned int kDenoiseRate = 48000;
constexpr size_t kFrameSize = 480;

} // namespace

void DenoiseDeleter::operator()(DenoiseState* ptr) const noexcept {
    if (ptr) {
        rnnoise_destroy(ptr);
    }
}

NoiseSuppressor::NoiseSuppressor()
    : _denoiseState(rnnoise_create(nullptr)) {
    if (!_denoiseState) {
        throw DeviceError("rnnoise_create failed");
    }
}

NoiseSuppressor::~NoiseSuppressor() = default;

std::vector<float> NoiseSuppressor::Resample(const std::vector<float>& input,
                                             unsigned int inputRate, unsigned int outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    const size_t outputSamples = static_cast<size_t>(std::round(input.size() * ratio));
    std::vector<float> output(outputSamples);

    for (size_t i = 0; i < outputSamples; ++i) {
        const double src = i / ratio;
        const size_t i0 = std::min(static_cast<size_t>(src), input.size() - 1);
        const size_t i1 = std::min(i0 + 1, input.size() - 1);
        const double t = src - static_cast<double>(i0);
        output[i] = static_cast<float>(input[i0] * (1.0 - t) + input[i1] * t);
    }
    return output;
}

std::vector<int16_t> NoiseSuppressor::Process(const std::vector<int16_t>& samples, unsigned int sampleRate) {
    if (samples.empty()) {
        return {};
    }

    // rnnoise expects float samples in the int16 range
    std::vector<float> signal(samples.begin(), samples.end());
    signal = Resample(signal, sampleRate, kDenoiseRate);

    const size_t originalLength = signal.size();
    signal.resize(((originalLength + kFrameSize - 1) / kFrameSize) * kFrameSize, 0.0f);

    for (size_t offset = 0; offset < signal.size(); offset += kFrameSize) {
        float* frame = signal.data() + offset;
        rnnoise_process_frame(_denoiseState.get(), frame, frame);
    }
    signal.resize(originalLength);

    signal = Resample(signal, kDenoiseRate, sampleRate);

    std::vector<int16_t> result(signal.size());
    std::transform(signal.begin(), signal.end(), result.begin(), [](float v) {
        return static_cast<int16_t>(std::max(-32768.0f, std::min(32767.0f, std::round(v))));
    });
    return result;
}

} // namespace voicenote
