#pragma once

#include <cstdint>
#include <memory>
#include <vector>

struct DenoiseState;

namespace voicenote {

struct DenoiseDeleter {
    void operator()(DenoiseState* ptr) const noexcept;
};

// rnnoise over a whole recording. rnnoise works on 480-sample frames at
// 48 kHz, so other rates are resampled on the way in and out.
class NoiseSuppressor {
public:
    NoiseSuppressor();
    ~NoiseSuppressor();

    std::vector<int16_t> Process(const std::vector<int16_t>& samples, unsigned int sampleRate);

private:
    static std::vector<float> Resample(const std::vector<float>& input,
                                       unsigned int inputRate, unsigned int outputRate);

    std::unique_ptr<DenoiseState, DenoiseDeleter> _denoiseState;
};

} // namespace voicenote
