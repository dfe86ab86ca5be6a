#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace voicenote {

class SavingWorkerException : public std::runtime_error {
public:
    explicit SavingWorkerException(const std::string& message) : std::runtime_error(message) {}
};

// Persists a captured mono int16 buffer somewhere
class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    void SetSampleRate(unsigned int sampleRate) {
        _sampleRate = sampleRate;
        _setter_called = true;
    }

    void SetAudioData(std::vector<int16_t> audioData) { _audioData = std::move(audioData); }

    const std::vector<int16_t>& GetAudioData() const { return _audioData; }
    unsigned int GetSampleRate() const { return _sampleRate; }

    virtual bool Save() = 0;

protected:
    std::vector<int16_t> _audioData;
    unsigned int _sampleRate = 0;
    bool _setter_called = false;
};

} // namespace voicenote
