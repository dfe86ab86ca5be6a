#pragma once

#include "ISavingWorker.hpp"

#include <string>

namespace voicenote {

// 16-bit PCM mono WAV files through libsndfile
class WavWorker : public ISavingWorker {
public:
    explicit WavWorker(std::string filename) : _filename(std::move(filename)) {}

    bool Save() override;

    // Reads the file, downmixing to mono. Sets the sample rate and audio data.
    bool Load();

    const std::string& GetFilename() const { return _filename; }

private:
    std::string _filename;
};

} // namespace voicenote
