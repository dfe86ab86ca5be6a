#include "WavWorker.hpp"
#include "../common/debug_log.hpp"

#include <sndfile.h>

namespace voicenote {

bool WavWorker::Save() {
    if (!_setter_called) {
        throw SavingWorkerException("Sample rate must be specified");
    }
    if (_audioData.empty()) {
        DEBUG_LOG("WavWorker: no audio data to save" << DEBUG_LOG_ENDL);
        return false;
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(_sampleRate);
    sfinfo.channels = 1;
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* outfile = sf_open(_filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        ERROR_LOG("WavWorker: could not open output file " << _filename << ": " << sf_strerror(nullptr));
        return false;
    }

    sf_count_t framesWritten = sf_write_short(outfile, _audioData.data(), static_cast<sf_count_t>(_audioData.size()));
    sf_close(outfile);

    if (framesWritten != static_cast<sf_count_t>(_audioData.size())) {
        ERROR_LOG("WavWorker: wrote " << framesWritten << " samples, expected " << _audioData.size());
        return false;
    }

    DEBUG_LOG("WavWorker: saved " << _audioData.size() << " samples to " << _filename << DEBUG_LOG_ENDL);
    return true;
}

bool WavWorker::Load() {
    SF_INFO sfinfo{};
    SNDFILE* infile = sf_open(_filename.c_str(), SFM_READ, &sfinfo);
    if (!infile) {
        ERROR_LOG("WavWorker: could not open input file " << _filename << ": " << sf_strerror(nullptr));
        return false;
    }

    if (sfinfo.channels < 1 || sfinfo.frames < 0) {
        sf_close(infile);
        ERROR_LOG("WavWorker: unsupported layout in " << _filename);
        return false;
    }

    const size_t channels = static_cast<size_t>(sfinfo.channels);
    std::vector<int16_t> interleaved(static_cast<size_t>(sfinfo.frames) * channels);
    sf_count_t framesRead = sf_readf_short(infile, interleaved.data(), sfinfo.frames);
    sf_close(infile);

    if (framesRead < 0) {
        ERROR_LOG("WavWorker: read failed for " << _filename);
        return false;
    }

    std::vector<int16_t> mono(static_cast<size_t>(framesRead));
    for (size_t frame = 0; frame < mono.size(); ++frame) {
        int sum = 0;
        for (size_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * channels + ch];
        }
        mono[frame] = static_cast<int16_t>(sum / static_cast<int>(channels));
    }

    SetSampleRate(static_cast<unsigned int>(sfinfo.samplerate));
    SetAudioData(std::move(mono));

    DEBUG_LOG("WavWorker: loaded " << _audioData.size() << " samples from " << _filename << DEBUG_LOG_ENDL);
    return true;
}

} // namespace voicenote
