#include "SavingWorkers/WavWorker.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace voicenote;

namespace {

std::vector<int16_t> Tone(size_t samples) {
    std::vector<int16_t> data(samples);
    for (size_t i = 0; i < samples; ++i) {
        data[i] = static_cast<int16_t>(8000.0 * std::sin(2.0 * M_PI * 440.0 * i / 16000.0));
    }
    return data;
}

} // namespace

TEST(WavWorkerTest, SaveWithoutSampleRateThrows) {
    WavWorker worker(::testing::TempDir() + "no-rate.wav");
    worker.SetAudioData(Tone(100));
    EXPECT_THROW(worker.Save(), SavingWorkerException);
}

TEST(WavWorkerTest, SaveWithoutAudioReturnsFalse) {
    WavWorker worker(::testing::TempDir() + "no-audio.wav");
    worker.SetSampleRate(16000);
    EXPECT_FALSE(worker.Save());
}

TEST(WavWorkerTest, SavedFileLoadsBack) {
    test_utils::TempFile file("wavworker-tone.wav");
    std::vector<int16_t> tone = Tone(16000);

    WavWorker writer(file.Path());
    writer.SetSampleRate(16000);
    writer.SetAudioData(tone);
    ASSERT_TRUE(writer.Save());

    WavWorker reader(file.Path());
    ASSERT_TRUE(reader.Load());
    EXPECT_EQ(reader.GetSampleRate(), 16000u);
    EXPECT_EQ(reader.GetAudioData(), tone);
}

TEST(WavWorkerTest, LoadMissingFileReturnsFalse) {
    WavWorker worker("/nonexistent/dir/missing.wav");
    EXPECT_FALSE(worker.Load());
}
