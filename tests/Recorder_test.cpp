#include "Recorder/Recorder.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

using namespace std::chrono_literals;
using namespace voicenote;
using test_utils::FakeCaptureDevice;
using test_utils::ManualClock;
using test_utils::WaitFor;

class RecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_shared<FakeCaptureDevice>();
        clock = std::make_shared<ManualClock>();

        RecorderOptions options;
        options.tickInterval = 5ms;
        recorder = std::make_unique<Recorder>(device, clock, options);
        recorder->SetErrorCallback([this](ErrorKind kind, const std::string&) {
            errors.push_back(kind);
        });
    }

    // Callbacks write into the vectors below, so the manager goes first
    void TearDown() override { recorder.reset(); }

    std::shared_ptr<FakeCaptureDevice> device;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<Recorder> recorder;
    std::vector<ErrorKind> errors;
};

TEST_F(RecorderTest, StartOpensSingleSession) {
    ASSERT_TRUE(recorder->Start());

    EXPECT_TRUE(recorder->IsRecording());
    EXPECT_EQ(recorder->GetState(), Recorder::State::Recording);
    EXPECT_EQ(device->OpenCount(), 1u);
    EXPECT_EQ(device->permissionRequests, 1);
}

TEST_F(RecorderTest, StartWhileRecordingReleasesPreviousHandle) {
    ASSERT_TRUE(recorder->Start());
    CaptureHandle first = *device->openHandles.begin();

    ASSERT_TRUE(recorder->Start());

    EXPECT_EQ(device->OpenCount(), 1u);
    ASSERT_EQ(device->discarded.size(), 1u);
    EXPECT_EQ(device->discarded[0], first);
    EXPECT_EQ(device->openHandles.count(first), 0u);
    EXPECT_TRUE(recorder->IsRecording());
}

TEST_F(RecorderTest, StopWithoutSessionReturnsNothing) {
    std::optional<RecordingResult> result;
    EXPECT_NO_THROW(result = recorder->Stop());
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
}

TEST_F(RecorderTest, StopReportsElapsedWallClockSeconds) {
    ASSERT_TRUE(recorder->Start());
    clock->Advance(7400ms);

    auto result = recorder->Stop();

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(static_cast<int>(result->durationSeconds), 7, 1);
    EXPECT_FALSE(result->autoStopped);
    EXPECT_FALSE(result->location.empty());
    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    EXPECT_EQ(device->finalizeCount, 1);
}

TEST_F(RecorderTest, ShortRecordingMeasuresRealTime) {
    auto realRecorder = std::make_unique<Recorder>(device, MakeSteadyClock());
    ASSERT_TRUE(realRecorder->Start());
    std::this_thread::sleep_for(1100ms);

    auto result = realRecorder->Stop();

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(static_cast<int>(result->durationSeconds), 1, 1);
}

// Reaching the limit only raises the flag; the session keeps recording
// until the caller stops it.
TEST_F(RecorderTest, MaxDurationFlagsButDoesNotTerminate) {
    ASSERT_TRUE(recorder->Start());
    clock->Advance(std::chrono::seconds(Recorder::MAX_DURATION_SECONDS + 1));

    ASSERT_TRUE(WaitFor([this]() { return recorder->IsAutoStopped(); }));
    std::this_thread::sleep_for(50ms);

    EXPECT_TRUE(recorder->IsRecording());
    EXPECT_EQ(device->OpenCount(), 1u);
    EXPECT_EQ(device->finalizeCount, 0);

    auto result = recorder->Stop();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->autoStopped);
    EXPECT_EQ(result->durationSeconds, Recorder::MAX_DURATION_SECONDS + 1);
}

TEST_F(RecorderTest, BelowLimitIsNotAutoStopped) {
    ASSERT_TRUE(recorder->Start());
    clock->Advance(119s);

    ASSERT_TRUE(WaitFor([this]() { return recorder->GetElapsedSeconds() == 119; }));
    EXPECT_FALSE(recorder->IsAutoStopped());
}

TEST_F(RecorderTest, DurationCallbackSeesTicks) {
    std::atomic<unsigned int> lastElapsed{0};
    std::atomic<bool> sawAutoStop{false};
    recorder->SetDurationCallback([&](unsigned int elapsed, bool autoStopped) {
        lastElapsed = elapsed;
        if (autoStopped) {
            sawAutoStop = true;
        }
    });

    ASSERT_TRUE(recorder->Start());
    clock->Advance(3s);
    EXPECT_TRUE(WaitFor([&]() { return lastElapsed.load() == 3; }));
    EXPECT_FALSE(sawAutoStop.load());

    clock->Advance(120s);
    EXPECT_TRUE(WaitFor([&]() { return sawAutoStop.load(); }));
    recorder->Cancel();
}

TEST_F(RecorderTest, CallerCanStopFromDurationCallback) {
    std::promise<std::optional<RecordingResult>> stopped;
    auto stoppedFuture = stopped.get_future();
    std::atomic<bool> once{false};

    recorder->SetDurationCallback([&](unsigned int, bool autoStopped) {
        if (autoStopped && !once.exchange(true)) {
            stopped.set_value(recorder->Stop());
        }
    });

    ASSERT_TRUE(recorder->Start());
    clock->Advance(125s);

    ASSERT_EQ(stoppedFuture.wait_for(2s), std::future_status::ready);
    auto result = stoppedFuture.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->autoStopped);
    EXPECT_FALSE(recorder->IsRecording());
}

TEST_F(RecorderTest, PermissionDeniedCreatesNoSession) {
    device->permissionGranted = false;

    EXPECT_FALSE(recorder->Start());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::PermissionDenied);
}

TEST_F(RecorderTest, DeviceInitFailureReturnsToIdle) {
    device->failOpen = true;

    EXPECT_FALSE(recorder->Start());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::DeviceInitFailure);
}

TEST_F(RecorderTest, FinalizeFailureResetsToIdle) {
    device->failFinalize = true;
    ASSERT_TRUE(recorder->Start());

    EXPECT_FALSE(recorder->Stop().has_value());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    EXPECT_FALSE(recorder->Stop().has_value());
}

TEST_F(RecorderTest, MissingFileIsReportedAsIOFailure) {
    device->emptyLocation = true;
    ASSERT_TRUE(recorder->Start());

    EXPECT_FALSE(recorder->Stop().has_value());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::IOFailure);
}

TEST_F(RecorderTest, CancelDiscardsAndIsIdempotent) {
    ASSERT_TRUE(recorder->Start());

    recorder->Cancel();
    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    EXPECT_EQ(device->discarded.size(), 1u);
    EXPECT_EQ(device->finalizeCount, 0);

    EXPECT_NO_THROW(recorder->Cancel());
    EXPECT_EQ(device->discarded.size(), 1u);
    EXPECT_FALSE(recorder->Stop().has_value());
}

TEST_F(RecorderTest, CancelDuringStartLeavesNoHandle) {
    device->onOpen = [this]() { recorder->Cancel(); };

    EXPECT_FALSE(recorder->Start());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    EXPECT_EQ(device->discarded.size(), 1u);
}

TEST_F(RecorderTest, CancelDuringPermissionRequestLeavesNoHandle) {
    device->onPermission = [this]() { recorder->Cancel(); };

    EXPECT_FALSE(recorder->Start());

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
}

TEST_F(RecorderTest, ConcurrentStartsKeepOneSession) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this]() { recorder->Start(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_TRUE(recorder->IsRecording());
    EXPECT_EQ(device->OpenCount(), 1u);

    recorder->Cancel();
    EXPECT_EQ(device->OpenCount(), 0u);
}

TEST_F(RecorderTest, TeardownReleasesSessionAndRejectsStart) {
    ASSERT_TRUE(recorder->Start());

    recorder->Teardown();

    EXPECT_EQ(recorder->GetState(), Recorder::State::Idle);
    EXPECT_EQ(device->OpenCount(), 0u);
    EXPECT_FALSE(recorder->Start());
    EXPECT_EQ(device->OpenCount(), 0u);
}

TEST_F(RecorderTest, DestructorReleasesSession) {
    ASSERT_TRUE(recorder->Start());
    recorder.reset();
    EXPECT_EQ(device->OpenCount(), 0u);
}
