#include "Player/Player.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

using namespace voicenote;
using test_utils::FakePlaybackDevice;

class PlayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_shared<FakePlaybackDevice>();
        player = std::make_unique<Player>(device);
        player->SetStateCallback([this](Player::State state, const std::string& messageId) {
            transitions.emplace_back(state, messageId);
        });
        player->SetErrorCallback([this](ErrorKind kind, const std::string&) {
            errors.push_back(kind);
        });
    }

    // Callbacks write into the vectors below, so the manager goes first
    void TearDown() override { player.reset(); }

    std::shared_ptr<FakePlaybackDevice> device;
    std::unique_ptr<Player> player;
    std::vector<std::pair<Player::State, std::string>> transitions;
    std::vector<ErrorKind> errors;
};

TEST_F(PlayerTest, PlayStartsMessage) {
    player->Play("A", "https://cdn.example.com/a.m4a", 12);

    EXPECT_EQ(player->GetState(), Player::State::Playing);
    ASSERT_TRUE(player->GetCurrentlyPlayingId().has_value());
    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "A");
    EXPECT_EQ(player->GetDuration(), 12u);
    EXPECT_EQ(player->GetPosition(), 0u);
    EXPECT_EQ(device->LoadedCount(), 1u);
    EXPECT_EQ(device->playing.count(device->lastHandle), 1u);
}

TEST_F(PlayerTest, ToggleSwitchesBetweenMessages) {
    player->Toggle("A", "a.m4a", 5);
    PlaybackHandle handleA = device->lastHandle;

    player->Toggle("B", "b.m4a", 8);
    PlaybackHandle handleB = device->lastHandle;

    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "B");
    EXPECT_EQ(device->LoadedCount(), 1u);
    EXPECT_EQ(device->loaded.count(handleA), 0u);
    EXPECT_EQ(device->loaded.count(handleB), 1u);

    player->Toggle("B", "b.m4a", 8);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_FALSE(player->GetCurrentlyPlayingId().has_value());
    EXPECT_EQ(device->LoadedCount(), 0u);
    ASSERT_EQ(device->unloaded.size(), 2u);
    EXPECT_EQ(device->unloaded[0], handleA);
    EXPECT_EQ(device->unloaded[1], handleB);
}

TEST_F(PlayerTest, PlayOnActiveMessageRestartsIt) {
    player->Play("A", "a.m4a", 5);
    PlaybackHandle first = device->lastHandle;
    device->EmitStatus(first, 3.4, 5.0);
    EXPECT_EQ(player->GetPosition(), 3u);

    player->Play("A", "a.m4a", 5);

    EXPECT_NE(device->lastHandle, first);
    EXPECT_EQ(device->LoadedCount(), 1u);
    EXPECT_EQ(player->GetPosition(), 0u);
    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "A");
}

TEST_F(PlayerTest, StateCallbackReportsTransitions) {
    player->Play("A", "a.m4a", 5);
    player->Play("B", "b.m4a", 5);
    player->Stop();

    ASSERT_EQ(transitions.size(), 4u);
    EXPECT_EQ(transitions[0], std::make_pair(Player::State::Playing, std::string("A")));
    EXPECT_EQ(transitions[1], std::make_pair(Player::State::Idle, std::string("A")));
    EXPECT_EQ(transitions[2], std::make_pair(Player::State::Playing, std::string("B")));
    EXPECT_EQ(transitions[3], std::make_pair(Player::State::Idle, std::string("B")));
}

TEST_F(PlayerTest, SeekOnInactiveMessageIsIgnored) {
    player->Play("A", "a.m4a", 30);

    player->Seek("B", 10);

    EXPECT_TRUE(device->seeks.empty());
    EXPECT_EQ(player->GetPosition(), 0u);
    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "A");
}

TEST_F(PlayerTest, SeekWithNothingPlayingIsIgnored) {
    EXPECT_NO_THROW(player->Seek(10));
    EXPECT_NO_THROW(player->Seek("A", 10));
    EXPECT_TRUE(device->seeks.empty());
}

TEST_F(PlayerTest, SeekUpdatesPositionBeforeDeviceReports) {
    player->Play("A", "a.m4a", 30);

    player->Seek("A", 15);

    EXPECT_EQ(player->GetPosition(), 15u);
    ASSERT_EQ(device->seeks.size(), 1u);
    EXPECT_EQ(device->seeks[0].first, device->lastHandle);
    EXPECT_DOUBLE_EQ(device->seeks[0].second, 15.0);

    device->EmitStatus(device->lastHandle, 15.7, 30.0);
    EXPECT_EQ(player->GetPosition(), 15u);
}

TEST_F(PlayerTest, StatusIsFlooredToWholeSeconds) {
    player->Play("A", "a.m4a", 0);

    device->EmitStatus(device->lastHandle, 2.99, 9.6);

    EXPECT_EQ(player->GetPosition(), 2u);
    EXPECT_EQ(player->GetDuration(), 9u);
}

TEST_F(PlayerTest, DeviceDurationReplacesHint) {
    player->Play("A", "a.m4a", 40);
    EXPECT_EQ(player->GetDuration(), 40u);

    device->EmitStatus(device->lastHandle, 0.0, 0.0);
    EXPECT_EQ(player->GetDuration(), 40u);

    device->EmitStatus(device->lastHandle, 1.0, 37.2);
    EXPECT_EQ(player->GetDuration(), 37u);
}

TEST_F(PlayerTest, CompletionReturnsToIdle) {
    player->Play("A", "a.m4a", 5);
    PlaybackHandle handle = device->lastHandle;

    device->EmitStatus(handle, 5.0, 5.0, true);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_FALSE(player->GetCurrentlyPlayingId().has_value());
    EXPECT_EQ(device->LoadedCount(), 0u);
    EXPECT_EQ(transitions.back(), std::make_pair(Player::State::Idle, std::string("A")));

    VoiceMessageView view = player->ViewFor("A", "a.m4a", 5);
    EXPECT_FALSE(view.isPlaying);
    EXPECT_EQ(view.positionSeconds, 0u);
    EXPECT_EQ(view.durationSeconds, 5u);
}

TEST_F(PlayerTest, ViewReflectsActiveMessage) {
    player->Play("A", "a.m4a", 20);
    device->EmitStatus(device->lastHandle, 4.2, 21.0);

    VoiceMessageView active = player->ViewFor("A", "a.m4a", 20);
    VoiceMessageView other = player->ViewFor("B", "b.m4a", 9);

    EXPECT_TRUE(active.isPlaying);
    EXPECT_EQ(active.positionSeconds, 4u);
    EXPECT_EQ(active.durationSeconds, 21u);
    EXPECT_FALSE(other.isPlaying);
    EXPECT_EQ(other.positionSeconds, 0u);
    EXPECT_EQ(other.durationSeconds, 9u);
}

TEST_F(PlayerTest, ViewActionsDriveThePlayer) {
    VoiceMessageView view = player->ViewFor("A", "a.m4a", 20);

    view.onPlayPause();
    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "A");

    view.onSeek(7);
    EXPECT_EQ(player->GetPosition(), 7u);

    VoiceMessageView other = player->ViewFor("B", "b.m4a", 9);
    other.onSeek(3);
    EXPECT_EQ(player->GetPosition(), 7u);

    view.onPlayPause();
    EXPECT_EQ(player->GetState(), Player::State::Idle);
}

TEST_F(PlayerTest, LoadFailureLeavesPlayerIdle) {
    device->failingLocations.insert("broken.m4a");

    player->Play("A", "broken.m4a", 5);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_FALSE(player->GetCurrentlyPlayingId().has_value());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::DeviceInitFailure);
}

TEST_F(PlayerTest, LoadFailureStillStopsPreviousMessage) {
    player->Play("A", "a.m4a", 5);
    device->failingLocations.insert("broken.m4a");

    player->Play("B", "broken.m4a", 5);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_EQ(device->LoadedCount(), 0u);
}

TEST_F(PlayerTest, StopDuringLoadLeavesNothingLoaded) {
    device->onLoad = [this]() { player->Stop(); };

    player->Play("A", "a.m4a", 5);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_FALSE(player->GetCurrentlyPlayingId().has_value());
    EXPECT_EQ(device->LoadedCount(), 0u);
    EXPECT_TRUE(device->playing.empty());
}

TEST_F(PlayerTest, StaleStatusCallbackIsIgnored) {
    player->Play("A", "a.m4a", 5);
    auto staleCallback = device->CallbackFor(device->lastHandle);
    ASSERT_TRUE(staleCallback);

    player->Play("B", "b.m4a", 30);

    PlaybackStatus status;
    status.positionSeconds = 4.0;
    status.durationSeconds = 5.0;
    status.didJustFinish = true;
    staleCallback(status);

    EXPECT_EQ(player->GetState(), Player::State::Playing);
    EXPECT_EQ(*player->GetCurrentlyPlayingId(), "B");
    EXPECT_EQ(player->GetPosition(), 0u);
    EXPECT_EQ(player->GetDuration(), 30u);
}

TEST_F(PlayerTest, CompletionDuringPlayIsNotLost) {
    device->onPlay = [this](PlaybackHandle handle) {
        std::thread deviceThread([this, handle]() { device->EmitStatus(handle, 0.05, 0.05, true); });
        deviceThread.join();
    };

    player->Play("A", "short.wav", 1);

    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_FALSE(player->GetCurrentlyPlayingId().has_value());
    EXPECT_EQ(device->LoadedCount(), 0u);
    ASSERT_FALSE(transitions.empty());
    EXPECT_EQ(transitions.back(), std::make_pair(Player::State::Idle, std::string("A")));
}

TEST_F(PlayerTest, StatusAfterDestructionIsIgnored) {
    player->Play("A", "a.m4a", 5);
    // The device may still hold a copy of the callback when the player goes away
    auto pendingCallback = device->CallbackFor(device->lastHandle);
    ASSERT_TRUE(pendingCallback);
    const size_t transitionCount = transitions.size();

    player.reset();

    PlaybackStatus status;
    status.positionSeconds = 5.0;
    status.durationSeconds = 5.0;
    status.didJustFinish = true;
    EXPECT_NO_THROW(pendingCallback(status));
    EXPECT_EQ(transitions.size(), transitionCount + 1);
}

TEST_F(PlayerTest, StatusAfterTeardownIsIgnored) {
    player->Play("A", "a.m4a", 5);
    auto pendingCallback = device->CallbackFor(device->lastHandle);
    ASSERT_TRUE(pendingCallback);

    player->Teardown();

    PlaybackStatus status;
    status.positionSeconds = 3.0;
    status.durationSeconds = 5.0;
    pendingCallback(status);
    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_EQ(player->GetPosition(), 0u);
}

TEST_F(PlayerTest, StopIsIdempotent) {
    player->Play("A", "a.m4a", 5);

    player->Stop();
    EXPECT_NO_THROW(player->Stop());

    EXPECT_EQ(device->unloaded.size(), 1u);
    EXPECT_EQ(transitions.size(), 2u);
}

TEST_F(PlayerTest, TeardownUnloadsAndRejectsPlay) {
    player->Play("A", "a.m4a", 5);

    player->Teardown();

    EXPECT_EQ(device->LoadedCount(), 0u);
    player->Play("B", "b.m4a", 5);
    EXPECT_EQ(player->GetState(), Player::State::Idle);
    EXPECT_EQ(device->LoadedCount(), 0u);
}

TEST_F(PlayerTest, DestructorUnloadsActiveMessage) {
    player->Play("A", "a.m4a", 5);
    player.reset();
    EXPECT_EQ(device->LoadedCount(), 0u);
}
