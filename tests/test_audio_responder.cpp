#include <gtest/gtest.h>

#include "device_setups/actuator.hpp"
#include "fakes.hpp"
#include "voice/audio_responder.hpp"

using Voice::AudioResponder;

namespace {

class AudioResponderTest : public ::testing::Test {
protected:
    AudioResponderTest() : actuator(bus) {
        categories["A"] = { "/assets/a.wav", 0 };
        categories["B"] = { "", 2 };
        categories["C"] = { "", 0 };
        categories["D"] = { "/assets/d.wav", 4 };
        assets.volume = 70;
        assets.events[Voice::EVENT_NETWORK_ERROR] = "/assets/network_error.wav";
        assets.events[Voice::EVENT_PHOTO_ACK] = "/assets/photo_ack.wav";
    }

    FakeBus bus;
    FakePlayer player;
    Echo::Actuator actuator;
    CategoryMapping categories;
    AudioAssetConfig assets;
};

} // namespace

TEST_F(AudioResponderTest, AssetIsPlayedWithoutTouchingPeripheral) {
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceCategory("A");

    EXPECT_TRUE(res.success);
    ASSERT_EQ(player.played.size(), 1u);
    EXPECT_EQ(player.played[0], "/assets/a.wav");
    EXPECT_EQ(player.lastVolume, 70);
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(AudioResponderTest, PhraseIdBecomesAnnouncementCommand) {
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceCategory("B");

    EXPECT_TRUE(res.success);
    EXPECT_TRUE(player.played.empty());
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].reg, Echo::SPEAK_REGISTER);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0xFF, 0x02 }));
}

TEST_F(AudioResponderTest, NothingConfiguredFailsSilently) {
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceCategory("C");

    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.errorCode, "ERR_ANNOUNCE_FAILED");
    EXPECT_TRUE(player.played.empty());
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(AudioResponderTest, UnknownLabelFails) {
    AudioResponder responder(categories, assets, player, &actuator);

    EXPECT_FALSE(responder.announceCategory("塑料瓶").success);
    EXPECT_TRUE(player.played.empty());
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(AudioResponderTest, FailedAssetFallsBackToPhrase) {
    player.succeed = false;
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceCategory("D");

    EXPECT_TRUE(res.success);
    EXPECT_EQ(player.played.size(), 1u);
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0xFF, 0x04 }));
}

TEST_F(AudioResponderTest, PhraseWithoutPeripheralFails) {
    AudioResponder responder(categories, assets, player, nullptr);

    EXPECT_FALSE(responder.announceCategory("B").success);
}

TEST_F(AudioResponderTest, BusFailureIsReportedAsAnnounceFailure) {
    bus.failWrites = true;
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceCategory("B");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.errorCode, "ERR_ANNOUNCE_FAILED");
}

TEST_F(AudioResponderTest, RespondPlaysConfiguredEventOnly) {
    AudioResponder responder(categories, assets, player, &actuator);

    EXPECT_TRUE(responder.respond(Voice::EVENT_PHOTO_ACK));
    EXPECT_FALSE(responder.respond(Voice::EVENT_RESULT_PREFIX));

    ASSERT_EQ(player.played.size(), 1u);
    EXPECT_EQ(player.played[0], "/assets/photo_ack.wav");
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(AudioResponderTest, AnnounceErrorNeverUsesPeripheral) {
    AudioResponder responder(categories, assets, player, &actuator);

    EXPECT_TRUE(responder.announceError().success);
    ASSERT_EQ(player.played.size(), 1u);
    EXPECT_EQ(player.played[0], "/assets/network_error.wav");
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(AudioResponderTest, AnnounceErrorWithoutPromptStillAvoidsPeripheral) {
    assets.events.clear();
    AudioResponder responder(categories, assets, player, &actuator);

    ActionResult res = responder.announceError();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.errorCode, "ERR_PLAYBACK_FAILED");
    EXPECT_TRUE(bus.writes.empty());
}
