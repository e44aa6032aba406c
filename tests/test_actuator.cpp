#include <gtest/gtest.h>

#include "device_setups/actuator.hpp"
#include "fakes.hpp"

using Echo::Actuator;
using Echo::CommandType;

TEST(ActuatorEncode, CommandWordSerializesTypeThenPhrase) {
    auto bytes = Echo::encodeSpeak({ CommandType::CommandWord, 3 });
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(bytes[1], 0x03);
}

TEST(ActuatorEncode, AnnouncementUsesFF) {
    auto bytes = Echo::encodeSpeak({ CommandType::Announcement, 1 });
    EXPECT_EQ(bytes[0], 0xFF);
    EXPECT_EQ(bytes[1], 0x01);
}

TEST(ActuatorEncode, DecodeRejectsUnknownType) {
    EXPECT_FALSE(Echo::decodeSpeak({ 0x12, 0x01 }).has_value());

    auto cmd = Echo::decodeSpeak({ 0xFF, 0x04 });
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->type, CommandType::Announcement);
    EXPECT_EQ(cmd->phraseId, 4);
}

TEST(Actuator, SpeakIsOneBlockWriteToSpeakRegister) {
    FakeBus bus;
    Actuator actuator(bus);

    EXPECT_TRUE(actuator.speak(CommandType::CommandWord, 3));

    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].reg, Echo::SPEAK_REGISTER);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0x00, 0x03 }));
}

TEST(Actuator, RawSpeakRejectsUnknownCommandWithoutTouchingBus) {
    FakeBus bus;
    Actuator actuator(bus);

    EXPECT_FALSE(actuator.speak(static_cast<std::uint8_t>(0x12), 1));
    EXPECT_TRUE(bus.writes.empty());

    EXPECT_TRUE(actuator.speak(static_cast<std::uint8_t>(0xFF), 2));
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0xFF, 0x02 }));
}

TEST(Actuator, SpeakReportsBusFailureWithoutThrowing) {
    FakeBus bus;
    bus.failWrites = true;
    Actuator actuator(bus);

    bool ok = true;
    EXPECT_NO_THROW(ok = actuator.speak(CommandType::Announcement, 1));
    EXPECT_FALSE(ok);
}

TEST(Actuator, ReadResultReadsOneByteFromResultRegister) {
    FakeBus bus;
    bus.readValue = 0x38;
    Actuator actuator(bus);

    auto v = actuator.readResult();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 0x38);
    ASSERT_EQ(bus.reads.size(), 1u);
    EXPECT_EQ(bus.reads[0], Echo::RESULT_REGISTER);
}

TEST(Actuator, ReadResultFailureIsNullopt) {
    FakeBus bus;
    bus.failReads = true;
    Actuator actuator(bus);

    EXPECT_FALSE(actuator.readResult().has_value());
}

TEST(Actuator, ClearResultWritesZero) {
    FakeBus bus;
    Actuator actuator(bus);

    EXPECT_TRUE(actuator.clearResult());
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].reg, Echo::RESULT_REGISTER);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0x00 }));
}

TEST(Actuator, CustomRegisterMap) {
    FakeBus bus;
    Actuator actuator(bus, 0x70, 0x60);

    EXPECT_TRUE(actuator.speak(CommandType::Announcement, 9));
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].reg, 0x70);

    actuator.readResult();
    ASSERT_EQ(bus.reads.size(), 1u);
    EXPECT_EQ(bus.reads[0], 0x60);
}

TEST(I2CWriteMessage, RegisterThenPayloadInOneBuffer) {
    auto msg = buildWriteMessage(Echo::SPEAK_REGISTER, { 0x00, 0x03 });
    EXPECT_EQ(msg, (std::vector<std::uint8_t>{ 0x6E, 0x00, 0x03 }));

    EXPECT_EQ(buildWriteMessage(Echo::RESULT_REGISTER, {}), (std::vector<std::uint8_t>{ 0x64 }));
}

TEST(I2CWriteMessage, SpeakCommandReachesWireInOrder) {
    FakeBus bus;
    Actuator actuator(bus);
    ASSERT_TRUE(actuator.speak(CommandType::Announcement, 3));
    ASSERT_EQ(bus.writes.size(), 1u);

    auto wire = buildWriteMessage(bus.writes[0].reg, bus.writes[0].payload);
    EXPECT_EQ(wire, (std::vector<std::uint8_t>{ 0x6E, 0xFF, 0x03 }));
}

TEST(LinuxI2CBus, UnopenedBusFailsWithoutThrowing) {
    LinuxI2CBus bus(4, 0x34);
    EXPECT_FALSE(bus.isOpen());
    EXPECT_FALSE(bus.writeBlock(Echo::SPEAK_REGISTER, { 0x00, 0x03 }));
    EXPECT_FALSE(bus.readBlock(Echo::RESULT_REGISTER, 1).has_value());
}
