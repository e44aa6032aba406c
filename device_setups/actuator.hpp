#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "i2c_bus.hpp"

namespace Echo {

// Register map of the voice-output peripheral
inline constexpr std::uint8_t RESULT_REGISTER = 0x64;
inline constexpr std::uint8_t SPEAK_REGISTER  = 0x6E;

enum class CommandType : std::uint8_t {
    CommandWord  = 0x00,   // command-word phrase
    Announcement = 0xFF    // passive announcement phrase
};

struct ActuatorCommand {
    CommandType type = CommandType::CommandWord;
    std::uint8_t phraseId = 0;
};

// Wire bytes for the speak register: [commandType, phraseId], in that order.
std::array<std::uint8_t, 2> encodeSpeak(const ActuatorCommand& cmd);

// Inverse of encodeSpeak. nullopt for an unknown command type byte.
std::optional<ActuatorCommand> decodeSpeak(const std::array<std::uint8_t, 2>& bytes);

/// Actuator
/// Drives the peripheral over an I2CBus it does not own.
/// The bus is unreliable: every call logs and returns a status, none throws.
class Actuator {
public:
    explicit Actuator(I2CBus& bus,
                      std::uint8_t speakRegister = SPEAK_REGISTER,
                      std::uint8_t resultRegister = RESULT_REGISTER);

    /// Write the two-byte speak command as one block transaction.
    bool speak(CommandType type, std::uint8_t phraseId);

    /// Raw variant; rejects command types other than 0x00 / 0xFF.
    bool speak(std::uint8_t type, std::uint8_t phraseId);

    /// Last recognized phrase id. Advisory only: the peripheral does not
    /// keep this register in sync with its recognition state.
    std::optional<std::uint8_t> readResult();

    /// Reset the result register to 0x00.
    bool clearResult();

private:
    I2CBus& bus_;
    std::uint8_t speakRegister_;
    std::uint8_t resultRegister_;
};

} // namespace Echo
