#include "actuator.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <vector>

namespace Echo {

std::array<std::uint8_t, 2> encodeSpeak(const ActuatorCommand& cmd) {
    return { static_cast<std::uint8_t>(cmd.type), cmd.phraseId };
}

std::optional<ActuatorCommand> decodeSpeak(const std::array<std::uint8_t, 2>& bytes) {
    if (bytes[0] != static_cast<std::uint8_t>(CommandType::CommandWord) &&
        bytes[0] != static_cast<std::uint8_t>(CommandType::Announcement)) {
        return std::nullopt;
    }
    return ActuatorCommand{ static_cast<CommandType>(bytes[0]), bytes[1] };
}

Actuator::Actuator(I2CBus& bus, std::uint8_t speakRegister, std::uint8_t resultRegister)
    : bus_(bus), speakRegister_(speakRegister), resultRegister_(resultRegister) {}

bool Actuator::speak(CommandType type, std::uint8_t phraseId) {
    auto wire = encodeSpeak({ type, phraseId });

    // Splitting into two single-byte writes breaks playback on the device
    std::vector<std::uint8_t> payload(wire.begin(), wire.end());
    if (!bus_.writeBlock(speakRegister_, payload)) {
        ErrorManager::report("ERR_BUS_WRITE",
                             "speak(" + std::to_string(wire[0]) + ", " + std::to_string(wire[1]) + ")");
        return false;
    }

    LOG_TRACE("Actuator", "speak type=" + std::to_string(wire[0]) +
                          " phrase=" + std::to_string(wire[1]));
    return true;
}

bool Actuator::speak(std::uint8_t type, std::uint8_t phraseId) {
    auto cmd = decodeSpeak({ type, phraseId });
    if (!cmd) {
        LOG_ERROR("Actuator", "Rejected unknown command type " + std::to_string(type));
        return false;
    }
    return speak(cmd->type, cmd->phraseId);
}

std::optional<std::uint8_t> Actuator::readResult() {
    auto data = bus_.readBlock(resultRegister_, 1);
    if (!data || data->empty()) {
        ErrorManager::report("ERR_BUS_READ", "result register");
        return std::nullopt;
    }
    return (*data)[0];
}

bool Actuator::clearResult() {
    if (!bus_.writeBlock(resultRegister_, { 0x00 })) {
        ErrorManager::report("ERR_BUS_WRITE", "clear result register");
        return false;
    }
    return true;
}

} // namespace Echo
