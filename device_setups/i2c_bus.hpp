#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// I2CBus
/// Register-addressed byte bus seen from one 7-bit device address.
/// Implementations report failures through return values and never throw.
class I2CBus {
public:
    virtual ~I2CBus() = default;

    /// Write [reg, payload...] as one bus transaction.
    virtual bool writeBlock(std::uint8_t reg, const std::vector<std::uint8_t>& payload) = 0;

    /// Read count bytes starting at reg. nullopt on bus error.
    virtual std::optional<std::vector<std::uint8_t>> readBlock(std::uint8_t reg, std::size_t count) = 0;
};

// Buffer for one I2C_RDWR write message: [reg, payload...].
// The register byte and payload go out as a single transaction.
std::vector<std::uint8_t> buildWriteMessage(std::uint8_t reg, const std::vector<std::uint8_t>& payload);

/// LinuxI2CBus
/// /dev/i2c-<busId> through the i2c-dev I2C_RDWR interface.
class LinuxI2CBus : public I2CBus {
public:
    LinuxI2CBus(int busId, std::uint8_t address);
    ~LinuxI2CBus() override;

    LinuxI2CBus(const LinuxI2CBus&) = delete;
    LinuxI2CBus& operator=(const LinuxI2CBus&) = delete;

    /// Open the character device. False (with err) if it cannot be opened.
    bool open(std::string* err = nullptr);
    bool isOpen() const { return fd_ >= 0; }

    bool writeBlock(std::uint8_t reg, const std::vector<std::uint8_t>& payload) override;
    std::optional<std::vector<std::uint8_t>> readBlock(std::uint8_t reg, std::size_t count) override;

private:
    int busId_;
    std::uint8_t address_;
    int fd_ = -1;
};
