#include "i2c_bus.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>

static std::string hexByte(std::uint8_t v) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02X", v);
    return buf;
}

std::vector<std::uint8_t> buildWriteMessage(std::uint8_t reg, const std::vector<std::uint8_t>& payload) {
    std::vector<std::uint8_t> buf;
    buf.reserve(payload.size() + 1);
    buf.push_back(reg);
    buf.insert(buf.end(), payload.begin(), payload.end());
    return buf;
}

LinuxI2CBus::LinuxI2CBus(int busId, std::uint8_t address)
    : busId_(busId), address_(address) {}

LinuxI2CBus::~LinuxI2CBus() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool LinuxI2CBus::open(std::string* err) {
    if (fd_ >= 0) return true;

    std::string dev = "/dev/i2c-" + std::to_string(busId_);
    fd_ = ::open(dev.c_str(), O_RDWR);
    if (fd_ < 0) {
        if (err) *err = dev + ": " + std::strerror(errno);
        return false;
    }

    LOG_DEBUG("I2C", "Opened " + dev + " for device " + hexByte(address_));
    return true;
}

bool LinuxI2CBus::writeBlock(std::uint8_t reg, const std::vector<std::uint8_t>& payload) {
    if (fd_ < 0) return false;

    std::vector<std::uint8_t> buf = buildWriteMessage(reg, payload);

    i2c_msg msg{};
    msg.addr  = address_;
    msg.flags = 0;
    msg.len   = static_cast<__u16>(buf.size());
    msg.buf   = buf.data();

    i2c_rdwr_ioctl_data xfer{};
    xfer.msgs  = &msg;
    xfer.nmsgs = 1;

    if (::ioctl(fd_, I2C_RDWR, &xfer) < 0) {
        LOG_ERROR("I2C", "Write to reg " + hexByte(reg) + " failed: " + std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> LinuxI2CBus::readBlock(std::uint8_t reg, std::size_t count) {
    if (fd_ < 0 || count == 0) return std::nullopt;

    std::vector<std::uint8_t> out(count);
    std::uint8_t regBuf = reg;

    // Write register pointer, repeated start, read
    i2c_msg msgs[2]{};
    msgs[0].addr  = address_;
    msgs[0].flags = 0;
    msgs[0].len   = 1;
    msgs[0].buf   = &regBuf;
    msgs[1].addr  = address_;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len   = static_cast<__u16>(count);
    msgs[1].buf   = out.data();

    i2c_rdwr_ioctl_data xfer{};
    xfer.msgs  = msgs;
    xfer.nmsgs = 2;

    if (::ioctl(fd_, I2C_RDWR, &xfer) < 0) {
        LOG_ERROR("I2C", "Read from reg " + hexByte(reg) + " failed: " + std::strerror(errno));
        return std::nullopt;
    }
    return out;
}
