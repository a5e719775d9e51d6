#include "emmc/transports/spidev.hpp"
#include "emmc/error.hpp"
#include "logging.hpp"
#include "timing.hpp"

#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace emmc::transports {

namespace {

[[noreturn]] void throw_os_error(const std::string& what) {
    throw Error(ErrorKind::Transport, what + ": " + std::strerror(errno));
}

} // namespace

SpidevTransport::SpidevTransport(SpidevConfig config)
    : config_(std::move(config)) {}

SpidevTransport::~SpidevTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SpidevTransport::require_open() const {
    if (fd_ < 0) {
        throw Error(ErrorKind::Transport, config_.device + " is not open, call initialize() first");
    }
}

void SpidevTransport::configure_link() {
    uint8_t mode = SPI_MODE_0 | SPI_LSB_FIRST;
    if (::ioctl(fd_, SPI_IOC_WR_MODE, &mode) < 0) {
        throw_os_error("SPI_IOC_WR_MODE on " + config_.device);
    }
    uint8_t bits_per_word = 8;
    if (::ioctl(fd_, SPI_IOC_WR_BITS_PER_WORD, &bits_per_word) < 0) {
        throw_os_error("SPI_IOC_WR_BITS_PER_WORD on " + config_.device);
    }
    uint32_t speed = config_.speed_hz;
    if (::ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        throw_os_error("SPI_IOC_WR_MAX_SPEED_HZ on " + config_.device);
    }
}

void SpidevTransport::initialize() {
    if (fd_ < 0) {
        fd_ = ::open(config_.device.c_str(), O_RDWR);
        if (fd_ < 0) {
            throw_os_error("open " + config_.device);
        }
    }
    configure_link();

    if ((config_.reset_pin || config_.enable_pin) && !session_) {
        session_ = std::make_unique<GpioSession>(true);
        if (config_.reset_pin) {
            gpio_set_direction(*config_.reset_pin, true);
            gpio_set_high(*config_.reset_pin);
        }
        if (config_.enable_pin) {
            gpio_set_direction(*config_.enable_pin, true);
            gpio_set_high(*config_.enable_pin);
        }
    }

    set_enable(true);
    reset();
    LOG_HAL_INFO("spidev link up on %s at %u Hz", config_.device.c_str(), config_.speed_hz);
}

void SpidevTransport::write_register(Register reg, uint32_t data) {
    require_open();
    const auto frame = encode_frame(TransactionType::write(reg, data));

    struct spi_ioc_transfer xfer{};
    xfer.tx_buf = reinterpret_cast<uintptr_t>(frame.data());
    xfer.len = static_cast<uint32_t>(frame.size());
    xfer.speed_hz = config_.speed_hz;
    xfer.bits_per_word = 8;

    LOG_HAL_TRACE("spidev W 0x%02X <- 0x%08X", address(reg), data);
    if (::ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer) < 0) {
        throw_os_error("SPI write to " + config_.device);
    }
}

void SpidevTransport::transfer_read(Register reg, uint8_t* rx, std::size_t length) {
    require_open();
    const auto header = encode_header(Command::Read, reg);

    struct spi_ioc_transfer xfer[2] = {};
    xfer[0].tx_buf = reinterpret_cast<uintptr_t>(header.data());
    xfer[0].len = static_cast<uint32_t>(header.size());
    xfer[0].speed_hz = config_.speed_hz;
    xfer[0].bits_per_word = 8;
    xfer[0].delay_usecs = config_.read_delay_us;

    xfer[1].rx_buf = reinterpret_cast<uintptr_t>(rx);
    xfer[1].len = static_cast<uint32_t>(length);
    xfer[1].speed_hz = config_.speed_hz;
    xfer[1].bits_per_word = 8;

    if (::ioctl(fd_, SPI_IOC_MESSAGE(2), xfer) < 0) {
        throw_os_error("SPI read from " + config_.device);
    }
}

uint32_t SpidevTransport::read_register(Register reg) {
    uint8_t rx[4] = {};
    transfer_read(reg, rx, sizeof(rx));
    const uint32_t value = decode_u32_le(rx);
    LOG_HAL_TRACE("spidev R 0x%02X -> 0x%08X", address(reg), value);
    return value;
}

void SpidevTransport::read_data(Register reg, uint8_t* buffer, std::size_t length) {
    transfer_read(reg, buffer, length);
    LOG_HAL_TRACE("spidev D 0x%02X %zu bytes", address(reg), length);
}

void SpidevTransport::reset() {
    set_reset(true);
    sleep_us(static_cast<uint64_t>(config_.reset_hold_ms) * 1000ULL);
    set_reset(false);
}

void SpidevTransport::set_chip_select(bool) {
}

void SpidevTransport::set_reset(bool asserted) {
    if (!config_.reset_pin) {
        return;
    }
    if (!session_) {
        throw Error(ErrorKind::InvalidGpioState, "reset line used before initialize()");
    }
    gpio_write(*config_.reset_pin, !asserted);
}

void SpidevTransport::set_enable(bool enabled) {
    if (!config_.enable_pin) {
        return;
    }
    if (!session_) {
        throw Error(ErrorKind::InvalidGpioState, "enable line used before initialize()");
    }
    gpio_write(*config_.enable_pin, !enabled);
}

} // namespace emmc::transports
