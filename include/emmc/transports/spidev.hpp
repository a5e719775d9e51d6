#ifndef EMMC_TRANSPORTS_SPIDEV_HPP
#define EMMC_TRANSPORTS_SPIDEV_HPP

#include "emmc/transport.hpp"
#include "hardware_locations.hpp"
#include "gpio.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace emmc::transports {

struct SpidevConfig {
    std::string device = "/dev/spidev0.0";
    uint32_t speed_hz = EMMC_SPI_CLOCK_HZ;
    // Gap between the read header and the response inside one chip-select window
    uint16_t read_delay_us = 1;
    uint32_t reset_hold_ms = EMMC_RESET_HOLD_MS;
    // Unset lines turn the matching GpioControl call into a no-op
    std::optional<uint8_t> reset_pin = GPIO_RST_N;
    std::optional<uint8_t> enable_pin = GPIO_EN_N;
};

/**
Byte-framed variant of the protocol on a Linux spidev node (LSB-first mode).

Writes are a single 6-byte frame (command, address, 4 data bytes). Reads send
the 2-byte header, wait read_delay_us, then clock in 4 or 512 bytes without
releasing chip-select. Chip-select belongs to the kernel driver, so
set_chip_select() does nothing.
*/
class SpidevTransport : public SpiBackend, public GpioControl {
public:
    explicit SpidevTransport(SpidevConfig config = {});
    ~SpidevTransport() override;

    SpidevTransport(const SpidevTransport&) = delete;
    SpidevTransport& operator=(const SpidevTransport&) = delete;

    void write_register(Register reg, uint32_t data) override;
    uint32_t read_register(Register reg) override;
    void read_data(Register reg, uint8_t* buffer, std::size_t length) override;
    void reset() override;
    void initialize() override;

    void set_chip_select(bool asserted) override;
    void set_reset(bool asserted) override;
    void set_enable(bool enabled) override;

    const SpidevConfig& config() const noexcept { return config_; }

private:
    void require_open() const;
    void transfer_read(Register reg, uint8_t* rx, std::size_t length);
    void configure_link();

    SpidevConfig config_;
    int fd_ = -1;
    std::unique_ptr<GpioSession> session_;
};

} // namespace emmc::transports

#endif // EMMC_TRANSPORTS_SPIDEV_HPP
