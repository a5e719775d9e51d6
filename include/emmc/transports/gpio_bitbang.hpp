#ifndef EMMC_TRANSPORTS_GPIO_BITBANG_HPP
#define EMMC_TRANSPORTS_GPIO_BITBANG_HPP

#include "emmc/transport.hpp"
#include "hardware_locations.hpp"
#include "gpio.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace emmc::transports {

struct BitbangPins {
    uint8_t clk = GPIO_SPI_CLK;
    uint8_t mosi = GPIO_SPI_MOSI;
    uint8_t miso = GPIO_SPI_MISO;
    uint8_t ss_n = GPIO_SS_N;
    uint8_t en_n = GPIO_EN_N;
    uint8_t rst_n = GPIO_RST_N;
    uint32_t clock_hz = EMMC_SPI_CLOCK_HZ;
    uint32_t reset_hold_ms = EMMC_RESET_HOLD_MS;
};

/**
Clocks the controller protocol over discrete GPIO lines with bcm2835.

Frames go out LSB first: 2 command bits, 8 address bits, then either 32 data
bits (write) or 16 idle turnaround clocks followed by the sampled response
(read). Chip-select stays asserted for the whole frame.
*/
class GpioBitbangTransport : public SpiBackend, public GpioControl {
public:
    explicit GpioBitbangTransport(BitbangPins pins = {});
    ~GpioBitbangTransport() override;

    GpioBitbangTransport(const GpioBitbangTransport&) = delete;
    GpioBitbangTransport& operator=(const GpioBitbangTransport&) = delete;

    void write_register(Register reg, uint32_t data) override;
    uint32_t read_register(Register reg) override;
    void read_data(Register reg, uint8_t* buffer, std::size_t length) override;
    void reset() override;
    void initialize() override;

    void set_chip_select(bool asserted) override;
    void set_reset(bool asserted) override;
    void set_enable(bool enabled) override;

    const BitbangPins& pins() const noexcept { return pins_; }

private:
    static constexpr unsigned kTurnaroundClocks = 16;

    void require_session() const;
    void drive(uint8_t pin, bool high);
    void half_period() const;
    void clock_out(uint32_t value, unsigned bit_count);
    uint32_t clock_in(unsigned bit_count);
    void send_header(Command command, Register reg);
    void turnaround();

    BitbangPins pins_;
    std::unique_ptr<GpioSession> session_;
    uint32_t levels_ = 0;
    uint64_t half_period_ns_;
};

} // namespace emmc::transports

#endif // EMMC_TRANSPORTS_GPIO_BITBANG_HPP
