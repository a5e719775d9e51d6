#include "emmc/transports/gpio_bitbang.hpp"
#include "emmc/error.hpp"
#include "emmc/pins.hpp"
#include "logging.hpp"
#include "timing.hpp"

#include <bcm2835.h>

namespace emmc::transports {

GpioBitbangTransport::GpioBitbangTransport(BitbangPins pins)
    : pins_(pins),
      half_period_ns_(pins.clock_hz ? 500000000ULL / pins.clock_hz : 0) {
    if (pins_.clock_hz == 0) {
        throw Error(ErrorKind::Transport, "bit-bang clock rate must be non-zero");
    }
}

GpioBitbangTransport::~GpioBitbangTransport() {
    if (session_ && session_->active()) {
        // leave the bus idle: chip deselected, level shifter off
        gpio_set_high(pins_.ss_n);
        gpio_set_high(pins_.en_n);
    }
}

void GpioBitbangTransport::require_session() const {
    if (!session_ || !session_->active() || !gpio_active()) {
        throw Error(ErrorKind::InvalidGpioState, "GPIO session not open, call initialize() first");
    }
}

void GpioBitbangTransport::drive(uint8_t pin, bool high) {
    const uint32_t mask = pin_mask(pin);
    levels_ = apply_pin_level(levels_, mask, high);
    gpio_write_levels0(levels_, mask);
}

void GpioBitbangTransport::half_period() const {
    busy_wait_ns(half_period_ns_);
}

void GpioBitbangTransport::clock_out(uint32_t value, unsigned bit_count) {
    for (unsigned bit = 0; bit < bit_count; ++bit) {
        drive(pins_.mosi, ((value >> bit) & 0x1U) != 0);
        half_period();
        drive(pins_.clk, true);
        half_period();
        drive(pins_.clk, false);
    }
}

uint32_t GpioBitbangTransport::clock_in(unsigned bit_count) {
    uint32_t value = 0;
    for (unsigned bit = 0; bit < bit_count; ++bit) {
        half_period();
        drive(pins_.clk, true);
        if (gpio_read(pins_.miso)) {
            value |= 1U << bit;
        }
        half_period();
        drive(pins_.clk, false);
    }
    return value;
}

void GpioBitbangTransport::send_header(Command command, Register reg) {
    LOG_HAL_TRACE("frame %s %s (0x%02X)", to_string(command), to_string(reg), address(reg));
    clock_out(bits(command), command_bit_length());
    clock_out(address(reg), register_bit_length());
}

void GpioBitbangTransport::turnaround() {
    drive(pins_.mosi, false);
    for (unsigned i = 0; i < kTurnaroundClocks; ++i) {
        half_period();
        drive(pins_.clk, true);
        half_period();
        drive(pins_.clk, false);
    }
}

void GpioBitbangTransport::write_register(Register reg, uint32_t data) {
    require_session();
    set_chip_select(true);
    send_header(Command::Write, reg);
    clock_out(data, 32);
    set_chip_select(false);
}

uint32_t GpioBitbangTransport::read_register(Register reg) {
    require_session();
    set_chip_select(true);
    send_header(Command::Read, reg);
    turnaround();
    const uint32_t value = clock_in(32);
    set_chip_select(false);
    return value;
}

void GpioBitbangTransport::read_data(Register reg, uint8_t* buffer, std::size_t length) {
    require_session();
    set_chip_select(true);
    send_header(Command::Read, reg);
    turnaround();
    for (std::size_t i = 0; i < length; ++i) {
        buffer[i] = static_cast<uint8_t>(clock_in(8));
    }
    set_chip_select(false);
    LOG_HAL_TRACE("clocked in %zu data bytes", length);
}

void GpioBitbangTransport::reset() {
    require_session();
    set_reset(true);
    sleep_us(static_cast<uint64_t>(pins_.reset_hold_ms) * 1000ULL);
    set_reset(false);
}

void GpioBitbangTransport::initialize() {
    if (!session_) {
        session_ = std::make_unique<GpioSession>(true);
    }

    levels_ = gpio_read_levels0();

    gpio_set_direction(pins_.clk, true);
    gpio_set_direction(pins_.mosi, true);
    gpio_set_direction(pins_.ss_n, true);
    gpio_set_direction(pins_.en_n, true);
    gpio_set_direction(pins_.rst_n, true);
    gpio_set_direction(pins_.miso, false);
    // MISO floats while the controller is not driving it
    gpio_set_pud(pins_.miso, BCM2835_GPIO_PUD_DOWN);

    drive(pins_.clk, false);
    drive(pins_.mosi, false);
    drive(pins_.ss_n, true);
    drive(pins_.en_n, true);
    drive(pins_.rst_n, true);

    set_enable(true);
    set_chip_select(true);
    reset();
    set_chip_select(false);

    LOG_HAL_INFO("bit-bang link up at %u Hz (clk=%u mosi=%u miso=%u ss_n=%u)",
                 pins_.clock_hz, pins_.clk, pins_.mosi, pins_.miso, pins_.ss_n);
}

void GpioBitbangTransport::set_chip_select(bool asserted) {
    require_session();
    drive(pins_.ss_n, !asserted);
}

void GpioBitbangTransport::set_reset(bool asserted) {
    require_session();
    drive(pins_.rst_n, !asserted);
}

void GpioBitbangTransport::set_enable(bool enabled) {
    require_session();
    drive(pins_.en_n, !enabled);
}

} // namespace emmc::transports
