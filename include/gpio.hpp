#ifndef GPIO_HPP
#define GPIO_HPP

#include <stdint.h>

// Map the bcm2835 peripherals, lock memory, switch to SCHED_FIFO and pin the
// process to one CPU (EMMCSPI_PIN_CPU, default 0). Reference counted.
bool gpio_init();

// Set the direction of a GPIO pin
void gpio_set_direction(uint8_t pin, bool is_output);

// Write a value to a GPIO pin
void gpio_write(uint8_t pin, bool value);

// Read a value from a GPIO pin
bool gpio_read(uint8_t pin);

// Set the pull-up/down state of a GPIO pin (BCM2835_GPIO_PUD_*)
void gpio_set_pud(uint8_t pin, uint8_t pud);

// Directly set a GPIO pin high
void gpio_set_high(uint8_t pin);

// Read levels for GPIO 0..31 in a single register access (GPLEV0)
uint32_t gpio_read_levels0();

// Drive every pin in `mask` to the matching bit of `levels` (GPIO 0..31)
void gpio_write_levels0(uint32_t levels, uint32_t mask);

// Restore scheduler state and release bcm2835 resources when finished.
void gpio_shutdown();

// True while at least one gpio_init() is outstanding
bool gpio_active();

// RAII wrapper around gpio_init()/gpio_shutdown()
class GpioSession {
public:
    explicit GpioSession(bool throw_on_failure = true);
    ~GpioSession();

    GpioSession(const GpioSession&) = delete;
    GpioSession& operator=(const GpioSession&) = delete;

    GpioSession(GpioSession&& other) noexcept;
    GpioSession& operator=(GpioSession&& other) noexcept;

    bool active() const noexcept { return active_; }

private:
    bool active_;
};

#endif // GPIO_HPP
