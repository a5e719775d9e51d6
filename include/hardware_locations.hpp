#ifndef HARDWARE_LOCATIONS_HPP
#define HARDWARE_LOCATIONS_HPP

// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
// Pin Definitions
//
// BCM numbers of the lines wired to the eMMC controller's SPI port and the
// level shifter in front of it. The SPI0 lines match the header's hardware
// SPI pins so the same harness works with the spidev transport.
// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

// Serial bus
#define GPIO_SPI_CLK  11  // Serial clock, idles low, data sampled on the rising edge.
#define GPIO_SPI_MOSI 10  // Host to controller.
#define GPIO_SPI_MISO  9  // Controller to host.

// Control lines, all active low
#define GPIO_SS_N   8   // Chip select, held low for the whole frame.
#define GPIO_EN_N  25   // Level shifter output enable.
#define GPIO_RST_N 24   // Controller reset.

// Default serial clock of the bit-banged link (Hz)
#define EMMC_SPI_CLOCK_HZ 149000

// Hold time of the reset pulse issued by SpiBackend::reset() (ms)
#define EMMC_RESET_HOLD_MS 100

#endif // HARDWARE_LOCATIONS_HPP
