#ifndef EMMC_PINS_HPP
#define EMMC_PINS_HPP

#include <cstdint>

namespace emmc {

inline uint32_t pin_mask(uint8_t pin) { return static_cast<uint32_t>(1u) << pin; }

// Set (high) or clear one pin in a level word. `mask` must have exactly one
// bit set, otherwise emmc::Error{InvalidPinMask} is thrown.
uint32_t apply_pin_level(uint32_t current_levels, uint32_t mask, bool high);

} // namespace emmc

#endif // EMMC_PINS_HPP
