#include "emmc/pins.hpp"
#include "emmc/error.hpp"

#include <bit>

namespace emmc {

uint32_t apply_pin_level(uint32_t current_levels, uint32_t mask, bool high) {
    if (std::popcount(mask) != 1) {
        throw Error(ErrorKind::InvalidPinMask, "mask " + format_hex32(mask));
    }
    return high ? (current_levels | mask) : (current_levels & ~mask);
}

} // namespace emmc
