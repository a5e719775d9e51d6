#include "emmc/error.hpp"

#include <iomanip>
#include <sstream>

namespace emmc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotImplemented:
        return "Not implemented";
    case ErrorKind::Transport:
        return "Transport failure";
    case ErrorKind::InvalidGpioState:
        return "Invalid GPIO state";
    case ErrorKind::InvalidPinMask:
        return "Invalid pin mask (must be single bit)";
    case ErrorKind::SanityCheckFailed:
        return "Sanity check failed";
    case ErrorKind::InitializationFailed:
        return "Device initialization failed";
    case ErrorKind::RegisterAccessFailed:
        return "Register read/write failed";
    case ErrorKind::Timeout:
        return "Operation timed out";
    }
    return "Unknown error";
}

std::string format_hex32(uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

Error::Error(ErrorKind kind)
    : std::runtime_error(to_string(kind)), kind_(kind) {}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(to_string(kind)) + ": " + detail), kind_(kind) {}

SanityCheckError::SanityCheckError(uint32_t expected, uint32_t actual)
    : Error(ErrorKind::SanityCheckFailed,
            "expected " + format_hex32(expected) + ", got " + format_hex32(actual)),
      expected_(expected),
      actual_(actual) {}

HandshakeError::HandshakeError(Register reg, uint32_t expected, uint32_t actual)
    : Error(ErrorKind::InitializationFailed,
            std::string(to_string(reg)) + " expected " + format_hex32(expected) +
                ", got " + format_hex32(actual)),
      reg_(reg),
      expected_(expected),
      actual_(actual) {}

} // namespace emmc
