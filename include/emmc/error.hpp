#ifndef EMMC_ERROR_HPP
#define EMMC_ERROR_HPP

#include "emmc/commands.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace emmc {

enum class ErrorKind {
    NotImplemented,
    Transport,
    InvalidGpioState,
    InvalidPinMask,
    SanityCheckFailed,
    InitializationFailed,
    RegisterAccessFailed,
    Timeout,
};

const char* to_string(ErrorKind kind);

// Base for everything the protocol engine and its transports throw.
class Error : public std::runtime_error {
public:
    explicit Error(ErrorKind kind);
    Error(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Argument register loopback returned something other than what was written.
class SanityCheckError : public Error {
public:
    SanityCheckError(uint32_t expected, uint32_t actual);

    uint32_t expected() const noexcept { return expected_; }
    uint32_t actual() const noexcept { return actual_; }

private:
    uint32_t expected_;
    uint32_t actual_;
};

// A read during the init sequence diverged from the captured trace.
class HandshakeError : public Error {
public:
    HandshakeError(Register reg, uint32_t expected, uint32_t actual);

    Register reg() const noexcept { return reg_; }
    uint32_t expected() const noexcept { return expected_; }
    uint32_t actual() const noexcept { return actual_; }

private:
    Register reg_;
    uint32_t expected_;
    uint32_t actual_;
};

std::string format_hex32(uint32_t value);

} // namespace emmc

#endif // EMMC_ERROR_HPP
