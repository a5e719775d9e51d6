// Command and register definitions for the eMMC SPI controller protocol
#ifndef EMMC_COMMANDS_HPP
#define EMMC_COMMANDS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace emmc {

// 2-bit opcode sent at the start of every frame
enum class Command : uint8_t {
    Read = 0x1,
    Write = 0x2,
};

constexpr uint8_t bits(Command command) { return static_cast<uint8_t>(command); }

// Width of the command field on the wire (always 2)
constexpr uint8_t command_bit_length() { return 2; }

/**
8-bit controller register address space.
Names follow what the capture traces show each register doing; the numbered
entries are touched by the init sequence but their meaning is unconfirmed.
*/
enum class Register : uint8_t {
    Reg01 = 0x01,
    Argument = 0x02,               // command argument, loops back on read
    CommandAndTransferMode = 0x03,
    Response0And1 = 0x04,          // also used for status polling
    Response2And3 = 0x05,
    Response4And5 = 0x06,
    Response6And7 = 0x07,
    DataFifo = 0x08,               // 512-byte block reads
    PresentState = 0x09,
    Reg0A = 0x0A,
    StatusConfig = 0x0B,           // command register
    InterruptStatus = 0x0C,
    Config1 = 0x0D,
    Config2 = 0x0E,
    Reg0F = 0x0F,
    InitCommand = 0x44,
    XipOutputDelay = 0x88,
};

constexpr uint8_t address(Register reg) { return static_cast<uint8_t>(reg); }

// Width of the register address field on the wire (always 8)
constexpr uint8_t register_bit_length() { return 8; }

// Reverse lookup. Unmapped addresses are not an error, the controller
// very likely has registers nobody has named yet.
std::optional<Register> register_from_address(uint8_t addr);

// Case-insensitive lookup by name ("argument", "InterruptStatus", ...)
std::optional<Register> register_from_name(std::string_view name);

const char* to_string(Register reg);
const char* to_string(Command command);

// Response buffer sizes
enum class DataSize : std::size_t {
    Register = 4,
    Page = 512,
};

constexpr std::size_t bytes(DataSize size) { return static_cast<std::size_t>(size); }

constexpr std::size_t kPageSize = bytes(DataSize::Page);

// InterruptStatus values observed in protocol traces
namespace status {
constexpr uint32_t CMD_BUSY = 0x00000001;
constexpr uint32_t TRANSFER_COMPLETE = 0x00000002;
constexpr uint32_t DATA_READY = 0x00000020;
constexpr uint32_t CMD_ACCEPTED = 0x00000021;
constexpr uint32_t STATUS_CLEAR = 0xFFFFFFFF;
} // namespace status

// CommandAndTransferMode values observed in protocol traces
namespace transfer_config {
constexpr uint32_t PAGE_READ = 0x113A0010;

// Erase and write have not been captured yet; empty until a trace shows them.
constexpr std::optional<uint32_t> PAGE_ERASE = std::nullopt;
constexpr std::optional<uint32_t> PAGE_WRITE = std::nullopt;
} // namespace transfer_config

} // namespace emmc

#endif // EMMC_COMMANDS_HPP
