// Decoding helpers for card state and error bits reported by the controller
#ifndef EMMC_MMC_STATUS_HPP
#define EMMC_MMC_STATUS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace emmc {

// Card state machine position (4-bit field)
enum class MmcState : uint8_t {
    Idle = 0,
    Ready = 1,
    Ident = 2,
    Standby = 3,
    Transfer = 4,
    Data = 5,
    Receive = 6,
    Program = 7,
    Disabled = 8,
    Btst = 9,
    Sleep = 10,
};

// Only the low four bits are considered; 11..15 are reserved.
std::optional<MmcState> mmc_state_from_bits(uint8_t bits);

const char* to_string(MmcState state);

// Error bits of a card status word
class ErrorFlags {
public:
    static constexpr uint32_t ERASE_RESET = 1u << 0x0D;
    static constexpr uint32_t ERROR = 1u << 0x13;
    static constexpr uint32_t CC_ERROR = 1u << 0x14;
    static constexpr uint32_t DEVICE_ECC_FAILED = 1u << 0x15;
    static constexpr uint32_t ILLEGAL_COMMAND = 1u << 0x16;
    static constexpr uint32_t CRC_ERROR = 1u << 0x17;
    static constexpr uint32_t DEVICE_IS_LOCKED = 1u << 0x19;
    static constexpr uint32_t BLOCK_LENGTH_ERROR = 1u << 0x1D;
    static constexpr uint32_t ADDRESS_MISALIGN = 1u << 0x1E;

    static constexpr uint32_t ALL = ERASE_RESET | ERROR | CC_ERROR | DEVICE_ECC_FAILED |
                                    ILLEGAL_COMMAND | CRC_ERROR | DEVICE_IS_LOCKED |
                                    BLOCK_LENGTH_ERROR | ADDRESS_MISALIGN;

    // Bits outside ALL are dropped
    explicit ErrorFlags(uint32_t status_word) : bits_(status_word & ALL) {}

    uint32_t bits() const noexcept { return bits_; }
    bool has_error() const noexcept { return bits_ != 0; }
    bool contains(uint32_t flag) const noexcept { return (bits_ & flag) == flag; }

    // "none" or a '|'-separated list of flag names
    std::string describe() const;

private:
    uint32_t bits_;
};

} // namespace emmc

#endif // EMMC_MMC_STATUS_HPP
