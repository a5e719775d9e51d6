#include "emmc/mmc_status.hpp"

#include <array>

namespace emmc {

std::optional<MmcState> mmc_state_from_bits(uint8_t bits) {
    const uint8_t value = bits & 0x0F;
    if (value > static_cast<uint8_t>(MmcState::Sleep)) {
        return std::nullopt;
    }
    return static_cast<MmcState>(value);
}

const char* to_string(MmcState state) {
    switch (state) {
    case MmcState::Idle: return "Idle";
    case MmcState::Ready: return "Ready";
    case MmcState::Ident: return "Ident";
    case MmcState::Standby: return "Standby";
    case MmcState::Transfer: return "Transfer";
    case MmcState::Data: return "Data";
    case MmcState::Receive: return "Receive";
    case MmcState::Program: return "Program";
    case MmcState::Disabled: return "Disabled";
    case MmcState::Btst: return "Btst";
    case MmcState::Sleep: return "Sleep";
    }
    return "Unknown";
}

std::string ErrorFlags::describe() const {
    struct FlagName {
        uint32_t flag;
        const char* name;
    };
    static constexpr std::array<FlagName, 9> kNames = {{
        {ERASE_RESET, "ERASE_RESET"},
        {ERROR, "ERROR"},
        {CC_ERROR, "CC_ERROR"},
        {DEVICE_ECC_FAILED, "DEVICE_ECC_FAILED"},
        {ILLEGAL_COMMAND, "ILLEGAL_COMMAND"},
        {CRC_ERROR, "CRC_ERROR"},
        {DEVICE_IS_LOCKED, "DEVICE_IS_LOCKED"},
        {BLOCK_LENGTH_ERROR, "BLOCK_LENGTH_ERROR"},
        {ADDRESS_MISALIGN, "ADDRESS_MISALIGN"},
    }};

    if (!has_error()) return "none";

    std::string text;
    for (const auto& entry : kNames) {
        if (!contains(entry.flag)) continue;
        if (!text.empty()) text += '|';
        text += entry.name;
    }
    return text;
}

} // namespace emmc
