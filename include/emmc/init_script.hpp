// Register script captured from working hardware during power-up.
// Replayed verbatim by emmc::Reader::init().
#ifndef EMMC_INIT_SCRIPT_HPP
#define EMMC_INIT_SCRIPT_HPP

#include "emmc/commands.hpp"

#include <cstdint>
#include <vector>

namespace emmc {

struct ScriptStep {
    enum class Op : uint8_t {
        Write,   // write value to reg
        Expect,  // read reg, value must match exactly
    };

    Op op;
    Register reg;
    uint32_t value;
};

// Controller bring-up, runs right after the sanity check and before training
const std::vector<ScriptStep>& controller_setup_script();

// Card identification and bus configuration, runs after training
const std::vector<ScriptStep>& card_setup_script();

// Memory training loop: repeated until Response0And1 moves from the initial
// sentinel to the ready sentinel.
namespace training {
constexpr uint32_t ARGUMENT = 0x40000080;
constexpr uint32_t COMMAND = 0x01020000;
constexpr uint32_t INITIAL_RESPONSE = 0x00FF8080;
constexpr uint32_t READY_RESPONSE = 0xC0FF8080;
} // namespace training

// Identification response returned by the card during card_setup_script()
namespace device_id {
constexpr uint32_t RESPONSE_0_1 = 0x0F4E59BF;
constexpr uint32_t RESPONSE_2_3 = 0x3932009D;
constexpr uint32_t RESPONSE_4_5 = 0x30303847;
constexpr uint32_t RESPONSE_6_7 = 0x00110100;
} // namespace device_id

} // namespace emmc

#endif // EMMC_INIT_SCRIPT_HPP
