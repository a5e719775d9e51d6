#ifndef EMMCSPI_COMMANDS_EMMC_HPP
#define EMMCSPI_COMMANDS_EMMC_HPP

#include "emmcspi/command_registry.hpp"

#include <cstdint>

namespace emmcspi::commands {

// Page dump defaults: argument stride and exclusive end of the full-card range
constexpr uint32_t kDumpStride = 512;
constexpr uint32_t kDumpEnd = 0x9E0000;

void register_emmc_commands(CommandRegistry& registry);

}

#endif // EMMCSPI_COMMANDS_EMMC_HPP
