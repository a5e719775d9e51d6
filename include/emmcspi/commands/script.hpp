#ifndef EMMCSPI_COMMANDS_SCRIPT_HPP
#define EMMCSPI_COMMANDS_SCRIPT_HPP

#include "emmcspi/command_registry.hpp"

namespace emmcspi::commands {

void register_script_commands(CommandRegistry& registry);

} // namespace emmcspi::commands

#endif // EMMCSPI_COMMANDS_SCRIPT_HPP
