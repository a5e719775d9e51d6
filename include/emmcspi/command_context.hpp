#ifndef EMMCSPI_COMMAND_CONTEXT_HPP
#define EMMCSPI_COMMAND_CONTEXT_HPP

#include "emmcspi/command_arguments.hpp"

#include <iosfwd>

namespace emmcspi {

class CommandRegistry;
class DriverContext;
struct Command;

struct CommandContext {
    CommandRegistry& registry;
    DriverContext& driver;
    const Command& command;
    CommandArguments arguments;
    std::ostream& out;
    std::ostream& err;
    bool verbose = false;
    bool force = false;
    bool help_requested = false;
};

} // namespace emmcspi

#endif // EMMCSPI_COMMAND_CONTEXT_HPP
