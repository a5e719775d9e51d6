#ifndef EMMCSPI_CLI_PARSER_HPP
#define EMMCSPI_CLI_PARSER_HPP

#include "emmcspi/command.hpp"
#include "emmcspi/command_arguments.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace emmcspi {

struct ParsedCommand {
    CommandArguments arguments;
    bool help_requested = false;
    bool force = false;
};

// Throws std::invalid_argument on unknown options, missing values, wrong
// positional counts, and RequiresForce commands without --force.
ParsedCommand parse_command_arguments(const Command& command, const std::vector<std::string>& raw_args);

void print_command_usage(const Command& command, std::ostream& out);

} // namespace emmcspi

#endif // EMMCSPI_CLI_PARSER_HPP
