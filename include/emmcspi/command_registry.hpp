#ifndef EMMCSPI_COMMAND_REGISTRY_HPP
#define EMMCSPI_COMMAND_REGISTRY_HPP

#include "emmcspi/command.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace emmcspi {

/**
Command table with case-insensitive lookup by name or alias. References
returned by register_command() and find() stay valid for the registry's
lifetime (the Lua bindings hold on to them).
*/
class CommandRegistry {
public:
    CommandRegistry();

    // Throws std::invalid_argument for empty names, names with whitespace,
    // and names or aliases that are already taken. Nothing is registered
    // when it throws.
    Command& register_command(Command command);

    const Command* find(std::string_view name) const;

    const std::deque<Command>& commands() const noexcept { return commands_; }

private:
    std::deque<Command> commands_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

} // namespace emmcspi

#endif // EMMCSPI_COMMAND_REGISTRY_HPP
