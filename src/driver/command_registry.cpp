#include "emmcspi/command_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace emmcspi {

namespace {
std::string canonical_key(std::string_view name) {
    std::string key{name};
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return key;
}

void validate_name(const std::string& name, const char* what) {
    if (name.empty()) {
        throw std::invalid_argument(std::string(what) + " must not be empty");
    }
    const bool has_space = std::any_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (has_space) {
        throw std::invalid_argument(std::string(what) + " '" + name + "' contains whitespace");
    }
}
}

CommandRegistry::CommandRegistry() = default;

Command& CommandRegistry::register_command(Command command) {
    validate_name(command.name, "command name");

    std::vector<std::string> keys;
    keys.push_back(canonical_key(command.name));
    for (const auto& alias : command.aliases) {
        validate_name(alias, "command alias");
        keys.push_back(canonical_key(alias));
    }
    for (std::size_t i = 0; i < keys.size(); ++i) {
        const bool taken = lookup_.count(keys[i]) != 0U ||
                           std::find(keys.begin(), keys.begin() + static_cast<std::ptrdiff_t>(i), keys[i]) !=
                               keys.begin() + static_cast<std::ptrdiff_t>(i);
        if (taken) {
            throw std::invalid_argument("duplicate command name or alias: " + keys[i]);
        }
    }

    const std::size_t index = commands_.size();
    commands_.push_back(std::move(command));
    for (auto& key : keys) {
        lookup_.emplace(std::move(key), index);
    }
    return commands_.back();
}

const Command* CommandRegistry::find(std::string_view name) const {
    const auto it = lookup_.find(canonical_key(name));
    if (it == lookup_.end()) return nullptr;
    return &commands_.at(it->second);
}

} // namespace emmcspi
