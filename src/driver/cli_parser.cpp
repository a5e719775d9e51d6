#include "emmcspi/cli_parser.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace emmcspi {

namespace {

using OptionValues = std::unordered_map<std::string, std::vector<std::string>>;

class ArgumentParser {
public:
    explicit ArgumentParser(const Command& command) : command_(command) {
        for (const auto& option : command.options) {
            if (option.long_name.empty()) {
                throw std::invalid_argument("Option long name must not be empty");
            }
            if (!by_long_.emplace(option.long_name, &option).second) {
                throw std::invalid_argument("Duplicate option long name: --" + option.long_name);
            }
            if (option.short_name != '\0' && !by_short_.emplace(option.short_name, &option).second) {
                throw std::invalid_argument(std::string("Duplicate short option: -") + option.short_name);
            }
        }
    }

    ParsedCommand parse(const std::vector<std::string>& raw_args) {
        bool positional_mode = false;
        for (std::size_t i = 0; i < raw_args.size(); ++i) {
            const std::string& token = raw_args[i];

            if (command_.stop_parsing_options_after_positionals && !positionals_.empty()) {
                positional_mode = true;
            }
            if (positional_mode) {
                positionals_.push_back(token);
                continue;
            }

            if (token == "--") {
                positional_mode = true;
            } else if (token == "--help" || token == "-h") {
                help_ = true;
            } else if (token == "--force" || token == "-f") {
                force_ = true;
            } else if (token.rfind("--", 0) == 0) {
                parse_long(token.substr(2), raw_args, i);
            } else if (token.size() >= 2 && token[0] == '-' && !is_number(token)) {
                parse_short(token, raw_args, i);
            } else {
                positionals_.push_back(token);
            }
        }

        if (!help_) {
            validate();
        }

        ParsedCommand parsed;
        parsed.arguments = CommandArguments{std::move(values_), std::move(positionals_)};
        parsed.help_requested = help_;
        parsed.force = force_;
        return parsed;
    }

private:
    // "-5" style tokens are positionals, not short options
    static bool is_number(const std::string& token) {
        return token.size() >= 2 && token[0] == '-' && token[1] >= '0' && token[1] <= '9';
    }

    static std::string take_value(const std::vector<std::string>& raw_args, std::size_t& i, const std::string& shown) {
        if (++i >= raw_args.size()) {
            throw std::invalid_argument("Option '" + shown + "' expects a value");
        }
        return raw_args[i];
    }

    void parse_long(const std::string& body, const std::vector<std::string>& raw_args, std::size_t& i) {
        const auto equals_pos = body.find('=');
        const std::string name = body.substr(0, equals_pos);
        const std::string shown = "--" + name;

        const auto it = by_long_.find(name);
        if (it == by_long_.end()) {
            throw std::invalid_argument("Unknown option '" + shown + "'");
        }
        const OptionSpec& spec = *it->second;

        if (!spec.requires_value) {
            if (equals_pos != std::string::npos) {
                throw std::invalid_argument("Option '" + shown + "' does not take a value");
            }
            store(spec, "true");
            return;
        }
        store(spec, equals_pos != std::string::npos ? body.substr(equals_pos + 1) : take_value(raw_args, i, shown));
    }

    void parse_short(const std::string& token, const std::vector<std::string>& raw_args, std::size_t& i) {
        const char name = token[1];
        const std::string shown = std::string("-") + name;

        const auto it = by_short_.find(name);
        if (it == by_short_.end()) {
            throw std::invalid_argument("Unknown option '" + shown + "'");
        }
        const OptionSpec& spec = *it->second;
        const bool inline_value = token.size() > 2;

        if (!spec.requires_value) {
            if (inline_value) {
                throw std::invalid_argument("Option '" + shown + "' does not take a value");
            }
            store(spec, "true");
            return;
        }
        store(spec, inline_value ? token.substr(2) : take_value(raw_args, i, shown));
    }

    void store(const OptionSpec& spec, std::string value) {
        auto& slot = values_[spec.long_name];
        if (!spec.repeatable && !slot.empty()) {
            throw std::invalid_argument("Option '--" + spec.long_name + "' specified multiple times");
        }
        slot.push_back(std::move(value));
    }

    void validate() const {
        for (const auto& option : command_.options) {
            if (option.required && values_.find(option.long_name) == values_.end()) {
                throw std::invalid_argument("Missing required option '--" + option.long_name + "'");
            }
        }
        if (positionals_.size() < command_.min_positionals) {
            throw std::invalid_argument("Insufficient positional arguments");
        }
        if (command_.max_positionals != static_cast<std::size_t>(-1) &&
            positionals_.size() > command_.max_positionals) {
            throw std::invalid_argument("Too many positional arguments");
        }
        if (command_.safety == CommandSafety::RequiresForce && !force_) {
            throw std::invalid_argument("Command requires --force to proceed");
        }
    }

    const Command& command_;
    std::unordered_map<std::string, const OptionSpec*> by_long_;
    std::unordered_map<char, const OptionSpec*> by_short_;
    OptionValues values_;
    std::vector<std::string> positionals_;
    bool help_ = false;
    bool force_ = false;
};

} // namespace

ParsedCommand parse_command_arguments(const Command& command, const std::vector<std::string>& raw_args) {
    return ArgumentParser(command).parse(raw_args);
}

void print_command_usage(const Command& command, std::ostream& out) {
    out << "Usage: " << command.usage << "\n";
    if (!command.summary.empty()) {
        out << command.summary << "\n";
    }
    if (!command.description.empty()) {
        out << "\n" << command.description << "\n";
    }

    out << "\nOptions:\n";
    for (const auto& option : command.options) {
        out << "  --" << option.long_name;
        if (option.short_name != '\0') {
            out << ", -" << option.short_name;
        }
        if (option.requires_value) {
            out << " <" << (option.value_name.empty() ? "value" : option.value_name) << ">";
        }
        if (option.required) {
            out << " (required)";
        }
        out << "\n";
        if (!option.description.empty()) {
            out << "      " << option.description << "\n";
        }
    }
    if (command.safety == CommandSafety::RequiresForce) {
        out << "  --force, -f\n"
            << "      Confirm an operation that changes controller or card state.\n";
    }
    out << "  --help, -h\n      Show command-specific help.\n";
}

} // namespace emmcspi
