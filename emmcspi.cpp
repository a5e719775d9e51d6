#include "emmcspi/cli_parser.hpp"
#include "emmcspi/command_arguments.hpp"
#include "emmcspi/command_context.hpp"
#include "emmcspi/command_registry.hpp"
#include "emmcspi/commands/emmc.hpp"
#include "emmcspi/commands/script.hpp"
#include "emmcspi/driver_context.hpp"
#include "logging.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace {

bool is_root_user() {
    return ::geteuid() == 0;
}

constexpr const char* kDriverBanner = "emmcspi";
constexpr const char* kDriverVersion = "0.1.0";

void print_global_help(const emmcspi::CommandRegistry& registry, std::ostream& out, bool verbose) {
    out << kDriverBanner << " (" << kDriverVersion << ")" << (verbose ? " [verbose]" : "") << "\n";
    out << "Usage: emmcspi [global options] <command> [options]\n";
    out << "       emmcspi help <command>\n\n";
    out << "Global options:\n";
    out << "  --verbose, -v            Progress output on stderr\n";
    out << "  --transport <gpio|spidev> Link to the controller (default gpio)\n";
    out << "  --device <path>          spidev node (default /dev/spidev0.0)\n";
    out << "  --speed <hz>             Serial clock (default " << EMMC_SPI_CLOCK_HZ << ")\n";
    out << "  --log-file <path>        Append log output to a file instead of stderr\n\n";
    out << "Commands:\n";
    for (const auto& command : registry.commands()) {
        out << "  " << command.name;
        if (!command.aliases.empty()) {
            out << " (";
            for (std::size_t i = 0; i < command.aliases.size(); ++i) {
                out << command.aliases[i];
                if (i + 1 < command.aliases.size()) out << ", ";
            }
            out << ")";
        }
        if (!command.summary.empty()) {
            out << "\n    " << command.summary;
        }
        out << "\n";
    }
}

int help_command(const emmcspi::CommandContext& context) {
    if (context.arguments.positional_count() == 0) {
        print_global_help(context.registry, context.out, context.verbose);
        return 0;
    }
    const std::string& target = context.arguments.positional(0);
    const emmcspi::Command* command = context.registry.find(target);
    if (command == nullptr) {
        context.err << "Unknown command: " << target << "\n";
        return 1;
    }
    emmcspi::print_command_usage(*command, context.out);
    return 0;
}

int version_command(const emmcspi::CommandContext& context) {
    context.out << kDriverBanner << "\n";
    context.out << "Version: " << kDriverVersion << "\n";
    context.out << "Transport: " << emmcspi::to_string(context.driver.options().transport) << "\n";
#if EMMCSPI_WITH_LUAJIT
    context.out << "Scripting: LuaJIT\n";
#else
    context.out << "Scripting: disabled\n";
#endif
    return 0;
}

void register_builtin_commands(emmcspi::CommandRegistry& registry) {
    registry.register_command({
        .name = "help",
        .aliases = {"?", "list"},
        .summary = "Display help for all commands or a specific command.",
        .description = "Without arguments prints the global command list; otherwise shows detailed usage for the given command.",
        .usage = "emmcspi help [command]",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 1,
        .safety = emmcspi::CommandSafety::Safe,
        .requires_device = false,
        .handler = help_command,
    });

    registry.register_command({
        .name = "version",
        .aliases = {"about"},
        .summary = "Print the tool version and build features.",
        .description = "Reports the version string, the selected transport and whether Lua scripting was compiled in.",
        .usage = "emmcspi version",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = emmcspi::CommandSafety::Safe,
        .requires_device = false,
        .handler = version_command,
    });
}

// Consumes the value following a global option
std::string take_global_value(int argc, char** argv, int& i, const std::string& name) {
    if (++i >= argc) {
        throw std::invalid_argument("Global option '" + name + "' expects a value");
    }
    return argv[i];
}

struct FileCloser {
    void operator()(std::FILE* file) const {
        emmcspi::log::set_output_file(nullptr);
        std::fclose(file);
    }
};

} // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    bool global_help = false;
    emmcspi::DriverOptions options;
    std::string command_name;
    std::vector<std::string> raw_args;
    std::unique_ptr<std::FILE, FileCloser> log_file;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (!command_name.empty()) {
                raw_args.emplace_back(std::move(arg));
                continue;
            }
            if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h" || arg == "--list-commands") {
                global_help = true;
            } else if (arg == "--transport") {
                options.transport = emmcspi::transport_from_name(take_global_value(argc, argv, i, arg));
            } else if (arg == "--device") {
                options.device = take_global_value(argc, argv, i, arg);
            } else if (arg == "--speed") {
                options.speed_hz = emmcspi::parse_u32(take_global_value(argc, argv, i, arg), "--speed");
                if (options.speed_hz == 0) {
                    throw std::invalid_argument("--speed must be non-zero");
                }
            } else if (arg == "--log-file") {
                const std::string path = take_global_value(argc, argv, i, arg);
                log_file.reset(std::fopen(path.c_str(), "a"));
                if (!log_file) {
                    throw std::invalid_argument("Cannot open log file '" + path + "'");
                }
                emmcspi::log::set_output_file(log_file.get());
            } else {
                command_name = std::move(arg);
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << "\n";
        return 3;
    }

    emmcspi::CommandRegistry registry;
    register_builtin_commands(registry);
    emmcspi::commands::register_emmc_commands(registry);
    emmcspi::commands::register_script_commands(registry);

    if (global_help && command_name.empty()) {
        print_global_help(registry, std::cout, verbose);
        return 0;
    }

    if (command_name.empty()) {
        std::cerr << "No command specified. Use --help to list commands." << "\n";
        return 1;
    }

    const emmcspi::Command* command = registry.find(command_name);
    if (command == nullptr) {
        std::cerr << "Unknown command: " << command_name << "\n";
        print_global_help(registry, std::cerr, verbose);
        return 2;
    }

    emmcspi::ParsedCommand parsed;
    try {
        parsed = emmcspi::parse_command_arguments(*command, raw_args);
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << "\n";
        emmcspi::print_command_usage(*command, std::cerr);
        return 3;
    }

    if (parsed.help_requested) {
        emmcspi::print_command_usage(*command, std::cout);
        return 0;
    }

    // bcm2835 maps /dev/mem, spidev only needs access to the device node
    if (command->requires_device && options.transport == emmcspi::TransportKind::Gpio && !is_root_user()) {
        std::cerr << "Command '" << command->name << "' drives GPIO and requires root privileges. Please rerun with sudo." << "\n";
        return 5;
    }

    emmcspi::DriverContext driver(verbose, options);

    emmcspi::CommandContext context{registry, driver, *command, std::move(parsed.arguments), std::cout, std::cerr, verbose, parsed.force, parsed.help_requested};

    try {
        return command->handler(context);
    } catch (const std::exception& ex) {
        context.err << "Command '" << command->name << "' failed: " << ex.what() << "\n";
    }
    return 4;
}
