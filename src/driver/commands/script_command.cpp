#include "emmcspi/commands/script.hpp"

#include "emmcspi/command_context.hpp"
#include "emmcspi/command_registry.hpp"
#include "emmcspi/command_arguments.hpp"
#include "emmcspi/scripting/lua_engine.hpp"

#include <exception>
#include <ostream>
#include <string>
#include <vector>

#if EMMCSPI_WITH_LUAJIT
#include <filesystem>
extern "C" {
#include "lua.hpp"
}
#endif

namespace emmcspi::commands {
namespace {

// Exit status for a script that loaded but raised an error
constexpr int kScriptFailed = 6;
// Exit status when the binary was built without LuaJIT
constexpr int kScriptingUnavailable = 64;

int script_command(const CommandContext& context) {
#if EMMCSPI_WITH_LUAJIT
    const auto& positionals = context.arguments.positionals();

    scripting::ScriptOptions options;
    options.path = positionals.front();
    options.allow_unsafe_libraries = context.arguments.has("allow-unsafe");
    options.args.assign(positionals.begin() + 1, positionals.end());

    const std::filesystem::path script_path = std::filesystem::absolute(options.path);
    options.path = script_path.string();
    if (!std::filesystem::is_regular_file(script_path)) {
        context.err << "Script '" << options.path << "' does not exist or is not a regular file.\n";
        return 1;
    }

    try {
        scripting::LuaEngine engine(context.registry,
                                    context.driver,
                                    context.out,
                                    context.err,
                                    context.verbose);
        engine.open_standard_libraries(options.allow_unsafe_libraries);
        engine.register_bindings();
        const int status = engine.run_file(options);
        if (status != LUA_OK) {
            context.err << "Lua interpreter returned status code " << status << ".\n";
            return kScriptFailed;
        }
    } catch (const std::exception& ex) {
        context.err << "Failed to run Lua script: " << ex.what() << "\n";
        return kScriptFailed;
    }
    return 0;
#else
    context.err << "Lua scripting support is not enabled. Reconfigure with -DEMMCSPI_WITH_LUAJIT=ON.\n";
    return kScriptingUnavailable;
#endif
}

} // namespace

void register_script_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "script",
        .aliases = {"lua"},
        .summary = "Run a Lua automation script against the controller.",
        .description = "Runs the Lua file with the emmc module (init, read_register, write_register, read_page, poll), "
                       "the driver table and every CLI command under commands.<name>. Extra positionals land in 'arg'. "
                       "The device is shared with the script, so init runs at most once per invocation.",
        .usage = "emmcspi script [--allow-unsafe] <script.lua> [args...]",
        .options = {
            OptionSpec{"allow-unsafe", '\0', false, false, false, "", "Expose Lua's os/io libraries (disabled by default)."},
        },
        .min_positionals = 1,
        .max_positionals = static_cast<std::size_t>(-1),
        .safety = CommandSafety::Safe,
        .requires_device = false,
        .stop_parsing_options_after_positionals = true,
        .handler = script_command,
    });
}

} // namespace emmcspi::commands
