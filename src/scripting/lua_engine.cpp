#include "emmcspi/scripting/lua_engine.hpp"

#if EMMCSPI_WITH_LUAJIT

#include "emmcspi/cli_parser.hpp"
#include "emmcspi/command_context.hpp"
#include "emmcspi/driver_context.hpp"
#include "emmc/commands.hpp"
#include "emmc/error.hpp"
#include "emmc/reader.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include "lua.hpp"
}

namespace {

// Lua identifiers cannot contain '-', so "read-page" is also bound as "read_page"
std::string sanitize_identifier(std::string_view name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (char ch : name) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        sanitized.push_back(std::isalnum(uch) ? static_cast<char>(std::tolower(uch)) : '_');
    }
    if (!sanitized.empty() && std::isdigit(static_cast<unsigned char>(sanitized.front()))) {
        sanitized.insert(sanitized.begin(), '_');
    }
    return sanitized;
}

std::string option_key(std::string_view key) {
    std::string normalized;
    normalized.reserve(key.size());
    for (char ch : key) {
        normalized.push_back(ch == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

const emmcspi::OptionSpec* find_option_spec(const emmcspi::Command& command, std::string_view name) {
    for (const auto& option : command.options) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

int absolute_index(lua_State* L, int index) {
    if (index > 0 || index <= LUA_REGISTRYINDEX) {
        return index;
    }
    return lua_gettop(L) + index + 1;
}

std::string lua_to_token(lua_State* L, int index, const char* context) {
    switch (lua_type(L, index)) {
    case LUA_TSTRING:
    case LUA_TNUMBER: {
        size_t len = 0;
        const char* value = lua_tolstring(L, index, &len);
        return std::string(value, len);
    }
    case LUA_TBOOLEAN:
        return lua_toboolean(L, index) ? "true" : "false";
    default:
        luaL_error(L, "%s must be a string, number, or boolean", context);
        break;
    }
    return {};
}

// Register from a name string or a numeric address
emmc::Register check_register(lua_State* L, int index) {
    if (lua_type(L, index) == LUA_TNUMBER) {
        const lua_Integer addr = lua_tointeger(L, index);
        if (addr >= 0 && addr <= 0xFF) {
            if (auto reg = emmc::register_from_address(static_cast<uint8_t>(addr))) {
                return *reg;
            }
        }
        luaL_error(L, "no known register at address %d", static_cast<int>(addr));
    }
    const char* name = luaL_checkstring(L, index);
    if (auto reg = emmc::register_from_name(name)) {
        return *reg;
    }
    luaL_error(L, "unknown register '%s'", name);
    return emmc::Register::Argument;
}

uint32_t check_u32(lua_State* L, int index) {
    const auto value = emmcspi::u32_from_number(luaL_checknumber(L, index));
    if (!value) {
        luaL_argerror(L, index, "expected an integer in 0..0xFFFFFFFF");
        return 0;
    }
    return *value;
}

} // namespace

namespace emmcspi::scripting {

LuaEngine::LuaEngine(CommandRegistry& registry,
                     DriverContext& driver,
                     std::ostream& out,
                     std::ostream& err,
                     bool verbose)
    : registry_(registry),
      driver_(driver),
      out_(out),
      err_(err),
      verbose_(verbose),
      state_(luaL_newstate()) {
    if (state_ == nullptr) {
        throw std::runtime_error("Failed to initialise LuaJIT state");
    }
}

LuaEngine::~LuaEngine() {
    if (state_ != nullptr) {
        lua_close(state_);
        state_ = nullptr;
    }
}

void LuaEngine::ensure_state() const {
    if (state_ == nullptr) {
        throw std::runtime_error("Lua state is not initialised");
    }
}

void LuaEngine::open_standard_libraries(bool allow_unsafe) {
    ensure_state();
    luaL_openlibs(state_);
    if (!allow_unsafe) {
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_OSLIBNAME);
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_IOLIBNAME);
    }
}

LuaEngine& LuaEngine::from_upvalue(lua_State* L) {
    void* context = lua_touserdata(L, lua_upvalueindex(1));
    if (context == nullptr) {
        luaL_error(L, "missing scripting context");
    }
    return *static_cast<LuaEngine*>(context);
}

void LuaEngine::push_closure(int (*fn)(lua_State*), int table_index, const char* field) {
    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, fn, 1);
    lua_setfield(state_, table_index, field);
}

int LuaEngine::lua_exec(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const int nargs = lua_gettop(L);
    const char* command_name = luaL_checkstring(L, 1);
    std::vector<std::string> args;
    for (int i = 2; i <= nargs; ++i) {
        if (lua_isnil(L, i)) continue;
        args.push_back(lua_to_token(L, i, "exec argument"));
    }
    lua_pushinteger(L, engine.invoke_command(command_name, args));
    return 1;
}

int LuaEngine::lua_driver_init(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    try {
        engine.driver_.require_initialized();
    } catch (const std::exception& ex) {
        return luaL_error(L, "init failed: %s", ex.what());
    }
    lua_pushboolean(L, 1);
    return 1;
}

int LuaEngine::lua_driver_shutdown(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    engine.driver_.shutdown();
    lua_pushboolean(L, 1);
    return 1;
}

int LuaEngine::lua_driver_initialized(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    lua_pushboolean(L, engine.driver_.initialized() ? 1 : 0);
    return 1;
}

int LuaEngine::lua_read_register(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const emmc::Register reg = check_register(L, 1);
    uint32_t value = 0;
    try {
        value = engine.driver_.require_initialized().read_register(reg);
    } catch (const std::exception& ex) {
        return luaL_error(L, "read_register failed: %s", ex.what());
    }
    lua_pushnumber(L, static_cast<lua_Number>(value));
    return 1;
}

int LuaEngine::lua_write_register(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const emmc::Register reg = check_register(L, 1);
    const uint32_t value = check_u32(L, 2);
    try {
        engine.driver_.require_initialized().write_register(reg, value);
    } catch (const std::exception& ex) {
        return luaL_error(L, "write_register failed: %s", ex.what());
    }
    return 0;
}

int LuaEngine::lua_read_page(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const uint32_t page = check_u32(L, 1);
    emmc::PageBuffer buffer{};
    try {
        engine.driver_.require_initialized().read_page(page, buffer);
    } catch (const std::exception& ex) {
        return luaL_error(L, "read_page failed: %s", ex.what());
    }
    lua_pushlstring(L, reinterpret_cast<const char*>(buffer.data()), buffer.size());
    return 1;
}

// emmc.poll(register, value) -> true, or false when the poll budget runs out
int LuaEngine::lua_poll(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const emmc::Register reg = check_register(L, 1);
    const uint32_t value = check_u32(L, 2);
    bool reached = true;
    try {
        engine.driver_.require_initialized().poll_for_value(reg, value);
    } catch (const emmc::Error& ex) {
        if (ex.kind() != emmc::ErrorKind::Timeout) {
            return luaL_error(L, "poll failed: %s", ex.what());
        }
        reached = false;
    }
    lua_pushboolean(L, reached ? 1 : 0);
    return 1;
}


void LuaEngine::register_bindings() {
    ensure_state();

    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, &LuaEngine::lua_exec, 1);
    lua_setglobal(state_, "exec");

    lua_newtable(state_);
    const int driver_index = lua_gettop(state_);
    push_closure(&LuaEngine::lua_driver_init, driver_index, "init");
    push_closure(&LuaEngine::lua_driver_shutdown, driver_index, "shutdown");
    push_closure(&LuaEngine::lua_driver_initialized, driver_index, "is_initialized");
    lua_setglobal(state_, "driver");

    lua_newtable(state_);
    const int commands_index = lua_gettop(state_);
    for (const auto& command : registry_.commands()) {
        auto bind_command = [&](const std::string& key) {
            lua_pushlightuserdata(state_, this);
            lua_pushlightuserdata(state_, const_cast<Command*>(&command));
            lua_pushcclosure(state_, &LuaEngine::lua_command_dispatch, 2);
            lua_setfield(state_, commands_index, key.c_str());
        };
        std::vector<std::string> names{command.name};
        names.insert(names.end(), command.aliases.begin(), command.aliases.end());
        for (const auto& name : names) {
            bind_command(name);
            const std::string id = sanitize_identifier(name);
            if (id != name) {
                bind_command(id);
            }
        }
    }
    lua_setglobal(state_, "commands");

    lua_newtable(state_);
    const int module_index = lua_gettop(state_);
    push_closure(&LuaEngine::lua_exec, module_index, "exec");
    push_closure(&LuaEngine::lua_driver_init, module_index, "init");
    push_closure(&LuaEngine::lua_driver_initialized, module_index, "is_initialized");
    push_closure(&LuaEngine::lua_read_register, module_index, "read_register");
    push_closure(&LuaEngine::lua_write_register, module_index, "write_register");
    push_closure(&LuaEngine::lua_read_page, module_index, "read_page");
    push_closure(&LuaEngine::lua_poll, module_index, "poll");

    lua_pushinteger(state_, static_cast<lua_Integer>(emmc::kPageSize));
    lua_setfield(state_, module_index, "PAGE_SIZE");

    lua_getglobal(state_, "driver");
    lua_setfield(state_, module_index, "driver");
    lua_getglobal(state_, "commands");
    lua_setfield(state_, module_index, "commands");

    lua_setglobal(state_, "emmc");
}

void LuaEngine::push_script_arguments(const ScriptOptions& options) {
    ensure_state();
    lua_newtable(state_);

    lua_pushlstring(state_, options.path.c_str(), options.path.size());
    lua_rawseti(state_, -2, 0);

    for (std::size_t index = 0; index < options.args.size(); ++index) {
        const std::string& value = options.args[index];
        lua_pushlstring(state_, value.c_str(), value.size());
        lua_rawseti(state_, -2, static_cast<int>(index + 1));
    }

    lua_setglobal(state_, "arg");
}

/**
commands.<name>([options], positional...)

The optional first table maps long option names (underscores allowed) to
values; `args` holds extra positionals, `force`/`help` map to the flags and
`allow_failure` returns false,status instead of raising on a non-zero exit.
*/
int LuaEngine::lua_command_dispatch(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    void* command_ptr = lua_touserdata(L, lua_upvalueindex(2));
    if (command_ptr == nullptr) {
        return luaL_error(L, "internal error: missing command binding");
    }
    const Command& command = *static_cast<Command*>(command_ptr);

    std::vector<std::string> option_tokens;
    std::vector<std::string> positional_tokens;
    bool allow_failure = false;

    const int nargs = lua_gettop(L);
    int positional_start = 1;

    if (nargs >= 1 && lua_istable(L, 1)) {
        const int table_index = absolute_index(L, 1);
        lua_pushnil(L);
        while (lua_next(L, table_index) != 0) {
            if (lua_type(L, -2) != LUA_TSTRING) {
                return luaL_error(L, "options table keys must be strings");
            }
            const std::string key = option_key(lua_tostring(L, -2));

            if (key == "args") {
                luaL_checktype(L, -1, LUA_TTABLE);
                const int args_index = absolute_index(L, -1);
                const size_t len = lua_objlen(L, args_index);
                for (size_t i = 1; i <= len; ++i) {
                    lua_rawgeti(L, args_index, static_cast<int>(i));
                    positional_tokens.push_back(lua_to_token(L, -1, "options.args entry"));
                    lua_pop(L, 1);
                }
            } else if (key == "allow-failure") {
                allow_failure = lua_toboolean(L, -1) != 0;
            } else if (key == "force" || key == "help") {
                if (lua_toboolean(L, -1)) {
                    option_tokens.push_back("--" + key);
                }
            } else {
                const OptionSpec* spec = find_option_spec(command, key);
                if (spec == nullptr) {
                    return luaL_error(L, "unknown option '%s' for command '%s'", key.c_str(), command.name.c_str());
                }
                if (!spec->requires_value) {
                    if (lua_toboolean(L, -1)) {
                        option_tokens.push_back("--" + spec->long_name);
                    }
                } else {
                    option_tokens.push_back("--" + spec->long_name);
                    option_tokens.push_back(lua_to_token(L, -1, "option value"));
                }
            }
            lua_pop(L, 1);
        }
        positional_start = 2;
    }

    for (int index = positional_start; index <= nargs; ++index) {
        if (lua_isnil(L, index)) continue;
        positional_tokens.push_back(lua_to_token(L, index, "positional argument"));
    }

    std::vector<std::string> args = std::move(option_tokens);
    args.insert(args.end(), positional_tokens.begin(), positional_tokens.end());

    const int status = engine.invoke_command(command.name, args);
    if (status != 0) {
        if (!allow_failure) {
            return luaL_error(L, "command '%s' failed with status %d", command.name.c_str(), status);
        }
        lua_pushboolean(L, 0);
        lua_pushinteger(L, status);
        return 2;
    }

    lua_pushboolean(L, 1);
    return 1;
}

int LuaEngine::report_failure(int status, const std::string& label) {
    const char* message = lua_tostring(state_, -1);
    err_ << label << ": " << (message ? message : "unknown error") << "\n";
    lua_pop(state_, 1);
    return status;
}

int LuaEngine::run_file(const ScriptOptions& options) {
    ensure_state();
    push_script_arguments(options);

    const int load_status = luaL_loadfile(state_, options.path.c_str());
    if (load_status != LUA_OK) {
        return report_failure(load_status, "Failed to load script '" + options.path + "'");
    }
    const int call_status = lua_pcall(state_, 0, LUA_MULTRET, 0);
    if (call_status != LUA_OK) {
        return report_failure(call_status, "Script '" + options.path + "' failed");
    }
    return LUA_OK;
}

int LuaEngine::run_string(const std::string& chunk, const std::string& name) {
    ensure_state();
    const int load_status = luaL_loadbuffer(state_, chunk.data(), chunk.size(), name.c_str());
    if (load_status != LUA_OK) {
        return report_failure(load_status, "Failed to load chunk");
    }
    const int call_status = lua_pcall(state_, 0, LUA_MULTRET, 0);
    if (call_status != LUA_OK) {
        return report_failure(call_status, "Chunk failed");
    }
    return LUA_OK;
}

int LuaEngine::invoke_command(const std::string& name, const std::vector<std::string>& args) {
    const Command* command = registry_.find(name);
    if (command == nullptr) {
        err_ << "exec: unknown command '" << name << "'\n";
        return 2;
    }

    ParsedCommand parsed;
    try {
        parsed = parse_command_arguments(*command, args);
    } catch (const std::exception& ex) {
        err_ << "exec: argument error for '" << name << "': " << ex.what() << "\n";
        print_command_usage(*command, err_);
        return 3;
    }

    if (parsed.help_requested) {
        print_command_usage(*command, out_);
        return 0;
    }

    CommandContext context{
        registry_,
        driver_,
        *command,
        std::move(parsed.arguments),
        out_,
        err_,
        verbose_,
        parsed.force,
        parsed.help_requested};

    try {
        return command->handler(context);
    } catch (const std::exception& ex) {
        err_ << "exec: command '" << command->name << "' failed: " << ex.what() << "\n";
    }
    return 4;
}

} // namespace emmcspi::scripting

#endif // EMMCSPI_WITH_LUAJIT
