#ifndef EMMCSPI_SCRIPTING_LUA_ENGINE_HPP
#define EMMCSPI_SCRIPTING_LUA_ENGINE_HPP

#include "emmcspi/command_registry.hpp"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace emmcspi {
class DriverContext;
}

#if EMMCSPI_WITH_LUAJIT
extern "C" {
struct lua_State;
}
#endif

namespace emmcspi::scripting {

struct ScriptOptions {
    std::string path;
    std::vector<std::string> args;
    bool allow_unsafe_libraries = false;
};

#if EMMCSPI_WITH_LUAJIT

/**
LuaJIT host for automation scripts. Exposes:
  exec(name, ...)            run a registered command, returns its status
  commands.<name>{opts, ...} table-style command dispatch
  driver.init/shutdown/is_initialized
  emmc.*                     direct register and page access on the shared Reader
*/
class LuaEngine {
public:
    LuaEngine(CommandRegistry& registry,
              DriverContext& driver,
              std::ostream& out,
              std::ostream& err,
              bool verbose);
    ~LuaEngine();

    LuaEngine(const LuaEngine&) = delete;
    LuaEngine& operator=(const LuaEngine&) = delete;

    LuaEngine(LuaEngine&&) = delete;
    LuaEngine& operator=(LuaEngine&&) = delete;

    void open_standard_libraries(bool allow_unsafe);
    void register_bindings();
    int run_file(const ScriptOptions& options);

    // Runs a chunk of Lua source; used by tests and the REPL-less one-liners
    int run_string(const std::string& chunk, const std::string& name = "=chunk");

private:
    CommandRegistry& registry_;
    DriverContext& driver_;
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    ::lua_State* state_ = nullptr;

    void push_script_arguments(const ScriptOptions& options);
    void push_closure(int (*fn)(::lua_State*), int table_index, const char* field);
    int report_failure(int status, const std::string& label);

    static int lua_exec(::lua_State* L);
    static int lua_command_dispatch(::lua_State* L);
    static int lua_driver_init(::lua_State* L);
    static int lua_driver_shutdown(::lua_State* L);
    static int lua_driver_initialized(::lua_State* L);
    static int lua_read_register(::lua_State* L);
    static int lua_write_register(::lua_State* L);
    static int lua_read_page(::lua_State* L);
    static int lua_poll(::lua_State* L);
    static LuaEngine& from_upvalue(::lua_State* L);

    int invoke_command(const std::string& name, const std::vector<std::string>& args);
    void ensure_state() const;
};

#else // EMMCSPI_WITH_LUAJIT

class LuaEngine {
public:
    LuaEngine(CommandRegistry&, DriverContext&, std::ostream&, std::ostream&, bool) {
        throw std::runtime_error("LuaJIT support not enabled in this build");
    }
    void open_standard_libraries(bool) {}
    void register_bindings() {}
    int run_file(const ScriptOptions&) { return 1; }
    int run_string(const std::string&, const std::string& = "=chunk") { return 1; }
};

#endif // EMMCSPI_WITH_LUAJIT

} // namespace emmcspi::scripting

#endif // EMMCSPI_SCRIPTING_LUA_ENGINE_HPP
