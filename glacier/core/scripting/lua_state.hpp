#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <optional>

// Forward declare sol types to avoid header pollution
struct lua_State;

namespace sol {
class state;
}

namespace glacier::scripting {

// Script execution result
struct ScriptResult {
    bool success{false};
    std::string error;
    
    static ScriptResult ok() { return {true, ""}; }
    static ScriptResult fail(const std::string& err) { return {false, err}; }
    
    explicit operator bool() const { return success; }
};

// Memory and instruction limits for sandboxed scripts
struct ScriptLimits {
    std::size_t maxMemoryBytes{64 * 1024 * 1024};  // 64 MB default
    std::size_t maxInstructions{10000000};          // 10M hook ticks per call
    double maxExecutionTimeSec{5.0};                // 5 seconds max
};

// Lua VM wrapper with optional sandboxing
class LuaState {
public:
    LuaState();
    ~LuaState();
    
    // Non-copyable, movable
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&&) noexcept;
    LuaState& operator=(LuaState&&) noexcept;
    
    // Initialize the Lua state
    bool init();
    
    // Apply sandbox restrictions (removes dangerous functions)
    void apply_sandbox(const ScriptLimits& limits = {});
    
    bool is_sandboxed() const { return sandboxed_; }
    const ScriptLimits& limits() const { return limits_; }
    
    // Load and execute a script string
    ScriptResult execute(const std::string& script, const std::string& chunkName = "script");
    
    // Load a script without executing (for syntax checking)
    ScriptResult load(const std::string& script, const std::string& chunkName = "script");
    
    // Call a global function by name
    ScriptResult call(const std::string& funcName);
    ScriptResult call(const std::string& funcName, float arg1);
    
    bool has_function(const std::string& funcName) const;
    
    // Restart the instruction/time budget. Must precede any call into Lua
    // that does not go through execute() or call() (e.g. event callbacks).
    void reset_limits();
    
    std::optional<int> get_global_int(const std::string& name) const;
    std::optional<double> get_global_double(const std::string& name) const;
    std::optional<bool> get_global_bool(const std::string& name) const;
    std::optional<std::string> get_global_string(const std::string& name) const;
    
    // Access the underlying sol::state (for advanced usage)
    sol::state& state();
    const sol::state& state() const;
    
    // Get raw lua_State pointer (for C API interop)
    lua_State* lua_state();
    
    // Memory usage tracking
    std::size_t memory_used() const;


private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool sandboxed_{false};
    ScriptLimits limits_{};
};

// Convenience function to create a sandboxed Lua state
std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits = {});

// Convenience function to create an unrestricted Lua state (for trusted scripts)
std::unique_ptr<LuaState> create_engine_state();

} // namespace glacier::scripting
