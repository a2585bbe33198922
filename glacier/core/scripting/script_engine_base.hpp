#pragma once

#include "lua_state.hpp"
#include "sandbox.hpp"
#include "script_types.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace glacier::scripting {

// Base class for host script engines.
// Provides common infrastructure for Lua scripting with sandboxing.
// Hosts inherit and implement register_game_api() to expose their API.
class ScriptEngineBase {
public:
    ScriptEngineBase();
    virtual ~ScriptEngineBase();
    
    // Non-copyable
    ScriptEngineBase(const ScriptEngineBase&) = delete;
    ScriptEngineBase& operator=(const ScriptEngineBase&) = delete;
    
    // Initialize the engine with sandbox configuration
    bool init(const SandboxConfig& config = SandboxConfig::default_for_scenes());
    
    // Validate and run a script
    ScriptResult load_script(const ScriptSource& script);
    
    // Read `path` and run it; the chunk is named after the file
    ScriptResult load_script_file(const std::filesystem::path& path);
    
    // Unload current script and start over with a fresh state
    void unload();
    
    bool has_scripts() const { return scriptsLoaded_; }
    
    // Calls the script's on_update(dt) if it defines one
    void update(float deltaTime);
    
    LuaState* lua_state() { return lua_.get(); }
    const LuaState* lua_state() const { return lua_.get(); }
    
    const std::string& last_error() const { return lastError_; }
    
    // Set logging callback for script print() calls
    void set_log_callback(std::function<void(const std::string&)> callback);

protected:
    // Override this to register the host API
    // Called after engine initialization and after every reset
    virtual void register_game_api(LuaState& lua) = 0;
    
    // Override this to setup constants
    virtual void register_constants(LuaState& lua) { (void)lua; }
    
    // Called before the Lua state is reset or destroyed; drop every
    // reference into it here.
    virtual void release_script_references() {}
    
    // Call a Lua hook/callback by name (no args)
    void call_hook(const char* hookName);
    
    void set_last_error(std::string err) { lastError_ = std::move(err); }
    
    // Access for derived classes
    std::function<void(const std::string&)>& log_callback() { return logCallback_; }

    // Derived destructors must call this; the base destructor is too late
    // for release_script_references() to dispatch virtually.
    void shutdown();

private:
    void setup_base_api();
    
    std::unique_ptr<LuaState> lua_;
    SandboxConfig config_{};
    
    bool scriptsLoaded_{false};
    std::string lastError_;
    
    std::function<void(const std::string&)> logCallback_;
};

} // namespace glacier::scripting
