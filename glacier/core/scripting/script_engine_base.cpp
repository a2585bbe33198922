#include "script_engine_base.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <fstream>
#include <sstream>

namespace glacier::scripting {

ScriptEngineBase::ScriptEngineBase() = default;
ScriptEngineBase::~ScriptEngineBase() = default;

bool ScriptEngineBase::init(const SandboxConfig& config) {
    // Set up print handler to route to our log callback
    config_ = config;
    config_.printHandler = [this](const std::string& msg) {
        if (logCallback_) {
            logCallback_(msg);
        }
    };
    
    lua_ = Sandbox::create(config_);
    if (!lua_) {
        lastError_ = "Failed to create Lua state";
        return false;
    }
    
    setup_base_api();
    register_constants(*lua_);
    register_game_api(*lua_);
    
    return true;
}

void ScriptEngineBase::setup_base_api() {
    if (!lua_) return;
    
    auto& state = lua_->state();
    
    // Provide log as alias for print
    state["log"] = state["print"];
}

ScriptResult ScriptEngineBase::load_script(const ScriptSource& script) {
    if (!lua_) {
        return ScriptResult::fail("Engine not initialized");
    }
    
    if (scriptsLoaded_) {
        unload();
    }
    
    if (script.empty()) {
        return ScriptResult::ok();
    }
    
    if (!config_.trusted) {
        auto validation = Sandbox::validate_script(script.content);
        if (!validation.valid) {
            std::string errors;
            for (const auto& err : validation.errors) {
                if (!errors.empty()) errors += "; ";
                errors += err;
            }
            lastError_ = "Script validation failed: " + errors;
            return ScriptResult::fail(lastError_);
        }
        for (const auto& warning : validation.warnings) {
            if (logCallback_) {
                logCallback_("[script warning] " + script.name + ": " + warning);
            }
        }
    }
    
    // Loaded before execution: callbacks may fire while the chunk runs
    scriptsLoaded_ = true;
    
    auto result = lua_->execute(script.content, script.name);
    if (!result) {
        lastError_ = "Failed to run " + script.name + ": " + result.error;
        return ScriptResult::fail(lastError_);
    }
    
    if (lua_->has_function("on_init")) {
        call_hook("on_init");
    }
    
    return ScriptResult::ok();
}

ScriptResult ScriptEngineBase::load_script_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        lastError_ = "Failed to open script " + path.string();
        return ScriptResult::fail(lastError_);
    }
    
    std::ostringstream ss;
    ss << in.rdbuf();
    
    ScriptSource source;
    source.name = path.filename().string();
    source.content = ss.str();
    return load_script(source);
}

void ScriptEngineBase::unload() {
    if (!lua_) return;
    
    if (scriptsLoaded_ && lua_->has_function("on_unload")) {
        call_hook("on_unload");
    }
    
    scriptsLoaded_ = false;
    release_script_references();
    
    // Fresh state with the same sandbox and print routing
    lua_ = Sandbox::create(config_);
    if (!lua_) {
        lastError_ = "Failed to recreate Lua state";
        return;
    }
    setup_base_api();
    register_constants(*lua_);
    register_game_api(*lua_);
}

void ScriptEngineBase::shutdown() {
    if (!lua_) return;
    
    if (scriptsLoaded_ && lua_->has_function("on_unload")) {
        call_hook("on_unload");
    }
    scriptsLoaded_ = false;
    release_script_references();
    lua_.reset();
}

void ScriptEngineBase::update(float deltaTime) {
    if (!scriptsLoaded_ || !lua_) return;
    
    if (lua_->has_function("on_update")) {
        auto result = lua_->call("on_update", deltaTime);
        if (!result) {
            lastError_ = "Hook 'on_update' error: " + result.error;
            if (logCallback_) {
                logCallback_("[script error] " + lastError_);
            }
        }
    }
}

void ScriptEngineBase::call_hook(const char* hookName) {
    if (!scriptsLoaded_ || !lua_) return;
    
    if (lua_->has_function(hookName)) {
        auto result = lua_->call(hookName);
        if (!result) {
            lastError_ = std::string("Hook '") + hookName + "' error: " + result.error;
            if (logCallback_) {
                logCallback_("[script error] " + lastError_);
            }
        }
    }
}

void ScriptEngineBase::set_log_callback(std::function<void(const std::string&)> callback) {
    logCallback_ = std::move(callback);
}

} // namespace glacier::scripting
