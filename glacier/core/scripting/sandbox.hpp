#pragma once

#include "lua_state.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace glacier::scripting {

// Sandbox configuration for scene scripts
struct SandboxConfig {
    // Trusted scripts get the full standard library and no limits.
    bool trusted{false};
    
    // Memory limits
    std::size_t maxMemoryMB{64};
    
    // Execution limits
    std::size_t maxInstructionsPerCall{10000000};  // 10M
    double maxExecutionTimeSec{5.0};
    
    // Custom print handler
    std::function<void(const std::string&)> printHandler;
    
    static SandboxConfig default_for_scenes() {
        SandboxConfig cfg;
        cfg.maxMemoryMB = 32;
        cfg.maxInstructionsPerCall = 5000000;  // 5M per call
        cfg.maxExecutionTimeSec = 2.0;
        return cfg;
    }
    
    // Event callbacks run inside the frame; keep them short.
    static SandboxConfig default_for_callbacks() {
        SandboxConfig cfg;
        cfg.maxMemoryMB = 16;
        cfg.maxInstructionsPerCall = 1000000;  // 1M per call
        cfg.maxExecutionTimeSec = 0.5;
        return cfg;
    }
    
    static SandboxConfig trusted_engine() {
        SandboxConfig cfg;
        cfg.trusted = true;
        return cfg;
    }
    
    ScriptLimits to_script_limits() const {
        ScriptLimits limits;
        limits.maxMemoryBytes = maxMemoryMB * 1024 * 1024;
        limits.maxInstructions = maxInstructionsPerCall;
        limits.maxExecutionTimeSec = maxExecutionTimeSec;
        return limits;
    }
};

// Validation result for scripts
struct ValidationResult {
    bool valid{false};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    
    explicit operator bool() const { return valid; }
};

// Sandbox utility functions
class Sandbox {
public:
    // Validate a script without executing it
    static ValidationResult validate_script(const std::string& script);
    
    // Check if a script uses any forbidden functions
    static ValidationResult check_forbidden_calls(const std::string& script);
    
    // Create a Lua state configured by `config`
    static std::unique_ptr<LuaState> create(const SandboxConfig& config);
    
    // List of functions that are forbidden in sandboxed scripts
    static const std::vector<std::string>& forbidden_functions();
};

} // namespace glacier::scripting
