#include "sandbox.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <regex>
#include <sstream>

namespace glacier::scripting {

namespace {

const std::vector<std::string> kForbiddenFunctions = {
    "os",
    "io",
    "debug",
    "loadfile",
    "dofile",
    "load",
    "loadstring",
    "require",
    "package",
    "collectgarbage",
    "rawget",
    "rawset",
    "rawequal",
    "setmetatable",
    "getfenv",
    "setfenv",
    "newproxy",
    "gcinfo",
    "module",
};

std::string join_args(sol::variadic_args va, sol::this_state ts) {
    std::ostringstream oss;
    sol::state_view lua(ts);
    sol::protected_function tostring = lua["tostring"];

    bool first = true;
    for (auto v : va) {
        if (!first) oss << "\t";
        first = false;

        if (tostring.valid()) {
            auto result = tostring(v);
            if (result.valid()) {
                oss << result.get<std::string>();
            }
        }
    }
    return oss.str();
}

} // namespace

ValidationResult Sandbox::validate_script(const std::string& script) {
    ValidationResult result;
    result.valid = true;
    
    // Create a temporary Lua state for syntax checking
    auto state = create_sandboxed_state();
    if (!state) {
        result.valid = false;
        result.errors.push_back("Failed to create Lua state");
        return result;
    }
    
    auto loadResult = state->load(script);
    if (!loadResult) {
        result.valid = false;
        result.errors.push_back(loadResult.error);
        return result;
    }
    
    auto forbiddenCheck = check_forbidden_calls(script);
    if (!forbiddenCheck.valid) {
        result.valid = false;
        result.errors.insert(result.errors.end(), 
            forbiddenCheck.errors.begin(), forbiddenCheck.errors.end());
    }
    result.warnings.insert(result.warnings.end(),
        forbiddenCheck.warnings.begin(), forbiddenCheck.warnings.end());
    
    return result;
}

ValidationResult Sandbox::check_forbidden_calls(const std::string& script) {
    ValidationResult result;
    result.valid = true;
    
    for (const auto& forbidden : kForbiddenFunctions) {
        // Pattern: word boundary + forbidden name + optional dot or parenthesis
        std::string pattern = "\\b" + forbidden + "\\s*[.:(]";
        std::regex re(pattern);
        
        if (std::regex_search(script, re)) {
            result.valid = false;
            result.errors.push_back("Forbidden function/module used: " + forbidden);
        }
    }
    
    // Check for potential bytecode loading (binary strings)
    if (script.find("\\x1b") != std::string::npos || 
        script.find("\x1bLua") != std::string::npos ||
        script.find("\\27Lua") != std::string::npos) {
        result.valid = false;
        result.errors.push_back("Potential bytecode detected (security risk)");
    }
    
    if (script.find("while true do") != std::string::npos ||
        script.find("while(true)") != std::string::npos) {
        result.warnings.push_back("Infinite loop detected - ensure proper exit condition");
    }
    
    return result;
}

std::unique_ptr<LuaState> Sandbox::create(const SandboxConfig& config) {
    std::unique_ptr<LuaState> state;
    if (config.trusted) {
        state = create_engine_state();
    } else {
        state = create_sandboxed_state(config.to_script_limits());
    }
    if (!state) {
        return nullptr;
    }
    
    if (config.printHandler) {
        auto handler = config.printHandler;
        state->state()["print"] = [handler](sol::variadic_args va, sol::this_state ts) {
            handler(join_args(va, ts));
        };
    }
    
    return state;
}

const std::vector<std::string>& Sandbox::forbidden_functions() {
    return kForbiddenFunctions;
}

} // namespace glacier::scripting
