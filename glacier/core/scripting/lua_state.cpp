#include "lua_state.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <utility>

namespace glacier::scripting {

namespace {

// Custom allocator for memory tracking
struct MemoryTracker {
    std::atomic<std::size_t> allocated{0};
    std::size_t limit{0};
    
    static void* alloc(void* ud, void* ptr, std::size_t osize, std::size_t nsize) {
        auto* tracker = static_cast<MemoryTracker*>(ud);
        
        if (nsize == 0) {
            // Free
            if (ptr) {
                tracker->allocated -= osize;
                std::free(ptr);
            }
            return nullptr;
        }
        
        if (ptr == nullptr) {
            // Allocate (osize encodes the object type here, not a size)
            if (tracker->limit > 0 && tracker->allocated + nsize > tracker->limit) {
                return nullptr;  // Memory limit exceeded
            }
            void* newPtr = std::malloc(nsize);
            if (newPtr) {
                tracker->allocated += nsize;
            }
            return newPtr;
        }
        
        // Reallocate
        std::size_t delta = nsize > osize ? nsize - osize : 0;
        if (tracker->limit > 0 && delta > 0 && tracker->allocated + delta > tracker->limit) {
            return nullptr;  // Memory limit exceeded
        }
        
        void* newPtr = std::realloc(ptr, nsize);
        if (newPtr) {
            tracker->allocated = tracker->allocated - osize + nsize;
        }
        return newPtr;
    }
};

constexpr const char* kLimiterKey = "__glacier_exec_limiter";

// Instruction count hook for limiting execution
struct ExecutionLimiter {
    std::size_t instructionCount{0};
    std::size_t maxInstructions{0};
    std::chrono::steady_clock::time_point startTime{std::chrono::steady_clock::now()};
    double maxTimeSec{0.0};
    bool exceeded{false};
    
    static void hook(lua_State* L, lua_Debug*) {
        lua_getfield(L, LUA_REGISTRYINDEX, kLimiterKey);
        auto* limiter = static_cast<ExecutionLimiter*>(lua_touserdata(L, -1));
        lua_pop(L, 1);
        
        if (!limiter) return;
        
        limiter->instructionCount++;
        
        if (limiter->maxInstructions > 0 && limiter->instructionCount > limiter->maxInstructions) {
            limiter->exceeded = true;
            luaL_error(L, "instruction limit exceeded");
        }
        
        if (limiter->maxTimeSec > 0.0) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration<double>(now - limiter->startTime).count();
            if (elapsed > limiter->maxTimeSec) {
                limiter->exceeded = true;
                luaL_error(L, "execution time limit exceeded");
            }
        }
    }
};

ScriptResult to_result(sol::protected_function_result result) {
    if (!result.valid()) {
        sol::error err = result;
        return ScriptResult::fail(err.what());
    }
    return ScriptResult::ok();
}

} // namespace

struct LuaState::Impl {
    // Declared before `lua` so the tracker outlives the state that uses it.
    std::unique_ptr<MemoryTracker> memTracker;
    std::unique_ptr<ExecutionLimiter> execLimiter;
    sol::state lua;
    
    Impl() = default;
    
    explicit Impl(std::size_t memLimit)
        : memTracker(std::make_unique<MemoryTracker>())
        , lua(sol::default_at_panic, &MemoryTracker::alloc, memTracker.get()) {
        memTracker->limit = memLimit;
    }
    
    bool init_default() {
        if (!lua.lua_state()) {
            return false;
        }
        lua.open_libraries(
            sol::lib::base,
            sol::lib::coroutine,
            sol::lib::string,
            sol::lib::table,
            sol::lib::math,
            sol::lib::utf8
        );
        return true;
    }
    
    void setup_execution_limiter(const ScriptLimits& limits) {
        execLimiter = std::make_unique<ExecutionLimiter>();
        execLimiter->maxInstructions = limits.maxInstructions;
        execLimiter->maxTimeSec = limits.maxExecutionTimeSec;
        
        // Store limiter in registry for hook access
        lua_pushlightuserdata(lua.lua_state(), execLimiter.get());
        lua_setfield(lua.lua_state(), LUA_REGISTRYINDEX, kLimiterKey);
        
        // Set hook to fire every 1000 instructions
        lua_sethook(lua.lua_state(), ExecutionLimiter::hook, LUA_MASKCOUNT, 1000);
    }
    
    void reset_execution_limiter() {
        if (execLimiter) {
            execLimiter->instructionCount = 0;
            execLimiter->startTime = std::chrono::steady_clock::now();
            execLimiter->exceeded = false;
        }
    }
};

LuaState::LuaState() : impl_(std::make_unique<Impl>()) {}

LuaState::~LuaState() = default;

LuaState::LuaState(LuaState&&) noexcept = default;
LuaState& LuaState::operator=(LuaState&&) noexcept = default;

bool LuaState::init() {
    return impl_->init_default();
}

void LuaState::apply_sandbox(const ScriptLimits& limits) {
    // The allocator can only be swapped on a fresh state.
    if (limits.maxMemoryBytes > 0 && !impl_->memTracker) {
        impl_ = std::make_unique<Impl>(limits.maxMemoryBytes);
        impl_->init_default();
    }
    
    limits_ = limits;
    sandboxed_ = true;
    
    auto& lua = impl_->lua;
    
    // Remove dangerous libraries/functions
    lua["os"] = sol::lua_nil;
    lua["io"] = sol::lua_nil;
    lua["debug"] = sol::lua_nil;
    lua["loadfile"] = sol::lua_nil;
    lua["dofile"] = sol::lua_nil;
    lua["load"] = sol::lua_nil;       // Can load bytecode
    lua["loadstring"] = sol::lua_nil;
    lua["require"] = sol::lua_nil;    // File system access
    lua["package"] = sol::lua_nil;
    lua["collectgarbage"] = sol::lua_nil;
    lua["rawget"] = sol::lua_nil;
    lua["rawset"] = sol::lua_nil;
    lua["rawequal"] = sol::lua_nil;
    lua["setmetatable"] = sol::lua_nil;
    lua["getfenv"] = sol::lua_nil;
    lua["setfenv"] = sol::lua_nil;
    
    impl_->setup_execution_limiter(limits);
    
    // Silent until the host installs its own print
    lua["print"] = [](sol::variadic_args va) {
        (void)va;
    };
}

ScriptResult LuaState::execute(const std::string& script, const std::string& chunkName) {
    reset_limits();
    
    auto result = impl_->lua.safe_script(script, sol::script_pass_on_error, chunkName);
    return to_result(std::move(result));
}

ScriptResult LuaState::load(const std::string& script, const std::string& chunkName) {
    auto loadResult = impl_->lua.load(script, chunkName);
    
    if (!loadResult.valid()) {
        sol::error err = loadResult;
        return ScriptResult::fail(err.what());
    }
    
    return ScriptResult::ok();
}

ScriptResult LuaState::call(const std::string& funcName) {
    reset_limits();
    
    sol::protected_function func = impl_->lua[funcName];
    if (!func.valid()) {
        return ScriptResult::fail("function '" + funcName + "' not found");
    }
    
    return to_result(func());
}

ScriptResult LuaState::call(const std::string& funcName, float arg1) {
    reset_limits();
    
    sol::protected_function func = impl_->lua[funcName];
    if (!func.valid()) {
        return ScriptResult::fail("function '" + funcName + "' not found");
    }
    
    return to_result(func(arg1));
}

bool LuaState::has_function(const std::string& funcName) const {
    sol::object obj = impl_->lua[funcName];
    return obj.is<sol::function>();
}

void LuaState::reset_limits() {
    if (sandboxed_) {
        impl_->reset_execution_limiter();
    }
}

std::optional<int> LuaState::get_global_int(const std::string& name) const {
    sol::object obj = impl_->lua[name];
    if (obj.get_type() == sol::type::number) {
        return obj.as<int>();
    }
    return std::nullopt;
}

std::optional<double> LuaState::get_global_double(const std::string& name) const {
    sol::object obj = impl_->lua[name];
    if (obj.get_type() == sol::type::number) {
        return obj.as<double>();
    }
    return std::nullopt;
}

std::optional<bool> LuaState::get_global_bool(const std::string& name) const {
    sol::object obj = impl_->lua[name];
    if (obj.get_type() == sol::type::boolean) {
        return obj.as<bool>();
    }
    return std::nullopt;
}

std::optional<std::string> LuaState::get_global_string(const std::string& name) const {
    sol::object obj = impl_->lua[name];
    if (obj.get_type() == sol::type::string) {
        return obj.as<std::string>();
    }
    return std::nullopt;
}

sol::state& LuaState::state() {
    return impl_->lua;
}

const sol::state& LuaState::state() const {
    return impl_->lua;
}

lua_State* LuaState::lua_state() {
    return impl_->lua.lua_state();
}

std::size_t LuaState::memory_used() const {
    if (impl_->memTracker) {
        return impl_->memTracker->allocated.load();
    }
    // Fallback: use Lua's internal count
    lua_State* L = impl_->lua.lua_state();
    return static_cast<std::size_t>(lua_gc(L, LUA_GCCOUNT, 0)) * 1024 +
           static_cast<std::size_t>(lua_gc(L, LUA_GCCOUNTB, 0));
}

std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits) {
    auto state = std::make_unique<LuaState>();
    if (!state->init()) {
        return nullptr;
    }
    state->apply_sandbox(limits);
    return state;
}

std::unique_ptr<LuaState> create_engine_state() {
    auto state = std::make_unique<LuaState>();
    if (!state->init()) {
        return nullptr;
    }
    state->state().open_libraries(
        sol::lib::io,
        sol::lib::os,
        sol::lib::debug,
        sol::lib::package
    );
    return state;
}

} // namespace glacier::scripting
