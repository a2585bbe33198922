#pragma once

// Glacier Scripting Module - Lua scripting infrastructure
// 
// This module provides:
// - LuaState: Wrapper around sol2/Lua with sandbox support
// - Sandbox: Security utilities for untrusted scripts
// - ScriptEngineBase: Abstract base class for host script engines
//
// Usage:
//   1. Create a derived class from ScriptEngineBase
//   2. Override register_game_api() to expose your host's API
//   3. Override register_constants() to expose constants
//   4. Override release_script_references() if the host keeps Lua
//      functions or values alive outside the state
//
// Example:
//   class MyScriptEngine : public glacier::scripting::ScriptEngineBase {
//   protected:
//       void register_game_api(LuaState& lua) override {
//           auto& state = lua.state();
//           state["game"] = state.create_table_with(
//               "quit", [this]() { ... }
//           );
//       }
//   };

#include "lua_state.hpp"
#include "sandbox.hpp"
#include "script_types.hpp"
#include "script_engine_base.hpp"
