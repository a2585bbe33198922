#include "scene_script_engine.hpp"

#include <raylib.h>

namespace glacier::scripting {

SceneScriptEngine::SceneScriptEngine(scene::World& world, std::filesystem::path baseDir)
    : api_(std::make_unique<SceneApi>(world, std::move(baseDir))) {
    set_log_callback([](const std::string& msg) {
        TraceLog(LOG_INFO, "[script] %s", msg.c_str());
    });
}

SceneScriptEngine::~SceneScriptEngine() {
    shutdown();
}

void SceneScriptEngine::register_game_api(LuaState& lua) {
    api_->register_api(lua);
}

void SceneScriptEngine::register_constants(LuaState& lua) {
    api_->register_constants(lua);
}

void SceneScriptEngine::release_script_references() {
    api_->release();
}

} // namespace glacier::scripting
