#pragma once

#include "scene_api.hpp"

#include "glacier/core/scripting/script_engine_base.hpp"

#include <filesystem>
#include <memory>

namespace glacier::scene {
class World;
}

namespace glacier::scripting {

// Script engine exposing the `pf` scene API over a World.
// Asset paths passed by scripts are resolved against `baseDir`.
class SceneScriptEngine : public ScriptEngineBase {
public:
    SceneScriptEngine(scene::World& world, std::filesystem::path baseDir);
    ~SceneScriptEngine() override;
    
    SceneApi& api() { return *api_; }

protected:
    void register_game_api(LuaState& lua) override;
    void register_constants(LuaState& lua) override;
    void release_script_references() override;

private:
    std::unique_ptr<SceneApi> api_;
};

} // namespace glacier::scripting
