#pragma once

#include "glacier/assets/pfobj_io.hpp"
#include "glacier/core/types.hpp"
#include "glacier/events/event_bus.hpp"

#include <entt/entt.hpp>
#include <raylib.h>
#include <sol/forward.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace glacier::scene {
class World;
}

namespace glacier::scripting {

class LuaState;
class SceneApi;

// Thrown by API bindings; sol2 turns it into a Lua error carrying what().
class ScriptApiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Script-facing entity handles
// ============================================================================
//
// Handles are plain values: they hold no state of their own and resolve the
// entity through the World on every access. A handle whose entity was
// destroyed (explicitly or by new_game) raises "stale entity handle".

class EntityHandle {
public:
    EntityHandle(SceneApi& api, entt::entity entity, EntityUid uid);

    EntityUid uid() const { return uid_; }
    bool alive() const;

    std::string name() const;
    void set_name(const std::string& name);

    std::string dir() const;
    std::string file() const;

    Vector3 position() const;
    void set_position(Vector3 pos);
    Vector3 scale() const;
    void set_scale(Vector3 scale);

    bool active() const;
    bool activate();
    bool deactivate();
    bool destroy();

    void register_handler(EventCode code, sol::protected_function fn, sol::object user);
    bool unregister_handler(EventCode code, const sol::protected_function& fn);
    std::size_t notify(EventCode code, sol::object arg);

    std::string describe() const;

protected:
    entt::entity checked() const;

    SceneApi* api_;
    entt::entity entity_;
    EntityUid uid_;
};

class AnimEntityHandle : public EntityHandle {
public:
    using EntityHandle::EntityHandle;

    void play_anim(const std::string& clip);
    std::string anim() const;
    std::uint32_t frame() const;
    std::vector<std::string> clips() const;
};

// ============================================================================
// SceneApi - the `pf` table
// ============================================================================

class SceneApi {
public:
    SceneApi(scene::World& world, std::filesystem::path baseDir);

    // Registers pf.* functions and the Entity/AnimEntity usertypes.
    void register_api(LuaState& lua);

    // Registers pf.EVENT_*, pf.SCANCODE_*, pf.CAM_MODE_*.
    void register_constants(LuaState& lua);

    // Drops every script-installed handler and queued event. Must run
    // before the Lua state that created them is closed.
    void release();

    scene::World& world() { return world_; }

    // Wraps a Lua callback as an event handler invoked as fn(user, arg).
    events::Handler wrap_handler(sol::protected_function fn, sol::object user, EventCode code);

    // --- API implementations ---

    void api_new_game(const std::string& dir, const std::string& file);
    EntityHandle api_new_entity(const std::string& dir, const std::string& file,
                                const std::string& name);
    AnimEntityHandle api_new_anim_entity(const std::string& dir, const std::string& file,
                                         const std::string& name, const std::string& clip);
    void api_activate_camera(int index, int mode);

    std::size_t cached_model_count() const { return models_.size(); }

private:
    std::shared_ptr<const assets::ModelData> load_model(const std::string& dir,
                                                        const std::string& file,
                                                        const char* caller);

    struct CallbackDepthGuard {
        explicit CallbackDepthGuard(int& depth) : depth_(depth) { ++depth_; }
        ~CallbackDepthGuard() { --depth_; }
        CallbackDepthGuard(const CallbackDepthGuard&) = delete;
        CallbackDepthGuard& operator=(const CallbackDepthGuard&) = delete;
        int& depth_;
    };

    scene::World& world_;
    std::filesystem::path baseDir_;
    LuaState* lua_{nullptr};
    int callbackDepth_{0};
    std::unordered_map<std::string, std::shared_ptr<const assets::ModelData>> models_;
};

} // namespace glacier::scripting
