#include "scene_api.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include "glacier/core/scripting/lua_state.hpp"
#include "glacier/ecs/components.hpp"
#include "glacier/events/event_codes.hpp"
#include "glacier/scene/world.hpp"

#include <any>
#include <sstream>
#include <tuple>
#include <utility>

namespace glacier::scripting {

namespace {

Vector3 table_to_vec3(const sol::object& obj, const char* what) {
    const std::string msg = std::string(what) + ": expected {x, y, z}";

    if (obj.get_type() != sol::type::table) {
        throw ScriptApiError(msg);
    }

    sol::table t = obj.as<sol::table>();
    if (t.size() != 3) {
        throw ScriptApiError(msg);
    }

    float out[3]{};
    for (int i = 0; i < 3; ++i) {
        sol::object c = t[i + 1];
        if (c.get_type() != sol::type::number) {
            throw ScriptApiError(msg);
        }
        out[i] = c.as<float>();
    }
    return Vector3{out[0], out[1], out[2]};
}

sol::as_table_t<std::vector<float>> vec3_to_table(Vector3 v) {
    return sol::as_table(std::vector<float>{v.x, v.y, v.z});
}

sol::object to_lua(sol::state_view lua, const events::EventArg& arg) {
    if (!arg.has_value()) {
        return sol::make_object(lua, sol::lua_nil);
    }
    if (const auto* obj = std::any_cast<sol::object>(&arg)) {
        return *obj;
    }
    if (const auto* key = std::any_cast<events::KeyEvent>(&arg)) {
        sol::table t = lua.create_table();
        t["scancode"] = key->scancode;
        t["key"] = key->key;
        t["repeat"] = key->repeat;
        return sol::make_object(lua, t);
    }
    if (const auto* s = std::any_cast<std::string>(&arg)) {
        return sol::make_object(lua, *s);
    }
    if (const auto* d = std::any_cast<double>(&arg)) {
        return sol::make_object(lua, *d);
    }
    if (const auto* i = std::any_cast<std::int64_t>(&arg)) {
        return sol::make_object(lua, *i);
    }
    if (const auto* b = std::any_cast<bool>(&arg)) {
        return sol::make_object(lua, *b);
    }

    TraceLog(LOG_WARNING, "[script] event payload of type '%s' has no Lua mapping", arg.type().name());
    return sol::make_object(lua, sol::lua_nil);
}

// Members shared by pf.Entity and pf.AnimEntity.
template <typename Handle>
void bind_entity_members(sol::usertype<Handle>& ut) {
    ut["uid"] = sol::readonly_property([](const Handle& h) { return h.uid(); });
    ut["alive"] = sol::readonly_property([](const Handle& h) { return h.alive(); });
    ut["active"] = sol::readonly_property([](const Handle& h) { return h.active(); });
    ut["path"] = sol::readonly_property([](const Handle& h) { return h.dir(); });
    ut["pfobj"] = sol::readonly_property([](const Handle& h) { return h.file(); });

    ut["name"] = sol::property(
        [](const Handle& h) { return h.name(); },
        [](Handle& h, const std::string& name) { h.set_name(name); });
    ut["pos"] = sol::property(
        [](const Handle& h) { return vec3_to_table(h.position()); },
        [](Handle& h, sol::object v) { h.set_position(table_to_vec3(v, "pos")); });
    ut["scale"] = sol::property(
        [](const Handle& h) { return vec3_to_table(h.scale()); },
        [](Handle& h, sol::object v) { h.set_scale(table_to_vec3(v, "scale")); });

    ut["activate"] = [](Handle& h) { return h.activate(); };
    ut["deactivate"] = [](Handle& h) { return h.deactivate(); };
    ut["destroy"] = [](Handle& h) { return h.destroy(); };

    ut["register"] = [](Handle& h, EventCode code, sol::protected_function fn, sol::object user) {
        h.register_handler(code, std::move(fn), std::move(user));
    };
    ut["unregister"] = [](Handle& h, EventCode code, sol::protected_function fn) {
        return h.unregister_handler(code, fn);
    };
    ut["notify"] = [](Handle& h, EventCode code, sol::object arg) {
        return h.notify(code, std::move(arg));
    };

    ut[sol::meta_function::to_string] = [](const Handle& h) { return h.describe(); };
    ut[sol::meta_function::equal_to] = [](const Handle& a, const Handle& b) {
        return a.uid() == b.uid();
    };
}

} // namespace

// ============================================================================
// EntityHandle
// ============================================================================

EntityHandle::EntityHandle(SceneApi& api, entt::entity entity, EntityUid uid)
    : api_(&api), entity_(entity), uid_(uid) {}

bool EntityHandle::alive() const {
    const auto& world = api_->world();
    return world.valid(entity_) && world.uid_of(entity_) == uid_;
}

entt::entity EntityHandle::checked() const {
    if (!alive()) {
        throw ScriptApiError("stale entity handle (uid " + std::to_string(uid_) + ")");
    }
    return entity_;
}

std::string EntityHandle::name() const {
    return api_->world().registry().get<ecs::Name>(checked()).value;
}

void EntityHandle::set_name(const std::string& name) {
    api_->world().registry().get<ecs::Name>(checked()).value = name;
}

std::string EntityHandle::dir() const {
    return api_->world().registry().get<ecs::ModelRef>(checked()).dir;
}

std::string EntityHandle::file() const {
    return api_->world().registry().get<ecs::ModelRef>(checked()).file;
}

Vector3 EntityHandle::position() const {
    return api_->world().registry().get<ecs::Transform>(checked()).position;
}

void EntityHandle::set_position(Vector3 pos) {
    api_->world().registry().get<ecs::Transform>(checked()).position = pos;
}

Vector3 EntityHandle::scale() const {
    return api_->world().registry().get<ecs::Transform>(checked()).scale;
}

void EntityHandle::set_scale(Vector3 scale) {
    api_->world().registry().get<ecs::Transform>(checked()).scale = scale;
}

bool EntityHandle::active() const {
    return api_->world().is_active(checked());
}

bool EntityHandle::activate() {
    const bool changed = api_->world().activate(checked());
    if (!changed) {
        TraceLog(LOG_DEBUG, "[script] %s already active", describe().c_str());
    }
    return changed;
}

bool EntityHandle::deactivate() {
    return api_->world().deactivate(checked());
}

bool EntityHandle::destroy() {
    if (!alive()) return false;
    return api_->world().destroy(entity_);
}

void EntityHandle::register_handler(EventCode code, sol::protected_function fn, sol::object user) {
    checked();
    const void* identity = fn.pointer();
    api_->world().events().subscribe_entity(uid_, code,
        api_->wrap_handler(std::move(fn), std::move(user), code),
        identity, events::HandlerOrigin::Script);
}

bool EntityHandle::unregister_handler(EventCode code, const sol::protected_function& fn) {
    checked();
    return api_->world().events().unsubscribe_entity(uid_, code, fn.pointer());
}

std::size_t EntityHandle::notify(EventCode code, sol::object arg) {
    checked();
    return api_->world().events().notify_entity(uid_, code, events::EventArg(std::move(arg)));
}

std::string EntityHandle::describe() const {
    std::ostringstream oss;
    oss << "Entity(" << uid_;
    if (alive()) {
        oss << ", '" << api_->world().registry().get<ecs::Name>(entity_).value << "'";
    } else {
        oss << ", <destroyed>";
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// AnimEntityHandle
// ============================================================================

void AnimEntityHandle::play_anim(const std::string& clip) {
    std::string err;
    if (!api_->world().play_anim(checked(), clip, &err)) {
        throw ScriptApiError("play_anim: " + err);
    }
}

std::string AnimEntityHandle::anim() const {
    return api_->world().registry().get<ecs::Animator>(checked()).clip;
}

std::uint32_t AnimEntityHandle::frame() const {
    return api_->world().registry().get<ecs::Animator>(checked()).frame;
}

std::vector<std::string> AnimEntityHandle::clips() const {
    const auto& ref = api_->world().registry().get<ecs::ModelRef>(checked());

    std::vector<std::string> out;
    out.reserve(ref.model->clips.size());
    for (const auto& clip : ref.model->clips) {
        out.push_back(clip.name);
    }
    return out;
}

// ============================================================================
// SceneApi
// ============================================================================

SceneApi::SceneApi(scene::World& world, std::filesystem::path baseDir)
    : world_(world), baseDir_(std::move(baseDir)) {}

void SceneApi::register_constants(LuaState& lua) {
    auto& state = lua.state();
    sol::table pf = state["pf"].get_or_create<sol::table>();

    pf["EVENT_SDL_KEYDOWN"] = events::kEventKeyDown;
    pf["EVENT_SDL_KEYUP"] = events::kEventKeyUp;
    pf["EVENT_CUSTOM"] = events::kEventCustom;

    for (int i = 0; i < 26; ++i) {
        const char letter[2] = {static_cast<char>('A' + i), '\0'};
        pf[std::string("SCANCODE_") + letter] = events::scancode::kA + i;
    }
    for (int i = 0; i < 9; ++i) {
        pf["SCANCODE_" + std::to_string(i + 1)] = events::scancode::k1 + i;
    }
    pf["SCANCODE_0"] = events::scancode::k0;
    pf["SCANCODE_RETURN"] = events::scancode::kReturn;
    pf["SCANCODE_ESCAPE"] = events::scancode::kEscape;
    pf["SCANCODE_SPACE"] = events::scancode::kSpace;
    pf["SCANCODE_TAB"] = events::scancode::kTab;

    pf["CAM_MODE_FPS"] = static_cast<int>(scene::CameraMode::FPS);
    pf["CAM_MODE_RTS"] = static_cast<int>(scene::CameraMode::RTS);
    pf["NUM_CAMERAS"] = scene::CameraRig::kNumCameras;
}

void SceneApi::register_api(LuaState& lua) {
    lua_ = &lua;
    auto& state = lua.state();
    sol::table pf = state["pf"].get_or_create<sol::table>();

    // --- Lighting ---

    pf["set_ambient_light_color"] = [this](sol::object v) {
        world_.lighting().ambientColor = table_to_vec3(v, "set_ambient_light_color");
    };
    pf["set_emit_light_color"] = [this](sol::object v) {
        world_.lighting().emitColor = table_to_vec3(v, "set_emit_light_color");
    };
    pf["set_emit_light_pos"] = [this](sol::object v) {
        world_.lighting().emitPosition = table_to_vec3(v, "set_emit_light_pos");
    };
    pf["get_ambient_light_color"] = [this]() { return vec3_to_table(world_.lighting().ambientColor); };
    pf["get_emit_light_color"] = [this]() { return vec3_to_table(world_.lighting().emitColor); };
    pf["get_emit_light_pos"] = [this]() { return vec3_to_table(world_.lighting().emitPosition); };

    // --- Map / cameras ---

    pf["new_game"] = [this](const std::string& dir, const std::string& file) {
        api_new_game(dir, file);
    };
    pf["activate_camera"] = [this](int index, int mode) { api_activate_camera(index, mode); };
    pf["get_active_camera"] = [this]() {
        const auto& cams = world_.cameras();
        return std::make_tuple(cams.active_index(), static_cast<int>(cams.active_mode()));
    };

    // --- Events ---

    pf["register_event_handler"] = [this](EventCode code, sol::protected_function fn, sol::object user) {
        const void* identity = fn.pointer();
        world_.events().subscribe(code, wrap_handler(std::move(fn), std::move(user), code),
                                  identity, events::HandlerOrigin::Script);
    };
    pf["unregister_event_handler"] = [this](EventCode code, sol::protected_function fn) {
        return world_.events().unsubscribe(code, fn.pointer());
    };
    pf["global_event"] = [this](EventCode code, sol::object arg) {
        world_.events().notify_global(code, events::EventArg(std::move(arg)));
    };

    // --- Entities ---

    auto entity = pf.new_usertype<EntityHandle>("Entity",
        sol::call_constructor,
        sol::factories([this](const std::string& dir, const std::string& file, const std::string& name) {
            return api_new_entity(dir, file, name);
        }),
        "new",
        sol::factories([this](const std::string& dir, const std::string& file, const std::string& name) {
            return api_new_entity(dir, file, name);
        }));
    bind_entity_members<EntityHandle>(entity);

    auto anim = pf.new_usertype<AnimEntityHandle>("AnimEntity",
        sol::call_constructor,
        sol::factories([this](const std::string& dir, const std::string& file,
                              const std::string& name, const std::string& clip) {
            return api_new_anim_entity(dir, file, name, clip);
        }),
        "new",
        sol::factories([this](const std::string& dir, const std::string& file,
                              const std::string& name, const std::string& clip) {
            return api_new_anim_entity(dir, file, name, clip);
        }),
        sol::base_classes, sol::bases<EntityHandle>());
    bind_entity_members<AnimEntityHandle>(anim);

    anim["play_anim"] = [](AnimEntityHandle& h, const std::string& clip) { h.play_anim(clip); };
    anim["anim"] = sol::readonly_property([](const AnimEntityHandle& h) { return h.anim(); });
    anim["frame"] = sol::readonly_property([](const AnimEntityHandle& h) { return h.frame(); });
    anim["clips"] = sol::readonly_property([](const AnimEntityHandle& h) {
        return sol::as_table(h.clips());
    });

    pf["get_entities"] = [this](sol::this_state ts) {
        sol::state_view lua(ts);
        sol::table out = lua.create_table();

        int i = 1;
        for (auto e : world_.entities()) {
            const EntityUid uid = world_.uid_of(e);
            if (world_.registry().all_of<ecs::Animator>(e)) {
                out[i++] = AnimEntityHandle(*this, e, uid);
            } else {
                out[i++] = EntityHandle(*this, e, uid);
            }
        }
        return out;
    };
}

void SceneApi::release() {
    const std::size_t removed = world_.events().remove_origin(events::HandlerOrigin::Script);
    // Script payloads reference the closing state; engine events such as key input stay queued.
    const std::size_t dropped = world_.events().remove_pending([](const events::QueuedEvent& ev) {
        return std::any_cast<sol::object>(&ev.arg) != nullptr;
    });
    lua_ = nullptr;

    if (removed > 0 || dropped > 0) {
        TraceLog(LOG_DEBUG, "[script] released %zu script handlers, %zu queued events", removed, dropped);
    }
}

events::Handler SceneApi::wrap_handler(sol::protected_function fn, sol::object user, EventCode code) {
    return [this, fn = std::move(fn), user = std::move(user), code](const events::EventArg& arg) mutable {
        // Nested callbacks (a handler calling notify) share the outer budget.
        if (lua_ && callbackDepth_ == 0) {
            lua_->reset_limits();
        }
        CallbackDepthGuard depth(callbackDepth_);

        sol::state_view lua(fn.lua_state());
        auto result = fn(user, to_lua(lua, arg));
        if (!result.valid()) {
            sol::error err = result;
            TraceLog(LOG_ERROR, "[script] handler for event 0x%X failed: %s", code, err.what());
        }
    };
}

void SceneApi::api_new_game(const std::string& dir, const std::string& file) {
    const auto path = baseDir_ / dir / file;

    assets::MapData map;
    std::string err;
    if (!assets::read_pfmap(path, &map, &err)) {
        throw ScriptApiError("new_game: " + err);
    }

    world_.reset(std::move(map));
}

std::shared_ptr<const assets::ModelData> SceneApi::load_model(const std::string& dir,
                                                              const std::string& file,
                                                              const char* caller) {
    const std::string key = dir + "/" + file;
    if (auto it = models_.find(key); it != models_.end()) {
        return it->second;
    }

    auto model = std::make_shared<assets::ModelData>();
    std::string err;
    if (!assets::read_pfobj(baseDir_ / dir / file, model.get(), &err)) {
        throw ScriptApiError(std::string(caller) + ": " + err);
    }

    TraceLog(LOG_DEBUG, "[assets] loaded %s (%zu animation sets)", key.c_str(), model->clips.size());
    models_.emplace(key, model);
    return model;
}

EntityHandle SceneApi::api_new_entity(const std::string& dir, const std::string& file,
                                      const std::string& name) {
    if (!world_.has_map()) {
        throw ScriptApiError("Entity: no map loaded, call new_game first");
    }

    auto model = load_model(dir, file, "Entity");
    const auto e = world_.spawn(std::move(model), dir, file, name);
    return EntityHandle(*this, e, world_.uid_of(e));
}

AnimEntityHandle SceneApi::api_new_anim_entity(const std::string& dir, const std::string& file,
                                               const std::string& name, const std::string& clip) {
    if (!world_.has_map()) {
        throw ScriptApiError("AnimEntity: no map loaded, call new_game first");
    }

    auto model = load_model(dir, file, "AnimEntity");

    std::string err;
    const auto e = world_.spawn_animated(std::move(model), dir, file, name, clip, &err);
    if (e == entt::null) {
        throw ScriptApiError("AnimEntity: " + err);
    }
    return AnimEntityHandle(*this, e, world_.uid_of(e));
}

void SceneApi::api_activate_camera(int index, int mode) {
    std::string err;
    if (!world_.cameras().activate(index, mode, &err)) {
        throw ScriptApiError("activate_camera: " + err);
    }
}

} // namespace glacier::scripting
