#pragma once

#include "camera_rig.hpp"
#include "lighting.hpp"

#include "glacier/assets/pfmap_io.hpp"
#include "glacier/assets/pfobj_io.hpp"
#include "glacier/core/types.hpp"
#include "glacier/events/event_bus.hpp"

#include <entt/entt.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace glacier::scene {

// ============================================================================
// World - entities, lighting, cameras and the event dispatcher
// ============================================================================
//
// Owns every piece of state the scripting API mutates. Entities are created
// inactive and only take part in update() once activated.

class World {
public:
    World();
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // --- Map ---

    // Destroys every entity (and its handlers) and installs `map`.
    void reset(assets::MapData map);
    bool has_map() const { return map_.has_value(); }
    const assets::MapData* map() const { return map_ ? &*map_ : nullptr; }

    // --- Entities ---

    // Creates an inactive entity. Returns entt::null if no map is loaded.
    entt::entity spawn(std::shared_ptr<const assets::ModelData> model,
                       const std::string& dir, const std::string& file,
                       const std::string& name);

    // Like spawn(), but also starts `clip`. Fails if the model has no such clip.
    entt::entity spawn_animated(std::shared_ptr<const assets::ModelData> model,
                                const std::string& dir, const std::string& file,
                                const std::string& name, const std::string& clip,
                                std::string* outError);

    bool destroy(entt::entity e);
    bool valid(entt::entity e) const { return registry_.valid(e); }

    // Returns true if the state changed.
    bool activate(entt::entity e);
    bool deactivate(entt::entity e);
    bool is_active(entt::entity e) const;

    // Switches clip and rewinds it. Fails on unknown clip or non-animated entity.
    bool play_anim(entt::entity e, const std::string& clip, std::string* outError);

    EntityUid uid_of(entt::entity e) const;
    entt::entity find(EntityUid uid) const;

    // Live entities in creation order.
    std::vector<entt::entity> entities() const;
    std::size_t entity_count() const;

    // --- Simulation ---

    // Flushes queued global events, then advances active animators.
    void update(float dt);

    // --- Subsystems ---

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    events::EventBus& events() { return events_; }
    Lighting& lighting() { return lighting_; }
    const Lighting& lighting() const { return lighting_; }
    CameraRig& cameras() { return cameras_; }
    const CameraRig& cameras() const { return cameras_; }

private:
    void advance_animators(float dt);
    void destroy_all();

    entt::registry registry_;
    events::EventBus events_;
    Lighting lighting_{};
    CameraRig cameras_{};
    std::optional<assets::MapData> map_;
    EntityUid nextUid_{1};
};

} // namespace glacier::scene
