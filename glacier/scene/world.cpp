#include "world.hpp"

#include "glacier/ecs/components.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>

namespace glacier::scene {

World::World() = default;

World::~World() {
    destroy_all();
}

// ============================================================================
// Map
// ============================================================================

void World::reset(assets::MapData map) {
    destroy_all();

    const float extent = std::max(map.width(), map.depth());
    cameras_.frame_area(Vector3{0.0f, 0.0f, 0.0f}, extent * 0.5f);

    TraceLog(LOG_INFO, "[world] map '%s' loaded (%dx%d tiles)",
             map.name.c_str(), map.rows, map.cols);
    map_ = std::move(map);
}

void World::destroy_all() {
    events_.remove_all_entity_handlers();
    registry_.clear();
}

// ============================================================================
// Entities
// ============================================================================

entt::entity World::spawn(std::shared_ptr<const assets::ModelData> model,
                          const std::string& dir, const std::string& file,
                          const std::string& name) {
    if (!map_ || !model) {
        return entt::null;
    }

    const auto e = registry_.create();
    registry_.emplace<ecs::Uid>(e, nextUid_++);
    registry_.emplace<ecs::Name>(e, name);
    registry_.emplace<ecs::Transform>(e);
    registry_.emplace<ecs::ModelRef>(e, dir, file, std::move(model));

    TraceLog(LOG_DEBUG, "[world] spawned '%s' (%s/%s)", name.c_str(), dir.c_str(), file.c_str());
    return e;
}

entt::entity World::spawn_animated(std::shared_ptr<const assets::ModelData> model,
                                   const std::string& dir, const std::string& file,
                                   const std::string& name, const std::string& clip,
                                   std::string* outError) {
    if (!model || !model->animated()) {
        if (outError) *outError = "model " + dir + "/" + file + " has no animation sets";
        return entt::null;
    }

    const int idx = model->find_clip(clip);
    if (idx < 0) {
        if (outError) *outError = "model " + file + " has no animation '" + clip + "'";
        return entt::null;
    }

    const auto e = spawn(std::move(model), dir, file, name);
    if (e == entt::null) {
        if (outError) *outError = "no map loaded";
        return entt::null;
    }

    auto& anim = registry_.emplace<ecs::Animator>(e);
    anim.clipIndex = idx;
    anim.clip = clip;
    return e;
}

bool World::destroy(entt::entity e) {
    if (!registry_.valid(e)) return false;

    events_.remove_owner(registry_.get<ecs::Uid>(e).value);
    registry_.destroy(e);
    return true;
}

bool World::activate(entt::entity e) {
    if (!registry_.valid(e) || registry_.all_of<ecs::Active>(e)) return false;
    registry_.emplace<ecs::Active>(e);
    return true;
}

bool World::deactivate(entt::entity e) {
    if (!registry_.valid(e) || !registry_.all_of<ecs::Active>(e)) return false;
    registry_.remove<ecs::Active>(e);
    return true;
}

bool World::is_active(entt::entity e) const {
    return registry_.valid(e) && registry_.all_of<ecs::Active>(e);
}

bool World::play_anim(entt::entity e, const std::string& clip, std::string* outError) {
    if (!registry_.valid(e)) {
        if (outError) *outError = "invalid entity";
        return false;
    }

    auto* anim = registry_.try_get<ecs::Animator>(e);
    const auto& ref = registry_.get<ecs::ModelRef>(e);
    if (!anim) {
        if (outError) *outError = "entity '" + registry_.get<ecs::Name>(e).value + "' is not animated";
        return false;
    }

    const int idx = ref.model->find_clip(clip);
    if (idx < 0) {
        if (outError) *outError = "model " + ref.file + " has no animation '" + clip + "'";
        return false;
    }

    anim->clipIndex = idx;
    anim->clip = clip;
    anim->time = 0.0f;
    anim->frame = 0;

    TraceLog(LOG_DEBUG, "[world] '%s' plays '%s'",
             registry_.get<ecs::Name>(e).value.c_str(), clip.c_str());
    return true;
}

EntityUid World::uid_of(entt::entity e) const {
    if (!registry_.valid(e)) return kInvalidUid;
    return registry_.get<ecs::Uid>(e).value;
}

entt::entity World::find(EntityUid uid) const {
    if (uid == kInvalidUid) return entt::null;

    for (auto [e, id] : registry_.view<ecs::Uid>().each()) {
        if (id.value == uid) return e;
    }
    return entt::null;
}

std::vector<entt::entity> World::entities() const {
    std::vector<entt::entity> out;
    for (auto e : registry_.view<ecs::Uid>()) {
        out.push_back(e);
    }

    std::sort(out.begin(), out.end(), [this](entt::entity a, entt::entity b) {
        return registry_.get<ecs::Uid>(a).value < registry_.get<ecs::Uid>(b).value;
    });
    return out;
}

std::size_t World::entity_count() const {
    return registry_.view<ecs::Uid>().size();
}

// ============================================================================
// Simulation
// ============================================================================

void World::update(float dt) {
    events_.flush();
    advance_animators(dt);
}

void World::advance_animators(float dt) {
    auto view = registry_.view<ecs::Animator, ecs::ModelRef, ecs::Active>();

    for (auto e : view) {
        auto& anim = view.get<ecs::Animator>(e);
        const auto& ref = view.get<ecs::ModelRef>(e);

        const auto& clip = ref.model->clips[static_cast<std::size_t>(anim.clipIndex)];

        anim.time += dt;
        const auto frames = static_cast<double>(clip.frameCount);
        const double t = static_cast<double>(anim.time);
        const double raw = std::floor(t * anim.framesPerSecond);
        anim.frame = static_cast<std::uint32_t>(std::fmod(raw, frames));

        // Keep the clock within one loop of the clip so float steps never vanish.
        const double period = frames / anim.framesPerSecond;
        anim.time = static_cast<float>(std::fmod(t, period));
    }
}

} // namespace glacier::scene
