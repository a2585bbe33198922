#pragma once

// =============================================================================
// Scene components
// =============================================================================
//
// Data-only structs attached to world entities. Script handles never own
// these; they look them up through the World on every access.

#include "glacier/assets/pfobj_io.hpp"
#include "glacier/core/types.hpp"

#include <raylib.h>

#include <cstdint>
#include <memory>
#include <string>

namespace glacier::ecs {

struct Uid {
    EntityUid value{kInvalidUid};
};

struct Name {
    std::string value;
};

struct Transform {
    Vector3 position{0.0f, 0.0f, 0.0f};
    Vector3 scale{1.0f, 1.0f, 1.0f};
};

// Where the entity's model came from, plus its parsed header.
struct ModelRef {
    std::string dir;     // e.g. "assets/models/sinbad"
    std::string file;    // e.g. "Sinbad.pfobj"
    std::shared_ptr<const assets::ModelData> model;
};

// Tag: entity participates in the simulation (animation, drawing).
struct Active {};

// Clip playback state for animated models.
struct Animator {
    int clipIndex{0};
    std::string clip;
    float time{0.0f};            // seconds since the clip started
    std::uint32_t frame{0};
    float framesPerSecond{24.0f};
};

} // namespace glacier::ecs
