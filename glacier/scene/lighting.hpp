#pragma once

#include <raylib.h>

namespace glacier::scene {

// Global light parameters. Colours are linear RGB in [0, 1].
struct Lighting {
    Vector3 ambientColor{0.2f, 0.2f, 0.2f};
    Vector3 emitColor{1.0f, 1.0f, 1.0f};
    Vector3 emitPosition{0.0f, 1000.0f, 0.0f};
};

} // namespace glacier::scene
