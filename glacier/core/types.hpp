#pragma once

#include <cstdint>

namespace glacier {

// ============================================================================
// Core Types
// ============================================================================

// Stable entity identifier exposed to scripts. Unlike entt ids it is never recycled.
using EntityUid = std::uint32_t;
using EventCode = std::uint32_t;

static constexpr EntityUid kInvalidUid = 0;

} // namespace glacier
