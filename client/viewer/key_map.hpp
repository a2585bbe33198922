#pragma once

#include "glacier/events/event_codes.hpp"

#include <vector>

namespace viewer {

// raylib keycode -> USB HID scancode as seen by scripts (SCANCODE_*).
// Keys without a mapping return scancode::kUnknown.
int scancode_from_key(int key);

// Every raylib key that has a scancode; the viewer polls these for releases.
const std::vector<int>& mapped_keys();

} // namespace viewer
