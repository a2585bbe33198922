#pragma once

#include "glacier/core/types.hpp"

namespace glacier::events {

// ============================================================================
// Engine event codes
// ============================================================================
//
// Input codes share the SDL event numbering so scripts written against an
// SDL-backed host keep working. Codes at or above kEventCustom are free for
// script use.

static constexpr EventCode kEventKeyDown     = 0x300;
static constexpr EventCode kEventKeyUp       = 0x301;
static constexpr EventCode kEventCustom      = 0x20000;

// ============================================================================
// Scancodes (USB HID usage ids, as SDL reports them)
// ============================================================================

namespace scancode {

static constexpr int kUnknown   = 0;
static constexpr int kA         = 4;
static constexpr int kC         = 6;
static constexpr int kV         = 25;
static constexpr int kZ         = 29;
static constexpr int k1         = 30;
static constexpr int k0         = 39;
static constexpr int kReturn    = 40;
static constexpr int kEscape    = 41;
static constexpr int kBackspace = 42;
static constexpr int kTab       = 43;
static constexpr int kSpace     = 44;
static constexpr int kRight     = 79;
static constexpr int kLeft      = 80;
static constexpr int kDown      = 81;
static constexpr int kUp        = 82;

} // namespace scancode

// Payload of kEventKeyDown / kEventKeyUp.
struct KeyEvent {
    int scancode{scancode::kUnknown};
    int key{0};          // raylib key code
    bool repeat{false};
};

} // namespace glacier::events
