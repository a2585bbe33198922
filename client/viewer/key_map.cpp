#include "key_map.hpp"

#include <raylib.h>

namespace viewer {

namespace scancode = glacier::events::scancode;

int scancode_from_key(int key) {
    if (key >= KEY_A && key <= KEY_Z) {
        return scancode::kA + (key - KEY_A);
    }

    // HID orders digits 1..9 then 0.
    if (key >= KEY_ONE && key <= KEY_NINE) {
        return scancode::k1 + (key - KEY_ONE);
    }

    switch (key) {
        case KEY_ZERO: return scancode::k0;
        case KEY_ENTER: return scancode::kReturn;
        case KEY_ESCAPE: return scancode::kEscape;
        case KEY_BACKSPACE: return scancode::kBackspace;
        case KEY_TAB: return scancode::kTab;
        case KEY_SPACE: return scancode::kSpace;
        case KEY_RIGHT: return scancode::kRight;
        case KEY_LEFT: return scancode::kLeft;
        case KEY_DOWN: return scancode::kDown;
        case KEY_UP: return scancode::kUp;
        default: break;
    }

    return scancode::kUnknown;
}

const std::vector<int>& mapped_keys() {
    static const std::vector<int> keys = [] {
        std::vector<int> out;
        for (int k = KEY_A; k <= KEY_Z; ++k) out.push_back(k);
        for (int k = KEY_ZERO; k <= KEY_NINE; ++k) out.push_back(k);
        out.insert(out.end(), {KEY_ENTER, KEY_ESCAPE, KEY_BACKSPACE, KEY_TAB, KEY_SPACE,
                               KEY_RIGHT, KEY_LEFT, KEY_DOWN, KEY_UP});
        return out;
    }();
    return keys;
}

} // namespace viewer
