#pragma once

#include "client/core/config.hpp"

#include "glacier/scene/camera_rig.hpp"

#include <raylib.h>

#include <unordered_set>

namespace glacier::scene {
class World;
}

namespace glacier::scripting {
class SceneScriptEngine;
}

namespace viewer {

// ============================================================================
// Viewer - window, input translation and debug rendering of a World
// ============================================================================
//
// Each frame: key presses/releases become kEventKeyDown/kEventKeyUp global
// events, the world flushes them and steps, the script gets on_update(dt),
// and the scene is drawn from the active camera slot.

class Viewer {
public:
    Viewer(glacier::scene::World& world,
           glacier::scripting::SceneScriptEngine& scripts,
           const core::ClientConfig& config);
    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Opens the window and blocks until it is closed or the exit key is hit.
    void run();
    void stop() { running_ = false; }

private:
    void init_window();
    void close_window();

    void poll_input();
    void sync_camera(float dt);

    void draw_scene() const;
    void draw_map() const;
    void draw_entities() const;
    void draw_light() const;
    void draw_names() const;
    void draw_overlay() const;

    Color shade(Color base) const;

    glacier::scene::World& world_;
    glacier::scripting::SceneScriptEngine& scripts_;
    core::ClientConfig config_;

    Camera3D camera_{};
    glacier::scene::CameraMode lastMode_{glacier::scene::CameraMode::RTS};
    int lastSlot_{-1};

    std::unordered_set<int> held_;
    bool overlay_{true};
    bool running_{false};
};

} // namespace viewer
