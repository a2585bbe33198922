#include "viewer.hpp"

#include "key_map.hpp"

#include "glacier/ecs/components.hpp"
#include "glacier/events/event_codes.hpp"
#include "glacier/scene/world.hpp"
#include "glacier/scripting/scene_script_engine.hpp"

#include <raymath.h>

#include <algorithm>
#include <string>

namespace viewer {

using glacier::scene::CameraMode;

namespace {

constexpr float kHeightStep = 2.0f;

// Debug boxes stand in for meshes: unit size per model kind, times scale.
constexpr Vector3 kAnimatedBox{4.0f, 10.0f, 4.0f};
constexpr Vector3 kStaticBox{6.0f, 14.0f, 6.0f};

Color to_color(Vector3 rgb) {
    auto channel = [](float v) {
        return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f);
    };
    return Color{channel(rgb.x), channel(rgb.y), channel(rgb.z), 255};
}

Color clip_color(int clipIndex) {
    static const Color palette[] = {ORANGE, SKYBLUE, LIME, PINK, GOLD, VIOLET};
    const int n = static_cast<int>(sizeof(palette) / sizeof(palette[0]));
    return palette[((clipIndex % n) + n) % n];
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Viewer::Viewer(glacier::scene::World& world,
               glacier::scripting::SceneScriptEngine& scripts,
               const core::ClientConfig& config)
    : world_(world)
    , scripts_(scripts)
    , config_(config)
    , overlay_(config.viewer.overlay)
{
}

Viewer::~Viewer() {
    stop();
}

void Viewer::init_window() {
    unsigned int flags = FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT;
    if (config_.window.vsync) {
        flags |= FLAG_VSYNC_HINT;
    }
    SetConfigFlags(flags);

    InitWindow(config_.window.width, config_.window.height, config_.window.title.c_str());
    SetExitKey(KEY_NULL);  // exit key is handled in poll_input

    if (config_.window.target_fps > 0) {
        SetTargetFPS(config_.window.target_fps);
    }

    camera_.up = Vector3{0.0f, 1.0f, 0.0f};
    camera_.projection = CAMERA_PERSPECTIVE;
}

void Viewer::close_window() {
    if (IsCursorHidden()) {
        EnableCursor();
    }
    CloseWindow();
}

void Viewer::run() {
    init_window();
    running_ = true;

    TraceLog(LOG_INFO, "[viewer] running (%s to quit, %s toggles overlay)",
             core::key_name(config_.controls.exit).c_str(),
             core::key_name(config_.controls.toggle_overlay).c_str());

    while (running_ && !WindowShouldClose()) {
        const float dt = GetFrameTime();

        poll_input();
        world_.update(dt);
        scripts_.update(dt);
        sync_camera(dt);

        BeginDrawing();
        ClearBackground(shade(Color{110, 150, 200, 255}));

        BeginMode3D(camera_);
        draw_scene();
        EndMode3D();

        if (config_.viewer.draw_names) draw_names();
        if (overlay_) draw_overlay();

        EndDrawing();
    }

    running_ = false;
    close_window();
    TraceLog(LOG_INFO, "[viewer] stopped");
}

// ============================================================================
// Input
// ============================================================================

void Viewer::poll_input() {
    auto& bus = world_.events();

    for (int key = GetKeyPressed(); key != 0; key = GetKeyPressed()) {
        if (key == config_.controls.exit) {
            running_ = false;
        }
        if (key == config_.controls.toggle_overlay) {
            overlay_ = !overlay_;
        }

        const int sc = scancode_from_key(key);
        if (sc == glacier::events::scancode::kUnknown) continue;

        held_.insert(key);
        bus.notify_global(glacier::events::kEventKeyDown,
                          glacier::events::KeyEvent{sc, key, false});
    }

    for (int key : mapped_keys()) {
        if (held_.count(key) == 0) continue;

        if (IsKeyPressedRepeat(key)) {
            bus.notify_global(glacier::events::kEventKeyDown,
                              glacier::events::KeyEvent{scancode_from_key(key), key, true});
        }
        if (IsKeyReleased(key) || !IsKeyDown(key)) {
            held_.erase(key);
            bus.notify_global(glacier::events::kEventKeyUp,
                              glacier::events::KeyEvent{scancode_from_key(key), key, false});
        }
    }
}

// ============================================================================
// Camera
// ============================================================================

void Viewer::sync_camera(float dt) {
    (void)dt;
    auto& rig = world_.cameras();
    auto& slot = rig.active();

    const bool switched = rig.active_index() != lastSlot_ || slot.mode != lastMode_;
    if (switched) {
        if (slot.mode == CameraMode::FPS) {
            DisableCursor();
        } else if (IsCursorHidden()) {
            EnableCursor();
        }
        lastSlot_ = rig.active_index();
        lastMode_ = slot.mode;
    }

    camera_.position = slot.position;
    camera_.target = slot.target;
    camera_.fovy = slot.fovy;

    if (slot.mode == CameraMode::FPS) {
        UpdateCamera(&camera_, CAMERA_FIRST_PERSON);
        slot.position = camera_.position;
        slot.target = camera_.target;
    }
}

// ============================================================================
// Rendering
// ============================================================================

Color Viewer::shade(Color base) const {
    return ColorTint(base, to_color(world_.lighting().ambientColor));
}

void Viewer::draw_scene() const {
    draw_map();
    draw_entities();
    draw_light();
}

void Viewer::draw_map() const {
    const auto* map = world_.map();
    if (!map) return;

    const float tile = glacier::assets::kTileSize;
    const float x0 = -map->width() * 0.5f;
    const float z0 = -map->depth() * 0.5f;

    for (int r = 0; r < map->rows; ++r) {
        for (int c = 0; c < map->cols; ++c) {
            const int level = std::clamp(map->height_at(r, c), 0, glacier::assets::kMaxTileHeight);
            const float h = static_cast<float>(level) * kHeightStep;
            const float sy = std::max(h, 0.1f);
            const Vector3 center{x0 + (c + 0.5f) * tile, sy * 0.5f - 0.1f, z0 + (r + 0.5f) * tile};

            const unsigned char g = static_cast<unsigned char>(std::min(120 + level * 18, 255));
            DrawCube(center, tile, sy, tile, shade(Color{70, g, 60, 255}));
            if (config_.viewer.draw_grid) {
                DrawCubeWires(center, tile, sy, tile, shade(DARKGREEN));
            }
        }
    }
}

void Viewer::draw_entities() const {
    const auto& reg = world_.registry();
    auto view = reg.view<glacier::ecs::Transform, glacier::ecs::ModelRef, glacier::ecs::Active>();

    for (auto e : view) {
        const auto& tf = reg.get<glacier::ecs::Transform>(e);
        const auto* anim = reg.try_get<glacier::ecs::Animator>(e);

        const Vector3 box = anim ? kAnimatedBox : kStaticBox;
        const Vector3 size = Vector3Multiply(box, tf.scale);
        Vector3 center = tf.position;
        center.y += size.y * 0.5f;

        Color color = shade(BROWN);
        if (anim) {
            color = shade(clip_color(anim->clipIndex));
            // Bob with the frame counter so playback is visible.
            center.y += 0.25f * static_cast<float>(anim->frame % 8);
        }

        DrawCubeV(center, size, Fade(color, 0.6f));
        DrawCubeWiresV(center, size, color);
    }
}

void Viewer::draw_light() const {
    const auto& light = world_.lighting();
    const float len = Vector3Length(light.emitPosition);
    const Vector3 dir = len > 0.0f ? Vector3Scale(light.emitPosition, 1.0f / len) : Vector3{0.0f, 1.0f, 0.0f};

    const Vector3 marker = Vector3Scale(dir, 120.0f);
    const Color c = to_color(light.emitColor);
    DrawSphere(marker, 3.0f, c);
    DrawLine3D(Vector3{0.0f, 0.0f, 0.0f}, marker, Fade(c, 0.4f));
}

void Viewer::draw_names() const {
    const auto& reg = world_.registry();
    auto view = reg.view<glacier::ecs::Name, glacier::ecs::Transform, glacier::ecs::Active>();

    for (auto e : view) {
        const auto& name = reg.get<glacier::ecs::Name>(e).value;
        const auto& tf = reg.get<glacier::ecs::Transform>(e);

        Vector3 top = tf.position;
        top.y += kStaticBox.y * tf.scale.y + 2.0f;
        const Vector2 p = GetWorldToScreen(top, camera_);
        if (p.x < 0 || p.y < 0 || p.x > GetScreenWidth() || p.y > GetScreenHeight()) continue;

        const int w = MeasureText(name.c_str(), 18);
        DrawText(name.c_str(), static_cast<int>(p.x) - w / 2, static_cast<int>(p.y), 18, RAYWHITE);
    }
}

void Viewer::draw_overlay() const {
    const auto& rig = world_.cameras();
    const auto* map = world_.map();

    int y = 10;
    auto line = [&y](const std::string& text) {
        DrawText(text.c_str(), 10, y, 18, RAYWHITE);
        y += 22;
    };

    DrawRectangle(4, 4, 360, 120, Fade(BLACK, 0.45f));
    line("map: " + (map ? map->name : std::string("<none>")));
    line("camera: " + std::to_string(rig.active_index()) + " (" +
         glacier::scene::camera_mode_name(rig.active_mode()) + ")");
    line("entities: " + std::to_string(world_.entity_count()));

    const auto& reg = world_.registry();
    auto anims = reg.view<glacier::ecs::Name, glacier::ecs::Animator, glacier::ecs::Active>();
    for (auto e : anims) {
        const auto& anim = reg.get<glacier::ecs::Animator>(e);
        line(reg.get<glacier::ecs::Name>(e).value + ": " + anim.clip +
             " [" + std::to_string(anim.frame) + "]");
    }

    DrawFPS(GetScreenWidth() - 90, 10);
}

} // namespace viewer
