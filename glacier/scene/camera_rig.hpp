#pragma once

#include <raylib.h>

#include <array>
#include <cstdint>
#include <string>

namespace glacier::scene {

enum class CameraMode : std::uint8_t {
    FPS = 0,    // free-fly, mouse look
    RTS = 1,    // fixed pitch overhead
};

const char* camera_mode_name(CameraMode mode);

struct CameraSlot {
    Vector3 position{0.0f, 0.0f, 0.0f};
    Vector3 target{0.0f, 0.0f, -1.0f};
    float fovy{45.0f};
    CameraMode mode{CameraMode::RTS};
};

// Fixed set of camera slots; exactly one is active at a time.
class CameraRig {
public:
    static constexpr int kNumCameras = 2;

    CameraRig();

    // Selects slot `index` and puts it in `mode` (raw CameraMode value).
    // On failure returns false, leaves the rig unchanged and fills outError.
    bool activate(int index, int mode, std::string* outError);

    int active_index() const { return active_; }
    CameraMode active_mode() const { return slots_[static_cast<std::size_t>(active_)].mode; }

    CameraSlot& active() { return slots_[static_cast<std::size_t>(active_)]; }
    const CameraSlot& active() const { return slots_[static_cast<std::size_t>(active_)]; }

    CameraSlot& slot(int index) { return slots_.at(static_cast<std::size_t>(index)); }
    const CameraSlot& slot(int index) const { return slots_.at(static_cast<std::size_t>(index)); }

    // Re-aims every slot at `center` (called after a map load).
    void frame_area(Vector3 center, float extent);

    // Number of successful activate() calls.
    std::uint32_t switch_count() const { return switches_; }

private:
    std::array<CameraSlot, kNumCameras> slots_{};
    int active_{0};
    std::uint32_t switches_{0};
};

} // namespace glacier::scene
