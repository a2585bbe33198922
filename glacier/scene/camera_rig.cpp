#include "camera_rig.hpp"

#include <raylib.h>

namespace glacier::scene {

const char* camera_mode_name(CameraMode mode) {
    switch (mode) {
        case CameraMode::FPS: return "fps";
        case CameraMode::RTS: return "rts";
        default: return "unknown";
    }
}

CameraRig::CameraRig() {
    frame_area(Vector3{0.0f, 0.0f, 0.0f}, 64.0f);
    slots_[0].mode = CameraMode::RTS;
    slots_[1].mode = CameraMode::FPS;
}

void CameraRig::frame_area(Vector3 center, float extent) {
    const float e = extent > 1.0f ? extent : 1.0f;

    // Overhead view from the south, pitched down ~60 degrees.
    slots_[0].target = center;
    slots_[0].position = Vector3{center.x, center.y + e * 1.2f, center.z + e * 0.7f};

    // Eye level at the south edge, looking north.
    slots_[1].target = Vector3{center.x, center.y + 6.0f, center.z - e * 0.5f};
    slots_[1].position = Vector3{center.x, center.y + 6.0f, center.z + e * 0.5f};
}

bool CameraRig::activate(int index, int mode, std::string* outError) {
    if (index < 0 || index >= kNumCameras) {
        if (outError) {
            *outError = "camera index " + std::to_string(index) + " out of range [0, " +
                        std::to_string(kNumCameras) + ")";
        }
        return false;
    }
    if (mode != static_cast<int>(CameraMode::FPS) && mode != static_cast<int>(CameraMode::RTS)) {
        if (outError) *outError = "unknown camera mode " + std::to_string(mode);
        return false;
    }

    active_ = index;
    slots_[static_cast<std::size_t>(index)].mode = static_cast<CameraMode>(mode);
    ++switches_;

    TraceLog(LOG_DEBUG, "[camera] active slot %d (%s)", index,
             camera_mode_name(static_cast<CameraMode>(mode)));
    return true;
}

} // namespace glacier::scene
