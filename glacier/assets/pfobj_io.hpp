#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace glacier::assets {

struct AnimClip {
    std::string name;
    std::uint32_t frameCount{0};
};

// Model description read from a `.pfobj` header.
//
// Header (one key per line):
//   version        1.0
//   num_verts      N
//   num_joints     J
//   num_materials  M
//   num_as         A
//   frame_counts   f0 f1 ... f(A-1)
//   has_collision  0|1
//
// Body: one `as <name> <frames>` line per animation set, in header order.
// Any other body line (vertex, joint, material records) is skipped.
struct ModelData {
    std::string file;           // e.g. "Sinbad.pfobj"
    float version{0.0f};
    std::uint32_t numVerts{0};
    std::uint32_t numJoints{0};
    std::uint32_t numMaterials{0};
    bool hasCollision{false};
    std::vector<AnimClip> clips;

    bool animated() const { return !clips.empty(); }

    // Returns the clip index or -1.
    int find_clip(const std::string& name) const {
        for (std::size_t i = 0; i < clips.size(); ++i) {
            if (clips[i].name == name) return static_cast<int>(i);
        }
        return -1;
    }
};

// Parses model text. On failure returns false and fills outError (if provided).
bool parse_pfobj(const std::string& text, ModelData* outModel, std::string* outError);

// Reads a `.pfobj` file from disk.
// On failure returns false and fills outError (if provided).
bool read_pfobj(const std::filesystem::path& path, ModelData* outModel, std::string* outError);

} // namespace glacier::assets
