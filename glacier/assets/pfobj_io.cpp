#include "pfobj_io.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace glacier::assets {

namespace {

bool expect_key(std::istringstream& line, const char* key, std::string* outError) {
    std::string got;
    line >> got;
    if (got != key) {
        if (outError) *outError = std::string("expected '") + key + "', got '" + got + "'";
        return false;
    }
    return true;
}

template <typename T>
bool read_field(std::istream& in, const char* key, T* out, std::string* outError) {
    std::string text;
    if (!std::getline(in, text)) {
        if (outError) *outError = std::string("missing header field '") + key + "'";
        return false;
    }

    std::istringstream line(text);
    if (!expect_key(line, key, outError)) return false;

    if (!(line >> *out)) {
        if (outError) *outError = std::string("invalid value for '") + key + "'";
        return false;
    }
    return true;
}

bool to_count(long long raw, std::uint32_t* out) {
    if (raw < 0 || raw > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
        return false;
    }
    *out = static_cast<std::uint32_t>(raw);
    return true;
}

// Unsigned header field. Negative values are rejected rather than wrapped.
bool read_count(std::istream& in, const char* key, std::uint32_t* out, std::string* outError) {
    long long raw = 0;
    if (!read_field(in, key, &raw, outError)) return false;
    if (!to_count(raw, out)) {
        if (outError) *outError = std::string("invalid value for '") + key + "': " + std::to_string(raw);
        return false;
    }
    return true;
}

} // namespace

bool parse_pfobj(const std::string& text, ModelData* outModel, std::string* outError) {
    if (!outModel) {
        if (outError) *outError = "outModel is null";
        return false;
    }

    std::istringstream in(text);
    ModelData model;
    std::uint32_t numAs = 0;
    int hasCollision = 0;

    if (!read_field(in, "version", &model.version, outError)) return false;
    if (!read_count(in, "num_verts", &model.numVerts, outError)) return false;
    if (!read_count(in, "num_joints", &model.numJoints, outError)) return false;
    if (!read_count(in, "num_materials", &model.numMaterials, outError)) return false;
    if (!read_count(in, "num_as", &numAs, outError)) return false;

    std::vector<std::uint32_t> frameCounts;
    {
        std::string lineText;
        if (!std::getline(in, lineText)) {
            if (outError) *outError = "missing header field 'frame_counts'";
            return false;
        }
        std::istringstream line(lineText);
        if (!expect_key(line, "frame_counts", outError)) return false;

        long long raw = 0;
        while (line >> raw) {
            std::uint32_t fc = 0;
            if (!to_count(raw, &fc)) {
                if (outError) *outError = "invalid frame count: " + std::to_string(raw);
                return false;
            }
            frameCounts.push_back(fc);
        }
        if (frameCounts.size() != numAs) {
            if (outError) {
                *outError = "frame_counts lists " + std::to_string(frameCounts.size()) +
                            " entries, num_as is " + std::to_string(numAs);
            }
            return false;
        }
    }

    if (!read_field(in, "has_collision", &hasCollision, outError)) return false;
    model.hasCollision = hasCollision != 0;

    if (numAs > 0 && model.numJoints == 0) {
        if (outError) *outError = "animation sets declared on a model without joints";
        return false;
    }

    std::string lineText;
    while (std::getline(in, lineText)) {
        std::istringstream line(lineText);
        std::string tag;
        if (!(line >> tag) || tag != "as") continue;

        AnimClip clip;
        long long frames = 0;
        if (!(line >> clip.name >> frames) || !to_count(frames, &clip.frameCount)) {
            if (outError) *outError = "malformed animation set line: '" + lineText + "'";
            return false;
        }

        const std::size_t idx = model.clips.size();
        if (idx >= numAs) {
            if (outError) *outError = "more animation sets than num_as (" + std::to_string(numAs) + ")";
            return false;
        }
        if (clip.frameCount == 0 || clip.frameCount != frameCounts[idx]) {
            if (outError) {
                *outError = "animation set '" + clip.name + "' frame count " +
                            std::to_string(clip.frameCount) + " does not match header " +
                            std::to_string(frameCounts[idx]);
            }
            return false;
        }
        if (model.find_clip(clip.name) >= 0) {
            if (outError) *outError = "duplicate animation set '" + clip.name + "'";
            return false;
        }
        model.clips.push_back(std::move(clip));
    }

    if (model.clips.size() != numAs) {
        if (outError) {
            *outError = "expected " + std::to_string(numAs) + " animation sets, found " +
                        std::to_string(model.clips.size());
        }
        return false;
    }

    *outModel = std::move(model);
    return true;
}

bool read_pfobj(const std::filesystem::path& path, ModelData* outModel, std::string* outError) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (outError) *outError = "failed to open " + path.string();
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();

    ModelData model;
    if (!parse_pfobj(ss.str(), &model, outError)) {
        return false;
    }
    model.file = path.filename().string();

    if (outModel) *outModel = std::move(model);
    return true;
}

} // namespace glacier::assets
