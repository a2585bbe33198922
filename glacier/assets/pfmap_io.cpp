#include "pfmap_io.hpp"

#include <fstream>
#include <sstream>

namespace glacier::assets {

namespace {

bool read_header_value(std::istream& in, const char* expectedKey, std::string* outValue,
                       std::string* outError) {
    std::string key;
    if (!(in >> key >> *outValue)) {
        if (outError) *outError = std::string("missing header field '") + expectedKey + "'";
        return false;
    }
    if (key != expectedKey) {
        if (outError) *outError = std::string("expected '") + expectedKey + "', got '" + key + "'";
        return false;
    }
    return true;
}

bool parse_dimension(const std::string& raw, const char* what, int* out, std::string* outError) {
    try {
        std::size_t idx = 0;
        const int v = std::stoi(raw, &idx, 10);
        if (idx != raw.size() || v <= 0 || v > kMaxMapDimension) {
            if (outError) *outError = std::string("invalid ") + what + ": " + raw;
            return false;
        }
        *out = v;
        return true;
    } catch (const std::exception&) {
        if (outError) *outError = std::string("invalid ") + what + ": " + raw;
        return false;
    }
}

} // namespace

bool parse_pfmap(const std::string& text, MapData* outMap, std::string* outError) {
    if (!outMap) {
        if (outError) *outError = "outMap is null";
        return false;
    }

    std::istringstream in(text);
    std::string raw;

    MapData map;

    if (!read_header_value(in, "version", &raw, outError)) return false;
    try {
        map.version = std::stof(raw);
    } catch (const std::exception&) {
        if (outError) *outError = "invalid version: " + raw;
        return false;
    }
    if (map.version < 1.0f) {
        if (outError) *outError = "unsupported version: " + raw;
        return false;
    }

    if (!read_header_value(in, "num_rows", &raw, outError)) return false;
    if (!parse_dimension(raw, "num_rows", &map.rows, outError)) return false;

    if (!read_header_value(in, "num_cols", &raw, outError)) return false;
    if (!parse_dimension(raw, "num_cols", &map.cols, outError)) return false;

    const std::size_t count = static_cast<std::size_t>(map.rows) * static_cast<std::size_t>(map.cols);
    map.heights.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        int h = 0;
        if (!(in >> h)) {
            if (outError) {
                *outError = "tile data truncated: expected " + std::to_string(count) +
                            " heights, got " + std::to_string(i);
            }
            return false;
        }
        if (h < 0 || h > kMaxTileHeight) {
            if (outError) {
                *outError = "tile height out of range at index " + std::to_string(i) + ": " +
                            std::to_string(h);
            }
            return false;
        }
        map.heights.push_back(h);
    }

    std::string trailing;
    if (in >> trailing) {
        if (outError) *outError = "unexpected data after tile heights: '" + trailing + "'";
        return false;
    }

    *outMap = std::move(map);
    return true;
}

bool read_pfmap(const std::filesystem::path& path, MapData* outMap, std::string* outError) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (outError) *outError = "failed to open " + path.string();
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();

    MapData map;
    if (!parse_pfmap(ss.str(), &map, outError)) {
        return false;
    }
    map.name = path.stem().string();

    if (outMap) *outMap = std::move(map);
    return true;
}

} // namespace glacier::assets
