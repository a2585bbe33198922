#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace glacier::assets {

// World units covered by one map tile along X and Z.
static constexpr float kTileSize = 8.0f;

// Maps larger than this are rejected as malformed.
static constexpr int kMaxMapDimension = 1024;

// Tile heights are in [0, kMaxTileHeight] height steps.
static constexpr int kMaxTileHeight = 255;

// Height-field map read from a `.pfmap` file.
//
// Layout (text, whitespace separated):
//   version   1.0
//   num_rows  R
//   num_cols  C
//   R lines of C integer tile heights
//
// Row 0 is the most negative Z; column 0 the most negative X. The map is
// centred on the world origin.
struct MapData {
    std::string name;           // file stem, e.g. "grass-cliffs"
    float version{0.0f};
    int rows{0};
    int cols{0};
    std::vector<int> heights;   // rows * cols, row-major

    bool empty() const { return rows == 0 || cols == 0; }

    int height_at(int row, int col) const {
        return heights[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols) +
                       static_cast<std::size_t>(col)];
    }

    float width() const { return static_cast<float>(cols) * kTileSize; }
    float depth() const { return static_cast<float>(rows) * kTileSize; }

    // True if (x, z) in world space lies over a tile.
    bool contains(float x, float z) const {
        return x >= -width() * 0.5f && x <= width() * 0.5f &&
               z >= -depth() * 0.5f && z <= depth() * 0.5f;
    }
};

// Parses map text. On failure returns false and fills outError (if provided).
bool parse_pfmap(const std::string& text, MapData* outMap, std::string* outError);

// Reads a `.pfmap` file from disk.
// On failure returns false and fills outError (if provided).
bool read_pfmap(const std::filesystem::path& path, MapData* outMap, std::string* outError);

} // namespace glacier::assets
