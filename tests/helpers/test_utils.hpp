#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities and helpers.
 */

#include "glacier/assets/pfmap_io.hpp"
#include "glacier/assets/pfobj_io.hpp"
#include "glacier/core/scripting/scripting.hpp"
#include "glacier/scene/world.hpp"
#include "glacier/scripting/scene_script_engine.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef GLACIER_SOURCE_DIR
#define GLACIER_SOURCE_DIR "."
#endif

namespace test_helpers {

// =============================================================================
// Paths and temporary files
// =============================================================================

/** @brief Repository root; asset and script paths resolve against it. */
inline std::filesystem::path source_dir() {
    return std::filesystem::path(GLACIER_SOURCE_DIR);
}

/** @brief Removes the file (or directory tree) on scope exit. */
struct TempFileGuard {
    std::filesystem::path path;
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("glacier_test_" + name);
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// =============================================================================
// Asset builders
// =============================================================================

/** @brief Flat map of the given size. */
inline glacier::assets::MapData make_map(int rows, int cols, const std::string& name = "test") {
    glacier::assets::MapData map;
    map.name = name;
    map.version = 1.0f;
    map.rows = rows;
    map.cols = cols;
    map.heights.assign(static_cast<std::size_t>(rows * cols), 0);
    return map;
}

/** @brief Model with the given animation sets (no clips = static prop). */
inline std::shared_ptr<const glacier::assets::ModelData> make_model(
    const std::string& file,
    std::vector<glacier::assets::AnimClip> clips = {})
{
    auto model = std::make_shared<glacier::assets::ModelData>();
    model->file = file;
    model->version = 1.0f;
    model->numVerts = 8;
    model->numJoints = clips.empty() ? 0 : 4;
    model->numMaterials = 1;
    model->clips = std::move(clips);
    return model;
}

// =============================================================================
// Script harness
// =============================================================================

/**
 * @brief World plus a sandboxed scene script engine rooted at the repo.
 *
 * print() output is captured in `output` instead of going to the log.
 */
struct ScriptHarness {
    glacier::scene::World world;
    glacier::scripting::SceneScriptEngine engine;
    std::vector<std::string> output;

    explicit ScriptHarness(std::filesystem::path base = source_dir())
        : engine(world, std::move(base))
    {
        if (!engine.init()) {
            throw std::runtime_error("script engine init failed: " + engine.last_error());
        }
        engine.set_log_callback([this](const std::string& msg) { output.push_back(msg); });
    }

    /** @brief Loads `code` as the current script (replaces any previous one). */
    glacier::scripting::ScriptResult load(const std::string& code, const std::string& name = "test.lua") {
        glacier::scripting::ScriptSource src;
        src.name = name;
        src.content = code;
        return engine.load_script(src);
    }

    /** @brief Runs more code in the already loaded script's state. */
    glacier::scripting::ScriptResult exec(const std::string& code) {
        return engine.lua_state()->execute(code, "exec");
    }

    /** @brief One viewer frame: flush events, step animation, on_update. */
    void tick(float dt = 1.0f / 60.0f) {
        world.update(dt);
        engine.update(dt);
    }
};

/** @brief Script prologue that loads the bundled demo map. */
inline const char* kLoadMap =
    "pf.new_game('assets/maps/grass-cliffs-1', 'grass-cliffs.pfmap')\n";

} // namespace test_helpers
