#include "../client/core/config.hpp"
#include "../client/core/logger.hpp"
#include "../client/viewer/viewer.hpp"

#include "glacier/scene/world.hpp"
#include "glacier/scripting/scene_script_engine.hpp"

#include <raylib.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <string>

namespace {

struct Args {
    std::string config = "glacier.conf";
    std::string base;       // overrides [script] base
    std::string script;     // overrides [script] path
    int headlessFrames = -1;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            args.config = argv[++i];
        } else if (std::strcmp(argv[i], "--base") == 0 && i + 1 < argc) {
            args.base = argv[++i];
        } else if (std::strcmp(argv[i], "--script") == 0 && i + 1 < argc) {
            args.script = argv[++i];
        } else if (std::strcmp(argv[i], "--headless") == 0 && i + 1 < argc) {
            try {
                args.headlessFrames = std::max(0, std::stoi(argv[++i]));
            } catch (const std::exception&) {
                TraceLog(LOG_WARNING, "[app] ignoring bad --headless value '%s'", argv[i]);
            }
        } else {
            TraceLog(LOG_WARNING, "[app] unknown argument '%s'", argv[i]);
        }
    }

    return args;
}

// Steps the world without a window at a fixed 60 Hz.
void run_headless(glacier::scene::World& world,
                  glacier::scripting::SceneScriptEngine& scripts, int frames) {
    constexpr float kStep = 1.0f / 60.0f;
    for (int i = 0; i < frames; ++i) {
        world.update(kStep);
        scripts.update(kStep);
    }

    const auto& cams = world.cameras();
    TraceLog(LOG_INFO, "[app] headless run done: %d frames, %zu entities, camera %d (%s)",
             frames, world.entity_count(), cams.active_index(),
             glacier::scene::camera_mode_name(cams.active_mode()));
}

} // namespace

int main(int argc, char* argv[]) {
    const Args args = parse_args(argc, argv);

    auto& config = core::Config::instance();
    const bool cfg_ok = config.load_from_file(args.config);
    if (!args.base.empty()) config.mutable_get().script.base = args.base;
    if (!args.script.empty()) config.mutable_get().script.path = args.script;

    core::Logger::instance().init(config.logging());
    TraceLog(LOG_INFO, "[config] %s: %s", args.config.c_str(), cfg_ok ? "ok" : "missing (defaults)");

    const std::filesystem::path base = config.script().base;
    std::filesystem::path scriptPath = config.script().path;
    if (scriptPath.is_relative()) {
        scriptPath = base / scriptPath;
    }

    glacier::scene::World world;
    int status = 0;
    {
        glacier::scripting::SceneScriptEngine scripts(world, base);

        const auto sandbox = config.script().sandbox
            ? glacier::scripting::SandboxConfig::default_for_scenes()
            : glacier::scripting::SandboxConfig::trusted_engine();

        if (!scripts.init(sandbox)) {
            TraceLog(LOG_ERROR, "[app] script engine init failed: %s", scripts.last_error().c_str());
            status = 1;
        } else if (auto result = scripts.load_script_file(scriptPath); !result) {
            TraceLog(LOG_ERROR, "[app] %s", result.error.c_str());
            status = 1;
        } else if (args.headlessFrames >= 0) {
            run_headless(world, scripts, args.headlessFrames);
        } else {
            viewer::Viewer view(world, scripts, config.get());
            view.run();
        }
    }

    core::Logger::instance().shutdown();
    return status;
}
