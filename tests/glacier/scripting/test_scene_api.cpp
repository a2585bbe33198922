/**
 * @file test_scene_api.cpp
 * @brief Tests for the `pf` scripting API: lighting, map loading, entity
 *        handles, cameras and event handlers.
 */

#include <catch2/catch_test_macros.hpp>

#include "glacier/ecs/components.hpp"
#include "glacier/events/event_codes.hpp"
#include "glacier/scripting/scene_api.hpp"

#include "../../helpers/test_utils.hpp"

#include <string>

using namespace glacier;
using test_helpers::ScriptHarness;
using test_helpers::kLoadMap;

namespace {

const std::string kSpawnOak =
    std::string(kLoadMap) +
    "oak = pf.Entity('assets/models/oak_tree', 'oak_tree.pfobj', 'Oak')\n";

const std::string kSpawnSinbad =
    std::string(kLoadMap) +
    "sinbad = pf.AnimEntity('assets/models/sinbad', 'Sinbad.pfobj', 'Sinbad', 'Dance')\n";

} // namespace

// =============================================================================
// Constants
// =============================================================================

TEST_CASE("pf exposes event, scancode and camera constants", "[scripting][api]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        keydown = pf.EVENT_SDL_KEYDOWN
        keyup = pf.EVENT_SDL_KEYUP
        custom = pf.EVENT_CUSTOM
        sc_c = pf.SCANCODE_C
        sc_v = pf.SCANCODE_V
        sc_1 = pf.SCANCODE_1
        sc_0 = pf.SCANCODE_0
        fps = pf.CAM_MODE_FPS
        rts = pf.CAM_MODE_RTS
        cams = pf.NUM_CAMERAS
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_int("keydown") == 0x300);
    REQUIRE(lua->get_global_int("keyup") == 0x301);
    REQUIRE(lua->get_global_int("custom") == 0x20000);
    REQUIRE(lua->get_global_int("sc_c") == 6);
    REQUIRE(lua->get_global_int("sc_v") == 25);
    REQUIRE(lua->get_global_int("sc_1") == 30);
    REQUIRE(lua->get_global_int("sc_0") == 39);
    REQUIRE(lua->get_global_int("fps") == 0);
    REQUIRE(lua->get_global_int("rts") == 1);
    REQUIRE(lua->get_global_int("cams") == 2);
}

// =============================================================================
// Lighting
// =============================================================================

TEST_CASE("Lighting setters update the world", "[scripting][api][lighting]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        pf.set_ambient_light_color({0.25, 0.5, 0.75})
        pf.set_emit_light_color({1.0, 0.5, 0.0})
        pf.set_emit_light_pos({1024.0, 512.0, 256.0})
        local p = pf.get_emit_light_pos()
        pos_x = p[1]
        pos_n = #p
    )"));

    const auto& light = h.world.lighting();
    REQUIRE(light.ambientColor.x == 0.25f);
    REQUIRE(light.ambientColor.z == 0.75f);
    REQUIRE(light.emitColor.y == 0.5f);
    REQUIRE(light.emitPosition.x == 1024.0f);
    REQUIRE(light.emitPosition.z == 256.0f);

    REQUIRE(h.engine.lua_state()->get_global_double("pos_x") == 1024.0);
    REQUIRE(h.engine.lua_state()->get_global_int("pos_n") == 3);
}

TEST_CASE("Lighting setters reject malformed vectors", "[scripting][api][lighting]") {
    ScriptHarness h;
    REQUIRE(h.load("x = 1"));

    SECTION("too few components") {
        auto r = h.exec("pf.set_emit_light_pos({1, 2})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("set_emit_light_pos: expected {x, y, z}") != std::string::npos);
    }

    SECTION("non-numeric component") {
        auto r = h.exec("pf.set_ambient_light_color({1, 'a', 2})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("set_ambient_light_color") != std::string::npos);
    }

    SECTION("not a table") {
        REQUIRE_FALSE(h.exec("pf.set_emit_light_color(5)"));
    }

    // Failed calls leave the old values.
    REQUIRE(h.world.lighting().emitPosition.y == 1000.0f);
    REQUIRE(h.world.lighting().ambientColor.x == 0.2f);
}

// =============================================================================
// Map loading
// =============================================================================

TEST_CASE("new_game loads a map relative to the base directory", "[scripting][api][map]") {
    ScriptHarness h;
    REQUIRE(h.load(kLoadMap));
    REQUIRE(h.world.has_map());
    REQUIRE(h.world.map()->name == "grass-cliffs");
}

TEST_CASE("new_game reports missing maps", "[scripting][api][map]") {
    ScriptHarness h;
    auto r = h.load("pf.new_game('assets/maps/nowhere', 'missing.pfmap')");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("new_game: failed to open") != std::string::npos);
    REQUIRE_FALSE(h.world.has_map());
}

// =============================================================================
// Entities
// =============================================================================

TEST_CASE("Entities cannot be created before new_game", "[scripting][api][entity]") {
    ScriptHarness h;
    auto r = h.load("pf.Entity('assets/models/oak_tree', 'oak_tree.pfobj', 'Oak')");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("no map loaded") != std::string::npos);
    REQUIRE(h.world.entity_count() == 0);
}

TEST_CASE("Entity properties read and write the world", "[scripting][api][entity]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak + R"(
        oak.pos = {30.0, 4.0, -50.0}
        oak.scale = {2.0, 2.0, 2.0}
        oak.name = 'BigOak'
        path = oak.path
        pfobj = oak.pfobj
        name = oak.name
        pos_z = oak.pos[3]
        active_before = oak.active
        changed = oak:activate()
        changed_again = oak:activate()
        active_after = oak.active
        text = tostring(oak)
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_string("path") == std::string("assets/models/oak_tree"));
    REQUIRE(lua->get_global_string("pfobj") == std::string("oak_tree.pfobj"));
    REQUIRE(lua->get_global_string("name") == std::string("BigOak"));
    REQUIRE(lua->get_global_double("pos_z") == -50.0);
    REQUIRE(lua->get_global_bool("active_before") == false);
    REQUIRE(lua->get_global_bool("changed") == true);
    REQUIRE(lua->get_global_bool("changed_again") == false);
    REQUIRE(lua->get_global_bool("active_after") == true);
    REQUIRE(lua->get_global_string("text") == std::string("Entity(1, 'BigOak')"));

    const auto e = h.world.entities().front();
    const auto& tf = h.world.registry().get<ecs::Transform>(e);
    REQUIRE(tf.position.x == 30.0f);
    REQUIRE(tf.scale.y == 2.0f);
    REQUIRE(h.world.is_active(e));
}

TEST_CASE("Entity rejects malformed positions", "[scripting][api][entity]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak));

    auto r = h.exec("oak.pos = {1, 2, 3, 4}");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("pos: expected {x, y, z}") != std::string::npos);
}

TEST_CASE("Entity reports unreadable models", "[scripting][api][entity]") {
    ScriptHarness h;
    auto r = h.load(std::string(kLoadMap) + "pf.Entity('assets/models/oak_tree', 'missing.pfobj', 'X')");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("Entity: failed to open") != std::string::npos);
}

TEST_CASE("Models are parsed once per file", "[scripting][api][entity]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak + R"(
        a = pf.Entity('assets/models/oak_tree', 'oak_tree.pfobj', 'A')
        b = pf.Entity.new('assets/models/oak_tree', 'oak_leafless.pfobj', 'B')
    )"));

    REQUIRE(h.world.entity_count() == 3);
    REQUIRE(h.engine.api().cached_model_count() == 2);
}

TEST_CASE("AnimEntity plays clips", "[scripting][api][anim]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnSinbad + R"(
        sinbad:activate()
        start_anim = sinbad.anim
        clip_count = #sinbad.clips
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_string("start_anim") == std::string("Dance"));
    REQUIRE(lua->get_global_int("clip_count") == 5);

    const auto e = h.world.entities().front();
    const auto& anim = h.world.registry().get<ecs::Animator>(e);

    h.tick(0.5f);
    REQUIRE(anim.frame == 12);

    REQUIRE(h.exec("sinbad:play_anim('RunBase'); now = sinbad.anim; f = sinbad.frame"));
    REQUIRE(lua->get_global_string("now") == std::string("RunBase"));
    REQUIRE(lua->get_global_int("f") == 0);

    SECTION("unknown clip raises and keeps the current one") {
        auto r = h.exec("sinbad:play_anim('Moonwalk')");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("play_anim: model Sinbad.pfobj has no animation 'Moonwalk'") != std::string::npos);
        REQUIRE(anim.clip == "RunBase");
    }

    SECTION("AnimEntity shares the Entity members") {
        REQUIRE(h.exec("sinbad.pos = {0.0, 6.0, -50.0}; y = sinbad.pos[2]"));
        REQUIRE(lua->get_global_double("y") == 6.0);
    }
}

TEST_CASE("AnimEntity validates the starting clip", "[scripting][api][anim]") {
    ScriptHarness h;

    SECTION("unknown clip") {
        auto r = h.load(std::string(kLoadMap) +
            "pf.AnimEntity('assets/models/sinbad', 'Sinbad.pfobj', 'S', 'Fly')");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("AnimEntity: model Sinbad.pfobj has no animation 'Fly'") != std::string::npos);
    }

    SECTION("static model") {
        auto r = h.load(std::string(kLoadMap) +
            "pf.AnimEntity('assets/models/oak_tree', 'oak_tree.pfobj', 'T', 'Idle')");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("no animation sets") != std::string::npos);
    }

    REQUIRE(h.world.entity_count() == 0);
}

TEST_CASE("Handles go stale when their entity is gone", "[scripting][api][entity]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak));

    SECTION("after new_game") {
        REQUIRE(h.exec(std::string(kLoadMap) + "alive = oak.alive"));
        REQUIRE(h.engine.lua_state()->get_global_bool("alive") == false);

        auto r = h.exec("local n = oak.name");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("stale entity handle (uid 1)") != std::string::npos);
    }

    SECTION("after destroy") {
        REQUIRE(h.exec("first = oak:destroy(); second = oak:destroy()"));
        REQUIRE(h.engine.lua_state()->get_global_bool("first") == true);
        REQUIRE(h.engine.lua_state()->get_global_bool("second") == false);
        REQUIRE(h.world.entity_count() == 0);
        REQUIRE_FALSE(h.exec("oak:activate()"));
    }
}

TEST_CASE("get_entities lists live entities in creation order", "[scripting][api][entity]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnSinbad + R"(
        oak = pf.Entity('assets/models/oak_tree', 'oak_tree.pfobj', 'Oak')
        local list = pf.get_entities()
        count = #list
        first = list[1].name
        first_anim = list[1].anim
        second = list[2].name
        same = list[2] == oak
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_int("count") == 2);
    REQUIRE(lua->get_global_string("first") == std::string("Sinbad"));
    REQUIRE(lua->get_global_string("first_anim") == std::string("Dance"));
    REQUIRE(lua->get_global_string("second") == std::string("Oak"));
    REQUIRE(lua->get_global_bool("same") == true);
}

// =============================================================================
// Cameras
// =============================================================================

TEST_CASE("activate_camera switches the active slot", "[scripting][api][camera]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        pf.activate_camera(1, pf.CAM_MODE_FPS)
        idx, mode = pf.get_active_camera()
    )"));

    REQUIRE(h.world.cameras().active_index() == 1);
    REQUIRE(h.world.cameras().active_mode() == scene::CameraMode::FPS);
    REQUIRE(h.engine.lua_state()->get_global_int("idx") == 1);
    REQUIRE(h.engine.lua_state()->get_global_int("mode") == 0);

    auto r = h.exec("pf.activate_camera(2, pf.CAM_MODE_RTS)");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("activate_camera: camera index 2 out of range") != std::string::npos);
    REQUIRE(h.world.cameras().active_index() == 1);

    REQUIRE_FALSE(h.exec("pf.activate_camera(0, 9)"));
}

// =============================================================================
// Events
// =============================================================================

TEST_CASE("Global handlers receive user data and payload after a flush", "[scripting][api][events]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        calls = 0
        function on_custom(user, event)
            calls = calls + 1
            got_user = user
            got_event = event
        end
        pf.register_event_handler(pf.EVENT_CUSTOM, on_custom, 'UserArg')
        pf.global_event(pf.EVENT_CUSTOM, 'EventArg')
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_int("calls") == 0);
    REQUIRE(h.world.events().pending() == 1);

    h.tick();
    REQUIRE(lua->get_global_int("calls") == 1);
    REQUIRE(lua->get_global_string("got_user") == std::string("UserArg"));
    REQUIRE(lua->get_global_string("got_event") == std::string("EventArg"));

    SECTION("unregister stops delivery") {
        REQUIRE(h.exec("removed = pf.unregister_event_handler(pf.EVENT_CUSTOM, on_custom)"));
        REQUIRE(lua->get_global_bool("removed") == true);
        REQUIRE(h.exec("pf.global_event(pf.EVENT_CUSTOM, 'again')"));
        h.tick();
        REQUIRE(lua->get_global_int("calls") == 1);
    }

    SECTION("unregister of an unknown function is a no-op") {
        REQUIRE(h.exec("removed = pf.unregister_event_handler(pf.EVENT_CUSTOM, function() end)"));
        REQUIRE(lua->get_global_bool("removed") == false);
    }
}

TEST_CASE("Key events arrive as scancode tables", "[scripting][api][events]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        function on_key(user, event)
            sc = event.scancode
            rep = event['repeat']
        end
        pf.register_event_handler(pf.EVENT_SDL_KEYDOWN, on_key, nil)
    )"));

    h.world.events().notify_global(events::kEventKeyDown,
                                   events::KeyEvent{events::scancode::kC, 67, false});
    h.tick();

    REQUIRE(h.engine.lua_state()->get_global_int("sc") == events::scancode::kC);
    REQUIRE(h.engine.lua_state()->get_global_bool("rep") == false);
}

TEST_CASE("Entity handlers run synchronously on notify", "[scripting][api][events]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak + R"(
        hits = 0
        local function on_poke(user, event)
            hits = hits + event
            who = user
        end
        oak:register(pf.EVENT_CUSTOM + 5, on_poke, 'me')
        delivered = oak:notify(pf.EVENT_CUSTOM + 5, 2)
        after_notify = hits
        nobody = oak:notify(pf.EVENT_CUSTOM + 6, 1)
        handler = on_poke
    )"));

    auto* lua = h.engine.lua_state();
    REQUIRE(lua->get_global_int("after_notify") == 2);
    REQUIRE(lua->get_global_int("delivered") == 1);
    REQUIRE(lua->get_global_int("nobody") == 0);
    REQUIRE(lua->get_global_string("who") == std::string("me"));

    SECTION("global events do not reach entity handlers") {
        REQUIRE(h.exec("pf.global_event(pf.EVENT_CUSTOM + 5, 10)"));
        h.tick();
        REQUIRE(lua->get_global_int("hits") == 2);
    }

    SECTION("unregister removes the handler") {
        REQUIRE(h.exec("ok = oak:unregister(pf.EVENT_CUSTOM + 5, handler); n = oak:notify(pf.EVENT_CUSTOM + 5, 1)"));
        REQUIRE(lua->get_global_bool("ok") == true);
        REQUIRE(lua->get_global_int("n") == 0);
    }

    SECTION("destroying the entity drops its handlers") {
        REQUIRE(h.exec("oak:destroy()"));
        REQUIRE(h.world.events().handler_count() == 0);
    }
}

TEST_CASE("A failing handler is logged and does not stop others", "[scripting][api][events]") {
    ScriptHarness h;
    REQUIRE(h.load(R"(
        second = false
        pf.register_event_handler(pf.EVENT_CUSTOM, function() error('bad handler') end, nil)
        pf.register_event_handler(pf.EVENT_CUSTOM, function() second = true end, nil)
        pf.global_event(pf.EVENT_CUSTOM)
    )"));

    REQUIRE_NOTHROW(h.tick());
    REQUIRE(h.engine.lua_state()->get_global_bool("second") == true);
}

TEST_CASE("Nested callbacks share the outer handler's budget", "[scripting][api][events]") {
    scene::World world;
    scripting::SceneScriptEngine engine(world, test_helpers::source_dir());

    auto cfg = scripting::SandboxConfig::default_for_scenes();
    cfg.maxInstructionsPerCall = 20;    // hook ticks of 1000 VM instructions
    cfg.maxExecutionTimeSec = 0.0;
    REQUIRE(engine.init(cfg));

    scripting::ScriptSource src;
    src.name = "budget.lua";
    src.content = kSpawnOak + R"(
        local function spin() for i = 1, 15000 do end end

        oak:register(pf.EVENT_CUSTOM + 1, function() inner = true end, nil)

        pf.register_event_handler(pf.EVENT_CUSTOM, function()
            spin()
            oak:notify(pf.EVENT_CUSTOM + 1, nil)
            spin()
            outer_done = true
        end, nil)
        pf.register_event_handler(pf.EVENT_CUSTOM + 2, function()
            spin()
            sibling_done = true
        end, nil)

        pf.global_event(pf.EVENT_CUSTOM)
        pf.global_event(pf.EVENT_CUSTOM + 2)
    )";
    REQUIRE(engine.load_script(src));

    world.update(1.0f / 60.0f);

    auto* lua = engine.lua_state();
    REQUIRE(lua->get_global_bool("inner") == true);
    // 30k instructions in one top-level callback exceed the 20k budget.
    REQUIRE_FALSE(lua->get_global_bool("outer_done").has_value());
    // The next top-level callback starts with a fresh budget.
    REQUIRE(lua->get_global_bool("sibling_done") == true);
}

TEST_CASE("Unloading the script drops its handlers and queued events", "[scripting][api][events]") {
    ScriptHarness h;
    REQUIRE(h.load(kSpawnOak + R"(
        pf.register_event_handler(pf.EVENT_CUSTOM, function() end, nil)
        oak:register(pf.EVENT_CUSTOM, function() end, nil)
        pf.global_event(pf.EVENT_CUSTOM)
    )"));
    REQUIRE(h.world.events().handler_count() == 2);

    int keys = 0;
    h.world.events().subscribe(events::kEventKeyDown, [&](const events::EventArg&) { ++keys; });
    h.world.events().notify_global(events::kEventKeyDown,
                                   events::KeyEvent{events::scancode::kV, 86, false});

    h.engine.unload();

    REQUIRE_FALSE(h.engine.has_scripts());
    REQUIRE(h.world.events().handler_count() == 1);
    // Key input queued by the host survives; the script's custom event does not.
    REQUIRE(h.world.events().pending() == 1);
    REQUIRE(h.world.events().flush() == 1);
    REQUIRE(keys == 1);
    // Entities belong to the world, not the script.
    REQUIRE(h.world.entity_count() == 1);
}
