/**
 * @file test_pfobj_io.cpp
 * @brief Unit tests for PFOBJ header and animation-set parsing.
 */

#include <catch2/catch_test_macros.hpp>

#include "glacier/assets/pfobj_io.hpp"

#include "../../helpers/test_utils.hpp"

using namespace glacier::assets;

namespace {

std::string header(int joints, int numAs, const std::string& frameCounts) {
    return "version        1.0\n"
           "num_verts      12\n"
           "num_joints     " + std::to_string(joints) + "\n"
           "num_materials  1\n"
           "num_as         " + std::to_string(numAs) + "\n"
           "frame_counts   " + frameCounts + "\n"
           "has_collision  1\n";
}

} // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("parse_pfobj reads a static model", "[assets][pfobj]") {
    ModelData model;
    std::string err;
    REQUIRE(parse_pfobj(header(0, 0, "") + "v 0 0 0\n", &model, &err));

    REQUIRE(model.numVerts == 12);
    REQUIRE(model.numMaterials == 1);
    REQUIRE(model.hasCollision);
    REQUIRE_FALSE(model.animated());
    REQUIRE(model.find_clip("Idle") == -1);
}

TEST_CASE("parse_pfobj reads animation sets in order", "[assets][pfobj]") {
    ModelData model;
    std::string err;
    const std::string text = header(3, 2, "10 20") +
        "v 0 0 0\n"
        "as Walk 10\n"
        "j 0 root\n"
        "as Run 20\n";

    REQUIRE(parse_pfobj(text, &model, &err));
    REQUIRE(model.animated());
    REQUIRE(model.clips.size() == 2);
    REQUIRE(model.clips[0].name == "Walk");
    REQUIRE(model.clips[1].frameCount == 20);
    REQUIRE(model.find_clip("Run") == 1);
}

TEST_CASE("parse_pfobj rejects inconsistent animation data", "[assets][pfobj]") {
    ModelData model;
    std::string err;

    SECTION("frame_counts length differs from num_as") {
        REQUIRE_FALSE(parse_pfobj(header(3, 2, "10"), &model, &err));
        REQUIRE(err.find("frame_counts") != std::string::npos);
    }

    SECTION("animation without joints") {
        REQUIRE_FALSE(parse_pfobj(header(0, 1, "5") + "as Wave 5\n", &model, &err));
        REQUIRE(err.find("without joints") != std::string::npos);
    }

    SECTION("body frame count differs from header") {
        REQUIRE_FALSE(parse_pfobj(header(2, 1, "5") + "as Wave 6\n", &model, &err));
        REQUIRE(err.find("does not match") != std::string::npos);
    }

    SECTION("missing animation set") {
        REQUIRE_FALSE(parse_pfobj(header(2, 2, "5 6") + "as Wave 5\n", &model, &err));
        REQUIRE(err.find("found 1") != std::string::npos);
    }

    SECTION("extra animation set") {
        REQUIRE_FALSE(parse_pfobj(header(2, 1, "5") + "as Wave 5\nas Nod 5\n", &model, &err));
        REQUIRE(err.find("more animation sets") != std::string::npos);
    }

    SECTION("duplicate names") {
        REQUIRE_FALSE(parse_pfobj(header(2, 2, "5 5") + "as Wave 5\nas Wave 5\n", &model, &err));
        REQUIRE(err.find("duplicate") != std::string::npos);
    }

    SECTION("negative counts") {
        const std::string verts =
            "version 1.0\nnum_verts -5\nnum_joints 0\nnum_materials 0\nnum_as 0\nframe_counts\nhas_collision 0\n";
        REQUIRE_FALSE(parse_pfobj(verts, &model, &err));
        REQUIRE(err.find("num_verts") != std::string::npos);

        const std::string materials =
            "version 1.0\nnum_verts 1\nnum_joints 0\nnum_materials -1\nnum_as 0\nframe_counts\nhas_collision 0\n";
        REQUIRE_FALSE(parse_pfobj(materials, &model, &err));
        REQUIRE(err.find("num_materials") != std::string::npos);

        REQUIRE_FALSE(parse_pfobj(header(2, 1, "-5"), &model, &err));
        REQUIRE(err.find("invalid frame count") != std::string::npos);

        REQUIRE_FALSE(parse_pfobj(header(2, 1, "5") + "as Wave -5\n", &model, &err));
        REQUIRE(err.find("malformed") != std::string::npos);
    }

    SECTION("header out of order") {
        const std::string text =
            "version 1.0\nnum_joints 0\nnum_verts 1\nnum_materials 0\nnum_as 0\nframe_counts\nhas_collision 0\n";
        REQUIRE_FALSE(parse_pfobj(text, &model, &err));
        REQUIRE(err.find("num_verts") != std::string::npos);
    }
}

// =============================================================================
// Bundled models
// =============================================================================

TEST_CASE("Bundled demo models load", "[assets][pfobj]") {
    const auto root = test_helpers::source_dir() / "assets/models";
    ModelData model;
    std::string err;

    SECTION("Sinbad carries the demo clips") {
        REQUIRE(read_pfobj(root / "sinbad/Sinbad.pfobj", &model, &err));
        REQUIRE(model.file == "Sinbad.pfobj");
        REQUIRE(model.find_clip("Dance") >= 0);
        REQUIRE(model.find_clip("RunBase") >= 0);
    }

    SECTION("oak trees are static") {
        REQUIRE(read_pfobj(root / "oak_tree/oak_tree.pfobj", &model, &err));
        REQUIRE_FALSE(model.animated());
        REQUIRE(read_pfobj(root / "oak_tree/oak_leafless.pfobj", &model, &err));
        REQUIRE_FALSE(model.animated());
    }
}
