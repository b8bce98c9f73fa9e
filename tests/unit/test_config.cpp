/**
 * @file test_config.cpp
 * @brief Unit tests for RendererConfig and command line parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lumen/config.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lumen;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

// Owns argv storage for parseCommandLine
struct Args {
    explicit Args(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "lumen");
        for (auto& s : storage) pointers.push_back(s.data());
    }
    int argc() { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("Defaults are valid", "[config]") {
    RendererConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.target == TargetKind::Mono);
    REQUIRE(config.framesInFlight == 2);
}

TEST_CASE("apply overlays JSON keys", "[config]") {
    RendererConfig config;
    config.apply(json::parse(R"({
        "mode": "vr",
        "framesInFlight": 3,
        "fovY": 90.0,
        "ipd": 0.07,
        "clearColor": [0.0, 0.5, 1.0, 1.0],
        "unknownKey": 42
    })"));

    REQUIRE(config.target == TargetKind::Stereo);
    REQUIRE(config.framesInFlight == 3);
    REQUIRE_THAT(config.fovY, WithinAbs(90.0, 1e-6));
    REQUIRE_THAT(config.interpupillaryDistance, WithinAbs(0.07, 1e-6));
    REQUIRE_THAT(config.clearColor.g, WithinAbs(0.5, 1e-6));
    REQUIRE(config.width == 1280);
    REQUIRE_NOTHROW(config.validate());

    config.apply(json::parse(R"({"mode": "flat"})"));
    REQUIRE(config.target == TargetKind::Mono);
}

TEST_CASE("apply rejects malformed values", "[config]") {
    RendererConfig config;
    REQUIRE_THROWS_AS(config.apply(json::parse(R"({"mode": "anaglyph"})")), std::invalid_argument);
    REQUIRE_THROWS_AS(config.apply(json::parse(R"({"width": "wide"})")), std::invalid_argument);
    REQUIRE_THROWS_AS(config.apply(json::parse(R"({"clearColor": [1, 0]})")), std::invalid_argument);
    REQUIRE_THROWS_AS(config.apply(json::parse("[1, 2]")), std::invalid_argument);
}

TEST_CASE("validate checks ranges", "[config]") {
    RendererConfig config;

    SECTION("frames in flight") {
        config.framesInFlight = 1;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.framesInFlight = 4;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("clip planes") {
        config.nearPlane = 10.0f;
        config.farPlane = 1.0f;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("field of view") {
        config.fovY = 180.0f;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("sizes") {
        config.eyeWidth = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
}

TEST_CASE("loadFile reports unreadable files", "[config]") {
    REQUIRE_THROWS_AS(RendererConfig::loadFile("/nonexistent/lumen-config.json"), std::runtime_error);
}

// =============================================================================
// Command line
// =============================================================================

TEST_CASE("parseCommandLine", "[config][cli]") {
    RendererConfig config;

    SECTION("no arguments keeps defaults") {
        Args args({});
        REQUIRE(parseCommandLine(args.argc(), args.argv(), config) == -1);
        REQUIRE(config.target == TargetKind::Mono);
    }

    SECTION("--vr selects the stereo target") {
        Args args({"--vr", "--headless", "--frames", "10"});
        REQUIRE(parseCommandLine(args.argc(), args.argv(), config) == -1);
        REQUIRE(config.target == TargetKind::Stereo);
        REQUIRE(config.headless);
        REQUIRE(config.maxFrames == 10);
    }

    SECTION("--vr with --flat falls back to mono") {
        Args args({"--vr", "--flat"});
        REQUIRE(parseCommandLine(args.argc(), args.argv(), config) == -1);
        REQUIRE(config.target == TargetKind::Mono);
    }

    SECTION("frames in flight outside 2..3 is an error") {
        Args args({"--frames-in-flight", "5"});
        REQUIRE(parseCommandLine(args.argc(), args.argv(), config) > 0);
    }

    SECTION("size overrides") {
        Args args({"--width", "800", "--height", "600", "--frames-in-flight", "3"});
        REQUIRE(parseCommandLine(args.argc(), args.argv(), config) == -1);
        REQUIRE(config.width == 800);
        REQUIRE(config.height == 600);
        REQUIRE(config.framesInFlight == 3);
    }
}
