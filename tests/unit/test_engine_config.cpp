/**
 * @file test_engine_config.cpp
 * @brief Unit tests for loading the engine configuration
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "config/EngineConfig.hpp"

using Catch::Matchers::WithinAbs;

#ifndef INKVISION_CONFIG_DIR
#define INKVISION_CONFIG_DIR "config"
#endif

// Writes `text` to a scratch file removed when the object goes away
struct ScratchFile {
    explicit ScratchFile(const std::string& text)
        : path("inkvision_test_config.yml") {
        std::ofstream out(path);
        out << text;
    }
    ~ScratchFile() { std::remove(path.c_str()); }
    std::string path;
};

TEST_CASE("Shipped configuration matches the built-in values", "[config]") {
    EngineConfig builtIn;
    EngineConfig loaded;
    REQUIRE(loadEngineConfig(std::string(INKVISION_CONFIG_DIR) + "/inkvision.yml",
                             loaded));

    CHECK_THAT(loaded.limits.scaleMin, WithinAbs(builtIn.limits.scaleMin, 1e-6));
    CHECK_THAT(loaded.limits.scaleMax, WithinAbs(builtIn.limits.scaleMax, 1e-6));
    CHECK_THAT(loaded.scaleStep, WithinAbs(builtIn.scaleStep, 1e-6));
    CHECK_THAT(loaded.rotateSensitivity,
               WithinAbs(builtIn.rotateSensitivity, 1e-6));
    CHECK_THAT(loaded.baselineWidthFraction,
               WithinAbs(builtIn.baselineWidthFraction, 1e-6));
    CHECK(loaded.colorAdjust == builtIn.colorAdjust);
    CHECK(loaded.exportPrefix == builtIn.exportPrefix);
    CHECK(loaded.defaults.blendMode == BlendMode::Multiply);
    CHECK_THAT(loaded.defaults.opacity, WithinAbs(0.8, 1e-6));
}

TEST_CASE("Configuration overrides and validation", "[config]") {
    ScratchFile file(
        "%YAML:1.0\n"
        "---\n"
        "scale_min: 0.1\n"
        "scale_max: 3.0\n"
        "scale_step: 0.25\n"
        "rotate_sensitivity: -1.0\n"
        "color_adjust: 0\n"
        "export_prefix: \"tattoo\"\n"
        "defaults:\n"
        "   scale: 9.0\n"
        "   blend_mode: \"Screen\"\n"
        "   saturation: 150.0\n");

    EngineConfig config;
    REQUIRE(loadEngineConfig(file.path, config));

    CHECK_THAT(config.limits.scaleMin, WithinAbs(0.1, 1e-6));
    CHECK_THAT(config.limits.scaleMax, WithinAbs(3.0, 1e-6));
    CHECK_THAT(config.scaleStep, WithinAbs(0.25, 1e-6));
    // Non-positive values are rejected
    CHECK_THAT(config.rotateSensitivity, WithinAbs(0.35, 1e-6));
    CHECK_FALSE(config.colorAdjust);
    CHECK(config.exportPrefix == "tattoo");
    // Defaults are normalized against the loaded bounds
    CHECK_THAT(config.defaults.scale, WithinAbs(3.0, 1e-6));
    CHECK(config.defaults.blendMode == BlendMode::Screen);
    CHECK_THAT(config.defaults.saturation, WithinAbs(150.0, 1e-6));
}

TEST_CASE("Inverted scale bounds keep the previous ones", "[config]") {
    ScratchFile file(
        "%YAML:1.0\n"
        "---\n"
        "scale_min: 4.0\n"
        "scale_max: 2.0\n");

    EngineConfig config;
    REQUIRE(loadEngineConfig(file.path, config));
    CHECK_THAT(config.limits.scaleMin, WithinAbs(0.05, 1e-6));
    CHECK_THAT(config.limits.scaleMax, WithinAbs(5.0, 1e-6));
}

TEST_CASE("Missing configuration file", "[config]") {
    EngineConfig config;
    CHECK_FALSE(loadEngineConfig("does/not/exist.yml", config));
    CHECK(config.exportPrefix == "inkvision");
}
