/*
 * EngineConfig.hpp
 *
 * Tunables of the compositing engine. Loaded from an OpenCV FileStorage
 * document (YAML, XML or JSON). See config/inkvision.yml for every key.
 */
#ifndef ENGINE_CONFIG_HPP
#define ENGINE_CONFIG_HPP

#include <string>

#include "state/OverlayState.hpp"

struct EngineConfig {
    StateLimits limits;       // scale_min / scale_max
    float scaleStep = 0.1f;   // zoom buttons and one wheel notch
    float rotateSensitivity = 0.35f;  // degrees per display pixel
    float baselineWidthFraction = 0.3f;
    bool colorAdjust = true;
    OverlayConfig defaults;
    std::string exportPrefix = "inkvision";
};

// Reads `path` over the built-in values. Keys that are missing keep their
// current value; out-of-range values are reported on std::cerr and ignored.
// Returns false if the file cannot be opened or parsed.
bool loadEngineConfig(const std::string& path, EngineConfig& config);

#endif
