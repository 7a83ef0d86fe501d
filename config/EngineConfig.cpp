#include "config/EngineConfig.hpp"

#include <iostream>
#include <opencv2/core.hpp>

// Reads a positive real if the key exists.
static void readPositive(const cv::FileNode& root, const char* key,
                         float& value) {
    cv::FileNode node = root[key];
    if (node.empty()) return;
    if (!node.isReal() && !node.isInt()) {
        std::cerr << "[Config] '" << key << "' is not a number, ignored\n";
        return;
    }
    double v = (double)node;
    if (v <= 0.0) {
        std::cerr << "[Config] '" << key << "' must be positive, ignored\n";
        return;
    }
    value = (float)v;
}

static void readReal(const cv::FileNode& root, const char* key, float& value) {
    cv::FileNode node = root[key];
    if (node.empty()) return;
    if (!node.isReal() && !node.isInt()) {
        std::cerr << "[Config] '" << key << "' is not a number, ignored\n";
        return;
    }
    value = (float)(double)node;
}

static void readDefaults(const cv::FileNode& node, OverlayConfig& defaults) {
    if (node.empty()) return;
    readPositive(node, "scale", defaults.scale);
    readReal(node, "rotation", defaults.rotation);
    readPositive(node, "opacity", defaults.opacity);
    readReal(node, "offset_x", defaults.offsetX);
    readReal(node, "offset_y", defaults.offsetY);
    readReal(node, "hue", defaults.hue);
    readReal(node, "saturation", defaults.saturation);
    readReal(node, "brightness", defaults.brightness);

    cv::FileNode blend = node["blend_mode"];
    if (!blend.empty()) {
        BlendMode mode;
        if (blend.isString() && parseBlendMode((std::string)blend, mode)) {
            defaults.blendMode = mode;
        } else {
            std::cerr << "[Config] unknown blend_mode, keeping "
                      << blendModeName(defaults.blendMode) << "\n";
        }
    }
}

bool loadEngineConfig(const std::string& path, EngineConfig& config) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            std::cerr << "[Config] Could not open '" << path << "'\n";
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[Config] Could not parse '" << path << "': " << e.what()
                  << "\n";
        return false;
    }

    cv::FileNode root = fs.root();

    float scaleMin = config.limits.scaleMin;
    float scaleMax = config.limits.scaleMax;
    readPositive(root, "scale_min", scaleMin);
    readPositive(root, "scale_max", scaleMax);
    if (scaleMin < scaleMax) {
        config.limits.scaleMin = scaleMin;
        config.limits.scaleMax = scaleMax;
    } else {
        std::cerr << "[Config] scale_min must be below scale_max, keeping "
                  << config.limits.scaleMin << ".." << config.limits.scaleMax
                  << "\n";
    }

    readPositive(root, "scale_step", config.scaleStep);
    readPositive(root, "rotate_sensitivity", config.rotateSensitivity);
    readPositive(root, "baseline_width_fraction",
                 config.baselineWidthFraction);

    cv::FileNode colorAdjust = root["color_adjust"];
    if (!colorAdjust.empty()) config.colorAdjust = (int)colorAdjust != 0;

    cv::FileNode prefix = root["export_prefix"];
    if (!prefix.empty() && prefix.isString()) {
        std::string p = (std::string)prefix;
        if (!p.empty()) config.exportPrefix = p;
    }

    readDefaults(root["defaults"], config.defaults);
    config.defaults = normalize(config.defaults, config.limits);

    std::cout << "[Config] Loaded '" << path << "' (scale "
              << config.limits.scaleMin << ".." << config.limits.scaleMax
              << ", color adjust " << (config.colorAdjust ? "on" : "off")
              << ")\n";
    return true;
}
