#include "state/OverlayState.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Multiply:
            return "multiply";
        case BlendMode::Screen:
            return "screen";
        case BlendMode::Overlay:
            return "overlay";
        case BlendMode::Darken:
            return "darken";
        case BlendMode::Normal:
            return "normal";
    }
    return "normal";
}

bool parseBlendMode(const std::string& name, BlendMode& mode) {
    static const BlendMode all[] = {BlendMode::Multiply, BlendMode::Screen,
                                    BlendMode::Overlay, BlendMode::Darken,
                                    BlendMode::Normal};
    std::string lower = name;
    for (auto& c : lower) c = (char)tolower((unsigned char)c);
    for (BlendMode m : all) {
        if (lower == blendModeName(m)) {
            mode = m;
            return true;
        }
    }
    return false;
}

bool operator==(const OverlayConfig& a, const OverlayConfig& b) {
    return a.scale == b.scale && a.rotation == b.rotation &&
           a.opacity == b.opacity && a.offsetX == b.offsetX &&
           a.offsetY == b.offsetY && a.blendMode == b.blendMode &&
           a.hue == b.hue && a.saturation == b.saturation &&
           a.brightness == b.brightness;
}

bool operator!=(const OverlayConfig& a, const OverlayConfig& b) {
    return !(a == b);
}

OverlayPatch& OverlayPatch::scale(float v) {
    fields |= kFieldScale;
    values.scale = v;
    return *this;
}

OverlayPatch& OverlayPatch::rotation(float v) {
    fields |= kFieldRotation;
    values.rotation = v;
    return *this;
}

OverlayPatch& OverlayPatch::opacity(float v) {
    fields |= kFieldOpacity;
    values.opacity = v;
    return *this;
}

OverlayPatch& OverlayPatch::offsetX(float v) {
    fields |= kFieldOffsetX;
    values.offsetX = v;
    return *this;
}

OverlayPatch& OverlayPatch::offsetY(float v) {
    fields |= kFieldOffsetY;
    values.offsetY = v;
    return *this;
}

OverlayPatch& OverlayPatch::offset(float x, float y) {
    return offsetX(x).offsetY(y);
}

OverlayPatch& OverlayPatch::blendMode(BlendMode v) {
    fields |= kFieldBlendMode;
    values.blendMode = v;
    return *this;
}

OverlayPatch& OverlayPatch::hue(float v) {
    fields |= kFieldHue;
    values.hue = v;
    return *this;
}

OverlayPatch& OverlayPatch::saturation(float v) {
    fields |= kFieldSaturation;
    values.saturation = v;
    return *this;
}

OverlayPatch& OverlayPatch::brightness(float v) {
    fields |= kFieldBrightness;
    values.brightness = v;
    return *this;
}

static float clampf(float v, float lo, float hi) {
    return std::min(hi, std::max(lo, v));
}

static float wrapHue(float degrees) {
    float h = std::fmod(degrees, 360.0f);
    if (h < 0.0f) h += 360.0f;
    // fmod of a tiny negative value can round back up to exactly 360
    if (h >= 360.0f) h = 0.0f;
    return h;
}

// Merges one numeric field: non-finite input keeps the previous value.
static void mergeField(float& dst, float src, bool present) {
    if (present && std::isfinite(src)) dst = src;
}

OverlayConfig normalize(const OverlayConfig& config, const StateLimits& limits) {
    OverlayConfig out = config;
    out.scale = clampf(out.scale, limits.scaleMin, limits.scaleMax);
    out.rotation = clampf(out.rotation, StateLimits::kRotationMin,
                          StateLimits::kRotationMax);
    out.opacity = clampf(out.opacity, StateLimits::kOpacityMin,
                         StateLimits::kOpacityMax);
    out.hue = wrapHue(out.hue);
    out.saturation = clampf(out.saturation, StateLimits::kPercentMin,
                            StateLimits::kPercentMax);
    out.brightness = clampf(out.brightness, StateLimits::kPercentMin,
                            StateLimits::kPercentMax);
    if (!std::isfinite(out.offsetX)) out.offsetX = 0.0f;
    if (!std::isfinite(out.offsetY)) out.offsetY = 0.0f;
    return out;
}

OverlayConfig applyPatch(const OverlayConfig& base, const OverlayPatch& patch,
                         const StateLimits& limits) {
    OverlayConfig merged = base;
    const OverlayConfig& v = patch.values;
    mergeField(merged.scale, v.scale, patch.has(kFieldScale));
    mergeField(merged.rotation, v.rotation, patch.has(kFieldRotation));
    mergeField(merged.opacity, v.opacity, patch.has(kFieldOpacity));
    mergeField(merged.offsetX, v.offsetX, patch.has(kFieldOffsetX));
    mergeField(merged.offsetY, v.offsetY, patch.has(kFieldOffsetY));
    mergeField(merged.hue, v.hue, patch.has(kFieldHue));
    mergeField(merged.saturation, v.saturation, patch.has(kFieldSaturation));
    mergeField(merged.brightness, v.brightness, patch.has(kFieldBrightness));
    if (patch.has(kFieldBlendMode)) merged.blendMode = v.blendMode;
    return normalize(merged, limits);
}

OverlayState::OverlayState(const StateLimits& limits,
                           const OverlayConfig& defaults)
    : limits_(limits),
      defaults_(normalize(defaults, limits)),
      current_(defaults_) {}

OverlayConfig OverlayState::update(const OverlayPatch& patch) {
    current_ = applyPatch(current_, patch, limits_);
    notify();
    return current_;
}

OverlayConfig OverlayState::reset(unsigned fields) {
    OverlayPatch patch;
    patch.fields = fields & kFieldAll;
    patch.values = defaults_;
    return update(patch);
}

int OverlayState::addListener(Listener listener) {
    int id = nextListenerId_++;
    listeners_.push_back(std::make_pair(id, std::move(listener)));
    return id;
}

void OverlayState::removeListener(int id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [id](const std::pair<int, Listener>& entry) {
                           return entry.first == id;
                       }),
        listeners_.end());
}

void OverlayState::notify() {
    // Copy so a listener may unregister itself
    auto listeners = listeners_;
    for (auto& entry : listeners) entry.second(current_);
}
