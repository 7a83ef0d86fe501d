/*
 * OverlayState.hpp
 *
 * Placement and color adjustment of the design over the photo. The record is
 * only ever changed through OverlayState::update / reset, which normalize
 * every field back into its domain.
 */
#ifndef OVERLAY_STATE_HPP
#define OVERLAY_STATE_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

enum class BlendMode { Multiply, Screen, Overlay, Darken, Normal };

const char* blendModeName(BlendMode mode);
// Accepts the lower-case names returned by blendModeName.
bool parseBlendMode(const std::string& name, BlendMode& mode);

struct OverlayConfig {
    float scale = 1.0f;
    float rotation = 0.0f;  // degrees, positive = clockwise
    float opacity = 0.8f;
    float offsetX = 0.0f;  // background pixels from the photo center
    float offsetY = 0.0f;
    BlendMode blendMode = BlendMode::Multiply;
    float hue = 0.0f;           // degrees in [0, 360)
    float saturation = 100.0f;  // percent
    float brightness = 100.0f;  // percent
};

bool operator==(const OverlayConfig& a, const OverlayConfig& b);
bool operator!=(const OverlayConfig& a, const OverlayConfig& b);

// Field masks for partial updates and resets
enum OverlayField : unsigned {
    kFieldScale = 1u << 0,
    kFieldRotation = 1u << 1,
    kFieldOpacity = 1u << 2,
    kFieldOffsetX = 1u << 3,
    kFieldOffsetY = 1u << 4,
    kFieldBlendMode = 1u << 5,
    kFieldHue = 1u << 6,
    kFieldSaturation = 1u << 7,
    kFieldBrightness = 1u << 8,

    kFieldOffsets = kFieldOffsetX | kFieldOffsetY,
    kFieldTransform = kFieldScale | kFieldRotation | kFieldOffsets,
    kFieldColor = kFieldHue | kFieldSaturation | kFieldBrightness,
    kFieldAll = 0x1FFu
};

//! Partial update: only the fields set through the builder are merged.
struct OverlayPatch {
    OverlayPatch& scale(float v);
    OverlayPatch& rotation(float v);
    OverlayPatch& opacity(float v);
    OverlayPatch& offsetX(float v);
    OverlayPatch& offsetY(float v);
    OverlayPatch& offset(float x, float y);
    OverlayPatch& blendMode(BlendMode v);
    OverlayPatch& hue(float v);
    OverlayPatch& saturation(float v);
    OverlayPatch& brightness(float v);

    bool has(unsigned field) const { return (fields & field) == field; }
    bool empty() const { return fields == 0; }

    unsigned fields = 0;
    OverlayConfig values;
};

//! Domain limits. Scale bounds are configurable, the rest are fixed.
struct StateLimits {
    float scaleMin = 0.05f;
    float scaleMax = 5.0f;

    static constexpr float kRotationMin = -180.0f;
    static constexpr float kRotationMax = 180.0f;
    static constexpr float kOpacityMin = 0.1f;
    static constexpr float kOpacityMax = 1.0f;
    static constexpr float kPercentMin = 0.0f;
    static constexpr float kPercentMax = 200.0f;
};

// Pure merge of `patch` over `base`. Numeric fields are clamped (hue wraps
// into [0, 360)); non-finite patch values leave the field untouched.
OverlayConfig applyPatch(const OverlayConfig& base, const OverlayPatch& patch,
                         const StateLimits& limits);

// Brings every field of `config` into its domain.
OverlayConfig normalize(const OverlayConfig& config, const StateLimits& limits);

class OverlayState {
   public:
    typedef std::function<void(const OverlayConfig&)> Listener;

    explicit OverlayState(const StateLimits& limits = StateLimits(),
                          const OverlayConfig& defaults = OverlayConfig());

    const OverlayConfig& current() const { return current_; }
    const OverlayConfig& defaults() const { return defaults_; }
    const StateLimits& limits() const { return limits_; }

    //! update
    /*! Merges the patch, notifies listeners once and returns the new value.
        An empty patch still notifies. */
    OverlayConfig update(const OverlayPatch& patch);

    //! reset
    /*! Restores the masked fields to their defaults. */
    OverlayConfig reset(unsigned fields = kFieldAll);

    // Returns an id for removeListener.
    int addListener(Listener listener);
    void removeListener(int id);

   private:
    void notify();

    StateLimits limits_;
    OverlayConfig defaults_;
    OverlayConfig current_;
    std::vector<std::pair<int, Listener>> listeners_;
    int nextListenerId_ = 1;
};

#endif
