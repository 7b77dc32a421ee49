#pragma once

#include "render/Uniforms.h"

namespace math { struct Camera; }

// GridLod — decade-based density for the procedural ground grid.
//
// The grid draws three tiers of lines, every `scale`, `10 * scale` and `100 * scale`
// world units. As `fade` runs through a decade the fine tier fades out and the middle
// tier turns from minor into major style, so when the decade rolls over every line
// keeps the weight it had. grid.frag mirrors gridLineStyle().
namespace render {

struct GridLodConfig {
    float referenceSpacing = 10.0f; // radius at which the 1-unit grid is the base level
    float fadeNearScale = 2.5f;     // lines start fading at radius * fadeNearScale
    float fadeFarScale = 25.0f;     // and are gone at radius * fadeFarScale
};

struct GridLod {
    int level = 0;        // floor(log10(radius / referenceSpacing))
    float scale = 1.0f;   // 10^level
    float fade = 0.0f;    // position within the decade, [0, 1)
    float fadeNear = 0.0f;
    float fadeFar = 0.0f;
};

GridLod deriveGridLod(const math::Camera& camera, const GridLodConfig& cfg = {});

inline constexpr int kGridTiers = 3;
inline constexpr float kMinorLineAlpha = 0.5f;
inline constexpr float kMajorLineAlpha = 0.8f;

struct GridLineStyle {
    float alpha = 0.0f;    // peak opacity of a line on this tier
    float majorMix = 0.0f; // 0 = minor colour, 1 = major colour
};

// Style of tier 0..2 at the given fade. Out-of-range tiers draw nothing.
GridLineStyle gridLineStyle(int tier, float fade);

// Exact power of ten for an integer exponent.
float decadeScale(int level);

CameraUniform makeCameraUniform(const math::Camera& camera);
GridUniform makeGridUniform(const math::Camera& camera, const GridLod& lod);

} // namespace render
