#include "GridLod.h"

#include <cmath>

#include <glm/matrix.hpp>

#include "math/Camera.h"

namespace render {

float decadeScale(int level) {
    return static_cast<float>(std::pow(10.0, static_cast<double>(level)));
}

GridLod deriveGridLod(const math::Camera& camera, const GridLodConfig& cfg) {
    const double spacing = cfg.referenceSpacing > 0.0f ? cfg.referenceSpacing : GridLodConfig{}.referenceSpacing;
    // Camera keeps radius >= kRadiusMin, so the log argument is always positive.
    const double continuousLog = std::log10(static_cast<double>(camera.radius) / spacing);
    const double level = std::floor(continuousLog);

    GridLod lod{};
    lod.level = static_cast<int>(level);
    lod.scale = decadeScale(lod.level);
    lod.fade = static_cast<float>(continuousLog - level);
    if (lod.fade >= 1.0f) {
        lod.fade = std::nextafter(1.0f, 0.0f);
    } else if (lod.fade < 0.0f) {
        lod.fade = 0.0f;
    }
    lod.fadeNear = camera.radius * cfg.fadeNearScale;
    lod.fadeFar = camera.radius * cfg.fadeFarScale;
    return lod;
}

GridLineStyle gridLineStyle(int tier, float fade) {
    const float keep = 1.0f - fade;
    switch (tier) {
    case 0: return GridLineStyle{kMinorLineAlpha * keep, 0.0f};
    case 1: return GridLineStyle{kMinorLineAlpha + (kMajorLineAlpha - kMinorLineAlpha) * keep, keep};
    case 2: return GridLineStyle{kMajorLineAlpha, 1.0f};
    default: return GridLineStyle{};
    }
}

CameraUniform makeCameraUniform(const math::Camera& camera) {
    CameraUniform u{};
    u.viewProj = camera.viewProj();
    return u;
}

GridUniform makeGridUniform(const math::Camera& camera, const GridLod& lod) {
    GridUniform u{};
    u.viewProj = camera.viewProj();
    u.invViewProj = glm::inverse(u.viewProj);
    u.eyePos = camera.eyePosition();
    u.pad0 = 0.0f;
    u.fadeNear = lod.fadeNear;
    u.fadeFar = lod.fadeFar;
    u.lodScale = lod.scale;
    u.lodFade = lod.fade;
    return u;
}

} // namespace render
