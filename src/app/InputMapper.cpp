#include "InputMapper.h"
#include "InputState.h"
#include "math/Camera.h"

#include <algorithm>

namespace app {

namespace {

bool applyOrbit(const InputState& input, math::Camera& camera, const InputMapperConfig& cfg) {
    if (!input.rightHeld || !input.anyDelta()) {
        return false;
    }
    // Horizontal drag is negated so the scene follows the pointer.
    const float deltaAz = -input.delta.x * cfg.orbitSensitivity;
    const float deltaEl = input.delta.y * cfg.orbitSensitivity;
    camera.orbit(deltaAz, deltaEl);
    return true;
}

bool applyPan(const InputState& input, math::Camera& camera, const InputMapperConfig& cfg) {
    const bool panButton = input.middleHeld || (input.leftHeld && input.shiftHeld);
    if (!panButton || !input.anyDelta()) {
        return false;
    }
    const float scale = camera.radius * cfg.panSensitivity;
    camera.pan(-input.delta.x * scale, input.delta.y * scale);
    return true;
}

bool applyZoom(const InputState& input, math::Camera& camera, const InputMapperConfig& cfg) {
    if (input.scroll == 0.0f) {
        return false;
    }
    // Positive scroll zooms in (shrinks radius).
    const float factor = std::max(1.0f - input.scroll * cfg.zoomFactor, cfg.minZoomStep);
    camera.zoom(factor);
    return true;
}

} // namespace

CameraDelta applyInput(const InputState& input, math::Camera& camera, const InputMapperConfig& cfg) {
    CameraDelta delta{};
    delta.orbited = applyOrbit(input, camera, cfg);
    delta.panned = applyPan(input, camera, cfg);
    delta.zoomed = applyZoom(input, camera, cfg);
    return delta;
}

} // namespace app
