#pragma once

namespace math { struct Camera; }

namespace app {

struct InputState;

struct InputMapperConfig {
    float orbitSensitivity = 0.005f; // radians per pixel
    float panSensitivity = 0.002f;   // world units per pixel, scaled by radius
    float zoomFactor = 0.1f;         // radius change per scroll line
    float minZoomStep = 0.1f;        // lower bound on a single frame's zoom factor
};

// What applyInput changed this frame.
struct CameraDelta {
    bool orbited = false;
    bool panned = false;
    bool zoomed = false;

    bool any() const { return orbited || panned || zoomed; }
};

// Map one frame of accumulated input onto the camera. Orbit (right button),
// pan (middle button, or shift + left) and zoom (scroll) are independent.
CameraDelta applyInput(const InputState& input, math::Camera& camera, const InputMapperConfig& cfg);

} // namespace app
