#pragma once

#include <cstdint>

namespace app {

class CameraController;

struct ViewportExtent {
    uint32_t width = 0;
    uint32_t height = 0;
};

// Viewport — framebuffer size tracking and the resize policy.
//
// A zero-sized request (minimised window) is dropped entirely: extent, aspect and the
// GPU resources sized from them stay as they were. Any other request updates the
// camera aspect and marks the swapchain for rebuild on the next frame.
class Viewport {
public:
    Viewport(CameraController& controller, uint32_t width, uint32_t height);

    bool requestResize(uint32_t width, uint32_t height);
    // Force a rebuild at the current extent (suboptimal / out-of-date swapchain).
    void markDirty() { dirty_ = true; }
    // Returns true once per pending rebuild.
    bool consumeDirty();

    bool dirty() const { return dirty_; }
    bool minimized() const { return minimized_; }
    ViewportExtent extent() const { return extent_; }
    float aspect() const;

private:
    CameraController& controller_;
    ViewportExtent extent_{};
    bool dirty_ = false;
    bool minimized_ = false;
};

} // namespace app
