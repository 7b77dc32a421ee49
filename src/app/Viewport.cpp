#include "Viewport.h"

#include <spdlog/spdlog.h>

#include "CameraController.h"

namespace app {

Viewport::Viewport(CameraController& controller, uint32_t width, uint32_t height)
    : controller_(controller) {
    if (width > 0 && height > 0) {
        extent_ = {width, height};
        controller_.setAspect(aspect());
    }
}

bool Viewport::requestResize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        minimized_ = true;
        spdlog::debug("Viewport: ignoring zero-sized resize {}x{}", width, height);
        return false;
    }
    minimized_ = false;
    if (width == extent_.width && height == extent_.height) {
        return false;
    }
    extent_ = {width, height};
    dirty_ = true;
    controller_.setAspect(aspect());
    spdlog::debug("Viewport: resized to {}x{} (aspect {:.3f})", width, height, aspect());
    return true;
}

bool Viewport::consumeDirty() {
    const bool was = dirty_;
    dirty_ = false;
    return was;
}

float Viewport::aspect() const {
    if (extent_.height == 0) return 0.0f;
    return static_cast<float>(extent_.width) / static_cast<float>(extent_.height);
}

} // namespace app
