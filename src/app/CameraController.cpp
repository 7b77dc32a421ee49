#include "CameraController.h"

namespace app {

void CameraController::setAspect(float aspect) {
    mutate([aspect](math::Camera& cam) { cam.setAspect(aspect); });
}

CameraSnapshot CameraController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CameraSnapshot snap{};
    snap.camera = camera_;
    snap.eye = camera_.eyePosition();
    snap.viewProj = camera_.viewProj();
    snap.revision = revision_;
    return snap;
}

unsigned long long CameraController::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

} // namespace app
