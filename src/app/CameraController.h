#pragma once

// CameraController — owns the single camera shared between the render loop and readers.
//
// The render loop is the only writer and goes through mutate(); readers (the status
// overlay, tools) take a snapshot() that is computed under the same lock, so the
// derived eye position and matrices always belong to one consistent camera state.

#include <mutex>
#include <utility>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "math/Camera.h"

namespace app {

struct CameraSnapshot {
    math::Camera camera{};
    glm::vec3 eye{0.0f};
    glm::mat4 viewProj{1.0f};
    unsigned long long revision = 0;
};

class CameraController {
public:
    CameraController() = default;
    explicit CameraController(const math::Camera& initial) : camera_(initial) {}

    // Apply `fn(math::Camera&)` as one serialized mutation; returns what fn returns.
    template <typename Fn>
    decltype(auto) mutate(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++revision_;
        return std::forward<Fn>(fn)(camera_);
    }

    void setAspect(float aspect);

    CameraSnapshot snapshot() const;
    unsigned long long revision() const;

private:
    mutable std::mutex mutex_;
    math::Camera camera_{};
    unsigned long long revision_ = 0;
};

} // namespace app
