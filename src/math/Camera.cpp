#include "Camera.h"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace math {

namespace {

glm::vec3 safeNormalize(const glm::vec3& v, const glm::vec3& fallback) {
    const float len = glm::length(v);
    if (!std::isfinite(len) || len < 1e-6f) {
        return fallback;
    }
    return v / len;
}

} // namespace

void Camera::orbit(float deltaAz, float deltaEl) {
    if (std::isfinite(deltaAz)) {
        azimuth += deltaAz;
    }
    if (std::isfinite(deltaEl)) {
        elevation += deltaEl;
    }
    elevation = std::clamp(elevation, kElevationMin, kElevationMax);
}

void Camera::zoom(float factor) {
    float next = radius * factor;
    if (std::isnan(next)) {
        next = radius;
    }
    radius = std::clamp(next, kRadiusMin, kRadiusMax);
}

void Camera::pan(float dx, float dy) {
    glm::vec3 delta = right() * dx + up() * dy;
    if (std::isfinite(delta.x) && std::isfinite(delta.y) && std::isfinite(delta.z)) {
        target += delta;
    }
}

void Camera::setAspect(float newAspect) {
    if (!std::isfinite(newAspect) || newAspect <= 0.0f) return;
    aspect = newAspect;
}

glm::vec3 Camera::eyePosition() const {
    const float cosEl = std::cos(elevation);
    const float sinEl = std::sin(elevation);
    const float cosAz = std::cos(azimuth);
    const float sinAz = std::sin(azimuth);
    return target + radius * glm::vec3(cosEl * sinAz, cosEl * cosAz, sinEl);
}

glm::vec3 Camera::forward() const {
    return safeNormalize(target - eyePosition(), glm::vec3(0.0f, 1.0f, 0.0f));
}

// Elevation never reaches the zenith, so forward x up is never degenerate.
glm::vec3 Camera::right() const {
    return safeNormalize(glm::cross(forward(), kWorldUp), glm::vec3(1.0f, 0.0f, 0.0f));
}

glm::vec3 Camera::up() const {
    const glm::vec3 fwd = forward();
    const glm::vec3 r = safeNormalize(glm::cross(fwd, kWorldUp), glm::vec3(1.0f, 0.0f, 0.0f));
    return safeNormalize(glm::cross(r, fwd), kWorldUp);
}

float Camera::nearPlane() const {
    return std::max(radius * nearRatio, kMinNear);
}

float Camera::farPlane() const {
    return std::max(radius * farRatio, kMinFar);
}

glm::mat4 Camera::view() const {
    return glm::lookAtRH(eyePosition(), target, kWorldUp);
}

glm::mat4 Camera::projection() const {
    glm::mat4 proj = glm::perspectiveRH_ZO(fovy, aspect, nearPlane(), farPlane());
    proj[1][1] *= -1.0f;
    return proj;
}

glm::mat4 Camera::viewProj() const {
    return projection() * view();
}

} // namespace math
