#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/gtc/constants.hpp>

// Camera — spherical orbit camera (Z-up, right-handed) and its view/projection math.
//
// The eye is placed on a sphere of `radius` around `target`:
//   azimuth   horizontal angle from +Y toward +X, unbounded
//   elevation angle above the XY ground plane, clamped short of plane and zenith
// Depth planes follow the radius so precision tracks the current framing scale.
namespace math {

inline constexpr float kRadiusMin = 0.5f;
inline constexpr float kRadiusMax = 100'000.0f;
inline constexpr float kElevationMin = 0.01f;            // just above XY plane
inline constexpr float kElevationMax = 1.57079633f - 0.01f; // just below zenith

inline constexpr float kMinNear = 0.001f;
inline constexpr float kMinFar = 10.0f;

inline const glm::vec3 kWorldUp{0.0f, 0.0f, 1.0f};

struct Camera {
    glm::vec3 target{0.0f};
    float radius = 20.0f;
    float azimuth = -glm::quarter_pi<float>();
    float elevation = glm::pi<float>() / 6.0f;

    float aspect = 16.0f / 9.0f;
    float fovy = glm::quarter_pi<float>();
    float nearRatio = 0.01f;   // znear = radius * nearRatio
    float farRatio = 1000.0f;  // zfar  = radius * farRatio

    // Rotate around the target; angles in radians.
    void orbit(float deltaAz, float deltaEl);
    // Multiplicative zoom: factor > 1 moves out, < 1 moves in.
    void zoom(float factor);
    // Translate target in the view-aligned plane; world units.
    void pan(float dx, float dy);
    // Ignores non-positive or non-finite values.
    void setAspect(float newAspect);

    glm::vec3 eyePosition() const;
    glm::vec3 forward() const;
    glm::vec3 right() const;
    glm::vec3 up() const;

    float nearPlane() const;
    float farPlane() const;

    glm::mat4 view() const;
    // Vulkan clip space: [0,1] depth and Y pointing down.
    glm::mat4 projection() const;
    glm::mat4 viewProj() const;
};

} // namespace math
