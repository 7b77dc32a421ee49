#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include <glm/vec3.hpp>

// SceneGeometry — CPU-side vertex data for the fixed mesh set (cube, axes, target markers).
namespace render {

struct LineVertex {
    glm::vec3 position;
    glm::vec3 color;
};
static_assert(sizeof(LineVertex) == 24, "LineVertex is two tightly packed vec3");

struct CubeGeometry {
    std::array<glm::vec3, 8> vertices;
    std::array<uint16_t, 36> indices;
};

inline constexpr float kAxisLength = 5.0f;
inline constexpr float kMarkerArm = 0.3f;
// Target offsets from the ground plane at or below this get no connecting line.
inline constexpr float kGroundEpsilon = 0.001f;
// Two crosses of three arms plus the connecting line.
inline constexpr uint32_t kMaxMarkerVertices = 14;

// Unit cube spanning [-1, 1]^3, Z-up.
CubeGeometry buildCube();

// +X/+Y/+Z arms in full colour, negative arms dimmed; line list.
std::vector<LineVertex> buildAxes();

// White cross at target, yellow cross at its ground projection, grey line between
// them when |target.z| > kGroundEpsilon; line list, at most kMaxMarkerVertices.
std::vector<LineVertex> buildTargetMarkers(const glm::vec3& target);

} // namespace render
