#include "SceneGeometry.h"

#include <cmath>

namespace render {

namespace {

const glm::vec3 kColXPos{1.0f, 0.2f, 0.2f};
const glm::vec3 kColYPos{0.2f, 1.0f, 0.2f};
const glm::vec3 kColZPos{0.2f, 0.4f, 1.0f};
const glm::vec3 kColXNeg{0.3f, 0.1f, 0.1f};
const glm::vec3 kColYNeg{0.1f, 0.3f, 0.1f};
const glm::vec3 kColZNeg{0.1f, 0.15f, 0.3f};

const glm::vec3 kColTarget{1.0f, 1.0f, 1.0f};
const glm::vec3 kColProjection{1.0f, 1.0f, 0.2f};
const glm::vec3 kColConnect{0.5f, 0.5f, 0.5f};

void pushCross(std::vector<LineVertex>& out, const glm::vec3& c, const glm::vec3& color) {
    out.push_back({c - glm::vec3(kMarkerArm, 0.0f, 0.0f), color});
    out.push_back({c + glm::vec3(kMarkerArm, 0.0f, 0.0f), color});
    out.push_back({c - glm::vec3(0.0f, kMarkerArm, 0.0f), color});
    out.push_back({c + glm::vec3(0.0f, kMarkerArm, 0.0f), color});
    out.push_back({c - glm::vec3(0.0f, 0.0f, kMarkerArm), color});
    out.push_back({c + glm::vec3(0.0f, 0.0f, kMarkerArm), color});
}

} // namespace

CubeGeometry buildCube() {
    CubeGeometry geo{};
    geo.vertices = {
        glm::vec3{-1.0f, -1.0f, -1.0f}, // 0 bottom
        glm::vec3{ 1.0f, -1.0f, -1.0f},
        glm::vec3{ 1.0f,  1.0f, -1.0f},
        glm::vec3{-1.0f,  1.0f, -1.0f},
        glm::vec3{-1.0f, -1.0f,  1.0f}, // 4 top
        glm::vec3{ 1.0f, -1.0f,  1.0f},
        glm::vec3{ 1.0f,  1.0f,  1.0f},
        glm::vec3{-1.0f,  1.0f,  1.0f},
    };
    geo.indices = {
        0, 1, 2,  0, 2, 3,  // bottom (Z-)
        4, 5, 6,  4, 6, 7,  // top    (Z+)
        0, 1, 5,  0, 5, 4,  // front  (Y-)
        2, 3, 7,  2, 7, 6,  // back   (Y+)
        1, 2, 6,  1, 6, 5,  // right  (X+)
        3, 0, 4,  3, 4, 7,  // left   (X-)
    };
    return geo;
}

std::vector<LineVertex> buildAxes() {
    const glm::vec3 o{0.0f};
    return {
        {o, kColXPos}, {{ kAxisLength, 0.0f, 0.0f}, kColXPos},
        {o, kColXNeg}, {{-kAxisLength, 0.0f, 0.0f}, kColXNeg},
        {o, kColYPos}, {{0.0f,  kAxisLength, 0.0f}, kColYPos},
        {o, kColYNeg}, {{0.0f, -kAxisLength, 0.0f}, kColYNeg},
        {o, kColZPos}, {{0.0f, 0.0f,  kAxisLength}, kColZPos},
        {o, kColZNeg}, {{0.0f, 0.0f, -kAxisLength}, kColZNeg},
    };
}

std::vector<LineVertex> buildTargetMarkers(const glm::vec3& target) {
    const glm::vec3 projected{target.x, target.y, 0.0f};

    std::vector<LineVertex> verts;
    verts.reserve(kMaxMarkerVertices);
    pushCross(verts, target, kColTarget);
    pushCross(verts, projected, kColProjection);
    if (std::fabs(target.z) > kGroundEpsilon) {
        verts.push_back({target, kColConnect});
        verts.push_back({projected, kColConnect});
    }
    return verts;
}

} // namespace render
