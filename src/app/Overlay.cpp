#include "Overlay.h"

#include <iomanip>
#include <sstream>

#include <glm/trigonometric.hpp>

#include "app/CameraController.h"
#include "render/GridLod.h"

namespace app {

std::vector<std::string> buildOverlayLines(const CameraSnapshot& snapshot,
                                           const render::GridLod& lod,
                                           std::string_view adapterName,
                                           float frameMs) {
    std::vector<std::string> lines;
    lines.reserve(5);
    auto clampLine = [&](std::string line) {
        if (line.size() > kOverlayMaxCols) {
            line.resize(kOverlayMaxCols);
        }
        lines.push_back(std::move(line));
    };

    const math::Camera& cam = snapshot.camera;
    const float fps = (frameMs > 1e-3f) ? (1000.0f / frameMs) : 0.0f;

    clampLine("ADAPTER " + std::string(adapterName));
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "FPS " << std::setw(6) << fps
           << "  DT " << std::setw(6) << frameMs << "MS";
        clampLine(ss.str());
    }
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << "TARGET X " << cam.target.x
           << " Y " << cam.target.y
           << " Z " << cam.target.z;
        clampLine(ss.str());
    }
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << "RADIUS " << cam.radius
           << " AZ " << std::setprecision(1) << glm::degrees(cam.azimuth)
           << " EL " << glm::degrees(cam.elevation);
        clampLine(ss.str());
    }
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << "EYE X " << snapshot.eye.x
           << " Y " << snapshot.eye.y
           << " Z " << snapshot.eye.z;
        clampLine(ss.str());
    }
    {
        std::ostringstream ss;
        ss << "GRID SCALE " << lod.scale
           << std::fixed << std::setprecision(2)
           << " FADE " << lod.fade;
        clampLine(ss.str());
    }
    return lines;
}

std::string buildWindowTitle(const CameraSnapshot& snapshot, const render::GridLod& lod, float frameMs) {
    std::ostringstream ss;
    ss << "kyzu | " << std::fixed << std::setprecision(1) << frameMs << " ms"
       << " | r " << std::setprecision(2) << snapshot.camera.radius
       << " | grid " << std::defaultfloat << lod.scale;
    return ss.str();
}

} // namespace app
