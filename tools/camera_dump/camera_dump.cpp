#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <glm/trigonometric.hpp>
#include <glm/vec4.hpp>

#include "app/CameraController.h"
#include "app/InputMapper.h"
#include "app/InputState.h"
#include "math/Camera.h"
#include "render/GridLod.h"
#include "render/SceneGeometry.h"

namespace {

void printUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " [op args]...\n"
              << "  orbit <dAz> <dEl>        rotate around the target (radians)\n"
              << "  zoom <factor>            multiply the radius\n"
              << "  pan <dx> <dy>            move the target in the view plane (world units)\n"
              << "  drag <button> <dx> <dy>  pointer drag; button is left|middle|right|shift-left\n"
              << "  scroll <lines>           wheel scroll in lines\n"
              << "  scroll-px <px> <pxPerLine>  touchpad scroll in pixels\n"
              << "  aspect <w/h>             set the projection aspect\n"
              << "Prints the camera, grid LOD and uniform data after each op." << std::endl;
}

bool parseNumber(const char* s, float& out) {
    char* end = nullptr;
    const float v = std::strtof(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

void dumpState(const std::string& label, const app::CameraController& controller) {
    const app::CameraSnapshot snap = controller.snapshot();
    const math::Camera& cam = snap.camera;
    const render::GridLod lod = render::deriveGridLod(cam);
    const render::GridUniform gu = render::makeGridUniform(cam, lod);
    const glm::vec4 clip = snap.viewProj * glm::vec4(cam.target, 1.0f);
    const auto markers = render::buildTargetMarkers(cam.target);

    std::cout << std::fixed << std::setprecision(4)
              << "== " << label << " (rev " << snap.revision << ")\n"
              << "  target   " << cam.target.x << ' ' << cam.target.y << ' ' << cam.target.z << '\n'
              << "  radius   " << cam.radius
              << "  az " << cam.azimuth << " (" << glm::degrees(cam.azimuth) << " deg)"
              << "  el " << cam.elevation << " (" << glm::degrees(cam.elevation) << " deg)\n"
              << "  eye      " << snap.eye.x << ' ' << snap.eye.y << ' ' << snap.eye.z << '\n'
              << "  planes   near " << cam.nearPlane() << " far " << cam.farPlane() << " aspect " << cam.aspect << '\n'
              << "  target ndc " << clip.x / clip.w << ' ' << clip.y / clip.w << ' ' << clip.z / clip.w << '\n'
              << "  grid     level " << lod.level << " scale " << lod.scale << " fade " << lod.fade
              << " fadeNear " << gu.fadeNear << " fadeFar " << gu.fadeFar << '\n'
              << "  markers  " << markers.size() << " vertices"
              << (markers.size() == render::kMaxMarkerVertices ? " (with ground line)" : "") << '\n';
}

} // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    app::CameraController controller;
    const app::InputMapperConfig mapper{};
    dumpState("initial", controller);

    int i = 1;
    auto need = [&](int n) {
        if (i + n >= argc) {
            std::cerr << "Missing arguments for '" << argv[i] << "'" << std::endl;
            return false;
        }
        return true;
    };
    auto number = [&](int offset, float& out) {
        if (!parseNumber(argv[i + offset], out)) {
            std::cerr << "Invalid number '" << argv[i + offset] << "' for '" << argv[i] << "'" << std::endl;
            return false;
        }
        return true;
    };

    while (i < argc) {
        const std::string op = argv[i];
        float a = 0.0f, b = 0.0f;
        int consumed = 0;
        if (op == "orbit" || op == "pan") {
            if (!need(2) || !number(1, a) || !number(2, b)) return EXIT_FAILURE;
            consumed = 2;
            if (op == "orbit") {
                controller.mutate([&](math::Camera& cam) { cam.orbit(a, b); });
            } else {
                controller.mutate([&](math::Camera& cam) { cam.pan(a, b); });
            }
        } else if (op == "zoom" || op == "aspect") {
            if (!need(1) || !number(1, a)) return EXIT_FAILURE;
            consumed = 1;
            if (op == "zoom") {
                controller.mutate([&](math::Camera& cam) { cam.zoom(a); });
            } else {
                controller.setAspect(a);
            }
        } else if (op == "drag") {
            if (!need(3) || !number(2, a) || !number(3, b)) return EXIT_FAILURE;
            consumed = 3;
            const std::string button = argv[i + 1];
            app::InputState input{};
            if (button == "left") {
                input.onButton(app::MouseButton::Left, true);
            } else if (button == "middle") {
                input.onButton(app::MouseButton::Middle, true);
            } else if (button == "right") {
                input.onButton(app::MouseButton::Right, true);
            } else if (button == "shift-left") {
                input.onShift(true);
                input.onButton(app::MouseButton::Left, true);
            } else {
                std::cerr << "Unknown button '" << button << "'" << std::endl;
                return EXIT_FAILURE;
            }
            input.onCursorMoved(0.0f, 0.0f);
            input.onCursorMoved(a, b);
            const app::CameraDelta delta = controller.mutate([&](math::Camera& cam) {
                return app::applyInput(input, cam, mapper);
            });
            std::cout << "  applied  orbit " << delta.orbited << " pan " << delta.panned
                      << " zoom " << delta.zoomed << '\n';
        } else if (op == "scroll" || op == "scroll-px") {
            app::InputState input{};
            if (op == "scroll") {
                if (!need(1) || !number(1, a)) return EXIT_FAILURE;
                consumed = 1;
                input.onScrollLines(a);
            } else {
                if (!need(2) || !number(1, a) || !number(2, b)) return EXIT_FAILURE;
                consumed = 2;
                input.onScrollPixels(a, b);
            }
            controller.mutate([&](math::Camera& cam) { return app::applyInput(input, cam, mapper); });
        } else {
            std::cerr << "Unknown op '" << op << "'" << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }

        std::string label = op;
        for (int k = 1; k <= consumed; ++k) {
            label += ' ';
            label += argv[i + k];
        }
        dumpState(label, controller);
        i += consumed + 1;
    }
    return EXIT_SUCCESS;
}
