// Camera model, navigation clamps and the shared camera controller.
#include <atomic>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <limits>
#include <thread>
#include <vector>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/vec4.hpp>

#include "app/CameraController.h"
#include "math/Camera.h"

using math::Camera;

static bool approx(float a, float b, float eps = 1e-4f) { return std::fabs(a - b) <= eps; }

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "CameraTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

} // namespace

#define CHECK(cond, msg, ...) \
    do { \
        if (!(cond)) { \
            logFailureFmt(__FILE__, __LINE__, msg, ##__VA_ARGS__); \
            success = false; \
        } \
    } while (0)

int main() {
    bool success = true;

    // Default camera, orbit then zoom in and out of bounds
    {
        Camera cam{};
        CHECK(approx(cam.radius, 20.0f), "Default radius should be 20 (got %g)", cam.radius);
        const float el0 = cam.elevation;
        cam.orbit(0.1f, 0.0f);
        CHECK(approx(cam.azimuth, -0.6854f, 1e-3f), "Azimuth after orbit should be ~-0.6854 (got %g)", cam.azimuth);
        CHECK(cam.elevation == el0, "Elevation should be unchanged by horizontal orbit (got %g)", cam.elevation);
        cam.zoom(2.0f);
        CHECK(approx(cam.radius, 40.0f), "zoom(2) should double radius (got %g)", cam.radius);
        cam.zoom(1e12f);
        CHECK(cam.radius == math::kRadiusMax, "Huge zoom should clamp to kRadiusMax (got %g)", cam.radius);
        cam.zoom(1e-12f);
        CHECK(cam.radius == math::kRadiusMin, "Tiny zoom should clamp to kRadiusMin (got %g)", cam.radius);
    }

    // Elevation never leaves its band, azimuth is unbounded
    {
        Camera cam{};
        cam.orbit(0.0f, 10.0f);
        CHECK(cam.elevation == math::kElevationMax, "Elevation should clamp below zenith (got %g)", cam.elevation);
        cam.orbit(0.0f, -10.0f);
        CHECK(cam.elevation == math::kElevationMin, "Elevation should clamp above ground (got %g)", cam.elevation);
        cam.orbit(100.0f, 0.0f);
        CHECK(cam.azimuth > 99.0f, "Azimuth should not wrap or clamp (got %g)", cam.azimuth);
    }

    // Non-finite input leaves state untouched
    {
        Camera cam{};
        const Camera before = cam;
        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float inf = std::numeric_limits<float>::infinity();
        cam.orbit(nan, nan);
        cam.zoom(nan);
        cam.pan(inf, 0.0f);
        cam.setAspect(0.0f);
        cam.setAspect(nan);
        CHECK(cam.azimuth == before.azimuth && cam.elevation == before.elevation,
              "NaN orbit must not change angles (az=%g el=%g)", cam.azimuth, cam.elevation);
        CHECK(cam.radius == before.radius, "NaN zoom must not change radius (got %g)", cam.radius);
        CHECK(glm::length(cam.target - before.target) == 0.0f, "Infinite pan must not move target");
        CHECK(cam.aspect == before.aspect, "Invalid aspect must be ignored (got %g)", cam.aspect);
    }

    // Basis is orthonormal and pan stays in the view plane
    {
        Camera cam{};
        cam.orbit(0.7f, 0.3f);
        const glm::vec3 f = cam.forward();
        const glm::vec3 r = cam.right();
        const glm::vec3 u = cam.up();
        CHECK(approx(glm::dot(f, r), 0.0f) && approx(glm::dot(f, u), 0.0f) && approx(glm::dot(r, u), 0.0f),
              "Camera basis should be orthogonal (f.r=%g f.u=%g r.u=%g)",
              glm::dot(f, r), glm::dot(f, u), glm::dot(r, u));
        CHECK(approx(r.z, 0.0f), "Right vector should lie in the ground plane (z=%g)", r.z);

        const glm::vec3 eyeBefore = cam.eyePosition();
        const glm::vec3 targetBefore = cam.target;
        cam.pan(3.0f, -2.0f);
        const glm::vec3 moved = cam.target - targetBefore;
        CHECK(approx(glm::dot(moved, f), 0.0f, 1e-3f), "Pan should not move along forward (dot=%g)", glm::dot(moved, f));
        CHECK(approx(glm::length(moved), std::sqrt(13.0f), 1e-3f), "Pan distance should be |(3,-2)| (got %g)", glm::length(moved));
        const glm::vec3 eyeMoved = cam.eyePosition() - eyeBefore;
        CHECK(approx(glm::length(eyeMoved - moved), 0.0f, 1e-3f), "Pan should translate eye and target together");
    }

    // Horizontal pan moves only along right(), vertical pan only along up()
    {
        const float azimuths[] = {-glm::quarter_pi<float>(), 0.0f, 1.3f, 3.0f, -2.2f};
        const float elevations[] = {math::kElevationMin, 0.3f, glm::quarter_pi<float>(), math::kElevationMax};
        int failures = 0;
        for (float az : azimuths) {
            for (float el : elevations) {
                Camera cam{};
                cam.azimuth = az;
                cam.elevation = el;
                const glm::vec3 r = cam.right();
                const glm::vec3 u = cam.up();

                glm::vec3 start = cam.target;
                cam.pan(2.5f, 0.0f);
                const glm::vec3 side = cam.target - start;
                start = cam.target;
                cam.pan(0.0f, -1.5f);
                const glm::vec3 vertical = cam.target - start;

                const bool sideOk = glm::length(glm::cross(side, r)) < 1e-3f && approx(glm::dot(side, r), 2.5f, 1e-3f);
                const bool verticalOk = glm::length(glm::cross(vertical, u)) < 1e-3f &&
                                        approx(glm::dot(vertical, u), -1.5f, 1e-3f);
                if (!sideOk || !verticalOk) {
                    if (failures++ < 5) {
                        logFailureFmt(__FILE__, __LINE__,
                                      "az=%g el=%g: pan(dx,0) along right %g (off-axis %g), pan(0,dy) along up %g (off-axis %g)",
                                      az, el, glm::dot(side, r), glm::length(glm::cross(side, r)),
                                      glm::dot(vertical, u), glm::length(glm::cross(vertical, u)));
                    }
                }
            }
        }
        CHECK(failures == 0, "Axis-aligned pans leaked onto the other axis at %d orientations", failures);
    }

    // Eye sits at radius from target with the documented spherical convention
    {
        Camera cam{};
        cam.azimuth = 0.0f;
        cam.elevation = 0.5f;
        cam.radius = 10.0f;
        const glm::vec3 eye = cam.eyePosition();
        CHECK(approx(glm::length(eye - cam.target), 10.0f, 1e-3f), "Eye distance should equal radius (got %g)",
              glm::length(eye - cam.target));
        CHECK(approx(eye.x, 0.0f, 1e-4f) && eye.y > 0.0f && eye.z > 0.0f,
              "Azimuth 0 should place the eye on +Y above ground (eye=%g,%g,%g)", eye.x, eye.y, eye.z);
    }

    // Target projects to the screen centre with depth inside [0, 1]
    {
        Camera cam{};
        cam.target = glm::vec3(4.0f, -7.0f, 2.0f);
        cam.orbit(1.2f, 0.2f);
        cam.setAspect(1.5f);
        const glm::vec4 clip = cam.viewProj() * glm::vec4(cam.target, 1.0f);
        const glm::vec3 ndc = glm::vec3(clip) / clip.w;
        CHECK(approx(ndc.x, 0.0f, 1e-4f) && approx(ndc.y, 0.0f, 1e-4f),
              "Target should map to NDC origin (x=%g y=%g)", ndc.x, ndc.y);
        CHECK(ndc.z > 0.0f && ndc.z < 1.0f, "Target depth should be within [0,1] (z=%g)", ndc.z);
        CHECK(cam.nearPlane() < cam.radius && cam.farPlane() > cam.radius,
              "Depth range should bracket the target (near=%g far=%g)", cam.nearPlane(), cam.farPlane());

        // Point above the target lands in the upper half of the screen (Y down).
        const glm::vec4 above = cam.viewProj() * glm::vec4(cam.target + glm::vec3(0.0f, 0.0f, 1.0f), 1.0f);
        CHECK(above.y / above.w < 0.0f, "World up should map to negative NDC y (got %g)", above.y / above.w);
    }

    // Controller snapshots are internally consistent under concurrent mutation
    {
        app::CameraController controller;
        std::atomic<bool> stop{false};
        std::atomic<int> torn{0};

        std::thread writer([&] {
            for (int i = 1; i <= 2000; ++i) {
                controller.mutate([i](Camera& cam) {
                    cam.target = glm::vec3(static_cast<float>(i), 0.0f, 0.0f);
                    cam.radius = static_cast<float>(i) + 1.0f;
                });
            }
            stop = true;
        });

        std::vector<std::thread> readers;
        for (int r = 0; r < 3; ++r) {
            readers.emplace_back([&] {
                while (!stop) {
                    const app::CameraSnapshot snap = controller.snapshot();
                    if (snap.revision == 0) continue;
                    const glm::vec3 eye = snap.camera.eyePosition();
                    if (snap.camera.radius != snap.camera.target.x + 1.0f ||
                        glm::length(eye - snap.eye) > 1e-3f) {
                        ++torn;
                    }
                }
            });
        }
        writer.join();
        for (auto& t : readers) t.join();

        CHECK(torn.load() == 0, "Snapshots should never mix two camera states (torn=%d)", torn.load());
        CHECK(controller.revision() == 2000ull, "Revision should count every mutation (got %llu)", controller.revision());
        const app::CameraSnapshot last = controller.snapshot();
        CHECK(approx(last.camera.radius, 2001.0f), "Final radius should be the last write (got %g)", last.camera.radius);
    }

    // setAspect through the controller reaches the projection
    {
        app::CameraController controller;
        controller.setAspect(2.0f);
        const app::CameraSnapshot snap = controller.snapshot();
        CHECK(snap.camera.aspect == 2.0f, "Controller aspect should be 2 (got %g)", snap.camera.aspect);
        const glm::mat4 proj = snap.camera.projection();
        CHECK(approx(proj[1][1] / proj[0][0], -2.0f, 1e-4f),
              "Projection x/y scale ratio should follow aspect (got %g)", proj[1][1] / proj[0][0]);
    }

    return success ? 0 : 1;
}
