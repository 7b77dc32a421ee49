// Grid level-of-detail derivation and uniform construction.
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>

#include <glm/mat4x4.hpp>

#include "math/Camera.h"
#include "render/GridLod.h"

using render::deriveGridLod;
using render::GridLod;
using render::GridLodConfig;

static bool approx(float a, float b, float eps = 1e-4f) { return std::fabs(a - b) <= eps; }

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "GridLodTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

math::Camera cameraAt(float radius) {
    math::Camera cam{};
    cam.radius = radius;
    return cam;
}

// Style of the strongest tier whose lines pass through world coordinate `coord`.
render::GridLineStyle strongestStyle(const GridLod& lod, double coord) {
    render::GridLineStyle best{};
    for (int tier = 0; tier < render::kGridTiers; ++tier) {
        const double spacing = static_cast<double>(lod.scale) * std::pow(10.0, tier);
        const double cells = coord / spacing;
        if (std::fabs(cells - std::round(cells)) > 1e-4) continue;
        const render::GridLineStyle s = render::gridLineStyle(tier, lod.fade);
        if (s.alpha > best.alpha) best = s;
    }
    return best;
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
    const GridLodConfig cfg{};

    // Known decades around the reference spacing
    {
        GridLod lod = deriveGridLod(cameraAt(20.0f), cfg);
        CHECK(lod.level == 0 && lod.scale == 1.0f, "Radius 20 should use the unit grid (level=%d scale=%g)", lod.level, lod.scale);
        CHECK(approx(lod.fade, std::log10(2.0f), 1e-5f), "Radius 20 fade should be log10(2) (got %g)", lod.fade);

        lod = deriveGridLod(cameraAt(100.0f), cfg);
        CHECK(lod.level == 1 && lod.scale == 10.0f, "Radius 100 should start decade 1 (level=%d scale=%g)", lod.level, lod.scale);
        CHECK(lod.fade < 1e-5f, "Decade boundary should have zero fade (got %g)", lod.fade);

        lod = deriveGridLod(cameraAt(math::kRadiusMin), cfg);
        CHECK(lod.level == -2, "Minimum radius should reach level -2 (got %d)", lod.level);
        CHECK(lod.scale == render::decadeScale(-2), "Scale should be exactly 10^-2 (got %g)", lod.scale);
    }

    // Scale is always a power of ten and fade stays in [0, 1) over the full radius range
    {
        int failures = 0;
        for (float r = math::kRadiusMin; r <= math::kRadiusMax; r *= 1.037f) {
            GridLod lod = deriveGridLod(cameraAt(r), cfg);
            const bool powerOfTen = lod.scale == render::decadeScale(lod.level);
            const bool fadeInRange = lod.fade >= 0.0f && lod.fade < 1.0f;
            if (!powerOfTen || !fadeInRange) {
                if (failures++ < 5) {
                    logFailureFmt(__FILE__, __LINE__, "radius %g: level=%d scale=%g fade=%g", r, lod.level, lod.scale, lod.fade);
                }
            }
        }
        GridLod top = deriveGridLod(cameraAt(math::kRadiusMax), cfg);
        if (!(top.fade >= 0.0f && top.fade < 1.0f)) ++failures;
        CHECK(failures == 0, "LOD invariants violated at %d radii", failures);
    }

    // Fade rises monotonically within one decade
    {
        float prev = -1.0f;
        bool monotonic = true;
        for (float r = 10.0f; r < 99.0f; r += 1.0f) {
            GridLod lod = deriveGridLod(cameraAt(r), cfg);
            if (lod.level != 0 || lod.fade <= prev) monotonic = false;
            prev = lod.fade;
        }
        CHECK(monotonic, "Fade should increase through decade 0");
    }

    // Tier styles at the start of a decade
    {
        const render::GridLineStyle fine = render::gridLineStyle(0, 0.0f);
        const render::GridLineStyle mid = render::gridLineStyle(1, 0.0f);
        const render::GridLineStyle top = render::gridLineStyle(2, 0.5f);
        CHECK(approx(fine.alpha, render::kMinorLineAlpha) && fine.majorMix == 0.0f, "Fine tier starts as a full minor line");
        CHECK(approx(mid.alpha, render::kMajorLineAlpha) && approx(mid.majorMix, 1.0f), "Middle tier starts as a major line");
        CHECK(approx(top.alpha, render::kMajorLineAlpha) && top.majorMix == 1.0f, "Top tier is always major");
        CHECK(render::gridLineStyle(3, 0.2f).alpha == 0.0f, "Unknown tiers draw nothing");
    }

    // A line keeps its weight and colour across every decade boundary
    {
        int failures = 0;
        const float boundaries[] = {1.0f, 10.0f, 100.0f, 1000.0f, 10000.0f};
        for (float boundary : boundaries) {
            const GridLod before = deriveGridLod(cameraAt(boundary * 0.99999f), cfg);
            const GridLod after = deriveGridLod(cameraAt(boundary), cfg);
            if (after.level != before.level + 1) {
                logFailureFmt(__FILE__, __LINE__, "radius %g should start a new decade (%d -> %d)", boundary,
                              before.level, after.level);
                ++failures;
                continue;
            }
            const double multiples[] = {1.0, 3.0, 10.0, 20.0, 100.0, 0.7};
            for (double m : multiples) {
                const double coord = static_cast<double>(after.scale) * m;
                const render::GridLineStyle a = strongestStyle(before, coord);
                const render::GridLineStyle b = strongestStyle(after, coord);
                if (!approx(a.alpha, b.alpha, 2e-3f) || !approx(a.majorMix, b.majorMix, 2e-3f)) {
                    if (failures++ < 5) {
                        logFailureFmt(__FILE__, __LINE__, "radius %g, line at %g: alpha %g -> %g, major %g -> %g",
                                      boundary, coord, a.alpha, b.alpha, a.majorMix, b.majorMix);
                    }
                }
            }
        }
        CHECK(failures == 0, "Grid lines popped at %d decade crossings", failures);
    }

    // Fade distances follow radius and tuning
    {
        GridLod lod = deriveGridLod(cameraAt(40.0f), cfg);
        CHECK(approx(lod.fadeNear, 40.0f * cfg.fadeNearScale) && approx(lod.fadeFar, 40.0f * cfg.fadeFarScale),
              "Fade range should scale with radius (near=%g far=%g)", lod.fadeNear, lod.fadeFar);
        CHECK(lod.fadeNear < lod.fadeFar, "Fade should start before it ends");

        GridLodConfig coarse = cfg;
        coarse.referenceSpacing = 1.0f;
        GridLod c = deriveGridLod(cameraAt(40.0f), coarse);
        CHECK(c.level == 1, "Smaller reference spacing should raise the level (got %d)", c.level);

        GridLodConfig broken = cfg;
        broken.referenceSpacing = 0.0f;
        GridLod b = deriveGridLod(cameraAt(40.0f), broken);
        CHECK(b.level == lod.level, "Non-positive spacing should fall back to the default (got %d)", b.level);
    }

    // Uniform blocks carry the camera and LOD verbatim
    {
        math::Camera cam{};
        cam.target = glm::vec3(3.0f, 1.0f, 0.5f);
        cam.orbit(0.4f, 0.1f);
        const GridLod lod = deriveGridLod(cam, cfg);
        const render::GridUniform gu = render::makeGridUniform(cam, lod);
        const render::CameraUniform cu = render::makeCameraUniform(cam);

        CHECK(std::memcmp(&gu.viewProj, &cu.viewProj, sizeof(glm::mat4)) == 0, "Both blocks should share viewProj");
        const glm::mat4 id = gu.invViewProj * gu.viewProj;
        float maxErr = 0.0f;
        for (int c = 0; c < 4; ++c) {
            for (int r = 0; r < 4; ++r) {
                maxErr = std::fmax(maxErr, std::fabs(id[c][r] - (c == r ? 1.0f : 0.0f)));
            }
        }
        CHECK(maxErr < 1e-3f, "invViewProj should invert viewProj (max error %g)", maxErr);
        const glm::vec3 eye = cam.eyePosition();
        CHECK(approx(gu.eyePos.x, eye.x) && approx(gu.eyePos.y, eye.y) && approx(gu.eyePos.z, eye.z),
              "eyePos should be the camera eye");
        CHECK(gu.pad0 == 0.0f, "Padding should be zeroed");
        CHECK(gu.lodScale == lod.scale && gu.lodFade == lod.fade && gu.fadeNear == lod.fadeNear && gu.fadeFar == lod.fadeFar,
              "LOD fields should be copied unchanged");
    }

    return success ? 0 : 1;
}
