// Scene geometry, pass ordering and the per-frame stage contract.
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/CameraController.h"
#include "app/FrameStages.h"
#include "app/Viewport.h"
#include "core/FrameGraph.h"
#include "render/SceneGeometry.h"

using app::FrameStage;
using core::FrameGraph;
using core::PassState;

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "SceneTests failure (%s:%d): ", file, line);
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
    // Negative cases below log on purpose.
    spdlog::set_level(spdlog::level::off);

    // Cube: 12 triangles over 8 corners of [-1,1]^3
    {
        const render::CubeGeometry cube = render::buildCube();
        bool inRange = true;
        for (uint16_t idx : cube.indices) {
            if (idx >= cube.vertices.size()) inRange = false;
        }
        CHECK(inRange, "Cube indices should address the 8 corners");
        bool corners = true;
        for (const auto& v : cube.vertices) {
            if (std::fabs(v.x) != 1.0f || std::fabs(v.y) != 1.0f || std::fabs(v.z) != 1.0f) corners = false;
        }
        CHECK(corners, "Cube vertices should be unit-cube corners");
        bool degenerate = false;
        for (size_t t = 0; t < cube.indices.size(); t += 3) {
            const uint16_t a = cube.indices[t], b = cube.indices[t + 1], c = cube.indices[t + 2];
            if (a == b || b == c || a == c) degenerate = true;
        }
        CHECK(!degenerate, "Cube triangles should not be degenerate");
    }

    // Axes: three positive and three negative arms from the origin
    {
        const auto axes = render::buildAxes();
        CHECK(axes.size() == 12, "Axes should be 6 line segments (got %zu verts)", axes.size());
        const glm::vec3 xTip = axes[1].position;
        CHECK(xTip.x == render::kAxisLength && xTip.y == 0.0f && xTip.z == 0.0f, "First arm should be +X");
        CHECK(axes[1].color.x > axes[3].color.x, "Negative arms should be dimmer than positive ones");
        CHECK(axes[9].position.z == render::kAxisLength, "Fifth arm should be +Z (up)");
    }

    // Target markers: connecting line only when the target is off the ground plane
    {
        const auto grounded = render::buildTargetMarkers(glm::vec3(2.0f, 3.0f, 0.0f));
        CHECK(grounded.size() == 12, "Grounded target should have two crosses only (got %zu)", grounded.size());

        const auto nearGround = render::buildTargetMarkers(glm::vec3(2.0f, 3.0f, 0.0005f));
        CHECK(nearGround.size() == 12, "Sub-epsilon offset should not add a line (got %zu)", nearGround.size());

        const auto raised = render::buildTargetMarkers(glm::vec3(2.0f, 3.0f, 1.0f));
        CHECK(raised.size() == render::kMaxMarkerVertices, "Raised target should add the connecting line (got %zu)", raised.size());
        const auto& a = raised[raised.size() - 2];
        const auto& b = raised[raised.size() - 1];
        CHECK(a.position.z == 1.0f && b.position.z == 0.0f && a.position.x == b.position.x && a.position.y == b.position.y,
              "Connecting line should drop vertically to the ground");

        const auto below = render::buildTargetMarkers(glm::vec3(0.0f, 0.0f, -2.0f));
        CHECK(below.size() == render::kMaxMarkerVertices, "Targets below ground also get the line (got %zu)", below.size());
    }

    // Pass ordering: opaque groups, then transparent ones without depth writes
    {
        FrameGraph graph;
        std::vector<std::string> order;
        graph.beginFrame();
        graph.addPass("Cube", PassState::opaque(), [&](VkCommandBuffer) { order.push_back("Cube"); });
        graph.addPass("Axes", PassState::opaque(), [&](VkCommandBuffer) { order.push_back("Axes"); });
        graph.addPass("Grid", PassState::transparentOverlay(), [&](VkCommandBuffer) { order.push_back("Grid"); });
        CHECK(graph.validate(), "Opaque then transparent should validate");
        graph.execute(nullptr);
        CHECK(order.size() == 3 && order[0] == "Cube" && order[1] == "Axes" && order[2] == "Grid",
              "Passes should execute in insertion order");
        graph.endFrame();
        CHECK(graph.passes().empty(), "endFrame should drop the passes");

        graph.beginFrame();
        graph.addPass("Grid", PassState::transparentOverlay(), nullptr);
        graph.addPass("Cube", PassState::opaque(), nullptr);
        CHECK(!graph.validate(), "Opaque after transparent should be rejected");

        graph.beginFrame();
        PassState leaky = PassState::transparentOverlay();
        leaky.depthWrite = true;
        graph.addPass("Grid", leaky, nullptr);
        CHECK(!graph.validate(), "Depth-writing transparent pass should be rejected");

        graph.beginFrame();
        CHECK(graph.validate(), "Empty frame is valid");
        graph.execute(nullptr);

        const PassState overlay = PassState::transparentOverlay();
        CHECK(overlay.depthTest && !overlay.depthWrite && overlay.compare == core::DepthCompare::LessOrEqual,
              "Overlay state should test with less-or-equal and not write depth");
        CHECK(std::string(core::to_string(overlay.compare)) == "less-equal", "DepthCompare name");
    }

    // Frame stages only advance in order
    {
        app::FrameStageTracker stages;
        CHECK(!stages.advance(FrameStage::CameraUpdated), "Cannot advance before beginFrame");
        stages.beginFrame();
        CHECK(stages.current() == FrameStage::InputAccumulated, "beginFrame should start at InputAccumulated");
        CHECK(!stages.advance(FrameStage::UniformsUploaded), "Skipping the camera update should fail");
        CHECK(stages.current() == FrameStage::InputAccumulated, "Failed advance should not change the stage");
        const FrameStage order[] = {FrameStage::CameraUpdated, FrameStage::UniformsUploaded, FrameStage::Recorded,
                                    FrameStage::Submitted, FrameStage::Presented};
        bool all = true;
        for (FrameStage s : order) all = stages.advance(s) && all;
        CHECK(all, "Full frame sequence should be accepted");
        CHECK(stages.completedFrames() == 1, "One frame should be complete (got %llu)",
              static_cast<unsigned long long>(stages.completedFrames()));
        CHECK(!stages.advance(FrameStage::CameraUpdated), "Presented frame needs beginFrame first");

        // Abandoned frame does not block the next one
        stages.beginFrame();
        stages.advance(FrameStage::CameraUpdated);
        stages.beginFrame();
        CHECK(stages.frameIndex() == 3 && stages.current() == FrameStage::InputAccumulated,
              "beginFrame should restart after an abandoned frame (index %llu)",
              static_cast<unsigned long long>(stages.frameIndex()));
        CHECK(stages.completedFrames() == 1, "Abandoned frames should not count");

        // Repeated or premature stages are rejected without moving the frame
        stages.beginFrame();
        CHECK(stages.advance(FrameStage::CameraUpdated), "Camera update should follow input");
        CHECK(!stages.advance(FrameStage::CameraUpdated), "Repeating a stage should fail");
        CHECK(!stages.advance(FrameStage::Presented), "Presenting before submit should fail");
        CHECK(stages.current() == FrameStage::CameraUpdated, "Rejected stages should leave the frame where it was");
        CHECK(stages.completedFrames() == 1, "Rejected present should not complete the frame");
    }

    // Resize policy
    {
        app::CameraController controller;
        app::Viewport viewport(controller, 1280, 720);
        const float aspect0 = controller.snapshot().camera.aspect;
        CHECK(std::fabs(aspect0 - 1280.0f / 720.0f) < 1e-5f, "Initial aspect should follow the viewport (got %g)", aspect0);
        CHECK(!viewport.dirty(), "Fresh viewport is clean");

        const unsigned long long rev = controller.revision();
        CHECK(!viewport.requestResize(0, 720), "Zero width should be ignored");
        CHECK(!viewport.requestResize(1280, 0), "Zero height should be ignored");
        CHECK(viewport.minimized(), "Zero-sized request means minimised");
        CHECK(!viewport.dirty() && controller.revision() == rev, "Zero-sized request should not touch camera or swapchain");
        CHECK(viewport.extent().width == 1280 && viewport.extent().height == 720, "Extent should be kept");

        CHECK(!viewport.requestResize(1280, 720), "Same size should not mark dirty");
        CHECK(!viewport.minimized(), "Non-zero request restores from minimised");

        CHECK(viewport.requestResize(800, 800), "New size should be accepted");
        CHECK(controller.snapshot().camera.aspect == 1.0f, "Aspect should update on resize (got %g)",
              controller.snapshot().camera.aspect);
        CHECK(viewport.consumeDirty(), "Resize should request a rebuild");
        CHECK(!viewport.consumeDirty(), "Rebuild request is consumed once");
        viewport.markDirty();
        CHECK(viewport.consumeDirty(), "markDirty should request a rebuild");
    }

    return success ? 0 : 1;
}
