#pragma once

// FrameGraph — ordered draw groups inside the single scene render pass.
//
// Each pass carries the depth/blend state it will be drawn with, so the composition
// contract can be checked before anything is recorded: every opaque group comes first,
// transparent groups never write depth, and the frame ends on a transparent group when
// there is one. Passes execute strictly in insertion order.

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <vulkan/vulkan_core.h>

namespace core {

enum class DepthCompare : uint8_t { Less, LessOrEqual };
enum class BlendMode : uint8_t { Replace, Alpha };

struct PassState {
    bool depthTest = true;
    bool depthWrite = true;
    DepthCompare compare = DepthCompare::Less;
    BlendMode blend = BlendMode::Replace;

    bool transparent() const { return blend != BlendMode::Replace; }

    static PassState opaque() { return PassState{}; }
    static PassState transparentOverlay() {
        return PassState{true, false, DepthCompare::LessOrEqual, BlendMode::Alpha};
    }
};

class FrameGraph {
public:
    struct Pass {
        std::string name;
        PassState state;
        std::function<void(VkCommandBuffer)> record;
    };

    void beginFrame();
    void addPass(std::string name, PassState state, std::function<void(VkCommandBuffer)> record);
    // Logs the first violation and returns false.
    bool validate() const;
    void execute(VkCommandBuffer commandBuffer);
    void endFrame();

    const std::vector<Pass>& passes() const { return passes_; }

private:
    std::vector<Pass> passes_;
};

const char* to_string(DepthCompare compare);

}
