#pragma once

#include <array>
#include <cstdint>

#include <volk.h>

#include "core/Descriptors.h"
#include "core/FrameGraph.h"
#include "render/GridLod.h"
#include "render/VulkanUtils.h"

namespace platform { class VulkanContext; }
namespace math { struct Camera; }

namespace render {

// SceneComposer — records the fixed scene into one dynamic-rendering pass per frame.
//
// Draw order: cube (opaque), axes then target markers (opaque lines), grid (alpha
// blended, no depth write, always last). Per-frame data lives in one slot per frame
// in flight; a slot may only be written once the fence of the frame that last used
// it has signalled.
class SceneComposer {
public:
    static constexpr uint32_t kFramesInFlight = 2;

    bool init(platform::VulkanContext& vk, VkFormat colorFormat, VkExtent2D extent);
    void shutdown();

    // Zero-sized extents are ignored. Otherwise rebuilds the depth target and, when
    // the colour format changed, the pipelines. The GPU must be idle.
    bool resize(VkExtent2D extent, VkFormat colorFormat);

    void updateFrame(uint32_t slot, const math::Camera& camera, const GridLod& lod);
    // Records into an already-begun command buffer. Leaves `targetImage` in
    // PRESENT_SRC_KHR. Returns false without recording when the pass order is invalid.
    bool record(VkCommandBuffer cb, uint32_t slot, VkImage targetImage, VkImageView targetView);

    bool ready() const { return ready_; }

private:
    struct Pipeline {
        VkPipeline handle = VK_NULL_HANDLE;
        VkPipelineLayout layout = VK_NULL_HANDLE;
    };

    enum class VertexLayout { None, Position, PositionColor };

    struct PipelineDesc {
        const char* name;
        const char* vertShader;
        const char* fragShader;
        VkPrimitiveTopology topology;
        VertexLayout vertexLayout;
        core::PassState state;
        VkDescriptorSetLayout setLayout;
    };

    struct FrameResources {
        vkutil::MappedBuffer cameraUbo;
        vkutil::MappedBuffer gridUbo;
        vkutil::MappedBuffer markerVbo;
        VkDescriptorSet cameraSet = VK_NULL_HANDLE;
        VkDescriptorSet gridSet = VK_NULL_HANDLE;
        uint32_t markerCount = 0;
    };

    bool createStaticMeshes(platform::VulkanContext& vk);
    bool createFrameResources();
    bool createDepthTarget();
    void destroyDepthTarget();
    bool createPipelines();
    void destroyPipelines();
    bool createPipeline(const PipelineDesc& desc, Pipeline& out);
    void buildFrameGraph(uint32_t slot);

    VkDevice device_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkPipelineCache pipelineCache_ = VK_NULL_HANDLE;
    VkExtent2D extent_{};
    VkFormat colorFormat_ = VK_FORMAT_UNDEFINED;
    VkFormat depthFormat_ = VK_FORMAT_UNDEFINED;

    VkBuffer cubeVertexBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory cubeVertexMemory_ = VK_NULL_HANDLE;
    VkBuffer cubeIndexBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory cubeIndexMemory_ = VK_NULL_HANDLE;
    uint32_t cubeIndexCount_ = 0;
    VkBuffer axesVertexBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory axesVertexMemory_ = VK_NULL_HANDLE;
    uint32_t axesVertexCount_ = 0;

    VkImage depthImage_ = VK_NULL_HANDLE;
    VkDeviceMemory depthMemory_ = VK_NULL_HANDLE;
    VkImageView depthView_ = VK_NULL_HANDLE;

    core::Descriptors descriptors_;
    VkDescriptorSetLayout cameraSetLayout_ = VK_NULL_HANDLE;
    VkDescriptorSetLayout gridSetLayout_ = VK_NULL_HANDLE;
    std::array<FrameResources, kFramesInFlight> frames_{};

    Pipeline cubePipeline_{};
    Pipeline linePipeline_{};
    Pipeline gridPipeline_{};

    core::FrameGraph frameGraph_;
    bool ready_ = false;
};

} // namespace render
