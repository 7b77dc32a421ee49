#include "SceneComposer.h"

#include "core/Upload.h"
#include "math/Camera.h"
#include "platform/VulkanContext.h"
#include "render/SceneGeometry.h"
#include "render/Uniforms.h"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <vector>

namespace render {

namespace {

constexpr VkClearColorValue kClearColor{{0.02f, 0.02f, 0.03f, 1.0f}};
constexpr float kClearDepth = 1.0f;

VkCompareOp toVkCompare(core::DepthCompare compare) {
    switch (compare) {
    case core::DepthCompare::Less: return VK_COMPARE_OP_LESS;
    case core::DepthCompare::LessOrEqual: return VK_COMPARE_OP_LESS_OR_EQUAL;
    }
    return VK_COMPARE_OP_LESS;
}

VkImageAspectFlags depthAspect(VkFormat format) {
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_DEPTH_BIT;
    if (vkutil::hasStencil(format)) aspect |= VK_IMAGE_ASPECT_STENCIL_BIT;
    return aspect;
}

} // namespace

bool SceneComposer::init(platform::VulkanContext& vk, VkFormat colorFormat, VkExtent2D extent) {
    if (!vk.deviceInfo().hasDynamicRendering) {
        spdlog::error("SceneComposer: dynamic rendering not supported");
        return false;
    }

    device_ = vk.device();
    physicalDevice_ = vk.physicalDevice();
    pipelineCache_ = vk.pipelineCache();
    colorFormat_ = colorFormat;
    extent_ = extent;

    depthFormat_ = vkutil::findDepthFormat(physicalDevice_);
    if (depthFormat_ == VK_FORMAT_UNDEFINED) {
        spdlog::error("SceneComposer: no supported depth attachment format");
        return false;
    }
    if (depthFormat_ != VK_FORMAT_D32_SFLOAT) {
        spdlog::warn("SceneComposer: D32_SFLOAT unavailable, using depth format {}", static_cast<int>(depthFormat_));
    }

    if (!createStaticMeshes(vk)) return false;
    if (!createFrameResources()) return false;
    if (!createDepthTarget()) return false;
    if (!createPipelines()) return false;

    ready_ = true;
    spdlog::info("SceneComposer ready ({}x{}, colour format {}, depth format {})",
                 extent_.width, extent_.height, static_cast<int>(colorFormat_), static_cast<int>(depthFormat_));
    return true;
}

void SceneComposer::shutdown() {
    if (!device_) return;
    destroyPipelines();
    destroyDepthTarget();
    for (auto& frame : frames_) {
        vkutil::destroyMappedBuffer(device_, frame.cameraUbo);
        vkutil::destroyMappedBuffer(device_, frame.gridUbo);
        vkutil::destroyMappedBuffer(device_, frame.markerVbo);
        frame.cameraSet = VK_NULL_HANDLE;
        frame.gridSet = VK_NULL_HANDLE;
        frame.markerCount = 0;
    }
    descriptors_.shutdown();
    if (cameraSetLayout_) { vkDestroyDescriptorSetLayout(device_, cameraSetLayout_, nullptr); cameraSetLayout_ = VK_NULL_HANDLE; }
    if (gridSetLayout_) { vkDestroyDescriptorSetLayout(device_, gridSetLayout_, nullptr); gridSetLayout_ = VK_NULL_HANDLE; }
    vkutil::destroyBuffer(device_, cubeVertexBuffer_, cubeVertexMemory_);
    vkutil::destroyBuffer(device_, cubeIndexBuffer_, cubeIndexMemory_);
    vkutil::destroyBuffer(device_, axesVertexBuffer_, axesVertexMemory_);
    ready_ = false;
    device_ = VK_NULL_HANDLE;
}

bool SceneComposer::resize(VkExtent2D extent, VkFormat colorFormat) {
    if (extent.width == 0 || extent.height == 0) {
        spdlog::debug("SceneComposer: ignoring zero-sized resize");
        return true;
    }
    extent_ = extent;
    destroyDepthTarget();
    if (!createDepthTarget()) return false;

    if (colorFormat != colorFormat_) {
        spdlog::info("SceneComposer: colour format changed {} -> {}, rebuilding pipelines",
                     static_cast<int>(colorFormat_), static_cast<int>(colorFormat));
        colorFormat_ = colorFormat;
        destroyPipelines();
        if (!createPipelines()) return false;
    }
    return true;
}

void SceneComposer::updateFrame(uint32_t slot, const math::Camera& camera, const GridLod& lod) {
    if (!ready_ || slot >= kFramesInFlight) return;
    FrameResources& frame = frames_[slot];

    const CameraUniform cameraData = makeCameraUniform(camera);
    std::memcpy(frame.cameraUbo.mapped, &cameraData, sizeof(cameraData));

    const GridUniform gridData = makeGridUniform(camera, lod);
    std::memcpy(frame.gridUbo.mapped, &gridData, sizeof(gridData));

    const std::vector<LineVertex> markers = buildTargetMarkers(camera.target);
    frame.markerCount = static_cast<uint32_t>(markers.size());
    if (!markers.empty()) {
        std::memcpy(frame.markerVbo.mapped, markers.data(), markers.size() * sizeof(LineVertex));
    }
}

void SceneComposer::buildFrameGraph(uint32_t slot) {
    FrameResources& frame = frames_[slot];
    frameGraph_.beginFrame();

    frameGraph_.addPass("Cube", core::PassState::opaque(), [this, &frame](VkCommandBuffer cb) {
        VkDeviceSize offset = 0;
        vkCmdBindPipeline(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, cubePipeline_.handle);
        vkCmdBindDescriptorSets(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, cubePipeline_.layout,
                                0, 1, &frame.cameraSet, 0, nullptr);
        vkCmdBindVertexBuffers(cb, 0, 1, &cubeVertexBuffer_, &offset);
        vkCmdBindIndexBuffer(cb, cubeIndexBuffer_, 0, VK_INDEX_TYPE_UINT16);
        vkCmdDrawIndexed(cb, cubeIndexCount_, 1, 0, 0, 0);
    });

    frameGraph_.addPass("Axes", core::PassState::opaque(), [this, &frame](VkCommandBuffer cb) {
        VkDeviceSize offset = 0;
        vkCmdBindPipeline(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, linePipeline_.handle);
        vkCmdBindDescriptorSets(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, linePipeline_.layout,
                                0, 1, &frame.cameraSet, 0, nullptr);
        vkCmdBindVertexBuffers(cb, 0, 1, &axesVertexBuffer_, &offset);
        vkCmdDraw(cb, axesVertexCount_, 1, 0, 0);
    });

    // Shares the line pipeline and descriptor set bound by Axes.
    if (frame.markerCount > 0) {
        frameGraph_.addPass("DebugMarkers", core::PassState::opaque(), [&frame](VkCommandBuffer cb) {
            VkDeviceSize offset = 0;
            vkCmdBindVertexBuffers(cb, 0, 1, &frame.markerVbo.buffer, &offset);
            vkCmdDraw(cb, frame.markerCount, 1, 0, 0);
        });
    }

    frameGraph_.addPass("Grid", core::PassState::transparentOverlay(), [this, &frame](VkCommandBuffer cb) {
        vkCmdBindPipeline(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, gridPipeline_.handle);
        vkCmdBindDescriptorSets(cb, VK_PIPELINE_BIND_POINT_GRAPHICS, gridPipeline_.layout,
                                0, 1, &frame.gridSet, 0, nullptr);
        vkCmdDraw(cb, 3, 1, 0, 0);
    });
}

bool SceneComposer::record(VkCommandBuffer cb, uint32_t slot, VkImage targetImage, VkImageView targetView) {
    if (!ready_ || slot >= kFramesInFlight) return false;

    buildFrameGraph(slot);
    if (!frameGraph_.validate()) {
        frameGraph_.endFrame();
        return false;
    }

    vkutil::imageBarrier(cb, targetImage, VK_IMAGE_ASPECT_COLOR_BIT,
                         VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                         0, VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT,
                         VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
                         VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT);
    // The depth target is shared by both frame slots; order against the previous frame's writes.
    vkutil::imageBarrier(cb, depthImage_, depthAspect(depthFormat_),
                         VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL,
                         VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
                         VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
                         VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT,
                         VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT);

    VkRenderingAttachmentInfo colorAttachment{};
    colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    colorAttachment.imageView = targetView;
    colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    colorAttachment.clearValue.color = kClearColor;

    VkRenderingAttachmentInfo depthAttachment{};
    depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    depthAttachment.imageView = depthView_;
    depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    depthAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depthAttachment.clearValue.depthStencil = {kClearDepth, 0};

    VkRenderingInfo renderingInfo{};
    renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
    renderingInfo.renderArea = {{0, 0}, extent_};
    renderingInfo.layerCount = 1;
    renderingInfo.colorAttachmentCount = 1;
    renderingInfo.pColorAttachments = &colorAttachment;
    renderingInfo.pDepthAttachment = &depthAttachment;

    vkCmdBeginRendering(cb, &renderingInfo);

    VkViewport viewport{};
    viewport.x = 0.0f;
    viewport.y = 0.0f;
    viewport.width = static_cast<float>(extent_.width);
    viewport.height = static_cast<float>(extent_.height);
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(cb, 0, 1, &viewport);

    VkRect2D scissor{};
    scissor.offset = {0, 0};
    scissor.extent = extent_;
    vkCmdSetScissor(cb, 0, 1, &scissor);

    frameGraph_.execute(cb);

    vkCmdEndRendering(cb);
    frameGraph_.endFrame();

    vkutil::imageBarrier(cb, targetImage, VK_IMAGE_ASPECT_COLOR_BIT,
                         VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                         VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT, 0,
                         VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
                         VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT);
    return true;
}

bool SceneComposer::createStaticMeshes(platform::VulkanContext& vk) {
    const CubeGeometry cube = buildCube();
    const std::vector<LineVertex> axes = buildAxes();
    cubeIndexCount_ = static_cast<uint32_t>(cube.indices.size());
    axesVertexCount_ = static_cast<uint32_t>(axes.size());

    const VkDeviceSize cubeVertexBytes = sizeof(glm::vec3) * cube.vertices.size();
    const VkDeviceSize cubeIndexBytes = sizeof(uint16_t) * cube.indices.size();
    const VkDeviceSize axesBytes = sizeof(LineVertex) * axes.size();

    const VkBufferUsageFlags dst = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    if (!vkutil::allocateBuffer(device_, physicalDevice_, cubeVertexBytes,
                                VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | dst,
                                VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                                cubeVertexBuffer_, cubeVertexMemory_)) {
        return false;
    }
    if (!vkutil::allocateBuffer(device_, physicalDevice_, cubeIndexBytes,
                                VK_BUFFER_USAGE_INDEX_BUFFER_BIT | dst,
                                VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                                cubeIndexBuffer_, cubeIndexMemory_)) {
        return false;
    }
    if (!vkutil::allocateBuffer(device_, physicalDevice_, axesBytes,
                                VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | dst,
                                VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                                axesVertexBuffer_, axesVertexMemory_)) {
        return false;
    }

    core::UploadContext uploader;
    if (!uploader.init(vk)) {
        spdlog::error("SceneComposer failed to initialise upload context");
        uploader.shutdown();
        return false;
    }
    const bool uploaded = uploader.uploadBuffer(cube.vertices.data(), cubeVertexBytes, cubeVertexBuffer_) &&
                          uploader.uploadBuffer(cube.indices.data(), cubeIndexBytes, cubeIndexBuffer_) &&
                          uploader.uploadBuffer(axes.data(), axesBytes, axesVertexBuffer_);
    uploader.shutdown();
    if (!uploaded) {
        spdlog::error("SceneComposer failed to upload static meshes");
        return false;
    }
    return true;
}

bool SceneComposer::createFrameResources() {
    const std::vector<VkDescriptorPoolSize> poolSizes = {
        VkDescriptorPoolSize{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 2 * kFramesInFlight},
    };
    if (!descriptors_.init(device_, poolSizes, 2 * kFramesInFlight)) {
        return false;
    }
    cameraSetLayout_ = descriptors_.createUniformLayout(1, VK_SHADER_STAGE_VERTEX_BIT);
    gridSetLayout_ = descriptors_.createUniformLayout(1, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT);
    if (!cameraSetLayout_ || !gridSetLayout_) {
        return false;
    }

    for (uint32_t i = 0; i < kFramesInFlight; ++i) {
        FrameResources& frame = frames_[i];
        if (!vkutil::createMappedBuffer(device_, physicalDevice_, sizeof(CameraUniform),
                                        VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, frame.cameraUbo) ||
            !vkutil::createMappedBuffer(device_, physicalDevice_, sizeof(GridUniform),
                                        VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, frame.gridUbo) ||
            !vkutil::createMappedBuffer(device_, physicalDevice_, sizeof(LineVertex) * kMaxMarkerVertices,
                                        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, frame.markerVbo)) {
            spdlog::error("SceneComposer: failed to create buffers for frame slot {}", i);
            return false;
        }

        frame.cameraSet = descriptors_.allocate(cameraSetLayout_);
        frame.gridSet = descriptors_.allocate(gridSetLayout_);
        if (!frame.cameraSet || !frame.gridSet) {
            spdlog::error("SceneComposer: failed to allocate descriptor sets for frame slot {}", i);
            return false;
        }
        descriptors_.writeUniform(frame.cameraSet, 0, frame.cameraUbo.buffer, sizeof(CameraUniform));
        descriptors_.writeUniform(frame.gridSet, 0, frame.gridUbo.buffer, sizeof(GridUniform));
    }
    return true;
}

bool SceneComposer::createDepthTarget() {
    if (!vkutil::createImage2D(device_, physicalDevice_, extent_, depthFormat_,
                               VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                               depthAspect(depthFormat_),
                               depthImage_, depthMemory_, depthView_)) {
        spdlog::error("SceneComposer: failed to create {}x{} depth target", extent_.width, extent_.height);
        return false;
    }
    return true;
}

void SceneComposer::destroyDepthTarget() {
    vkutil::destroyImage(device_, depthImage_, depthMemory_, depthView_);
}

bool SceneComposer::createPipelines() {
    const PipelineDesc cube{"cube", "cube.vert.spv", "cube.frag.spv",
                            VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST, VertexLayout::Position,
                            core::PassState::opaque(), cameraSetLayout_};
    const PipelineDesc lines{"lines", "lines.vert.spv", "lines.frag.spv",
                             VK_PRIMITIVE_TOPOLOGY_LINE_LIST, VertexLayout::PositionColor,
                             core::PassState::opaque(), cameraSetLayout_};
    const PipelineDesc grid{"grid", "grid.vert.spv", "grid.frag.spv",
                            VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST, VertexLayout::None,
                            core::PassState::transparentOverlay(), gridSetLayout_};
    return createPipeline(cube, cubePipeline_) &&
           createPipeline(lines, linePipeline_) &&
           createPipeline(grid, gridPipeline_);
}

void SceneComposer::destroyPipelines() {
    for (Pipeline* p : {&cubePipeline_, &linePipeline_, &gridPipeline_}) {
        if (p->handle) { vkDestroyPipeline(device_, p->handle, nullptr); p->handle = VK_NULL_HANDLE; }
        if (p->layout) { vkDestroyPipelineLayout(device_, p->layout, nullptr); p->layout = VK_NULL_HANDLE; }
    }
}

bool SceneComposer::createPipeline(const PipelineDesc& desc, Pipeline& out) {
    VkShaderModule vs = vkutil::loadShaderModule(device_, desc.vertShader);
    VkShaderModule fs = vkutil::loadShaderModule(device_, desc.fragShader);
    if (!vs || !fs) {
        if (vs) vkDestroyShaderModule(device_, vs, nullptr);
        if (fs) vkDestroyShaderModule(device_, fs, nullptr);
        spdlog::error("SceneComposer: missing shaders for '{}' pipeline", desc.name);
        return false;
    }

    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vs;
    stages[0].pName = "main";
    stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = fs;
    stages[1].pName = "main";

    VkVertexInputBindingDescription binding{};
    binding.binding = 0;
    binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    VkVertexInputAttributeDescription attrs[2]{};
    uint32_t attrCount = 0;
    switch (desc.vertexLayout) {
    case VertexLayout::None:
        break;
    case VertexLayout::Position:
        binding.stride = sizeof(glm::vec3);
        attrs[0] = {0, 0, VK_FORMAT_R32G32B32_SFLOAT, 0};
        attrCount = 1;
        break;
    case VertexLayout::PositionColor:
        binding.stride = sizeof(LineVertex);
        attrs[0] = {0, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(LineVertex, position))};
        attrs[1] = {1, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(LineVertex, color))};
        attrCount = 2;
        break;
    }

    VkPipelineVertexInputStateCreateInfo vi{};
    vi.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    if (attrCount > 0) {
        vi.vertexBindingDescriptionCount = 1;
        vi.pVertexBindingDescriptions = &binding;
        vi.vertexAttributeDescriptionCount = attrCount;
        vi.pVertexAttributeDescriptions = attrs;
    }

    VkPipelineInputAssemblyStateCreateInfo ia{};
    ia.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    ia.topology = desc.topology;

    VkPipelineViewportStateCreateInfo vp{};
    vp.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    vp.viewportCount = 1;
    vp.scissorCount = 1;

    VkDynamicState dynamicStates[2] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dyn{};
    dyn.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dyn.dynamicStateCount = 2;
    dyn.pDynamicStates = dynamicStates;

    VkPipelineRasterizationStateCreateInfo rs{};
    rs.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rs.polygonMode = VK_POLYGON_MODE_FILL;
    rs.cullMode = VK_CULL_MODE_NONE;
    rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    rs.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo ms{};
    ms.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineDepthStencilStateCreateInfo ds{};
    ds.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    ds.depthTestEnable = desc.state.depthTest ? VK_TRUE : VK_FALSE;
    ds.depthWriteEnable = desc.state.depthWrite ? VK_TRUE : VK_FALSE;
    ds.depthCompareOp = toVkCompare(desc.state.compare);

    VkPipelineColorBlendAttachmentState blend{};
    blend.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                           VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    if (desc.state.blend == core::BlendMode::Alpha) {
        blend.blendEnable = VK_TRUE;
        blend.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        blend.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        blend.colorBlendOp = VK_BLEND_OP_ADD;
        blend.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        blend.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        blend.alphaBlendOp = VK_BLEND_OP_ADD;
    }

    VkPipelineColorBlendStateCreateInfo cb{};
    cb.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    cb.attachmentCount = 1;
    cb.pAttachments = &blend;

    VkPipelineLayoutCreateInfo plci{};
    plci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    plci.setLayoutCount = 1;
    plci.pSetLayouts = &desc.setLayout;
    if (vkCreatePipelineLayout(device_, &plci, nullptr, &out.layout) != VK_SUCCESS) {
        vkDestroyShaderModule(device_, vs, nullptr);
        vkDestroyShaderModule(device_, fs, nullptr);
        spdlog::error("SceneComposer: failed to create '{}' pipeline layout", desc.name);
        return false;
    }

    VkPipelineRenderingCreateInfo renderingInfo{};
    renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingInfo.colorAttachmentCount = 1;
    renderingInfo.pColorAttachmentFormats = &colorFormat_;
    renderingInfo.depthAttachmentFormat = depthFormat_;

    VkGraphicsPipelineCreateInfo gpci{};
    gpci.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    gpci.pNext = &renderingInfo;
    gpci.stageCount = 2;
    gpci.pStages = stages;
    gpci.pVertexInputState = &vi;
    gpci.pInputAssemblyState = &ia;
    gpci.pViewportState = &vp;
    gpci.pRasterizationState = &rs;
    gpci.pMultisampleState = &ms;
    gpci.pDepthStencilState = &ds;
    gpci.pColorBlendState = &cb;
    gpci.pDynamicState = &dyn;
    gpci.layout = out.layout;

    VkResult res = vkCreateGraphicsPipelines(device_, pipelineCache_, 1, &gpci, nullptr, &out.handle);

    vkDestroyShaderModule(device_, vs, nullptr);
    vkDestroyShaderModule(device_, fs, nullptr);

    if (res != VK_SUCCESS) {
        spdlog::error("SceneComposer failed to create '{}' pipeline ({})", desc.name, static_cast<int>(res));
        out.handle = VK_NULL_HANDLE;
        return false;
    }
    spdlog::debug("SceneComposer: '{}' pipeline ready (depth {} write {}, blend {})",
                  desc.name, core::to_string(desc.state.compare),
                  desc.state.depthWrite ? "on" : "off",
                  desc.state.transparent() ? "alpha" : "replace");
    return true;
}

} // namespace render
