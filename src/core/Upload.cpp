#include "Upload.h"

#include <algorithm>
#include <cstring>

#include "platform/VulkanContext.h"
#include "render/VulkanUtils.h"
#include <spdlog/spdlog.h>

namespace core {

bool UploadContext::init(platform::VulkanContext& vk, VkDeviceSize initialStagingBytes) {
    vk_ = &vk;
    minCapacity_ = std::max<VkDeviceSize>(initialStagingBytes, 256);
    queue_ = vk.graphicsQueue();
    queueFamily_ = vk.graphicsFamily();

    VkCommandPoolCreateInfo cpci{};
    cpci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    cpci.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    cpci.queueFamilyIndex = queueFamily_;
    if (vkCreateCommandPool(vk.device(), &cpci, nullptr, &commandPool_) != VK_SUCCESS) {
        spdlog::error("UploadContext: failed to create command pool");
        return false;
    }

    VkCommandBufferAllocateInfo cbai{};
    cbai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cbai.commandPool = commandPool_;
    cbai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cbai.commandBufferCount = 1;
    if (vkAllocateCommandBuffers(vk.device(), &cbai, &commandBuffer_) != VK_SUCCESS) {
        spdlog::error("UploadContext: failed to allocate command buffer");
        return false;
    }

    VkFenceCreateInfo fci{};
    fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    if (vkCreateFence(vk.device(), &fci, nullptr, &fence_) != VK_SUCCESS) {
        spdlog::error("UploadContext: failed to create fence");
        return false;
    }

    return ensureStagingCapacity(minCapacity_);
}

bool UploadContext::ensureStagingCapacity(VkDeviceSize bytes) {
    VkDeviceSize required = std::max(bytes, minCapacity_);
    if (stagingBuffer_ && stagingCapacity_ >= required) {
        return true;
    }

    render::vkutil::destroyBuffer(vk_->device(), stagingBuffer_, stagingMemory_);

    VkDeviceSize newCapacity = stagingCapacity_ == 0 ? required : std::max(required, stagingCapacity_ * 2);
    if (!render::vkutil::allocateBuffer(vk_->device(), vk_->physicalDevice(), newCapacity,
                                        VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                        stagingBuffer_, stagingMemory_)) {
        spdlog::error("UploadContext: failed to create staging buffer ({} bytes)", static_cast<uint64_t>(newCapacity));
        stagingCapacity_ = 0;
        return false;
    }

    stagingCapacity_ = newCapacity;
    spdlog::debug("UploadContext: staging buffer -> {} bytes (requested {})",
                  static_cast<uint64_t>(stagingCapacity_), static_cast<uint64_t>(bytes));
    return true;
}

bool UploadContext::uploadBuffer(const void* data, VkDeviceSize bytes, VkBuffer dstBuffer) {
    return uploadBufferRegion(data, bytes, dstBuffer, 0);
}

void UploadContext::flush() {
    if (queue_ != VK_NULL_HANDLE && vk_ && !deviceLost_) {
        vkQueueWaitIdle(queue_);
    }
}

bool UploadContext::uploadBufferRegion(const void* data,
                                       VkDeviceSize bytes,
                                       VkBuffer dstBuffer,
                                       VkDeviceSize dstOffset) {
    if (bytes == 0 || dstBuffer == VK_NULL_HANDLE) {
        return true;
    }
    if (deviceLost_) {
        spdlog::error("UploadContext: device lost, skipping buffer upload ({} bytes)", static_cast<uint64_t>(bytes));
        return false;
    }

    if (!ensureStagingCapacity(bytes)) {
        return false;
    }

    void* mapped = nullptr;
    if (vkMapMemory(vk_->device(), stagingMemory_, 0, bytes, 0, &mapped) != VK_SUCCESS || mapped == nullptr) {
        spdlog::error("UploadContext: failed to map staging memory");
        return false;
    }
    std::memcpy(mapped, data, static_cast<std::size_t>(bytes));
    vkUnmapMemory(vk_->device(), stagingMemory_);

    vkResetCommandPool(vk_->device(), commandPool_, 0);
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(commandBuffer_, &bi);
    VkBufferCopy region{};
    region.srcOffset = 0;
    region.dstOffset = dstOffset;
    region.size = bytes;
    vkCmdCopyBuffer(commandBuffer_, stagingBuffer_, dstBuffer, 1, &region);

    // Make the copy visible to vertex input for the first draw that uses it.
    VkMemoryBarrier toVertexInput{};
    toVertexInput.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
    toVertexInput.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    toVertexInput.dstAccessMask = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT | VK_ACCESS_INDEX_READ_BIT;
    vkCmdPipelineBarrier(commandBuffer_,
                         VK_PIPELINE_STAGE_TRANSFER_BIT,
                         VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
                         0,
                         1, &toVertexInput,
                         0, nullptr,
                         0, nullptr);
    if (vkEndCommandBuffer(commandBuffer_) != VK_SUCCESS) {
        spdlog::error("UploadContext: failed to record copy");
        return false;
    }

    VkSubmitInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.commandBufferCount = 1;
    si.pCommandBuffers = &commandBuffer_;
    VkResult submitRes = vkQueueSubmit(queue_, 1, &si, fence_);
    if (submitRes != VK_SUCCESS) {
        spdlog::error("UploadContext: vkQueueSubmit failed ({})", static_cast<int>(submitRes));
        deviceLost_ = (submitRes == VK_ERROR_DEVICE_LOST);
        return false;
    }

    VkResult waitRes = vkWaitForFences(vk_->device(), 1, &fence_, VK_TRUE, UINT64_MAX);
    if (waitRes != VK_SUCCESS) {
        spdlog::error("UploadContext: wait for fence after submit failed ({})", static_cast<int>(waitRes));
        deviceLost_ = (waitRes == VK_ERROR_DEVICE_LOST);
        return false;
    }
    vkResetFences(vk_->device(), 1, &fence_);
    spdlog::debug("UploadContext: copied {} bytes (queue family {})", static_cast<uint64_t>(bytes), queueFamily_);
    return true;
}

void UploadContext::shutdown() {
    if (!vk_) return;
    flush();
    render::vkutil::destroyBuffer(vk_->device(), stagingBuffer_, stagingMemory_);
    if (fence_) {
        vkDestroyFence(vk_->device(), fence_, nullptr);
        fence_ = VK_NULL_HANDLE;
    }
    if (commandPool_) {
        vkDestroyCommandPool(vk_->device(), commandPool_, nullptr);
        commandPool_ = VK_NULL_HANDLE;
    }
    commandBuffer_ = VK_NULL_HANDLE;
    queue_ = VK_NULL_HANDLE;
    stagingCapacity_ = 0;
    vk_ = nullptr;
    deviceLost_ = false;
}

}
