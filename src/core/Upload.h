#pragma once

#include <cstdint>

#include <volk.h>

namespace platform { class VulkanContext; }

// Upload — staging copies into device-local buffers on the graphics queue.
//
// Each upload waits for its copy to finish, so callers may free the source memory
// as soon as the call returns. Intended for the one-time static mesh uploads.
namespace core {
class UploadContext {
public:
    bool init(platform::VulkanContext& vk, VkDeviceSize initialStagingBytes = 64 * 1024);
    bool uploadBuffer(const void* data, VkDeviceSize bytes, VkBuffer dstBuffer);
    bool uploadBufferRegion(const void* data, VkDeviceSize bytes, VkBuffer dstBuffer, VkDeviceSize dstOffset);
    void flush();
    void shutdown();

private:
    bool ensureStagingCapacity(VkDeviceSize bytes);

    platform::VulkanContext* vk_ = nullptr;
    VkQueue queue_ = VK_NULL_HANDLE;
    uint32_t queueFamily_ = 0;
    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer_ = VK_NULL_HANDLE;
    VkFence fence_ = VK_NULL_HANDLE;
    VkBuffer stagingBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory stagingMemory_ = VK_NULL_HANDLE;
    VkDeviceSize stagingCapacity_ = 0;
    VkDeviceSize minCapacity_ = 0;
    bool deviceLost_ = false;
};
}
