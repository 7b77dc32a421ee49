#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <volk.h>

namespace render::vkutil {

// Find a memory type index that satisfies the requested property flags.
uint32_t findMemoryType(VkPhysicalDevice phys,
                        uint32_t typeBits,
                        VkMemoryPropertyFlags flags);

// Create a VkBuffer and its backing VkDeviceMemory. Returns false on failure.
bool allocateBuffer(VkDevice device,
                    VkPhysicalDevice phys,
                    VkDeviceSize size,
                    VkBufferUsageFlags usage,
                    VkMemoryPropertyFlags flags,
                    VkBuffer& outBuf,
                    VkDeviceMemory& outMem);

// Host-visible, host-coherent buffer that stays mapped for its whole lifetime.
struct MappedBuffer {
    VkBuffer buffer = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    void* mapped = nullptr;
    VkDeviceSize size = 0;
};

bool createMappedBuffer(VkDevice device,
                        VkPhysicalDevice phys,
                        VkDeviceSize size,
                        VkBufferUsageFlags usage,
                        MappedBuffer& out);
void destroyMappedBuffer(VkDevice device, MappedBuffer& buffer);

// Destroy a buffer/memory pair and reset handles to VK_NULL_HANDLE.
void destroyBuffer(VkDevice device, VkBuffer& buffer, VkDeviceMemory& memory);

// Create a simple 2D image with an accompanying image view.
bool createImage2D(VkDevice device,
                   VkPhysicalDevice phys,
                   VkExtent2D extent,
                   VkFormat format,
                   VkImageUsageFlags usage,
                   VkImageAspectFlags aspectMask,
                   VkImage& outImage,
                   VkDeviceMemory& outMemory,
                   VkImageView& outView);

// Destroy a VkImage/VkImageView pair and their memory.
void destroyImage(VkDevice device, VkImage& image, VkDeviceMemory& memory, VkImageView& view);

// First of D32_SFLOAT, D24_UNORM_S8_UINT, D16_UNORM usable as a depth attachment;
// VK_FORMAT_UNDEFINED when none is.
VkFormat findDepthFormat(VkPhysicalDevice phys);
bool hasStencil(VkFormat format);

// Directory holding compiled shaders: $KYZU_ASSETS_DIR/shaders, else the build-time
// KYZU_ASSETS_DIR, else ./assets/shaders.
std::string shaderDirectory();

// Read a SPIR-V binary. Empty on any failure (logged).
std::vector<uint32_t> readSpirv(const std::string& path);

// Load `relPath` from shaderDirectory() into a shader module; VK_NULL_HANDLE on failure.
VkShaderModule loadShaderModule(VkDevice device, const char* relPath);

// Single-image layout transition on the whole colour or depth subresource.
void imageBarrier(VkCommandBuffer cb,
                  VkImage image,
                  VkImageAspectFlags aspect,
                  VkImageLayout oldLayout,
                  VkImageLayout newLayout,
                  VkAccessFlags srcAccess,
                  VkAccessFlags dstAccess,
                  VkPipelineStageFlags srcStage,
                  VkPipelineStageFlags dstStage);

} // namespace render::vkutil
