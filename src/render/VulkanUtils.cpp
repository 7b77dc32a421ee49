#include "VulkanUtils.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <spdlog/spdlog.h>

namespace render::vkutil {

uint32_t findMemoryType(VkPhysicalDevice phys,
                        uint32_t typeBits,
                        VkMemoryPropertyFlags flags) {
    VkPhysicalDeviceMemoryProperties props{};
    vkGetPhysicalDeviceMemoryProperties(phys, &props);
    for (uint32_t i = 0; i < props.memoryTypeCount; ++i) {
        const bool supported = (typeBits & (1u << i)) != 0;
        const bool matchesFlags = (props.memoryTypes[i].propertyFlags & flags) == flags;
        if (supported && matchesFlags) {
            return i;
        }
    }
    return UINT32_MAX;
}

bool allocateBuffer(VkDevice device,
                    VkPhysicalDevice phys,
                    VkDeviceSize size,
                    VkBufferUsageFlags usage,
                    VkMemoryPropertyFlags flags,
                    VkBuffer& outBuf,
                    VkDeviceMemory& outMem) {
    VkBufferCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    createInfo.size = size;
    createInfo.usage = usage;
    createInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    if (vkCreateBuffer(device, &createInfo, nullptr, &outBuf) != VK_SUCCESS) {
        spdlog::error("vkCreateBuffer failed (size={} usage=0x{:x})",
                      static_cast<unsigned long long>(size),
                      static_cast<unsigned int>(usage));
        outBuf = VK_NULL_HANDLE;
        outMem = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryRequirements requirements{};
    vkGetBufferMemoryRequirements(device, outBuf, &requirements);
    uint32_t typeIndex = findMemoryType(phys, requirements.memoryTypeBits, flags);
    if (typeIndex == UINT32_MAX) {
        spdlog::error("No compatible memory type for buffer allocation (flags=0x{:x})",
                      static_cast<unsigned int>(flags));
        vkDestroyBuffer(device, outBuf, nullptr);
        outBuf = VK_NULL_HANDLE;
        outMem = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = requirements.size;
    allocInfo.memoryTypeIndex = typeIndex;
    if (vkAllocateMemory(device, &allocInfo, nullptr, &outMem) != VK_SUCCESS) {
        spdlog::error("vkAllocateMemory failed (size={} type={})",
                      static_cast<unsigned long long>(requirements.size),
                      typeIndex);
        vkDestroyBuffer(device, outBuf, nullptr);
        outBuf = VK_NULL_HANDLE;
        outMem = VK_NULL_HANDLE;
        return false;
    }

    if (vkBindBufferMemory(device, outBuf, outMem, 0) != VK_SUCCESS) {
        spdlog::error("vkBindBufferMemory failed (size={})", static_cast<unsigned long long>(size));
        destroyBuffer(device, outBuf, outMem);
        return false;
    }
    return true;
}

bool createMappedBuffer(VkDevice device,
                        VkPhysicalDevice phys,
                        VkDeviceSize size,
                        VkBufferUsageFlags usage,
                        MappedBuffer& out) {
    if (!allocateBuffer(device, phys, size, usage,
                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                        out.buffer, out.memory)) {
        return false;
    }
    if (vkMapMemory(device, out.memory, 0, size, 0, &out.mapped) != VK_SUCCESS || !out.mapped) {
        spdlog::error("vkMapMemory failed (size={})", static_cast<unsigned long long>(size));
        destroyBuffer(device, out.buffer, out.memory);
        out.mapped = nullptr;
        return false;
    }
    out.size = size;
    return true;
}

void destroyMappedBuffer(VkDevice device, MappedBuffer& buffer) {
    if (buffer.mapped && buffer.memory != VK_NULL_HANDLE) {
        vkUnmapMemory(device, buffer.memory);
    }
    buffer.mapped = nullptr;
    buffer.size = 0;
    destroyBuffer(device, buffer.buffer, buffer.memory);
}

void destroyBuffer(VkDevice device, VkBuffer& buffer, VkDeviceMemory& memory) {
    if (buffer != VK_NULL_HANDLE) {
        vkDestroyBuffer(device, buffer, nullptr);
        buffer = VK_NULL_HANDLE;
    }
    if (memory != VK_NULL_HANDLE) {
        vkFreeMemory(device, memory, nullptr);
        memory = VK_NULL_HANDLE;
    }
}

bool createImage2D(VkDevice device,
                   VkPhysicalDevice phys,
                   VkExtent2D extent,
                   VkFormat format,
                   VkImageUsageFlags usage,
                   VkImageAspectFlags aspectMask,
                   VkImage& outImage,
                   VkDeviceMemory& outMemory,
                   VkImageView& outView) {
    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.format = format;
    imageInfo.extent = { extent.width, extent.height, 1 };
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateImage(device, &imageInfo, nullptr, &outImage) != VK_SUCCESS) {
        spdlog::error("vkCreateImage failed ({}x{}, fmt={})",
                      extent.width,
                      extent.height,
                      static_cast<int>(format));
        outImage = VK_NULL_HANDLE;
        outMemory = VK_NULL_HANDLE;
        outView = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryRequirements mr{};
    vkGetImageMemoryRequirements(device, outImage, &mr);
    uint32_t typeIndex = findMemoryType(phys, mr.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (typeIndex == UINT32_MAX) {
        spdlog::error("No compatible memory type for image (fmt={})", static_cast<int>(format));
        vkDestroyImage(device, outImage, nullptr);
        outImage = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = mr.size;
    allocInfo.memoryTypeIndex = typeIndex;
    if (vkAllocateMemory(device, &allocInfo, nullptr, &outMemory) != VK_SUCCESS) {
        spdlog::error("vkAllocateMemory failed for image ({} bytes)", static_cast<unsigned long long>(mr.size));
        vkDestroyImage(device, outImage, nullptr);
        outImage = VK_NULL_HANDLE;
        outMemory = VK_NULL_HANDLE;
        return false;
    }

    if (vkBindImageMemory(device, outImage, outMemory, 0) != VK_SUCCESS) {
        spdlog::error("vkBindImageMemory failed ({}x{})", extent.width, extent.height);
        vkFreeMemory(device, outMemory, nullptr);
        vkDestroyImage(device, outImage, nullptr);
        outMemory = VK_NULL_HANDLE;
        outImage = VK_NULL_HANDLE;
        outView = VK_NULL_HANDLE;
        return false;
    }

    VkImageViewCreateInfo viewInfo{};
    viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewInfo.image = outImage;
    viewInfo.format = format;
    viewInfo.subresourceRange.aspectMask = aspectMask;
    viewInfo.subresourceRange.levelCount = 1;
    viewInfo.subresourceRange.layerCount = 1;

    if (vkCreateImageView(device, &viewInfo, nullptr, &outView) != VK_SUCCESS) {
        spdlog::error("vkCreateImageView failed");
        vkFreeMemory(device, outMemory, nullptr);
        vkDestroyImage(device, outImage, nullptr);
        outMemory = VK_NULL_HANDLE;
        outImage = VK_NULL_HANDLE;
        outView = VK_NULL_HANDLE;
        return false;
    }

    return true;
}

void destroyImage(VkDevice device, VkImage& image, VkDeviceMemory& memory, VkImageView& view) {
    if (view != VK_NULL_HANDLE) {
        vkDestroyImageView(device, view, nullptr);
        view = VK_NULL_HANDLE;
    }
    if (image != VK_NULL_HANDLE) {
        vkDestroyImage(device, image, nullptr);
        image = VK_NULL_HANDLE;
    }
    if (memory != VK_NULL_HANDLE) {
        vkFreeMemory(device, memory, nullptr);
        memory = VK_NULL_HANDLE;
    }
}

VkFormat findDepthFormat(VkPhysicalDevice phys) {
    const VkFormat candidates[] = {
        VK_FORMAT_D32_SFLOAT,
        VK_FORMAT_D24_UNORM_S8_UINT,
        VK_FORMAT_D16_UNORM,
    };
    for (VkFormat fmt : candidates) {
        VkFormatProperties props{};
        vkGetPhysicalDeviceFormatProperties(phys, fmt, &props);
        if (props.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) {
            return fmt;
        }
    }
    return VK_FORMAT_UNDEFINED;
}

bool hasStencil(VkFormat format) {
    return format == VK_FORMAT_D24_UNORM_S8_UINT || format == VK_FORMAT_D32_SFLOAT_S8_UINT ||
           format == VK_FORMAT_D16_UNORM_S8_UINT;
}

std::string shaderDirectory() {
    const char* envAssets = std::getenv("KYZU_ASSETS_DIR");
    const char* assetsDir = (envAssets && envAssets[0] != '\0') ? envAssets :
#ifdef KYZU_ASSETS_DIR
        KYZU_ASSETS_DIR;
#else
        "assets";
#endif
    return std::string(assetsDir) + "/shaders/";
}

std::vector<uint32_t> readSpirv(const std::string& path) {
    struct FileCloser {
        void operator()(FILE* f) const noexcept { if (f) std::fclose(f); }
    };
    FILE* raw = std::fopen(path.c_str(), "rb");
    if (!raw) {
        const int err = errno;
        spdlog::error("Failed to open shader {}: {}", path, std::strerror(err));
        return {};
    }
    std::unique_ptr<FILE, FileCloser> file(raw);
    if (std::fseek(file.get(), 0, SEEK_END) != 0) {
        const int err = errno;
        spdlog::error("Failed to seek shader {}: {}", path, std::strerror(err));
        return {};
    }
    const long end = std::ftell(file.get());
    if (end < 0 || std::fseek(file.get(), 0, SEEK_SET) != 0) {
        const int err = errno;
        spdlog::error("Failed to size shader {}: {}", path, std::strerror(err));
        return {};
    }
    const size_t size = static_cast<size_t>(end);
    if (size == 0 || (size % sizeof(uint32_t)) != 0u) {
        spdlog::error("Shader {} has invalid byte size {}", path, size);
        return {};
    }
    std::vector<uint32_t> words(size / sizeof(uint32_t));
    const size_t read = std::fread(words.data(), 1, size, file.get());
    if (read != size) {
        spdlog::error("Short read on shader {} (expected {} bytes, got {})", path, size, read);
        return {};
    }
    return words;
}

VkShaderModule loadShaderModule(VkDevice device, const char* relPath) {
    const std::string fullPath = shaderDirectory() + relPath;
    std::vector<uint32_t> words = readSpirv(fullPath);
    if (words.empty()) return VK_NULL_HANDLE;
    VkShaderModuleCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = words.size() * sizeof(uint32_t);
    ci.pCode = words.data();
    VkShaderModule module = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device, &ci, nullptr, &module) != VK_SUCCESS) {
        spdlog::error("Failed to create shader module {}", fullPath);
        return VK_NULL_HANDLE;
    }
    return module;
}

void imageBarrier(VkCommandBuffer cb,
                  VkImage image,
                  VkImageAspectFlags aspect,
                  VkImageLayout oldLayout,
                  VkImageLayout newLayout,
                  VkAccessFlags srcAccess,
                  VkAccessFlags dstAccess,
                  VkPipelineStageFlags srcStage,
                  VkPipelineStageFlags dstStage) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.srcAccessMask = srcAccess;
    barrier.dstAccessMask = dstAccess;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange.aspectMask = aspect;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.layerCount = 1;
    vkCmdPipelineBarrier(cb, srcStage, dstStage, 0,
                         0, nullptr,
                         0, nullptr,
                         1, &barrier);
}

} // namespace render::vkutil
