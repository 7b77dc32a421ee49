#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <optional>

// Forward declare Vulkan handles to avoid hard dependency in headers
// Include <volk.h> in the .cpp to define them.
typedef struct VkInstance_T* VkInstance;
typedef struct VkDebugUtilsMessengerEXT_T* VkDebugUtilsMessengerEXT;
typedef struct VkPhysicalDevice_T* VkPhysicalDevice;
typedef struct VkDevice_T* VkDevice;
typedef struct VkQueue_T* VkQueue;
typedef struct VkCommandPool_T* VkCommandPool;
typedef struct VkPipelineCache_T* VkPipelineCache;
typedef struct VkSurfaceKHR_T* VkSurfaceKHR;

namespace platform {

struct QueueFamilies {
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present; // when a surface is provided
    bool complete(bool needPresent) const {
        return graphics.has_value() && (!needPresent || present.has_value());
    }
};

struct DeviceInfo {
    uint32_t apiVersion = 0;
    std::string name;
    bool discrete = false;
    bool hasDynamicRendering = false;
};

class VulkanContext {
public:
    bool initInstance(const std::vector<const char*>& extraInstanceExts, bool enableValidation = true);
    bool initDevice(VkSurfaceKHR surface = nullptr);
    void shutdown();

    // Accessors
    VkInstance       instance() const { return instance_; }
    VkDebugUtilsMessengerEXT debugMessenger() const { return debugMessenger_; }
    VkPhysicalDevice physicalDevice() const { return physicalDevice_; }
    VkDevice         device() const { return device_; }
    VkQueue          graphicsQueue() const { return graphicsQueue_; }
    VkQueue          presentQueue() const { return presentQueue_; }
    uint32_t         graphicsFamily() const { return queueFamilies_.graphics.value(); }
    uint32_t         presentFamily() const { return queueFamilies_.present.value_or(queueFamilies_.graphics.value()); }
    VkCommandPool    commandPool() const { return commandPool_; }
    VkPipelineCache  pipelineCache() const { return pipelineCache_; }
    const DeviceInfo& deviceInfo() const { return deviceInfo_; }
    const std::string& deviceName() const { return deviceInfo_.name; }

private:
    bool createInstance(const std::vector<const char*>& extraExts, bool enableValidation);
    void setupDebugMessenger(bool enableValidation);
    bool pickPhysicalDevice(VkSurfaceKHR surface);
    bool createDevice(VkSurfaceKHR surface);
    bool createCommandPool();
    bool createPipelineCache();
    void destroyDebugMessenger();

private:
    VkInstance instance_ = nullptr;
    VkDebugUtilsMessengerEXT debugMessenger_ = nullptr;
    VkPhysicalDevice physicalDevice_ = nullptr;
    VkDevice device_ = nullptr;
    QueueFamilies queueFamilies_{};
    VkQueue graphicsQueue_ = nullptr;
    VkQueue presentQueue_ = nullptr;
    VkCommandPool commandPool_ = nullptr;
    VkPipelineCache pipelineCache_ = nullptr;
    DeviceInfo deviceInfo_{};
};

} // namespace platform
