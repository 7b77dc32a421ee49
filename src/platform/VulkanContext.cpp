#include "VulkanContext.h"

#include <cstring>
#include <vector>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <volk.h>

namespace platform {

static bool hasLayer(const std::vector<VkLayerProperties>& layers, const char* name) {
    for (auto& l : layers) if (std::strcmp(l.layerName, name) == 0) return true;
    return false;
}
static bool hasExtension(const std::vector<VkExtensionProperties>& exts, const char* name) {
    for (auto& e : exts) if (std::strcmp(e.extensionName, name) == 0) return true;
    return false;
}

static VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT type,
    const VkDebugUtilsMessengerCallbackDataEXT* callbackData,
    void* userData) {
    (void)type; (void)userData;
    const char* msg = (callbackData && callbackData->pMessage) ? callbackData->pMessage : "(null)";
    if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        spdlog::error("[vulkan] {}", msg);
    } else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        spdlog::warn("[vulkan] {}", msg);
    } else {
        spdlog::debug("[vulkan] {}", msg);
    }
    return VK_FALSE;
}

bool VulkanContext::createInstance(const std::vector<const char*>& extraExts, bool enableValidation) {
    if (volkInitialize() != VK_SUCCESS) {
        spdlog::error("[vk] Vulkan loader not available");
        return false;
    }

    uint32_t apiVer = 0;
    vkEnumerateInstanceVersion(&apiVer);
    if (apiVer < VK_API_VERSION_1_3) {
        spdlog::error("[vk] Instance version {}.{} is below the required 1.3",
                      VK_API_VERSION_MAJOR(apiVer), VK_API_VERSION_MINOR(apiVer));
        return false;
    }

    // Instance layers and extensions
    std::vector<const char*> layers;
    std::vector<const char*> exts;
    for (auto* e : extraExts) exts.push_back(e);
    if (enableValidation) {
        uint32_t lc = 0; vkEnumerateInstanceLayerProperties(&lc, nullptr);
        std::vector<VkLayerProperties> avail(lc); vkEnumerateInstanceLayerProperties(&lc, avail.data());
        if (hasLayer(avail, "VK_LAYER_KHRONOS_validation")) {
            layers.push_back("VK_LAYER_KHRONOS_validation");
        } else {
            spdlog::warn("[vk] Validation requested but VK_LAYER_KHRONOS_validation is not installed");
        }
        uint32_t ec = 0; vkEnumerateInstanceExtensionProperties(nullptr, &ec, nullptr);
        std::vector<VkExtensionProperties> instExts(ec); vkEnumerateInstanceExtensionProperties(nullptr, &ec, instExts.data());
        if (hasExtension(instExts, VK_EXT_DEBUG_UTILS_EXTENSION_NAME)) exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    VkApplicationInfo appInfo{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
    appInfo.pApplicationName = "kyzu";
    appInfo.apiVersion = VK_API_VERSION_1_3;

    VkInstanceCreateInfo ci{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
    ci.pApplicationInfo = &appInfo;
    ci.enabledLayerCount = static_cast<uint32_t>(layers.size());
    ci.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();
    ci.enabledExtensionCount = static_cast<uint32_t>(exts.size());
    ci.ppEnabledExtensionNames = exts.empty() ? nullptr : exts.data();

    VkResult res = vkCreateInstance(&ci, nullptr, &instance_);
    if (res != VK_SUCCESS) {
        spdlog::error("[vk] vkCreateInstance failed: {}", static_cast<int>(res));
        return false;
    }

    volkLoadInstance(instance_);
    return true;
}

void VulkanContext::setupDebugMessenger(bool enableValidation) {
    if (!enableValidation) return;
    VkDebugUtilsMessengerCreateInfoEXT info{ VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT };
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = debugCallback;
    auto pfnCreate = (PFN_vkCreateDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT");
    if (pfnCreate) {
        if (pfnCreate(instance_, &info, nullptr, &debugMessenger_) != VK_SUCCESS) {
            spdlog::warn("[vk] Debug messenger unavailable; validation output goes to the loader");
            debugMessenger_ = nullptr;
        }
    }
}

bool VulkanContext::pickPhysicalDevice(VkSurfaceKHR surface) {
    uint32_t count = 0; vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (count == 0) {
        spdlog::error("[vk] No Vulkan physical devices found");
        return false;
    }
    std::vector<VkPhysicalDevice> devs(count);
    vkEnumeratePhysicalDevices(instance_, &count, devs.data());

    // Score devices: prefer discrete, then integrated.
    auto scoreDevice = [&](VkPhysicalDevice pd) -> int {
        VkPhysicalDeviceProperties props; vkGetPhysicalDeviceProperties(pd, &props);
        int score = 0;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) score += 1000;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) score += 500;
        return score;
    };
    std::sort(devs.begin(), devs.end(), [&](auto a, auto b){ return scoreDevice(a) > scoreDevice(b); });

    for (auto pd : devs) {
        VkPhysicalDeviceProperties props; vkGetPhysicalDeviceProperties(pd, &props);
        if (props.apiVersion < VK_API_VERSION_1_3) {
            spdlog::debug("[vk] Skipping '{}': Vulkan 1.3 not supported", props.deviceName);
            continue;
        }

        VkPhysicalDeviceFeatures2 feats2{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
        VkPhysicalDeviceVulkan13Features v13{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES };
        feats2.pNext = &v13;
        vkGetPhysicalDeviceFeatures2(pd, &feats2);
        if (!v13.dynamicRendering) {
            spdlog::debug("[vk] Skipping '{}': dynamicRendering not supported", props.deviceName);
            continue;
        }

        if (surface) {
            uint32_t ec = 0; vkEnumerateDeviceExtensionProperties(pd, nullptr, &ec, nullptr);
            std::vector<VkExtensionProperties> avail(ec);
            vkEnumerateDeviceExtensionProperties(pd, nullptr, &ec, avail.data());
            if (!hasExtension(avail, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) {
                spdlog::debug("[vk] Skipping '{}': no swapchain support", props.deviceName);
                continue;
            }
        }

        // Query queue families
        uint32_t qCount = 0; vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, nullptr);
        std::vector<VkQueueFamilyProperties> qprops(qCount);
        vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, qprops.data());
        QueueFamilies qf{};
        for (uint32_t i=0;i<qCount;++i) {
            const bool graphics = (qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
            VkBool32 presentSupported = VK_FALSE;
            if (surface) vkGetPhysicalDeviceSurfaceSupportKHR(pd, i, surface, &presentSupported);
            // A family that does both avoids a queue ownership transfer at present time.
            if (graphics && presentSupported) { qf.graphics = i; qf.present = i; break; }
            if (graphics && !qf.graphics) qf.graphics = i;
            if (presentSupported && !qf.present) qf.present = i;
        }
        if (!qf.complete(surface != nullptr)) {
            spdlog::debug("[vk] Skipping '{}': no graphics/present queue", props.deviceName);
            continue;
        }

        physicalDevice_ = pd;
        queueFamilies_ = qf;
        deviceInfo_.apiVersion = props.apiVersion;
        deviceInfo_.name = props.deviceName;
        deviceInfo_.discrete = props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;
        deviceInfo_.hasDynamicRendering = true;
        spdlog::info("[vk] Using '{}' (Vulkan {}.{}.{}, graphics family {}, present family {})",
                     deviceInfo_.name,
                     VK_API_VERSION_MAJOR(props.apiVersion),
                     VK_API_VERSION_MINOR(props.apiVersion),
                     VK_API_VERSION_PATCH(props.apiVersion),
                     qf.graphics.value(), presentFamily());
        return true;
    }
    spdlog::error("[vk] No physical device with Vulkan 1.3 dynamic rendering and presentation");
    return false;
}

bool VulkanContext::createDevice(VkSurfaceKHR surface) {
    std::vector<const char*> devExts;
    if (surface) devExts.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

    // Features chain
    VkPhysicalDeviceFeatures2 feats2{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
    VkPhysicalDeviceVulkan13Features v13{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES };
    v13.dynamicRendering = VK_TRUE;
    feats2.pNext = &v13;

    // Queues
    float prio = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> qcis;
    std::vector<uint32_t> uniqIdx = { graphicsFamily(), presentFamily() };
    std::sort(uniqIdx.begin(), uniqIdx.end());
    uniqIdx.erase(std::unique(uniqIdx.begin(), uniqIdx.end()), uniqIdx.end());
    for (uint32_t idx : uniqIdx) {
        VkDeviceQueueCreateInfo qci{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        qci.queueFamilyIndex = idx;
        qci.queueCount = 1;
        qci.pQueuePriorities = &prio;
        qcis.push_back(qci);
    }

    VkDeviceCreateInfo dci{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
    dci.pNext = &feats2;
    dci.queueCreateInfoCount = static_cast<uint32_t>(qcis.size());
    dci.pQueueCreateInfos = qcis.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(devExts.size());
    dci.ppEnabledExtensionNames = devExts.empty() ? nullptr : devExts.data();

    VkResult res = vkCreateDevice(physicalDevice_, &dci, nullptr, &device_);
    if (res != VK_SUCCESS) {
        spdlog::error("[vk] vkCreateDevice failed: {}", static_cast<int>(res));
        return false;
    }
    volkLoadDevice(device_);

    vkGetDeviceQueue(device_, graphicsFamily(), 0, &graphicsQueue_);
    vkGetDeviceQueue(device_, presentFamily(), 0, &presentQueue_);
    return true;
}

bool VulkanContext::createCommandPool() {
    VkCommandPoolCreateInfo ci{ VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
    ci.queueFamilyIndex = graphicsFamily();
    ci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    if (vkCreateCommandPool(device_, &ci, nullptr, &commandPool_) != VK_SUCCESS) {
        spdlog::error("[vk] vkCreateCommandPool failed");
        return false;
    }
    return true;
}

bool VulkanContext::createPipelineCache() {
    VkPipelineCacheCreateInfo ci{ VK_STRUCTURE_TYPE_PIPELINE_CACHE_CREATE_INFO };
    if (vkCreatePipelineCache(device_, &ci, nullptr, &pipelineCache_) != VK_SUCCESS) {
        spdlog::warn("[vk] vkCreatePipelineCache failed; pipelines built uncached");
        pipelineCache_ = nullptr;
    }
    return true;
}

void VulkanContext::destroyDebugMessenger() {
    if (!debugMessenger_) return;
    auto pfnDestroy = (PFN_vkDestroyDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT");
    if (pfnDestroy) pfnDestroy(instance_, debugMessenger_, nullptr);
    debugMessenger_ = nullptr;
}

bool VulkanContext::initInstance(const std::vector<const char*>& extraExts, bool enableValidation) {
    if (!createInstance(extraExts, enableValidation)) return false;
    setupDebugMessenger(enableValidation);
    return true;
}

bool VulkanContext::initDevice(VkSurfaceKHR surface) {
    if (!pickPhysicalDevice(surface)) return false;
    if (!createDevice(surface)) return false;
    if (!createCommandPool()) return false;
    return createPipelineCache();
}

void VulkanContext::shutdown() {
    if (device_) {
        vkDeviceWaitIdle(device_);
        if (pipelineCache_) { vkDestroyPipelineCache(device_, pipelineCache_, nullptr); pipelineCache_ = nullptr; }
        if (commandPool_) { vkDestroyCommandPool(device_, commandPool_, nullptr); commandPool_ = nullptr; }
        vkDestroyDevice(device_, nullptr); device_ = nullptr;
    }
    destroyDebugMessenger();
    if (instance_) { vkDestroyInstance(instance_, nullptr); instance_ = nullptr; }
}

} // namespace platform
