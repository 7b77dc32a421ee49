#include "Swapchain.h"
#include <volk.h>
#include <vector>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace platform {

namespace {

bool supportsColorAttachment(VkPhysicalDevice phys, VkFormat fmt) {
    VkFormatProperties props{};
    vkGetPhysicalDeviceFormatProperties(phys, fmt, &props);
    return (props.optimalTilingFeatures & VK_FORMAT_FEATURE_COLOR_ATTACHMENT_BIT) != 0;
}

bool selectSurfaceFormat(VkPhysicalDevice phys,
                         const std::vector<VkSurfaceFormatKHR>& fmts,
                         VkSurfaceFormatKHR& chosen) {
    if (fmts.size() == 1 && fmts[0].format == VK_FORMAT_UNDEFINED) {
        chosen.format = VK_FORMAT_B8G8R8A8_SRGB;
        chosen.colorSpace = fmts[0].colorSpace;
        return true;
    }

    auto tryPick = [&](VkFormat fmt, VkColorSpaceKHR cs) -> bool {
        for (auto& f : fmts) {
            if (f.format != fmt || f.colorSpace != cs) continue;
            if (!supportsColorAttachment(phys, f.format)) continue;
            chosen = f;
            return true;
        }
        return false;
    };

    const VkColorSpaceKHR desiredCS = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;

    // sRGB targets so the shaders can output linear colour.
    if (tryPick(VK_FORMAT_B8G8R8A8_SRGB, desiredCS)) return true;
    if (tryPick(VK_FORMAT_R8G8B8A8_SRGB, desiredCS)) return true;
    if (tryPick(VK_FORMAT_B8G8R8A8_UNORM, desiredCS)) return true;
    if (tryPick(VK_FORMAT_R8G8B8A8_UNORM, desiredCS)) return true;

    for (auto& f : fmts) {
        if (!supportsColorAttachment(phys, f.format)) continue;
        chosen = f;
        return true;
    }
    return false;
}

VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync) {
    if (!vsync) {
        for (auto m : modes) if (m == VK_PRESENT_MODE_MAILBOX_KHR) return m;
        for (auto m : modes) if (m == VK_PRESENT_MODE_IMMEDIATE_KHR) return m;
    }
    return VK_PRESENT_MODE_FIFO_KHR; // always available
}

} // namespace

bool Swapchain::create(const SwapchainCreateInfo& info) {
    return build(info, VK_NULL_HANDLE);
}

bool Swapchain::build(const SwapchainCreateInfo& info, VkSwapchainKHR oldSwapchain) {
    // The retired swapchain is released on every exit path, after its replacement exists.
    struct RetiredSwapchain {
        VkDevice device;
        VkSwapchainKHR handle;
        ~RetiredSwapchain() { if (device && handle) vkDestroySwapchainKHR(device, handle, nullptr); }
    } retired{info.device, oldSwapchain};

    if (!info.device || !info.surface || !info.physicalDevice) return false;
    VkSurfaceCapabilitiesKHR caps{};
    if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(info.physicalDevice, info.surface, &caps) != VK_SUCCESS) {
        spdlog::error("[swapchain] Failed to query surface capabilities");
        return false;
    }
    uint32_t fmtCount=0; vkGetPhysicalDeviceSurfaceFormatsKHR(info.physicalDevice, info.surface, &fmtCount, nullptr);
    std::vector<VkSurfaceFormatKHR> fmts(fmtCount);
    if (fmtCount > 0) {
        vkGetPhysicalDeviceSurfaceFormatsKHR(info.physicalDevice, info.surface, &fmtCount, fmts.data());
    }
    uint32_t pmCount=0; vkGetPhysicalDeviceSurfacePresentModesKHR(info.physicalDevice, info.surface, &pmCount, nullptr);
    std::vector<VkPresentModeKHR> pms(pmCount); vkGetPhysicalDeviceSurfacePresentModesKHR(info.physicalDevice, info.surface, &pmCount, pms.data());

    if (fmts.empty()) {
        spdlog::error("[swapchain] No surface formats reported by the driver.");
        return false;
    }
    VkSurfaceFormatKHR fmt{};
    if (!selectSurfaceFormat(info.physicalDevice, fmts, fmt)) {
        spdlog::error("[swapchain] No surface format supports colour attachment usage.");
        return false;
    }
    auto pmode = choosePresentMode(pms, info.vsync);

    VkExtent2D extent{};
    if (caps.currentExtent.width != UINT32_MAX) extent = caps.currentExtent; else {
        extent.width = std::clamp<uint32_t>(info.width, caps.minImageExtent.width, caps.maxImageExtent.width);
        extent.height= std::clamp<uint32_t>(info.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }
    if (extent.width == 0 || extent.height == 0) {
        spdlog::debug("[swapchain] Surface is zero-sized; not building");
        return false;
    }
    uint32_t imageCount = caps.minImageCount + 1; if (caps.maxImageCount > 0 && imageCount > caps.maxImageCount) imageCount = caps.maxImageCount;

    VkSwapchainCreateInfoKHR sci{};
    sci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    sci.surface = info.surface;
    sci.minImageCount = imageCount;
    sci.imageFormat = fmt.format;
    sci.imageColorSpace = fmt.colorSpace;
    sci.imageExtent = extent;
    sci.imageArrayLayers = 1;
    sci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    uint32_t indices[2] = { info.graphicsQueueFamily, info.presentQueueFamily };
    if (info.graphicsQueueFamily != info.presentQueueFamily) {
        sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        sci.queueFamilyIndexCount = 2; sci.pQueueFamilyIndices = indices;
    } else {
        sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }
    sci.preTransform = caps.currentTransform;
    sci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    sci.presentMode = pmode;
    sci.clipped = VK_TRUE;
    sci.oldSwapchain = oldSwapchain;

    VkSwapchainKHR created = VK_NULL_HANDLE;
    VkResult res = vkCreateSwapchainKHR(info.device, &sci, nullptr, &created);
    if (res != VK_SUCCESS) {
        spdlog::error("[swapchain] vkCreateSwapchainKHR failed: {}", static_cast<int>(res));
        return false;
    }
    swapchain_ = created;
    format_ = fmt.format;
    extent_ = extent;

    // Retrieve images and create views
    uint32_t count=0; vkGetSwapchainImagesKHR(info.device, swapchain_, &count, nullptr);
    images_.resize(count); vkGetSwapchainImagesKHR(info.device, swapchain_, &count, images_.data());
    imageViews_.assign(count, VK_NULL_HANDLE);
    for (uint32_t i=0;i<count;++i) {
        VkImageViewCreateInfo vci{};
        vci.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vci.image = images_[i];
        vci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        vci.format = fmt.format;
        vci.components = { VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY };
        vci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.levelCount = 1; vci.subresourceRange.layerCount = 1;
        if (vkCreateImageView(info.device, &vci, nullptr, &imageViews_[i]) != VK_SUCCESS) {
            spdlog::error("[swapchain] vkCreateImageView failed for image {}", i);
            return false;
        }
    }
    spdlog::debug("[swapchain] {}x{}, {} images, format {}, present mode {}",
                  extent.width, extent.height, count,
                  static_cast<int>(fmt.format), static_cast<int>(pmode));
    return true;
}

void Swapchain::destroyViews(VkDevice device) {
    for (VkImageView view : imageViews_) if (view) vkDestroyImageView(device, view, nullptr);
    imageViews_.clear();
    images_.clear();
}

void Swapchain::destroy(VkDevice device) {
    destroyViews(device);
    if (swapchain_) { vkDestroySwapchainKHR(device, swapchain_, nullptr); swapchain_ = VK_NULL_HANDLE; }
}

bool Swapchain::resize(const SwapchainCreateInfo& info) {
    destroyViews(info.device);
    VkSwapchainKHR old = swapchain_;
    swapchain_ = VK_NULL_HANDLE;
    return build(info, old);
}

} // namespace platform
