#pragma once

#include <cstdint>
#include <vector>
#include <volk.h>

namespace platform {

struct SwapchainCreateInfo {
    VkDevice device{};
    VkSurfaceKHR surface{};
    VkPhysicalDevice physicalDevice{};
    uint32_t graphicsQueueFamily = 0;
    uint32_t presentQueueFamily = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    bool vsync = true;
};

class Swapchain {
public:
    bool create(const SwapchainCreateInfo&);
    void destroy(VkDevice device);
    // Rebuilds at the new size, handing the old swapchain to the driver for reuse.
    bool resize(const SwapchainCreateInfo& info);

    VkSwapchainKHR handle() const { return swapchain_; }
    VkImageView imageView(uint32_t i) const { return imageViews_[i]; }
    uint32_t imageCount() const { return static_cast<uint32_t>(images_.size()); }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    VkImage image(uint32_t i) const { return images_[i]; }

private:
    bool build(const SwapchainCreateInfo& info, VkSwapchainKHR oldSwapchain);
    void destroyViews(VkDevice device);

    VkSwapchainKHR swapchain_{};
    VkFormat format_{};
    VkExtent2D extent_{};
    std::vector<VkImage> images_{};
    std::vector<VkImageView> imageViews_{};
};

} // namespace platform
