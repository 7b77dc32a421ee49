#pragma once

#include <cstdint>
#include <functional>
#include <vector>
typedef struct VkInstance_T* VkInstance;
typedef struct VkSurfaceKHR_T* VkSurfaceKHR;

struct GLFWwindow;

namespace platform {

// Event hooks fed from the GLFW callbacks of this window. Unset hooks are skipped.
struct WindowHooks {
    std::function<void(double x, double y)> onCursorPos;
    std::function<void(bool entered)> onCursorEnter;
    std::function<void(int button, int action, int mods)> onMouseButton;
    std::function<void(double xoff, double yoff)> onScroll;
    std::function<void(int key, int action, int mods)> onKey;
    std::function<void(int width, int height)> onFramebufferResize;
};

class Window {
public:
    bool create(int width = 1280, int height = 720, const char* title = "kyzu");
    void poll();
    // Block until an event arrives; used while the framebuffer is zero-sized.
    void waitEvents();
    void destroy();

    // Create a Vulkan surface for this window using the given instance.
    bool createSurface(VkInstance instance, VkSurfaceKHR* outSurface) const;

    // Get instance extensions required by GLFW for surface creation.
    static void getRequiredInstanceExtensions(std::vector<const char*>& outExts);

    WindowHooks& hooks() { return hooks_; }
    void setTitle(const char* title);
    void requestClose();

    // Framebuffer size in pixels (differs from window size on HiDPI displays).
    void framebufferSize(uint32_t& outWidth, uint32_t& outHeight) const;

    int width() const { return width_; }
    int height() const { return height_; }
    GLFWwindow* handle() const { return window_; }
    bool shouldClose() const;

private:
    GLFWwindow* window_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    WindowHooks hooks_;
};

} // namespace platform
