#include "Window.h"

#include <volk.h>
#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace platform {

static void glfwErrorCallback(int code, const char* desc) {
    spdlog::error("[glfw] error {}: {}", code, desc ? desc : "(null)");
}

static Window* fromHandle(GLFWwindow* win) {
    return static_cast<Window*>(glfwGetWindowUserPointer(win));
}

bool Window::create(int w, int h, const char* title) {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        spdlog::error("[glfw] glfwInit failed");
        return false;
    }
    if (!glfwVulkanSupported()) {
        spdlog::error("[glfw] Vulkan loader not found");
        glfwTerminate();
        return false;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_DECORATED, GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window_ = glfwCreateWindow(w, h, title, nullptr, nullptr);
    if (!window_) {
        spdlog::error("[glfw] failed to create {}x{} window", w, h);
        glfwTerminate();
        return false;
    }
    width_ = w; height_ = h;
    glfwSetWindowUserPointer(window_, this);

    glfwSetCursorPosCallback(window_, [](GLFWwindow* win, double x, double y) {
        Window* self = fromHandle(win);
        if (self && self->hooks_.onCursorPos) self->hooks_.onCursorPos(x, y);
    });
    glfwSetCursorEnterCallback(window_, [](GLFWwindow* win, int entered) {
        Window* self = fromHandle(win);
        if (self && self->hooks_.onCursorEnter) self->hooks_.onCursorEnter(entered == GLFW_TRUE);
    });
    glfwSetMouseButtonCallback(window_, [](GLFWwindow* win, int button, int action, int mods) {
        Window* self = fromHandle(win);
        if (self && self->hooks_.onMouseButton) self->hooks_.onMouseButton(button, action, mods);
    });
    glfwSetScrollCallback(window_, [](GLFWwindow* win, double xoff, double yoff) {
        Window* self = fromHandle(win);
        if (self && self->hooks_.onScroll) self->hooks_.onScroll(xoff, yoff);
    });
    glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int sc, int action, int mods) {
        (void)sc;
        Window* self = fromHandle(win);
        if (self && self->hooks_.onKey) self->hooks_.onKey(key, action, mods);
    });
    glfwSetFramebufferSizeCallback(window_, [](GLFWwindow* win, int fbw, int fbh) {
        Window* self = fromHandle(win);
        if (!self) return;
        glfwGetWindowSize(win, &self->width_, &self->height_);
        if (self->hooks_.onFramebufferResize) self->hooks_.onFramebufferResize(fbw, fbh);
    });
    return true;
}

void Window::poll() {
    if (window_) glfwPollEvents();
}

void Window::waitEvents() {
    if (window_) glfwWaitEvents();
}

void Window::destroy() {
    if (window_) { glfwDestroyWindow(window_); window_ = nullptr; }
    glfwTerminate();
}

bool Window::createSurface(VkInstance instance, VkSurfaceKHR* outSurface) const {
    if (!window_) return false;
    VkSurfaceKHR surf = VK_NULL_HANDLE;
    VkResult res = glfwCreateWindowSurface(instance, window_, nullptr, &surf);
    if (res != VK_SUCCESS) {
        spdlog::error("[glfw] glfwCreateWindowSurface failed: {}", static_cast<int>(res));
        return false;
    }
    *outSurface = surf;
    return true;
}

void Window::getRequiredInstanceExtensions(std::vector<const char*>& outExts) {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (names && count > 0) {
        for (uint32_t i=0;i<count;++i) outExts.push_back(names[i]);
    }
}

void Window::setTitle(const char* title) {
    if (window_) glfwSetWindowTitle(window_, title);
}

void Window::requestClose() {
    if (window_) glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void Window::framebufferSize(uint32_t& outWidth, uint32_t& outHeight) const {
    int fbw = 0, fbh = 0;
    if (window_) glfwGetFramebufferSize(window_, &fbw, &fbh);
    outWidth = static_cast<uint32_t>(fbw > 0 ? fbw : 0);
    outHeight = static_cast<uint32_t>(fbh > 0 ? fbh : 0);
}

bool Window::shouldClose() const { return window_ && glfwWindowShouldClose(window_); }

} // namespace platform
