#include "App.h"
#include "Input.h"
#include "platform/VulkanContext.h"
#if KYZU_ENABLE_WINDOW
#include "platform/Window.h"
#include "platform/Swapchain.h"
#include "render/SceneComposer.h"
#include "app/CameraController.h"
#include "app/FrameStages.h"
#include "app/InputMapper.h"
#include "app/Overlay.h"
#include "app/Viewport.h"
#include "render/GridLod.h"
#endif

#include <volk.h>
#include <vector>
#include <chrono>
#include <spdlog/spdlog.h>

namespace app {

#if KYZU_ENABLE_WINDOW
namespace {

constexpr uint64_t kTitleInterval = 30;
constexpr uint64_t kOverlayLogInterval = 120;

struct FrameSync {
    VkSemaphore imageAvailable = VK_NULL_HANDLE;
    VkFence inFlight = VK_NULL_HANDLE;
};

enum class AcquireResult { Ready, Skip, Fatal };

class Runtime {
public:
    explicit Runtime(const ViewerConfig& config)
        : config_(config), viewport_(controller_, config.width, config.height) {}

    int run();

private:
    bool initialize();
    bool initWindowAndDevice();
    bool initFrameResources();
    bool createPresentSemaphores();
    void destroyPresentSemaphores();
    void mainLoop();
    void shutdown();

    bool waitOnFence(VkFence fence);
    AcquireResult acquireSwapImage(FrameSync& frame, uint32_t& imageIndex);
    bool recreateSwapchain();
    bool recordFrame(VkCommandBuffer cb, uint32_t imageIndex);
    bool submitFrame(FrameSync& frame, VkCommandBuffer cb, uint32_t imageIndex);
    bool presentFrame(uint32_t imageIndex);
    void updateStatus(const render::GridLod& lod, float frameMs);

    platform::SwapchainCreateInfo swapchainInfo() const;

private:
    ViewerConfig config_;
    platform::VulkanContext vk_;
    platform::Window window_;
    platform::Swapchain swap_;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    render::SceneComposer composer_;
    Input input_;
    CameraController controller_;
    Viewport viewport_;
    FrameStageTracker stages_;

    std::vector<VkCommandBuffer> commandBuffers_;
    std::vector<FrameSync> frames_;
    // Indexed by swapchain image: a present may still be reading the previous one.
    std::vector<VkSemaphore> renderFinished_;
    std::vector<VkFence> imagesInFlight_;

    uint32_t currentFrame_ = 0u;
    std::chrono::steady_clock::time_point lastTime_{};
};

} // namespace
#endif

int App::run(const ViewerConfig& config) {
#if KYZU_ENABLE_WINDOW
    Runtime runtime(config);
    return runtime.run();
#else
    platform::VulkanContext vk;
    if (!vk.initInstance({}, config.enableValidation)) return 1;
    if (!vk.initDevice(VK_NULL_HANDLE)) {
        vk.shutdown();
        return 1;
    }
    spdlog::info("Headless build: device '{}' is usable, no window to open", vk.deviceName());
    vk.shutdown();
    return 0;
#endif
}

#if KYZU_ENABLE_WINDOW

int Runtime::run() {
    if (!initialize()) {
        shutdown();
        return 1;
    }
    mainLoop();
    const bool clean = window_.shouldClose();
    shutdown();
    return clean ? 0 : 1;
}

bool Runtime::initialize() {
    if (!initWindowAndDevice()) {
        return false;
    }
    if (!composer_.init(vk_, swap_.format(), swap_.extent())) {
        spdlog::error("Scene composer initialisation failed");
        return false;
    }
    if (!initFrameResources()) {
        return false;
    }
    input_.initialize(window_);
    window_.hooks().onFramebufferResize = [this](int w, int h) {
        viewport_.requestResize(static_cast<uint32_t>(w > 0 ? w : 0), static_cast<uint32_t>(h > 0 ? h : 0));
    };
    lastTime_ = std::chrono::steady_clock::now();
    return true;
}

bool Runtime::initWindowAndDevice() {
    if (!window_.create(static_cast<int>(config_.width), static_cast<int>(config_.height), "kyzu")) {
        spdlog::error("Window creation failed");
        return false;
    }

    uint32_t fbw = 0, fbh = 0;
    window_.framebufferSize(fbw, fbh);
    viewport_.requestResize(fbw, fbh);
    viewport_.consumeDirty();
    spdlog::info("Window created ({}x{}, framebuffer {}x{})", window_.width(), window_.height(), fbw, fbh);

    std::vector<const char*> instanceExts;
    platform::Window::getRequiredInstanceExtensions(instanceExts);
    if (!vk_.initInstance(instanceExts, config_.enableValidation)) {
        spdlog::error("Vulkan instance initialisation failed");
        return false;
    }

    if (!window_.createSurface(vk_.instance(), &surface_)) {
        spdlog::error("Surface creation failed");
        return false;
    }

    if (!vk_.initDevice(surface_)) {
        spdlog::error("Device initialisation failed");
        return false;
    }

    if (!swap_.create(swapchainInfo())) {
        spdlog::error("Swapchain creation failed");
        return false;
    }
    spdlog::info("Swapchain ready ({}x{}, {} images)", swap_.extent().width, swap_.extent().height, swap_.imageCount());
    return true;
}

platform::SwapchainCreateInfo Runtime::swapchainInfo() const {
    platform::SwapchainCreateInfo sci{};
    sci.device = vk_.device();
    sci.physicalDevice = vk_.physicalDevice();
    sci.surface = surface_;
    sci.graphicsQueueFamily = vk_.graphicsFamily();
    sci.presentQueueFamily = vk_.presentFamily();
    sci.width = viewport_.extent().width;
    sci.height = viewport_.extent().height;
    return sci;
}

bool Runtime::initFrameResources() {
    const uint32_t framesInFlight = render::SceneComposer::kFramesInFlight;

    commandBuffers_.resize(framesInFlight);
    VkCommandBufferAllocateInfo cbai{};
    cbai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cbai.commandPool = vk_.commandPool();
    cbai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cbai.commandBufferCount = framesInFlight;
    if (vkAllocateCommandBuffers(vk_.device(), &cbai, commandBuffers_.data()) != VK_SUCCESS) {
        spdlog::error("Failed to allocate command buffers");
        commandBuffers_.clear();
        return false;
    }

    frames_.assign(framesInFlight, FrameSync{});
    VkSemaphoreCreateInfo sci{};
    sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    VkFenceCreateInfo fci{};
    fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    for (auto& frame : frames_) {
        if (vkCreateSemaphore(vk_.device(), &sci, nullptr, &frame.imageAvailable) != VK_SUCCESS ||
            vkCreateFence(vk_.device(), &fci, nullptr, &frame.inFlight) != VK_SUCCESS) {
            spdlog::error("Failed to create per-frame synchronization primitives");
            return false;
        }
    }
    currentFrame_ = 0;
    return createPresentSemaphores();
}

bool Runtime::createPresentSemaphores() {
    renderFinished_.assign(swap_.imageCount(), VK_NULL_HANDLE);
    imagesInFlight_.assign(swap_.imageCount(), VK_NULL_HANDLE);
    VkSemaphoreCreateInfo sci{};
    sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    for (auto& sem : renderFinished_) {
        if (vkCreateSemaphore(vk_.device(), &sci, nullptr, &sem) != VK_SUCCESS) {
            spdlog::error("Failed to create present semaphores");
            return false;
        }
    }
    return true;
}

void Runtime::destroyPresentSemaphores() {
    for (VkSemaphore sem : renderFinished_) {
        if (sem) vkDestroySemaphore(vk_.device(), sem, nullptr);
    }
    renderFinished_.clear();
    imagesInFlight_.clear();
}

void Runtime::mainLoop() {
    while (!window_.shouldClose()) {
        window_.poll();
        if (viewport_.minimized()) {
            window_.waitEvents();
            continue;
        }
        if (viewport_.consumeDirty()) {
            if (!recreateSwapchain()) {
                break;
            }
            if (viewport_.minimized()) {
                continue;
            }
        }

        // An out-of-order stage is a logic error; stop the viewer instead of presenting it.
        stages_.beginFrame();
        FrameSync& frame = frames_[currentFrame_];
        if (!waitOnFence(frame.inFlight)) {
            break;
        }

        uint32_t imageIndex = 0;
        const AcquireResult acquired = acquireSwapImage(frame, imageIndex);
        if (acquired == AcquireResult::Fatal) {
            break;
        }
        if (acquired == AcquireResult::Skip) {
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        const float frameMs = std::chrono::duration<float, std::milli>(now - lastTime_).count();
        lastTime_ = now;

        const InputState& input = input_.state();
        if (input.anyDelta() || input.scroll != 0.0f) {
            const CameraDelta delta = controller_.mutate([&](math::Camera& cam) {
                return applyInput(input, cam, config_.input);
            });
            if (delta.any()) {
                spdlog::trace("Camera input: orbit={} pan={} zoom={}", delta.orbited, delta.panned, delta.zoomed);
            }
        }
        if (!stages_.advance(FrameStage::CameraUpdated)) {
            break;
        }

        const CameraSnapshot snapshot = controller_.snapshot();
        const render::GridLod lod = render::deriveGridLod(snapshot.camera, config_.grid);
        composer_.updateFrame(currentFrame_, snapshot.camera, lod);
        if (!stages_.advance(FrameStage::UniformsUploaded)) {
            break;
        }

        VkCommandBuffer cb = commandBuffers_[currentFrame_];
        if (!recordFrame(cb, imageIndex)) {
            break;
        }
        if (!stages_.advance(FrameStage::Recorded)) {
            break;
        }

        if (!submitFrame(frame, cb, imageIndex)) {
            break;
        }
        if (!stages_.advance(FrameStage::Submitted)) {
            break;
        }

        if (!presentFrame(imageIndex)) {
            break;
        }
        if (!stages_.advance(FrameStage::Presented)) {
            break;
        }

        input_.endFrame();
        updateStatus(lod, frameMs);
        currentFrame_ = (currentFrame_ + 1) % render::SceneComposer::kFramesInFlight;
    }
}

void Runtime::shutdown() {
    if (vk_.device()) {
        vkDeviceWaitIdle(vk_.device());
    }
    if (!commandBuffers_.empty() && vk_.device()) {
        vkFreeCommandBuffers(vk_.device(), vk_.commandPool(), static_cast<uint32_t>(commandBuffers_.size()), commandBuffers_.data());
    }
    commandBuffers_.clear();

    if (vk_.device()) {
        for (auto& frame : frames_) {
            if (frame.imageAvailable) vkDestroySemaphore(vk_.device(), frame.imageAvailable, nullptr);
            if (frame.inFlight) vkDestroyFence(vk_.device(), frame.inFlight, nullptr);
        }
        destroyPresentSemaphores();
    }
    frames_.clear();

    composer_.shutdown();
    if (vk_.device()) {
        swap_.destroy(vk_.device());
    }
    if (surface_ && vk_.instance()) {
        vkDestroySurfaceKHR(vk_.instance(), surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    vk_.shutdown();
    window_.destroy();
    spdlog::info("Shutdown complete after {} frames", stages_.completedFrames());
}

bool Runtime::waitOnFence(VkFence fence) {
    if (fence == VK_NULL_HANDLE) {
        return true;
    }
    VkResult res = vkWaitForFences(vk_.device(), 1, &fence, VK_TRUE, UINT64_MAX);
    if (res != VK_SUCCESS) {
        spdlog::error("vkWaitForFences failed ({})", static_cast<int>(res));
        return false;
    }
    return true;
}

AcquireResult Runtime::acquireSwapImage(FrameSync& frame, uint32_t& imageIndex) {
    VkResult acquireRes = vkAcquireNextImageKHR(vk_.device(), swap_.handle(), UINT64_MAX,
                                                frame.imageAvailable, VK_NULL_HANDLE, &imageIndex);
    if (acquireRes == VK_ERROR_OUT_OF_DATE_KHR) {
        spdlog::debug("Swapchain out of date on acquire; recreating");
        if (!recreateSwapchain()) {
            return AcquireResult::Fatal;
        }
        if (viewport_.minimized()) {
            return AcquireResult::Skip;
        }
        acquireRes = vkAcquireNextImageKHR(vk_.device(), swap_.handle(), UINT64_MAX,
                                           frame.imageAvailable, VK_NULL_HANDLE, &imageIndex);
    }
    if (acquireRes == VK_SUBOPTIMAL_KHR) {
        viewport_.markDirty();
    } else if (acquireRes != VK_SUCCESS) {
        spdlog::error("vkAcquireNextImageKHR failed ({})", static_cast<int>(acquireRes));
        return AcquireResult::Fatal;
    }
    if (imageIndex < imagesInFlight_.size() && imagesInFlight_[imageIndex] != VK_NULL_HANDLE) {
        if (!waitOnFence(imagesInFlight_[imageIndex])) {
            spdlog::error("Failed to wait on image fence");
            return AcquireResult::Fatal;
        }
    }
    if (imageIndex < imagesInFlight_.size()) {
        imagesInFlight_[imageIndex] = frame.inFlight;
    }

    if (vkResetFences(vk_.device(), 1, &frame.inFlight) != VK_SUCCESS) {
        spdlog::error("vkResetFences failed");
        return AcquireResult::Fatal;
    }
    return AcquireResult::Ready;
}

bool Runtime::recreateSwapchain() {
    uint32_t fbw = 0, fbh = 0;
    window_.framebufferSize(fbw, fbh);
    if (fbw == 0 || fbh == 0) {
        viewport_.requestResize(fbw, fbh);
        return true;
    }
    viewport_.requestResize(fbw, fbh);
    viewport_.consumeDirty();

    vkDeviceWaitIdle(vk_.device());
    destroyPresentSemaphores();
    if (!swap_.resize(swapchainInfo())) {
        spdlog::error("Swapchain recreation failed ({}x{})", fbw, fbh);
        return false;
    }
    if (!createPresentSemaphores()) {
        return false;
    }
    const VkExtent2D extent = swap_.extent();
    controller_.setAspect(static_cast<float>(extent.width) / static_cast<float>(extent.height));
    if (!composer_.resize(extent, swap_.format())) {
        spdlog::error("Scene composer resize failed ({}x{})", extent.width, extent.height);
        return false;
    }
    spdlog::debug("Swapchain recreated ({}x{})", extent.width, extent.height);
    return true;
}

bool Runtime::recordFrame(VkCommandBuffer cb, uint32_t imageIndex) {
    vkResetCommandBuffer(cb, 0);
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(cb, &bi) != VK_SUCCESS) {
        spdlog::error("vkBeginCommandBuffer failed");
        return false;
    }
    if (!composer_.record(cb, currentFrame_, swap_.image(imageIndex), swap_.imageView(imageIndex))) {
        spdlog::error("Scene recording failed for frame {}", stages_.frameIndex());
        vkEndCommandBuffer(cb);
        return false;
    }
    if (vkEndCommandBuffer(cb) != VK_SUCCESS) {
        spdlog::error("vkEndCommandBuffer failed");
        return false;
    }
    return true;
}

bool Runtime::submitFrame(FrameSync& frame, VkCommandBuffer cb, uint32_t imageIndex) {
    VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores = &frame.imageAvailable;
    si.pWaitDstStageMask = &waitStage;
    si.commandBufferCount = 1;
    si.pCommandBuffers = &cb;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores = &renderFinished_[imageIndex];

    VkResult submitRes = vkQueueSubmit(vk_.graphicsQueue(), 1, &si, frame.inFlight);
    if (submitRes != VK_SUCCESS) {
        spdlog::error("vkQueueSubmit failed ({})", static_cast<int>(submitRes));
        return false;
    }
    return true;
}

bool Runtime::presentFrame(uint32_t imageIndex) {
    VkSwapchainKHR sc = swap_.handle();
    VkPresentInfoKHR pi{};
    pi.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores = &renderFinished_[imageIndex];
    pi.swapchainCount = 1;
    pi.pSwapchains = &sc;
    pi.pImageIndices = &imageIndex;

    VkResult presentRes = vkQueuePresentKHR(vk_.presentQueue(), &pi);
    if (presentRes == VK_SUBOPTIMAL_KHR || presentRes == VK_ERROR_OUT_OF_DATE_KHR) {
        viewport_.markDirty();
        return true;
    }
    if (presentRes != VK_SUCCESS) {
        spdlog::error("vkQueuePresentKHR failed ({})", static_cast<int>(presentRes));
        return false;
    }
    return true;
}

void Runtime::updateStatus(const render::GridLod& lod, float frameMs) {
    const uint64_t frameIndex = stages_.completedFrames();
    const bool title = (frameIndex % kTitleInterval) == 0;
    const bool log = (frameIndex % kOverlayLogInterval) == 0;
    if (!title && !log) return;

    const CameraSnapshot snapshot = controller_.snapshot();
    if (title) {
        window_.setTitle(buildWindowTitle(snapshot, lod, frameMs).c_str());
    }
    if (log && spdlog::should_log(spdlog::level::debug)) {
        for (const auto& line : buildOverlayLines(snapshot, lod, vk_.deviceName(), frameMs)) {
            spdlog::debug("[status] {}", line);
        }
    }
}

#endif

} // namespace app
