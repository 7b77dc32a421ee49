#pragma once

// Descriptors — a single descriptor pool plus set-layout and uniform-write helpers.
//
// Call `init(device, sizes, maxSets)` once, then `allocate(layout)` whenever a
// descriptor set is needed. Sets live until shutdown() destroys the pool.

#include <cstdint>
#include <mutex>
#include <vector>

#include <volk.h>

namespace core {

class Descriptors {
public:
    Descriptors() = default;

    bool init(VkDevice device,
              const std::vector<VkDescriptorPoolSize>& poolSizes,
              uint32_t maxSets,
              VkDescriptorPoolCreateFlags flags = 0);

    void shutdown();

    VkDescriptorSet allocate(VkDescriptorSetLayout layout);

    // Layout with one uniform buffer per binding, visible to `stages`.
    VkDescriptorSetLayout createUniformLayout(uint32_t bindingCount, VkShaderStageFlags stages) const;
    void writeUniform(VkDescriptorSet set, uint32_t binding, VkBuffer buffer, VkDeviceSize range) const;

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
    std::mutex mutex_;
};

}
