#include "Descriptors.h"

#include <spdlog/spdlog.h>

namespace core {

bool Descriptors::init(VkDevice device,
                       const std::vector<VkDescriptorPoolSize>& poolSizes,
                       uint32_t maxSets,
                       VkDescriptorPoolCreateFlags flags) {
    shutdown();
    if (!device || poolSizes.empty() || maxSets == 0u) return false;

    VkDescriptorPoolCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.flags = flags;
    info.maxSets = maxSets;
    info.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
    info.pPoolSizes = poolSizes.data();

    if (vkCreateDescriptorPool(device, &info, nullptr, &pool_) != VK_SUCCESS) {
        spdlog::error("Descriptors: vkCreateDescriptorPool failed (maxSets={})", maxSets);
        pool_ = VK_NULL_HANDLE;
        return false;
    }

    device_ = device;
    return true;
}

void Descriptors::shutdown() {
    if (pool_ && device_) {
        vkDestroyDescriptorPool(device_, pool_, nullptr);
    }
    pool_ = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
}

VkDescriptorSet Descriptors::allocate(VkDescriptorSetLayout layout) {
    if (!layout || !pool_) return VK_NULL_HANDLE;
    std::lock_guard<std::mutex> lock(mutex_);
    VkDescriptorSetAllocateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    info.descriptorPool = pool_;
    info.descriptorSetCount = 1;
    info.pSetLayouts = &layout;

    VkDescriptorSet set = VK_NULL_HANDLE;
    if (vkAllocateDescriptorSets(device_, &info, &set) != VK_SUCCESS) {
        spdlog::error("Descriptors: vkAllocateDescriptorSets failed");
        return VK_NULL_HANDLE;
    }
    return set;
}

VkDescriptorSetLayout Descriptors::createUniformLayout(uint32_t bindingCount, VkShaderStageFlags stages) const {
    if (!device_) return VK_NULL_HANDLE;
    std::vector<VkDescriptorSetLayoutBinding> bindings(bindingCount);
    for (uint32_t i = 0; i < bindingCount; ++i) {
        bindings[i].binding = i;
        bindings[i].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags = stages;
    }
    VkDescriptorSetLayoutCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    info.bindingCount = bindingCount;
    info.pBindings = bindings.data();

    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    if (vkCreateDescriptorSetLayout(device_, &info, nullptr, &layout) != VK_SUCCESS) {
        spdlog::error("Descriptors: vkCreateDescriptorSetLayout failed ({} bindings)", bindingCount);
        return VK_NULL_HANDLE;
    }
    return layout;
}

void Descriptors::writeUniform(VkDescriptorSet set, uint32_t binding, VkBuffer buffer, VkDeviceSize range) const {
    if (!set || !buffer || !device_) return;
    VkDescriptorBufferInfo bufferInfo{};
    bufferInfo.buffer = buffer;
    bufferInfo.offset = 0;
    bufferInfo.range = range;

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set;
    write.dstBinding = binding;
    write.descriptorCount = 1;
    write.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    write.pBufferInfo = &bufferInfo;
    vkUpdateDescriptorSets(device_, 1, &write, 0, nullptr);
}

}
