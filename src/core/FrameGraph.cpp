#include "FrameGraph.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace core {

const char* to_string(DepthCompare compare) {
    switch (compare) {
    case DepthCompare::Less: return "less";
    case DepthCompare::LessOrEqual: return "less-equal";
    }
    return "unknown";
}

void FrameGraph::beginFrame() {
    passes_.clear();
}

void FrameGraph::addPass(std::string name, PassState state, std::function<void(VkCommandBuffer)> record) {
    passes_.push_back(Pass{std::move(name), state, std::move(record)});
}

bool FrameGraph::validate() const {
    const Pass* firstTransparent = nullptr;
    for (const auto& pass : passes_) {
        if (pass.state.transparent()) {
            if (pass.state.depthWrite) {
                spdlog::error("FrameGraph: transparent pass '{}' writes depth", pass.name);
                return false;
            }
            if (!firstTransparent) firstTransparent = &pass;
            continue;
        }
        if (firstTransparent) {
            spdlog::error("FrameGraph: opaque pass '{}' recorded after transparent pass '{}'",
                          pass.name, firstTransparent->name);
            return false;
        }
    }
    return true;
}

void FrameGraph::execute(VkCommandBuffer commandBuffer) {
    for (auto& pass : passes_) {
        if (pass.record) {
            pass.record(commandBuffer);
        }
    }
}

void FrameGraph::endFrame() {
    passes_.clear();
}

}
