#include "FrameStages.h"

#include <spdlog/spdlog.h>

namespace app {

const char* to_string(FrameStage stage) {
    switch (stage) {
    case FrameStage::Idle: return "idle";
    case FrameStage::InputAccumulated: return "input-accumulated";
    case FrameStage::CameraUpdated: return "camera-updated";
    case FrameStage::UniformsUploaded: return "uniforms-uploaded";
    case FrameStage::Recorded: return "recorded";
    case FrameStage::Submitted: return "submitted";
    case FrameStage::Presented: return "presented";
    }
    return "unknown";
}

void FrameStageTracker::beginFrame() {
    if (stage_ != FrameStage::Idle && stage_ != FrameStage::Presented) {
        spdlog::debug("Frame {} abandoned at stage '{}'", frameIndex_, to_string(stage_));
    }
    ++frameIndex_;
    stage_ = FrameStage::InputAccumulated;
}

bool FrameStageTracker::advance(FrameStage next) {
    const auto expected = static_cast<FrameStage>(static_cast<uint8_t>(stage_) + 1);
    if (stage_ == FrameStage::Idle || stage_ == FrameStage::Presented || next != expected) {
        spdlog::error("Frame {}: illegal stage transition '{}' -> '{}'",
                      frameIndex_, to_string(stage_), to_string(next));
        return false;
    }
    stage_ = next;
    if (stage_ == FrameStage::Presented) {
        ++completed_;
    }
    return true;
}

} // namespace app
