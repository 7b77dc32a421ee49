#pragma once

#include <cstdint>

namespace app {

// Per-frame pipeline stages, in the only order a frame may take.
enum class FrameStage : uint8_t {
    Idle,
    InputAccumulated,
    CameraUpdated,
    UniformsUploaded,
    Recorded,
    Submitted,
    Presented,
};

const char* to_string(FrameStage stage);

// FrameStageTracker — guards the update/record/submit ordering of one frame.
//
// advance() only accepts the immediate successor of the current stage. beginFrame()
// restarts at InputAccumulated from anywhere, so a frame abandoned mid-way (skipped
// acquire, minimised window) does not poison the next one.
class FrameStageTracker {
public:
    void beginFrame();
    // Returns false and logs when `next` does not directly follow the current stage.
    bool advance(FrameStage next);

    FrameStage current() const { return stage_; }
    uint64_t frameIndex() const { return frameIndex_; }
    // Frames that reached Presented.
    uint64_t completedFrames() const { return completed_; }

private:
    FrameStage stage_ = FrameStage::Idle;
    uint64_t frameIndex_ = 0;
    uint64_t completed_ = 0;
};

} // namespace app
