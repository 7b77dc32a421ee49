#pragma once

#include "app/InputState.h"

namespace platform {
class Window;
}

namespace app {

// Input — routes the window's GLFW events into one InputState per frame.
class Input {
public:
    void initialize(platform::Window& window);

    const InputState& state() const { return state_; }
    InputState& state() { return state_; }

    // Call after the frame has consumed the state.
    void endFrame() { state_.endFrame(); }

private:
    InputState state_{};
};

}
