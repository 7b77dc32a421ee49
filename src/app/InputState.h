#pragma once

#include <glm/vec2.hpp>

namespace app {

enum class MouseButton { Left, Middle, Right };

inline constexpr float kDefaultPixelsPerLine = 40.0f;

// InputState — per-frame accumulation of raw pointer, button, scroll and modifier events.
//
// Pointer deltas and scroll are transient: they sum every event of the current frame
// and are cleared by endFrame(). Button and modifier flags persist until released.
struct InputState {
    glm::vec2 cursor{0.0f};
    glm::vec2 delta{0.0f};
    float scroll = 0.0f;   // in lines, positive = away from the user

    bool leftHeld = false;
    bool middleHeld = false;
    bool rightHeld = false;
    bool shiftHeld = false;

    bool hasCursor = false; // false until the first position sample

    void onCursorMoved(float x, float y);
    // Cursor left the window; the next sample re-seeds instead of jumping.
    void onCursorLeft();
    void onButton(MouseButton button, bool pressed);
    void onScrollLines(float lines);
    void onScrollPixels(float pixels, float pixelsPerLine = kDefaultPixelsPerLine);
    void onShift(bool pressed);

    // Clear transient per-frame deltas.
    void endFrame();

    bool anyDelta() const { return delta.x != 0.0f || delta.y != 0.0f; }
};

} // namespace app
