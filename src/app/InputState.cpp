#include "InputState.h"

#include <cmath>

namespace app {

void InputState::onCursorMoved(float x, float y) {
    if (!std::isfinite(x) || !std::isfinite(y)) return;
    if (hasCursor) {
        delta.x += x - cursor.x;
        delta.y += y - cursor.y;
    }
    cursor = glm::vec2(x, y);
    hasCursor = true;
}

void InputState::onCursorLeft() {
    hasCursor = false;
}

void InputState::onButton(MouseButton button, bool pressed) {
    switch (button) {
    case MouseButton::Left: leftHeld = pressed; break;
    case MouseButton::Middle: middleHeld = pressed; break;
    case MouseButton::Right: rightHeld = pressed; break;
    }
}

void InputState::onScrollLines(float lines) {
    if (std::isfinite(lines)) scroll += lines;
}

void InputState::onScrollPixels(float pixels, float pixelsPerLine) {
    if (!std::isfinite(pixels) || pixelsPerLine <= 0.0f) return;
    scroll += pixels / pixelsPerLine;
}

void InputState::onShift(bool pressed) {
    shiftHeld = pressed;
}

void InputState::endFrame() {
    delta = glm::vec2(0.0f);
    scroll = 0.0f;
}

} // namespace app
