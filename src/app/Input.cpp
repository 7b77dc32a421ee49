#include "Input.h"
#include "platform/Window.h"

#if KYZU_ENABLE_WINDOW
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#endif

namespace app {

void Input::initialize(platform::Window& window) {
#if KYZU_ENABLE_WINDOW
    GLFWwindow* handle = window.handle();
    if (!handle) return;
    glfwSetInputMode(handle, GLFW_CURSOR, GLFW_CURSOR_NORMAL);

    platform::WindowHooks& hooks = window.hooks();
    hooks.onCursorPos = [this](double x, double y) {
        state_.onCursorMoved(static_cast<float>(x), static_cast<float>(y));
    };
    hooks.onCursorEnter = [this](bool entered) {
        if (!entered) state_.onCursorLeft();
    };
    hooks.onMouseButton = [this](int button, int action, int mods) {
        (void)mods;
        const bool pressed = (action == GLFW_PRESS);
        switch (button) {
        case GLFW_MOUSE_BUTTON_LEFT: state_.onButton(MouseButton::Left, pressed); break;
        case GLFW_MOUSE_BUTTON_MIDDLE: state_.onButton(MouseButton::Middle, pressed); break;
        case GLFW_MOUSE_BUTTON_RIGHT: state_.onButton(MouseButton::Right, pressed); break;
        default: break;
        }
    };
    // GLFW reports wheel notches and trackpad motion alike in line units.
    hooks.onScroll = [this](double xoff, double yoff) {
        (void)xoff;
        state_.onScrollLines(static_cast<float>(yoff));
    };
    hooks.onKey = [this, &window](int key, int action, int mods) {
        (void)mods;
        if (action == GLFW_REPEAT) return;
        const bool pressed = (action == GLFW_PRESS);
        switch (key) {
        case GLFW_KEY_ESCAPE:
            if (pressed) window.requestClose();
            break;
        case GLFW_KEY_LEFT_SHIFT:
        case GLFW_KEY_RIGHT_SHIFT:
            state_.onShift(pressed);
            break;
        default:
            break;
        }
    };
#else
    (void)window;
#endif
}

}
