#pragma once

#include "app/Config.h"

namespace app {

// App — owns the viewer for one run: window, device, swapchain, scene and the frame loop.
class App {
public:
    // Returns the process exit code: 0 on a clean close, 1 on a fatal init or frame error.
    int run(const ViewerConfig& config);
};

} // namespace app
