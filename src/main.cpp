#include "app/App.h"
#include "app/Config.h"
#include "core/Logging.h"
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    // Initialize logging early so platform callbacks (GLFW/Vulkan) use it
    auto cfg = core::determine_log_config(argc, argv, spdlog::level::info);
    core::init_logging(cfg);
    const app::ViewerConfig config = app::determine_viewer_config(argc, argv);
    app::App app;
    const int rc = app.run(config);
    core::shutdown_logging();
    return rc;
}
