// Viewer configuration parsing and status text.
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/CameraController.h"
#include "app/Config.h"
#include "app/Overlay.h"
#include "core/Logging.h"
#include "render/GridLod.h"

using app::determine_viewer_config;
using app::parse_extent;
using app::parse_float;
using app::ViewerConfig;

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "ConfigTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

struct Argv {
    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        args.insert(args.begin(), "kyzu");
        for (auto& s : args) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> args;
    std::vector<char*> ptrs;
};

ViewerConfig parseArgs(std::vector<std::string> args) {
    Argv a(std::move(args));
    return determine_viewer_config(a.argc(), a.argv());
}

} // namespace

#define CHECK(cond, msg, ...) \
    do { \
        if (!(cond)) { \
            logFailureFmt(__FILE__, __LINE__, msg, ##__VA_ARGS__); \
            success = false; \
        } \
    } while (0)

int main() {
    bool success = true;
    spdlog::set_level(spdlog::level::off);
    ::unsetenv("KYZU_WIDTH");
    ::unsetenv("KYZU_HEIGHT");
    ::unsetenv("KYZU_VALIDATION");
    ::unsetenv("KYZU_LOG_LEVEL");
    ::unsetenv("KYZU_LOG_FILE");
    ::unsetenv("KYZU_LOG_COLOR");

    // Strict numeric parsing
    {
        CHECK(parse_float("0.25").value_or(-1.0f) == 0.25f, "parse_float should accept plain decimals");
        CHECK(parse_float("1e-3").has_value(), "parse_float should accept exponents");
        CHECK(!parse_float("").has_value(), "Empty float should be rejected");
        CHECK(!parse_float("0.5x").has_value(), "Trailing garbage should be rejected");
        CHECK(!parse_float("nan").has_value() && !parse_float("inf").has_value(), "Non-finite values should be rejected");
        CHECK(!parse_float("1e99").has_value(), "Overflow should be rejected");

        CHECK(parse_extent("1920").value_or(0) == 1920u, "parse_extent should accept 1920");
        CHECK(!parse_extent("0").has_value() && !parse_extent("-5").has_value(), "Non-positive extents should be rejected");
        CHECK(!parse_extent("16385").has_value(), "Oversized extents should be rejected");
        CHECK(!parse_extent("12px").has_value(), "Trailing garbage should be rejected");
    }

    // Defaults with no arguments
    {
        const ViewerConfig cfg = parseArgs({});
        CHECK(cfg.width == 1280 && cfg.height == 720, "Default size should be 1280x720 (got %ux%u)", cfg.width, cfg.height);
        CHECK(cfg.enableValidation, "Validation should default on");
        const app::InputMapperConfig input{};
        CHECK(cfg.input.zoomFactor == input.zoomFactor, "Zoom factor should default");
    }

    // CLI flags in both spellings, log flags skipped
    {
        const ViewerConfig cfg = parseArgs({"--width", "800", "--height=600", "--no-validation",
                                            "--log-level", "debug", "--orbit-sensitivity=0.01",
                                            "--zoom-factor", "0.2", "--grid-spacing", "5"});
        CHECK(cfg.width == 800 && cfg.height == 600, "Size flags should apply (got %ux%u)", cfg.width, cfg.height);
        CHECK(!cfg.enableValidation, "--no-validation should disable validation");
        CHECK(cfg.input.orbitSensitivity == 0.01f, "Orbit sensitivity should be 0.01 (got %g)", cfg.input.orbitSensitivity);
        CHECK(cfg.input.zoomFactor == 0.2f, "Zoom factor should be 0.2 (got %g)", cfg.input.zoomFactor);
        CHECK(cfg.grid.referenceSpacing == 5.0f, "Grid spacing should be 5 (got %g)", cfg.grid.referenceSpacing);
    }

    // Invalid values keep defaults
    {
        const ViewerConfig cfg = parseArgs({"--width", "0", "--pan-sensitivity", "-1", "--zoom-factor=abc", "--height"});
        CHECK(cfg.width == 1280 && cfg.height == 720, "Invalid sizes should keep defaults (got %ux%u)", cfg.width, cfg.height);
        CHECK(cfg.input.panSensitivity == app::InputMapperConfig{}.panSensitivity, "Negative pan sensitivity should be ignored");
        CHECK(cfg.input.zoomFactor == app::InputMapperConfig{}.zoomFactor, "Garbage zoom factor should be ignored");
    }

    // Environment applies first, CLI wins
    {
        ::setenv("KYZU_WIDTH", "1024", 1);
        ::setenv("KYZU_HEIGHT", "768", 1);
        ::setenv("KYZU_VALIDATION", "off", 1);
        ViewerConfig cfg = parseArgs({});
        CHECK(cfg.width == 1024 && cfg.height == 768, "Env size should apply (got %ux%u)", cfg.width, cfg.height);
        CHECK(!cfg.enableValidation, "KYZU_VALIDATION=off should disable validation");
        cfg = parseArgs({"--width=640"});
        CHECK(cfg.width == 640 && cfg.height == 768, "CLI should override env (got %ux%u)", cfg.width, cfg.height);
        ::unsetenv("KYZU_WIDTH");
        ::unsetenv("KYZU_HEIGHT");
        ::unsetenv("KYZU_VALIDATION");
    }

    // Logging flags
    {
        CHECK(core::parse_log_level(" Debug ") == spdlog::level::info, "Level names are case-sensitive");
        CHECK(core::parse_log_level(" debug ") == spdlog::level::debug, "Level names should be trimmed");
        CHECK(core::parse_log_level("warning") == spdlog::level::warn, "'warning' should alias warn");
        CHECK(core::parse_log_level("bogus", spdlog::level::err) == spdlog::level::err, "Unknown level should fall back");

        Argv a(std::vector<std::string>{"--log-level=trace", "--width", "900", "--log-file", "kyzu.log", "--no-color"});
        core::LogInitConfig log = core::determine_log_config(a.argc(), a.argv());
        CHECK(log.level == spdlog::level::trace, "--log-level= should apply");
        CHECK(log.file_path == "kyzu.log", "--log-file should apply (got '%s')", log.file_path.c_str());
        CHECK(!log.use_color, "--no-color should disable colour");

        Argv q(std::vector<std::string>{"-v", "--quiet"});
        log = core::determine_log_config(q.argc(), q.argv());
        CHECK(log.level == spdlog::level::warn, "Last level flag should win");

        ::setenv("KYZU_LOG_LEVEL", "error", 1);
        ::setenv("KYZU_LOG_COLOR", "off", 1);
        Argv none(std::vector<std::string>{});
        log = core::determine_log_config(none.argc(), none.argv());
        CHECK(log.level == spdlog::level::err && !log.use_color, "Env should set level and colour");
        Argv v(std::vector<std::string>{"--verbose"});
        log = core::determine_log_config(v.argc(), v.argv());
        CHECK(log.level == spdlog::level::trace, "CLI should override env level");
        ::unsetenv("KYZU_LOG_LEVEL");
        ::unsetenv("KYZU_LOG_COLOR");

        const ViewerConfig cfg = parseArgs({"--log-file", "900", "-v", "--width", "900"});
        CHECK(cfg.width == 900, "Viewer config should skip logging values (got %u)", cfg.width);
    }

    // Status lines
    {
        app::CameraController controller;
        const app::CameraSnapshot snap = controller.snapshot();
        const render::GridLod lod = render::deriveGridLod(snap.camera);
        const auto lines = app::buildOverlayLines(snap, lod, "Test GPU", 16.0f);
        CHECK(lines.size() == 6, "Overlay should have 6 lines (got %zu)", lines.size());
        CHECK(lines[0] == "ADAPTER Test GPU", "First line should name the adapter (got '%s')", lines[0].c_str());
        CHECK(lines[1].find("62.5") != std::string::npos, "16 ms should read as 62.5 FPS (got '%s')", lines[1].c_str());
        CHECK(lines[3].find("RADIUS 20.00") == 0, "Radius line should lead with 20.00 (got '%s')", lines[3].c_str());
        CHECK(lines[3].find("AZ -45.0") != std::string::npos, "Azimuth should be shown in degrees (got '%s')", lines[3].c_str());

        const auto longName = app::buildOverlayLines(snap, lod, std::string(300, 'G'), 0.0f);
        bool clamped = true;
        for (const auto& l : longName) {
            if (l.size() > app::kOverlayMaxCols) clamped = false;
        }
        CHECK(clamped, "Overlay lines should be clamped to kOverlayMaxCols");
        CHECK(longName[1].find("FPS    0.0") == 0, "Zero frame time should show 0 FPS (got '%s')", longName[1].c_str());

        const std::string title = app::buildWindowTitle(snap, lod, 16.0f);
        CHECK(title == "kyzu | 16.0 ms | r 20.00 | grid 1", "Unexpected title '%s'", title.c_str());
    }

    return success ? 0 : 1;
}
