#include "Config.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

namespace app {

std::optional<float> parse_float(std::string_view s) {
    if (s.empty()) return std::nullopt;
    const std::string buf(s);
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(buf.c_str(), &end);
    if (errno == ERANGE || end != buf.c_str() + buf.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<uint32_t> parse_extent(std::string_view s) {
    if (s.empty()) return std::nullopt;
    const std::string buf(s);
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(buf.c_str(), &end, 10);
    if (errno == ERANGE || end != buf.c_str() + buf.size() || v <= 0 || v > 16384) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(v);
}

namespace {

bool parse_switch(std::string_view s, bool fallback) {
    if (s == "0" || s == "false" || s == "off" || s == "no") return false;
    if (s == "1" || s == "true" || s == "on" || s == "yes") return true;
    return fallback;
}

void apply_extent(std::string_view name, std::string_view value, uint32_t& out) {
    if (auto v = parse_extent(value)) {
        out = *v;
    } else {
        spdlog::warn("Config: invalid {} '{}', keeping {}", name, value, out);
    }
}

// Positive, finite tuning values only.
void apply_positive(std::string_view name, std::string_view value, float& out) {
    auto v = parse_float(value);
    if (v && *v > 0.0f) {
        out = *v;
    } else {
        spdlog::warn("Config: invalid {} '{}', keeping {}", name, value, out);
    }
}

// Matches "--flag value" and "--flag=value"; advances i past a consumed value.
bool match_value(std::string_view arg, std::string_view flag, int& i, int argc, char** argv,
                 std::string_view& value) {
    if (arg == flag) {
        if (i + 1 >= argc) {
            spdlog::warn("Config: {} expects a value", flag);
            return false;
        }
        value = argv[++i];
        return true;
    }
    if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag && arg[flag.size()] == '=') {
        value = arg.substr(flag.size() + 1);
        return true;
    }
    return false;
}

} // namespace

ViewerConfig determine_viewer_config(int argc, char** argv) {
    ViewerConfig cfg{};

    if (const char* w = std::getenv("KYZU_WIDTH")) apply_extent("KYZU_WIDTH", w, cfg.width);
    if (const char* h = std::getenv("KYZU_HEIGHT")) apply_extent("KYZU_HEIGHT", h, cfg.height);
    if (const char* v = std::getenv("KYZU_VALIDATION")) {
        cfg.enableValidation = parse_switch(v, cfg.enableValidation);
    }

    // CLI overrides env
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i] ? argv[i] : "";
        std::string_view value;
        if (match_value(a, "--width", i, argc, argv, value)) {
            apply_extent("--width", value, cfg.width);
        } else if (match_value(a, "--height", i, argc, argv, value)) {
            apply_extent("--height", value, cfg.height);
        } else if (a == "--no-validation") {
            cfg.enableValidation = false;
        } else if (match_value(a, "--orbit-sensitivity", i, argc, argv, value)) {
            apply_positive("--orbit-sensitivity", value, cfg.input.orbitSensitivity);
        } else if (match_value(a, "--pan-sensitivity", i, argc, argv, value)) {
            apply_positive("--pan-sensitivity", value, cfg.input.panSensitivity);
        } else if (match_value(a, "--zoom-factor", i, argc, argv, value)) {
            apply_positive("--zoom-factor", value, cfg.input.zoomFactor);
        } else if (match_value(a, "--grid-spacing", i, argc, argv, value)) {
            apply_positive("--grid-spacing", value, cfg.grid.referenceSpacing);
        } else if (a == "--log-level" || a == "--log-file") {
            ++i; // consumed by determine_log_config
        }
    }

    spdlog::debug("Config: {}x{}, validation {}, orbit {:.4f}, pan {:.4f}, zoom {:.3f}, grid spacing {:.2f}",
                  cfg.width, cfg.height, cfg.enableValidation ? "on" : "off",
                  cfg.input.orbitSensitivity, cfg.input.panSensitivity,
                  cfg.input.zoomFactor, cfg.grid.referenceSpacing);
    return cfg;
}

} // namespace app
