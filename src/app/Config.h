#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "app/InputMapper.h"
#include "render/GridLod.h"

namespace app {

struct ViewerConfig {
    uint32_t width = 1280;
    uint32_t height = 720;
    bool enableValidation = true;
    InputMapperConfig input{};
    render::GridLodConfig grid{};
};

// Strict numeric parsing; nullopt on trailing garbage, overflow or non-finite input.
std::optional<float> parse_float(std::string_view s);
std::optional<uint32_t> parse_extent(std::string_view s);

// Inspect env and CLI (CLI wins) the same way as determine_log_config.
// Supported CLI flags:
//   --width <n> --height <n> --no-validation
//   --orbit-sensitivity <x> --pan-sensitivity <x> --zoom-factor <x> --grid-spacing <x>
// Env vars:
//   KYZU_WIDTH, KYZU_HEIGHT, KYZU_VALIDATION (0/false/off disables)
// Invalid values are logged and the default kept.
ViewerConfig determine_viewer_config(int argc, char** argv);

} // namespace app
