#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace render { struct GridLod; }

namespace app {

struct CameraSnapshot;

// Status lines describing the current camera and grid state. Lines are capped at
// kOverlayMaxCols characters.
std::vector<std::string> buildOverlayLines(const CameraSnapshot& snapshot,
                                           const render::GridLod& lod,
                                           std::string_view adapterName,
                                           float frameMs);

// Compact single-line form for the window title.
std::string buildWindowTitle(const CameraSnapshot& snapshot, const render::GridLod& lod, float frameMs);

inline constexpr size_t kOverlayMaxCols = 128;

} // namespace app
