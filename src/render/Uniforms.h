#pragma once

// Uniforms — CPU mirrors of the std140 uniform blocks declared in shaders/.
//
// These structs are memcpy'd verbatim into mapped uniform buffers. Any change here
// must be matched in cube.vert / lines.vert (CameraUniform) and grid.vert /
// grid.frag (GridUniform); the static_asserts below pin the layout.

#include <cstddef>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

namespace render {

struct CameraUniform {
    glm::mat4 viewProj{1.0f};   //  64 bytes (offset   0)
};

struct GridUniform {
    glm::mat4 viewProj{1.0f};    //  64 bytes (offset   0)
    glm::mat4 invViewProj{1.0f}; //  64 bytes (offset  64)
    glm::vec3 eyePos{0.0f};      //  12 bytes (offset 128)
    float pad0 = 0.0f;           //   4 bytes (offset 140), fills the vec3 slot
    float fadeNear = 0.0f;       //   4 bytes (offset 144)
    float fadeFar = 0.0f;        //   4 bytes (offset 148)
    float lodScale = 1.0f;       //   4 bytes (offset 152)
    float lodFade = 0.0f;        //   4 bytes (offset 156)
};

static_assert(sizeof(CameraUniform) == 64, "CameraUniform must match the shader block (64 bytes)");
static_assert(offsetof(CameraUniform, viewProj) == 0, "CameraUniform.viewProj offset");

static_assert(sizeof(GridUniform) == 160, "GridUniform must match the shader block (160 bytes)");
static_assert(sizeof(GridUniform) % 16 == 0, "GridUniform must be 16-byte aligned in size");
static_assert(offsetof(GridUniform, viewProj) == 0, "GridUniform.viewProj offset");
static_assert(offsetof(GridUniform, invViewProj) == 64, "GridUniform.invViewProj offset");
static_assert(offsetof(GridUniform, eyePos) == 128, "GridUniform.eyePos offset");
static_assert(offsetof(GridUniform, fadeNear) == 144, "GridUniform.fadeNear offset");
static_assert(offsetof(GridUniform, fadeFar) == 148, "GridUniform.fadeFar offset");
static_assert(offsetof(GridUniform, lodScale) == 152, "GridUniform.lodScale offset");
static_assert(offsetof(GridUniform, lodFade) == 156, "GridUniform.lodFade offset");

} // namespace render
