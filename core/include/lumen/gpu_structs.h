#pragma once

/**
 * @file gpu_structs.h
 * @brief GPU uniform buffer structures
 *
 * These structures are uploaded byte-for-byte into uniform buffers and must
 * match the WGSL struct declarations in shaders.cpp exactly. Every member is a
 * mat4 or vec4 so the 16-byte alignment rules hold without hidden padding.
 */

#include <lumen/types.h>
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace lumen {

// -------------------------------------------------------------------------
// Packing inputs
// -------------------------------------------------------------------------

/// Mono camera matrices for one frame
struct CameraData {
    glm::mat4 view{1.0f};
    glm::mat4 projection{1.0f};
    glm::vec3 position{0.0f};
};

/// Per-eye matrices, index 0 = left, 1 = right
struct StereoCameraData {
    CameraData eyes[2];
};

/// The single directional light of a frame
struct LightData {
    glm::vec3 direction{-1.0f, -1.0f, -1.0f};
    glm::vec3 color{1.0f};
    glm::vec3 ambient{0.1f};
};

// -------------------------------------------------------------------------
// Uniform structs (bit-exact with WGSL)
// -------------------------------------------------------------------------

/// Mono camera uniform (208 bytes), group 0 binding 0
struct CameraUniform {
    glm::mat4 viewProjection;  // offset 0
    glm::mat4 view;            // offset 64
    glm::mat4 projection;      // offset 128
    glm::vec4 position;        // offset 192 (w = 1)
};

static_assert(sizeof(CameraUniform) == 208, "CameraUniform must be 208 bytes");
static_assert(offsetof(CameraUniform, view) == 64, "CameraUniform.view offset mismatch");
static_assert(offsetof(CameraUniform, projection) == 128, "CameraUniform.projection offset mismatch");
static_assert(offsetof(CameraUniform, position) == 192, "CameraUniform.position offset mismatch");

/// Stereo camera uniform (416 bytes), group 0 binding 0. Arrays are [left, right].
struct StereoCameraUniform {
    glm::mat4 view[2];            // offset 0
    glm::mat4 projection[2];      // offset 128
    glm::mat4 viewProjection[2];  // offset 256
    glm::vec4 eyePosition[2];     // offset 384
};

static_assert(sizeof(StereoCameraUniform) == 416, "StereoCameraUniform must be 416 bytes");
static_assert(offsetof(StereoCameraUniform, projection) == 128, "StereoCameraUniform.projection offset mismatch");
static_assert(offsetof(StereoCameraUniform, viewProjection) == 256, "StereoCameraUniform.viewProjection offset mismatch");
static_assert(offsetof(StereoCameraUniform, eyePosition) == 384, "StereoCameraUniform.eyePosition offset mismatch");

/// Directional light uniform (48 bytes), group 1 binding 0
struct LightUniform {
    glm::vec4 direction;  // offset 0  (w = 0)
    glm::vec4 color;      // offset 16 (w = 1)
    glm::vec4 ambient;    // offset 32 (w = 1)
};

static_assert(sizeof(LightUniform) == 48, "LightUniform must be 48 bytes");

/// Per-object uniform (64 bytes), group 2 binding 0 with dynamic offset
struct ModelUniform {
    glm::mat4 model;  // offset 0
};

static_assert(sizeof(ModelUniform) == 64, "ModelUniform must be 64 bytes");

/// Per-material parameters (32 bytes), group 3 binding 0
struct MaterialUniform {
    glm::vec4 baseColor;  // offset 0
    glm::vec4 factors;    // offset 16: x = ambient, y = specular, z = shininess, w = normal scale
};

static_assert(sizeof(MaterialUniform) == 32, "MaterialUniform must be 32 bytes");

// -------------------------------------------------------------------------
// Frame uniform buffer layout
// -------------------------------------------------------------------------

/// Dynamic offsets and binding offsets must be multiples of this
constexpr uint32_t UNIFORM_ALIGNMENT = 256;

constexpr uint32_t alignUniform(uint32_t size) {
    return (size + UNIFORM_ALIGNMENT - 1) & ~(UNIFORM_ALIGNMENT - 1);
}

/// Region offsets inside one frame slot buffer
constexpr uint32_t CAMERA_REGION_OFFSET = 0;
constexpr uint32_t CAMERA_REGION_SIZE = alignUniform(sizeof(StereoCameraUniform));
constexpr uint32_t LIGHT_REGION_OFFSET = CAMERA_REGION_OFFSET + CAMERA_REGION_SIZE;
constexpr uint32_t OBJECT_REGION_OFFSET = LIGHT_REGION_OFFSET + alignUniform(sizeof(LightUniform));
constexpr uint32_t OBJECT_STRIDE = alignUniform(sizeof(ModelUniform));

static_assert(LIGHT_REGION_OFFSET == 512, "light region offset mismatch");
static_assert(OBJECT_REGION_OFFSET == 768, "object region offset mismatch");

constexpr uint64_t frameBufferSize(uint32_t objectCapacity) {
    return static_cast<uint64_t>(OBJECT_REGION_OFFSET) +
           static_cast<uint64_t>(objectCapacity) * OBJECT_STRIDE;
}

// -------------------------------------------------------------------------
// Packing helpers
// -------------------------------------------------------------------------

CameraUniform makeCameraUniform(const CameraData& camera);
StereoCameraUniform makeStereoCameraUniform(const StereoCameraData& camera);
LightUniform makeLightUniform(const LightData& light);

/**
 * @brief Read the view-projection matrix for one eye out of packed stereo bytes
 *
 * Mirrors the shader-side `camera.viewProjection[viewIndex]` lookup.
 * Throws std::out_of_range for a view index other than 0 or 1 or a short buffer.
 */
glm::mat4 eyeViewProjection(const uint8_t* packed, size_t size, uint32_t viewIndex);

} // namespace lumen
