#pragma once

/**
 * @file primitives.h
 * @brief Procedural meshes and images for the demo scene and tests
 *
 * Meshes carry uv, normal and tangent; tangents are derived from the uv
 * layout of each triangle so normal maps line up.
 */

#include <lumen/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace lumen {

struct MeshData {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    VertexAttributes attributes = VertexAttributes::All;
};

/// Single triangle in the z = 0 plane facing +Z
MeshData makeTriangle(float size = 1.0f);

/// Square in the XZ plane facing +Y; uv repeats `uvRepeat` times across it
MeshData makePlane(float size, float uvRepeat = 1.0f);

/// Axis-aligned box centered at the origin, 24 vertices, one uv square per face
MeshData makeCube(float size = 1.0f);

/// Tangent (xyz) and bitangent sign (w) for a triangle
glm::vec4 triangleTangent(const Vertex& a, const Vertex& b, const Vertex& c);

/// RGBA8 checkerboard, `cells` squares per side
std::vector<uint8_t> makeCheckerTexture(uint32_t size, uint32_t cells,
                                        glm::u8vec4 colorA, glm::u8vec4 colorB);

/// RGBA8 tangent-space normal map of a grid of rounded bumps
std::vector<uint8_t> makeBumpNormalMap(uint32_t size, uint32_t bumps, float strength = 1.0f);

} // namespace lumen
