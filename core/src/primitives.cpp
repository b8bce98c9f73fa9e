// Lumen - Procedural primitives

#include <lumen/primitives.h>
#include <algorithm>
#include <cmath>

namespace lumen {

glm::vec4 triangleTangent(const Vertex& a, const Vertex& b, const Vertex& c) {
    const glm::vec3 e1 = b.position - a.position;
    const glm::vec3 e2 = c.position - a.position;
    const glm::vec2 d1 = b.uv - a.uv;
    const glm::vec2 d2 = c.uv - a.uv;

    const float det = d1.x * d2.y - d2.x * d1.y;
    if (std::abs(det) < 1e-8f) {
        return glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
    }
    const float r = 1.0f / det;
    const glm::vec3 t = (e1 * d2.y - e2 * d1.y) * r;
    const glm::vec3 bt = (e2 * d1.x - e1 * d2.x) * r;

    const glm::vec3 n = a.normal;
    const glm::vec3 tangent = glm::normalize(t - n * glm::dot(n, t));
    const float sign = glm::dot(glm::cross(n, tangent), bt) < 0.0f ? -1.0f : 1.0f;
    return glm::vec4(tangent, sign);
}

namespace {

// Append a quad (v0..v3 counter-clockwise seen from the normal side)
void addQuad(MeshData& mesh, glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3,
             glm::vec3 normal, float uvScale) {
    const uint32_t base = static_cast<uint32_t>(mesh.vertices.size());
    Vertex v0(p0, normal, glm::vec2(0, 1) * uvScale);
    Vertex v1(p1, normal, glm::vec2(1, 1) * uvScale);
    Vertex v2(p2, normal, glm::vec2(1, 0) * uvScale);
    Vertex v3(p3, normal, glm::vec2(0, 0) * uvScale);

    const glm::vec4 tangent = triangleTangent(v0, v1, v2);
    v0.tangent = v1.tangent = v2.tangent = v3.tangent = tangent;

    mesh.vertices.push_back(v0);
    mesh.vertices.push_back(v1);
    mesh.vertices.push_back(v2);
    mesh.vertices.push_back(v3);
    mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
}

} // anonymous namespace

MeshData makeTriangle(float size) {
    const float h = size * 0.5f;
    const glm::vec3 normal(0, 0, 1);

    MeshData mesh;
    mesh.vertices = {
        Vertex(glm::vec3(-h, -h, 0), normal, glm::vec2(0, 1)),
        Vertex(glm::vec3( h, -h, 0), normal, glm::vec2(1, 1)),
        Vertex(glm::vec3( 0,  h, 0), normal, glm::vec2(0.5f, 0)),
    };
    const glm::vec4 tangent = triangleTangent(mesh.vertices[0], mesh.vertices[1], mesh.vertices[2]);
    for (auto& v : mesh.vertices) v.tangent = tangent;
    mesh.indices = {0, 1, 2};
    return mesh;
}

MeshData makePlane(float size, float uvRepeat) {
    const float h = size * 0.5f;
    MeshData mesh;
    addQuad(mesh,
            glm::vec3(-h, 0,  h), glm::vec3( h, 0,  h),
            glm::vec3( h, 0, -h), glm::vec3(-h, 0, -h),
            glm::vec3(0, 1, 0), uvRepeat);
    return mesh;
}

MeshData makeCube(float size) {
    const float h = size * 0.5f;
    MeshData mesh;

    // +Z
    addQuad(mesh, {-h, -h,  h}, { h, -h,  h}, { h,  h,  h}, {-h,  h,  h}, {0, 0, 1}, 1.0f);
    // -Z
    addQuad(mesh, { h, -h, -h}, {-h, -h, -h}, {-h,  h, -h}, { h,  h, -h}, {0, 0, -1}, 1.0f);
    // +X
    addQuad(mesh, { h, -h,  h}, { h, -h, -h}, { h,  h, -h}, { h,  h,  h}, {1, 0, 0}, 1.0f);
    // -X
    addQuad(mesh, {-h, -h, -h}, {-h, -h,  h}, {-h,  h,  h}, {-h,  h, -h}, {-1, 0, 0}, 1.0f);
    // +Y
    addQuad(mesh, {-h,  h,  h}, { h,  h,  h}, { h,  h, -h}, {-h,  h, -h}, {0, 1, 0}, 1.0f);
    // -Y
    addQuad(mesh, {-h, -h, -h}, { h, -h, -h}, { h, -h,  h}, {-h, -h,  h}, {0, -1, 0}, 1.0f);

    return mesh;
}

std::vector<uint8_t> makeCheckerTexture(uint32_t size, uint32_t cells,
                                        glm::u8vec4 colorA, glm::u8vec4 colorB) {
    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size * 4);
    const uint32_t cell = std::max(size / std::max(cells, 1u), 1u);
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            const bool even = ((x / cell) + (y / cell)) % 2 == 0;
            const glm::u8vec4 c = even ? colorA : colorB;
            uint8_t* p = &pixels[(static_cast<size_t>(y) * size + x) * 4];
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
            p[3] = c.a;
        }
    }
    return pixels;
}

std::vector<uint8_t> makeBumpNormalMap(uint32_t size, uint32_t bumps, float strength) {
    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size * 4);
    const float freq = 2.0f * 3.14159265f * static_cast<float>(std::max(bumps, 1u)) /
                       static_cast<float>(size);
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            // Height h = sin(fx) * sin(fy); normal = normalize(-dh/dx, -dh/dy, 1)
            const float sx = std::sin(freq * x), cx = std::cos(freq * x);
            const float sy = std::sin(freq * y), cy = std::cos(freq * y);
            glm::vec3 n(-strength * cx * sy, -strength * sx * cy, 1.0f);
            n = glm::normalize(n) * 0.5f + 0.5f;
            uint8_t* p = &pixels[(static_cast<size_t>(y) * size + x) * 4];
            p[0] = static_cast<uint8_t>(n.x * 255.0f + 0.5f);
            p[1] = static_cast<uint8_t>(n.y * 255.0f + 0.5f);
            p[2] = static_cast<uint8_t>(n.z * 255.0f + 0.5f);
            p[3] = 255;
        }
    }
    return pixels;
}

} // namespace lumen
