/**
 * @file test_resource_manager.cpp
 * @brief Unit tests for GpuResourceManager against the headless device
 *
 * Covers mesh validation, texture formats and reference counting, sampler
 * deduplication, materials, memory exhaustion and deferred destruction.
 */

#include <catch2/catch_test_macros.hpp>
#include <lumen/binding_layouts.h>
#include <lumen/error.h>
#include <lumen/headless_device.h>
#include <lumen/primitives.h>
#include <lumen/resource_manager.h>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <vector>

using namespace lumen;

namespace {

struct Fixture {
    HeadlessDevice device;
    BindingLayouts layouts{device};
    GpuResourceManager resources{device, layouts};
};

std::vector<uint8_t> solidPixels(uint32_t width, uint32_t height, uint32_t bpp = 4) {
    return std::vector<uint8_t>(static_cast<size_t>(width) * height * bpp, 200);
}

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GpuError& e) {
        return e.kind();
    }
    FAIL("expected a GpuError");
    return ErrorKind::InvalidHandle;
}

} // namespace

// =============================================================================
// Meshes
// =============================================================================

TEST_CASE("Mesh upload", "[resources][mesh]") {
    Fixture f;
    MeshData tri = makeTriangle();

    SECTION("valid mesh is uploaded with its counts") {
        MeshHandle h = f.resources.createMesh(tri.vertices, tri.indices, tri.attributes, "Tri");
        REQUIRE(f.resources.isValid(h));
        REQUIRE(f.resources.meshCount() == 1);

        const GpuMesh& mesh = f.resources.mesh(h);
        REQUIRE(mesh.vertexCount == 3);
        REQUIRE(mesh.indexCount == 3);
        REQUIRE(f.device.bufferSize(mesh.vertexBuffer) == 3 * sizeof(Vertex));
        REQUIRE(f.device.bufferSize(mesh.indexBuffer) == 3 * sizeof(uint32_t));
    }

    SECTION("index past the last vertex is rejected") {
        std::vector<uint32_t> bad = {0, 1, 3};
        REQUIRE(kindOf([&] { f.resources.createMesh(tri.vertices, bad); }) ==
                ErrorKind::InvalidGeometry);
        REQUIRE(f.resources.meshCount() == 0);
        REQUIRE(f.device.liveBufferCount() == 0);
    }

    SECTION("mesh without vertices is rejected") {
        REQUIRE(kindOf([&] { f.resources.createMesh({}, {}); }) == ErrorKind::InvalidGeometry);
    }

    SECTION("mesh without indices is accepted") {
        MeshHandle h = f.resources.createMesh(tri.vertices, {});
        REQUIRE(f.resources.mesh(h).indexCount == 0);
    }

    SECTION("stale handle lookups throw InvalidHandle") {
        MeshHandle h = f.resources.createMesh(tri.vertices, tri.indices);
        f.resources.destroyMesh(h);
        REQUIRE_FALSE(f.resources.isValid(h));
        REQUIRE(kindOf([&] { f.resources.mesh(h); }) == ErrorKind::InvalidHandle);
    }
}

TEST_CASE("Mesh destruction waits for in-flight submissions", "[resources][mesh]") {
    Fixture f;
    f.device.setAutoComplete(false);
    MeshData cube = makeCube();
    MeshHandle h = f.resources.createMesh(cube.vertices, cube.indices);
    const BufferId vertices = f.resources.mesh(h).vertexBuffer;

    const SubmissionId id = f.device.submit(CommandList{});
    f.resources.markSubmitted(id);
    f.resources.destroyMesh(h);

    REQUIRE(f.resources.pendingDestroyCount() == 2);
    REQUIRE(f.device.hasBuffer(vertices));

    f.resources.collectGarbage(f.device.completedSubmission());
    REQUIRE(f.device.hasBuffer(vertices));

    f.device.completeSubmission(id);
    f.resources.collectGarbage(f.device.completedSubmission());
    REQUIRE(f.resources.pendingDestroyCount() == 0);
    REQUIRE_FALSE(f.device.hasBuffer(vertices));
}

// =============================================================================
// Textures and samplers
// =============================================================================

TEST_CASE("Texture upload validation", "[resources][texture]") {
    Fixture f;

    SECTION("8-bit formats upload") {
        TextureHandle rgba = f.resources.createTexture(solidPixels(4, 4), 4, 4, TextureFormat::RGBA8Unorm);
        TextureHandle gray = f.resources.createTexture(solidPixels(4, 4, 1), 4, 4, TextureFormat::R8Unorm);
        REQUIRE(f.resources.isValid(rgba));
        REQUIRE(f.resources.isValid(gray));
        REQUIRE(f.resources.texture(rgba).width == 4);
        REQUIRE(f.device.liveTextureCount() == 2);
    }

    SECTION("float and compressed formats are unsupported") {
        REQUIRE(kindOf([&] {
            f.resources.createTexture(solidPixels(4, 4, 8), 4, 4, TextureFormat::RGBA16Float);
        }) == ErrorKind::UnsupportedFormat);
        REQUIRE(kindOf([&] {
            f.resources.createTexture(solidPixels(4, 4), 4, 4, TextureFormat::BC1RGBAUnorm);
        }) == ErrorKind::UnsupportedFormat);
        REQUIRE(f.resources.textureCount() == 0);
    }

    SECTION("pixel count must match the extent") {
        REQUIRE(kindOf([&] {
            f.resources.createTexture(solidPixels(4, 3), 4, 4, TextureFormat::RGBA8Unorm);
        }) == ErrorKind::InvalidTextureData);
        REQUIRE(kindOf([&] {
            f.resources.createTexture({}, 0, 0, TextureFormat::RGBA8Unorm);
        }) == ErrorKind::InvalidTextureData);
    }
}

TEST_CASE("Texture reference counting and cache keys", "[resources][texture]") {
    Fixture f;
    TextureOptions options;
    options.label = "Checker";
    options.cacheKey = "checker";

    TextureHandle a = f.resources.createTexture(solidPixels(8, 8), 8, 8, TextureFormat::RGBA8Unorm, options);
    TextureHandle b = f.resources.createTexture(solidPixels(8, 8), 8, 8, TextureFormat::RGBA8Unorm, options);

    REQUIRE(a == b);
    REQUIRE(f.resources.textureRefCount(a) == 2);
    REQUIRE(f.device.liveTextureCount() == 1);

    f.resources.releaseTexture(a);
    REQUIRE(f.resources.isValid(a));
    f.resources.releaseTexture(b);
    REQUIRE_FALSE(f.resources.isValid(a));
    REQUIRE(f.device.liveTextureCount() == 0);

    // The key is free again
    TextureHandle c = f.resources.createTexture(solidPixels(8, 8), 8, 8, TextureFormat::RGBA8Unorm, options);
    REQUIRE(c != a);
    REQUIRE(f.resources.textureRefCount(c) == 1);
}

TEST_CASE("Samplers are deduplicated by descriptor", "[resources][sampler]") {
    Fixture f;
    f.resources.createTexture(solidPixels(2, 2), 2, 2, TextureFormat::RGBA8Unorm);
    f.resources.createTexture(solidPixels(2, 2), 2, 2, TextureFormat::RGBA8Unorm);
    REQUIRE(f.resources.samplerCount() == 1);
    REQUIRE(f.device.samplerCount() == 1);

    TextureOptions nearest;
    nearest.sampler.magFilter = FilterMode::Nearest;
    nearest.sampler.minFilter = FilterMode::Nearest;
    f.resources.createTexture(solidPixels(2, 2), 2, 2, TextureFormat::RGBA8Unorm, nearest);
    REQUIRE(f.resources.samplerCount() == 2);

    REQUIRE(f.resources.sampler(SamplerDesc{}) == f.resources.sampler(SamplerDesc{}));
}

// =============================================================================
// Materials
// =============================================================================

TEST_CASE("Materials derive their signature and hold texture references", "[resources][material]") {
    Fixture f;
    TextureHandle diffuse = f.resources.createTexture(solidPixels(4, 4), 4, 4, TextureFormat::RGBA8UnormSrgb);
    TextureHandle normal = f.resources.createTexture(solidPixels(4, 4), 4, 4, TextureFormat::RGBA8Unorm);

    SECTION("flat") {
        MaterialHandle m = f.resources.createMaterial(MaterialDesc{});
        REQUIRE(f.resources.material(m).signature == MaterialSignature::make(false, false));
    }

    SECTION("textured and normal-mapped") {
        MaterialDesc desc;
        desc.name = "Brick";
        desc.diffuse = diffuse;
        desc.normal = normal;
        MaterialHandle m = f.resources.createMaterial(desc);

        REQUIRE(f.resources.material(m).signature == MaterialSignature::make(true, true));
        REQUIRE(f.resources.textureRefCount(diffuse) == 2);
        REQUIRE(f.resources.textureRefCount(normal) == 2);

        // Dropping the caller's references leaves the material's
        f.resources.releaseTexture(diffuse);
        f.resources.releaseTexture(normal);
        REQUIRE(f.resources.isValid(diffuse));

        f.resources.destroyMaterial(m);
        REQUIRE_FALSE(f.resources.isValid(diffuse));
        REQUIRE_FALSE(f.resources.isValid(normal));
    }

    SECTION("params are written to the material buffer") {
        MaterialDesc desc;
        desc.baseColor = glm::vec4(0.25f, 0.5f, 0.75f, 1.0f);
        desc.specular = 0.9f;
        MaterialHandle m = f.resources.createMaterial(desc);

        const auto& bytes = f.device.bufferContents(f.resources.material(m).params);
        MaterialUniform params;
        std::memcpy(&params, bytes.data(), sizeof(params));
        REQUIRE(params.baseColor == desc.baseColor);
        REQUIRE(params.factors.y == 0.9f);
        REQUIRE(params.factors.z == 32.0f);
    }

    SECTION("stale texture handles are rejected") {
        f.resources.releaseTexture(diffuse);
        MaterialDesc desc;
        desc.diffuse = diffuse;
        REQUIRE(kindOf([&] { f.resources.createMaterial(desc); }) == ErrorKind::InvalidHandle);
        REQUIRE(f.resources.materialCount() == 0);
    }
}

// =============================================================================
// Memory and buffers
// =============================================================================

TEST_CASE("Device memory exhaustion", "[resources][memory]") {
    Fixture f;
    MeshData tri = makeTriangle();

    SECTION("vertex buffer too large") {
        f.device.setMemoryBudget(64);
        REQUIRE(kindOf([&] { f.resources.createMesh(tri.vertices, tri.indices); }) ==
                ErrorKind::OutOfDeviceMemory);
    }

    SECTION("index buffer failure releases the vertex buffer") {
        f.device.setMemoryBudget(3 * sizeof(Vertex) + 4);
        REQUIRE(kindOf([&] { f.resources.createMesh(tri.vertices, tri.indices); }) ==
                ErrorKind::OutOfDeviceMemory);
        REQUIRE(f.device.liveBufferCount() == 0);
        REQUIRE(f.resources.meshCount() == 0);
    }

    SECTION("texture too large") {
        f.device.setMemoryBudget(1024);
        REQUIRE(kindOf([&] {
            f.resources.createTexture(solidPixels(64, 64), 64, 64, TextureFormat::RGBA8Unorm);
        }) == ErrorKind::OutOfDeviceMemory);
        REQUIRE(f.resources.textureCount() == 0);
    }
}

TEST_CASE("Buffers cannot be rewritten while a submission reads them", "[resources][buffer]") {
    Fixture f;
    f.device.setAutoComplete(false);
    BufferHandle h = f.resources.createBuffer(256, BufferUsage::Uniform | BufferUsage::CopyDst, "Params");
    const uint32_t value = 7;

    f.resources.updateBuffer(h, 0, &value, sizeof(value));

    const SubmissionId id = f.device.submit(CommandList{});
    f.resources.markBufferUsed(h, id);
    REQUIRE_THROWS_AS(f.resources.updateBuffer(h, 0, &value, sizeof(value)), std::logic_error);

    f.device.completeSubmission(id);
    REQUIRE_NOTHROW(f.resources.updateBuffer(h, 4, &value, sizeof(value)));
    REQUIRE_THROWS_AS(f.resources.updateBuffer(h, 254, &value, sizeof(value)), std::out_of_range);
}

TEST_CASE("invalidateAll forgets every resource", "[resources][loss]") {
    Fixture f;
    MeshData tri = makeTriangle();
    MeshHandle mesh = f.resources.createMesh(tri.vertices, tri.indices);
    TextureHandle tex = f.resources.createTexture(solidPixels(2, 2), 2, 2, TextureFormat::RGBA8Unorm);
    MaterialDesc desc;
    desc.diffuse = tex;
    MaterialHandle mat = f.resources.createMaterial(desc);

    f.resources.invalidateAll();

    REQUIRE_FALSE(f.resources.isValid(mesh));
    REQUIRE_FALSE(f.resources.isValid(tex));
    REQUIRE_FALSE(f.resources.isValid(mat));
    REQUIRE(f.resources.meshCount() == 0);
    REQUIRE(f.resources.textureCount() == 0);
    REQUIRE(f.resources.materialCount() == 0);
    REQUIRE(f.resources.samplerCount() == 0);
}
