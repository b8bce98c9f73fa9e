/**
 * @file test_pipeline_registry.cpp
 * @brief Unit tests for PipelineRegistry, ShaderLibrary and BindingLayouts
 */

#include <catch2/catch_test_macros.hpp>
#include <lumen/binding_layouts.h>
#include <lumen/error.h>
#include <lumen/headless_device.h>
#include <lumen/pipeline_registry.h>
#include <lumen/shaders.h>
#include <set>
#include <string>

using namespace lumen;

namespace {

struct Fixture {
    HeadlessDevice device;
    BindingLayouts layouts{device};
    ShaderLibrary shaders;
    PipelineRegistry registry{device, layouts, shaders};
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("getOrCreate is idempotent per key", "[pipelines]") {
    Fixture f;

    for (TargetKind target : {TargetKind::Mono, TargetKind::Stereo}) {
        for (uint32_t i = 0; i < MaterialSignature::VARIANT_COUNT; ++i) {
            const MaterialSignature sig = MaterialSignature::fromIndex(i);
            PipelineHandle first = f.registry.getOrCreate(sig, target);
            PipelineHandle second = f.registry.getOrCreate(sig, target);
            REQUIRE(first == second);
            REQUIRE(first->key.signature == sig);
            REQUIRE(first->key.target == target);
        }
    }

    REQUIRE(f.registry.size() == PipelineRegistry::MAX_PIPELINES);
    REQUIRE(f.device.pipelineCount() == PipelineRegistry::MAX_PIPELINES);

    // Every key maps to a distinct device pipeline
    std::set<uint64_t> ids;
    for (uint32_t key = 0; key < PipelineRegistry::MAX_PIPELINES; ++key) {
        const auto sig = MaterialSignature::fromIndex(key & 3u);
        const auto target = static_cast<TargetKind>(key >> 2);
        ids.insert(f.registry.find(sig, target)->pipeline.value);
    }
    REQUIRE(ids.size() == PipelineRegistry::MAX_PIPELINES);
}

TEST_CASE("Pipelines record their creation order", "[pipelines]") {
    Fixture f;
    PipelineHandle textured = f.registry.getOrCreate(MaterialSignature::make(true, false), TargetKind::Mono);
    PipelineHandle flat = f.registry.getOrCreate(MaterialSignature::make(false, false), TargetKind::Mono);
    REQUIRE(textured->creationOrder < flat->creationOrder);
}

TEST_CASE("Pipeline fixed-function state", "[pipelines]") {
    Fixture f;
    PipelineHandle p = f.registry.getOrCreate(MaterialSignature::make(true, true), TargetKind::Stereo);
    const RenderPipelineDesc& desc = f.device.pipelineDesc(p->pipeline);

    REQUIRE(desc.vertexStride == sizeof(Vertex));
    REQUIRE(desc.depthFormat == TextureFormat::Depth32Float);
    REQUIRE(desc.depthCompare == CompareFunction::Less);
    REQUIRE(desc.depthWrite);
    REQUIRE(desc.cullMode == CullMode::Back);
    REQUIRE(desc.viewCount == 2);
    REQUIRE(desc.colorFormat == f.device.colorFormat(TargetKind::Stereo));
    REQUIRE(desc.bindGroupLayouts.size() == 4);
    REQUIRE(desc.bindGroupLayouts[CAMERA_GROUP] == f.layouts.camera(TargetKind::Stereo));
    REQUIRE(desc.bindGroupLayouts[MATERIAL_GROUP] ==
            f.layouts.material(MaterialSignature::make(true, true)));
}

TEST_CASE("Vertex attributes per variant", "[pipelines]") {
    auto locations = [](MaterialSignature sig) {
        std::set<uint32_t> result;
        for (const auto& attr : PipelineRegistry::vertexAttributes(sig)) result.insert(attr.location);
        return result;
    };

    REQUIRE(locations(MaterialSignature::make(false, false)) == std::set<uint32_t>{0, 2});
    REQUIRE(locations(MaterialSignature::make(true, false)) == std::set<uint32_t>{0, 1, 2});
    REQUIRE(locations(MaterialSignature::make(false, true)) == std::set<uint32_t>{0, 1, 2, 3});
    REQUIRE(locations(MaterialSignature::make(true, true)) == std::set<uint32_t>{0, 1, 2, 3});

    for (const auto& attr : PipelineRegistry::vertexAttributes(MaterialSignature::make(true, true))) {
        if (attr.location == 1) REQUIRE(attr.offset == 12);
        if (attr.location == 2) REQUIRE(attr.offset == 20);
        if (attr.location == 3) REQUIRE(attr.offset == 32);
    }
}

TEST_CASE("Prewarm builds every variant of a target", "[pipelines]") {
    Fixture f;
    f.registry.prewarm(TargetKind::Mono);
    REQUIRE(f.registry.size() == 4);
    REQUIRE(f.registry.find(MaterialSignature::make(true, true), TargetKind::Mono) != nullptr);
    REQUIRE(f.registry.find(MaterialSignature::make(true, true), TargetKind::Stereo) == nullptr);
}

TEST_CASE("Shader compile failures surface as ShaderCompilationError", "[pipelines][shaders]") {
    Fixture f;
    const auto sig = MaterialSignature::make(false, false);
    f.shaders.setOverride(sig, TargetKind::Mono, "@vertex fn vs_main( {");

    try {
        f.registry.getOrCreate(sig, TargetKind::Mono);
        FAIL("expected ShaderCompilationError");
    } catch (const GpuError& e) {
        REQUIRE(e.kind() == ErrorKind::ShaderCompilationError);
    }
    REQUIRE(f.registry.size() == 0);
    REQUIRE(f.registry.find(sig, TargetKind::Mono) == nullptr);

    // Other variants are unaffected
    REQUIRE_NOTHROW(f.registry.getOrCreate(sig, TargetKind::Stereo));

    f.shaders.clearOverrides();
    REQUIRE_NOTHROW(f.registry.getOrCreate(sig, TargetKind::Mono));
}

TEST_CASE("invalidateAll empties the cache", "[pipelines]") {
    Fixture f;
    f.registry.prewarm(TargetKind::Mono);
    f.registry.invalidateAll();
    REQUIRE(f.registry.size() == 0);
    REQUIRE(f.registry.invalidationCount() == 1);
    REQUIRE(f.registry.find(MaterialSignature::make(false, false), TargetKind::Mono) == nullptr);

    PipelineHandle rebuilt = f.registry.getOrCreate(MaterialSignature::make(false, false), TargetKind::Mono);
    REQUIRE(rebuilt->creationOrder == 0);
}

// =============================================================================
// Shader sources
// =============================================================================

TEST_CASE("Generated shader variants", "[shaders]") {
    SECTION("flat mono binds no textures and reads no uv") {
        const std::string src = ShaderLibrary::builtinSource(MaterialSignature::make(false, false),
                                                             TargetKind::Mono);
        REQUIRE(contains(src, "fn vs_main"));
        REQUIRE(contains(src, "fn fs_main"));
        REQUIRE(contains(src, "@group(0) @binding(0) var<uniform> camera"));
        REQUIRE(contains(src, "@group(2) @binding(0)"));
        REQUIRE_FALSE(contains(src, "diffuseTexture"));
        REQUIRE_FALSE(contains(src, "@location(1) uv"));
        REQUIRE_FALSE(contains(src, "instance_index"));
    }

    SECTION("textured binds the diffuse pair") {
        const std::string src = ShaderLibrary::builtinSource(MaterialSignature::make(true, false),
                                                             TargetKind::Mono);
        REQUIRE(contains(src, "@group(3) @binding(1) var diffuseTexture"));
        REQUIRE(contains(src, "@group(3) @binding(2) var diffuseSampler"));
        REQUIRE_FALSE(contains(src, "normalTexture"));
    }

    SECTION("normal-mapped reads tangents") {
        const std::string src = ShaderLibrary::builtinSource(MaterialSignature::make(false, true),
                                                             TargetKind::Mono);
        REQUIRE(contains(src, "@location(3) tangent"));
        REQUIRE(contains(src, "@group(3) @binding(3) var normalTexture"));
    }

    SECTION("stereo selects the eye from instance_index") {
        const std::string src = ShaderLibrary::builtinSource(MaterialSignature::make(false, false),
                                                             TargetKind::Stereo);
        REQUIRE(contains(src, "@builtin(instance_index)"));
        REQUIRE(contains(src, "camera.viewProjection[eye]"));
        REQUIRE(contains(src, "array<mat4x4f, 2>"));
    }

    SECTION("overrides replace a single variant") {
        ShaderLibrary library;
        library.setOverride(MaterialSignature::make(true, true), TargetKind::Stereo, "custom");
        REQUIRE(library.source(MaterialSignature::make(true, true), TargetKind::Stereo) == "custom");
        REQUIRE(library.source(MaterialSignature::make(true, true), TargetKind::Mono) ==
                ShaderLibrary::builtinSource(MaterialSignature::make(true, true), TargetKind::Mono));
    }
}

// =============================================================================
// Binding layouts
// =============================================================================

TEST_CASE("Material layouts match the signature", "[layouts]") {
    REQUIRE(BindingLayouts::materialEntries(MaterialSignature::make(false, false)).size() == 1);
    REQUIRE(BindingLayouts::materialEntries(MaterialSignature::make(true, false)).size() == 3);
    REQUIRE(BindingLayouts::materialEntries(MaterialSignature::make(false, true)).size() == 3);
    REQUIRE(BindingLayouts::materialEntries(MaterialSignature::make(true, true)).size() == 5);

    HeadlessDevice device;
    BindingLayouts layouts(device);
    REQUIRE(layouts.camera(TargetKind::Mono) != layouts.camera(TargetKind::Stereo));
    const auto pipelineLayout = layouts.pipelineLayout(MaterialSignature::make(false, false), TargetKind::Mono);
    REQUIRE(pipelineLayout.size() == 4);
    REQUIRE(pipelineLayout[LIGHT_GROUP] == layouts.light());
    REQUIRE(pipelineLayout[MODEL_GROUP] == layouts.model());
}
