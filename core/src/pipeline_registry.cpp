// Lumen - Pipeline Registry Implementation

#include <lumen/pipeline_registry.h>
#include <lumen/error.h>
#include <cstddef>
#include <iostream>
#include <string>

namespace lumen {

PipelineRegistry::PipelineRegistry(Device& device, const BindingLayouts& layouts,
                                   const ShaderLibrary& shaders)
    : m_device(device)
    , m_layouts(layouts)
    , m_shaders(shaders) {
}

std::vector<VertexAttributeDesc> PipelineRegistry::vertexAttributes(MaterialSignature signature) {
    std::vector<VertexAttributeDesc> attrs;
    attrs.push_back({VertexFormat::Float32x3, static_cast<uint32_t>(offsetof(Vertex, position)), 0});
    if (signature.isTextured()) {
        attrs.push_back({VertexFormat::Float32x2, static_cast<uint32_t>(offsetof(Vertex, uv)), 1});
    }
    attrs.push_back({VertexFormat::Float32x3, static_cast<uint32_t>(offsetof(Vertex, normal)), 2});
    if (signature.hasNormalMap()) {
        attrs.push_back({VertexFormat::Float32x4, static_cast<uint32_t>(offsetof(Vertex, tangent)), 3});
    }
    return attrs;
}

PipelineHandle PipelineRegistry::find(MaterialSignature signature, TargetKind target) const {
    return m_cache[PipelineKey{signature, target}.packed()].get();
}

PipelineHandle PipelineRegistry::getOrCreate(MaterialSignature signature, TargetKind target) {
    const PipelineKey key{signature, target};
    auto& slot = m_cache[key.packed()];
    if (slot) return slot.get();

    const std::string name = std::string(toString(signature)) + "/" + toString(target);

    auto pipeline = std::make_unique<Pipeline>();
    pipeline->key = key;
    pipeline->attributes = vertexAttributes(signature);
    pipeline->requiredAttributes = requiredAttributes(signature);

    try {
        pipeline->shader = m_device.createShaderModule({"Shader " + name, m_shaders.source(signature, target)});

        RenderPipelineDesc desc;
        desc.label = "Pipeline " + name;
        desc.shader = pipeline->shader;
        desc.bindGroupLayouts = m_layouts.pipelineLayout(signature, target);
        desc.vertexStride = sizeof(Vertex);
        desc.attributes = pipeline->attributes;
        desc.colorFormat = m_device.colorFormat(target);
        desc.depthFormat = TextureFormat::Depth32Float;
        desc.viewCount = viewCount(target);
        desc.cullMode = CullMode::Back;
        desc.depthWrite = true;
        desc.depthCompare = CompareFunction::Less;
        pipeline->pipeline = m_device.createRenderPipeline(desc);
    } catch (const GpuError& e) {
        std::cerr << "[PipelineRegistry] Failed to build " << name << ": " << e.what() << "\n";
        throw;
    }

    pipeline->creationOrder = m_nextOrder++;
    slot = std::move(pipeline);
    ++m_count;
    std::cout << "[PipelineRegistry] Built pipeline " << name << " (" << m_count << "/"
              << MAX_PIPELINES << ")\n";
    return slot.get();
}

void PipelineRegistry::prewarm(TargetKind target) {
    for (uint32_t i = 0; i < MaterialSignature::VARIANT_COUNT; ++i) {
        getOrCreate(MaterialSignature::fromIndex(i), target);
    }
}

void PipelineRegistry::invalidateAll() {
    for (auto& entry : m_cache) entry.reset();
    m_count = 0;
    m_nextOrder = 0;
    ++m_invalidations;
}

} // namespace lumen
