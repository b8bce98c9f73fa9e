// Lumen - Bind group layouts

#include <lumen/binding_layouts.h>
#include <lumen/gpu_structs.h>
#include <string>

namespace lumen {

BindingLayouts::BindingLayouts(Device& device) {
    // Group 0: camera
    m_camera[static_cast<size_t>(TargetKind::Mono)] = device.createBindGroupLayout(
        {"Camera Mono Layout",
         {{0, BindingType::UniformBuffer, ShaderStage::VertexFragment, sizeof(CameraUniform)}}});
    m_camera[static_cast<size_t>(TargetKind::Stereo)] = device.createBindGroupLayout(
        {"Camera Stereo Layout",
         {{0, BindingType::UniformBuffer, ShaderStage::VertexFragment, sizeof(StereoCameraUniform)}}});

    // Group 1: light
    m_light = device.createBindGroupLayout(
        {"Light Layout",
         {{0, BindingType::UniformBuffer, ShaderStage::Fragment, sizeof(LightUniform)}}});

    // Group 2: per-object model matrix, addressed by dynamic offset
    m_model = device.createBindGroupLayout(
        {"Model Layout",
         {{0, BindingType::DynamicUniformBuffer, ShaderStage::Vertex, sizeof(ModelUniform)}}});

    // Group 3: one layout per material shape
    for (uint32_t i = 0; i < MaterialSignature::VARIANT_COUNT; ++i) {
        MaterialSignature sig = MaterialSignature::fromIndex(i);
        m_material[i] = device.createBindGroupLayout(
            {std::string("Material Layout (") + toString(sig) + ")", materialEntries(sig)});
    }
}

std::vector<BindGroupLayoutEntry> BindingLayouts::materialEntries(MaterialSignature signature) {
    std::vector<BindGroupLayoutEntry> entries;
    entries.push_back({MATERIAL_PARAMS_BINDING, BindingType::UniformBuffer,
                       ShaderStage::Fragment, sizeof(MaterialUniform)});
    if (signature.hasDiffuseTexture()) {
        entries.push_back({DIFFUSE_TEXTURE_BINDING, BindingType::Texture2D, ShaderStage::Fragment, 0});
        entries.push_back({DIFFUSE_SAMPLER_BINDING, BindingType::Sampler, ShaderStage::Fragment, 0});
    }
    if (signature.hasNormalMap()) {
        entries.push_back({NORMAL_TEXTURE_BINDING, BindingType::Texture2D, ShaderStage::Fragment, 0});
        entries.push_back({NORMAL_SAMPLER_BINDING, BindingType::Sampler, ShaderStage::Fragment, 0});
    }
    return entries;
}

std::vector<BindGroupLayoutId> BindingLayouts::pipelineLayout(MaterialSignature signature,
                                                              TargetKind target) const {
    return {camera(target), m_light, m_model, material(signature)};
}

} // namespace lumen
