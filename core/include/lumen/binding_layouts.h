#pragma once

/**
 * @file binding_layouts.h
 * @brief Bind group layouts shared by pipelines, materials and frame uniforms
 *
 * Group 0: camera uniform (mono or stereo struct), vertex + fragment
 * Group 1: light uniform, fragment
 * Group 2: model uniform with dynamic offset, vertex
 * Group 3: material parameters, then diffuse texture/sampler at 1/2 and
 *          normal texture/sampler at 3/4 when the signature carries them
 */

#include <lumen/device.h>
#include <lumen/types.h>
#include <array>
#include <vector>

namespace lumen {

constexpr uint32_t CAMERA_GROUP = 0;
constexpr uint32_t LIGHT_GROUP = 1;
constexpr uint32_t MODEL_GROUP = 2;
constexpr uint32_t MATERIAL_GROUP = 3;

constexpr uint32_t MATERIAL_PARAMS_BINDING = 0;
constexpr uint32_t DIFFUSE_TEXTURE_BINDING = 1;
constexpr uint32_t DIFFUSE_SAMPLER_BINDING = 2;
constexpr uint32_t NORMAL_TEXTURE_BINDING = 3;
constexpr uint32_t NORMAL_SAMPLER_BINDING = 4;

class BindingLayouts {
public:
    /// Creates every layout on `device`
    explicit BindingLayouts(Device& device);

    BindGroupLayoutId camera(TargetKind target) const {
        return m_camera[static_cast<size_t>(target)];
    }
    BindGroupLayoutId light() const { return m_light; }
    BindGroupLayoutId model() const { return m_model; }
    BindGroupLayoutId material(MaterialSignature signature) const {
        return m_material[signature.bits];
    }

    /// Layouts for groups 0..3 of a pipeline variant
    std::vector<BindGroupLayoutId> pipelineLayout(MaterialSignature signature,
                                                  TargetKind target) const;

    /// Entries of the group 3 layout for a signature
    static std::vector<BindGroupLayoutEntry> materialEntries(MaterialSignature signature);

private:
    std::array<BindGroupLayoutId, 2> m_camera;
    BindGroupLayoutId m_light;
    BindGroupLayoutId m_model;
    std::array<BindGroupLayoutId, MaterialSignature::VARIANT_COUNT> m_material;
};

} // namespace lumen
