#pragma once

/**
 * @file pipeline_registry.h
 * @brief Lazily built, never evicted cache of render pipelines
 *
 * A pipeline is keyed by (material signature, target kind): four material
 * shapes times two targets gives at most eight entries per device.
 */

#include <lumen/binding_layouts.h>
#include <lumen/device.h>
#include <lumen/shaders.h>
#include <lumen/types.h>
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace lumen {

struct PipelineKey {
    MaterialSignature signature;
    TargetKind target = TargetKind::Mono;

    /// Dense index in [0, 8): target bit above the two signature bits
    constexpr uint32_t packed() const {
        return (static_cast<uint32_t>(target) << 2) | signature.bits;
    }

    constexpr bool operator==(const PipelineKey&) const = default;
};

constexpr uint32_t MAX_PIPELINES = 8;

/// A built pipeline. Immutable after creation.
struct Pipeline {
    PipelineKey key;
    PipelineId pipeline;
    ShaderModuleId shader;
    std::vector<VertexAttributeDesc> attributes;
    VertexAttributes requiredAttributes = VertexAttributes::Position;
    uint32_t creationOrder = 0;  ///< Draw groups are ordered by this
};

/// Stable identity of a cached pipeline; valid until invalidateAll()
using PipelineHandle = const Pipeline*;

class PipelineRegistry {
public:
    PipelineRegistry(Device& device, const BindingLayouts& layouts, const ShaderLibrary& shaders);

    PipelineRegistry(const PipelineRegistry&) = delete;
    PipelineRegistry& operator=(const PipelineRegistry&) = delete;

    /**
     * @brief Return the cached pipeline for a key, building it on first use
     *
     * Throws GpuError(ShaderCompilationError) if the variant does not
     * compile. That is a packaging defect and callers treat it as fatal.
     */
    PipelineHandle getOrCreate(MaterialSignature signature, TargetKind target);

    /// Build all four material variants for a target up front
    void prewarm(TargetKind target);

    /// Cached entry or nullptr
    PipelineHandle find(MaterialSignature signature, TargetKind target) const;

    /// Drop every entry after device loss
    void invalidateAll();

    size_t size() const { return m_count; }
    uint64_t invalidationCount() const { return m_invalidations; }

    /// Vertex attributes a variant reads, in shader location order
    static std::vector<VertexAttributeDesc> vertexAttributes(MaterialSignature signature);

private:
    Device& m_device;
    const BindingLayouts& m_layouts;
    const ShaderLibrary& m_shaders;

    std::array<std::unique_ptr<Pipeline>, MAX_PIPELINES> m_cache;
    size_t m_count = 0;
    uint32_t m_nextOrder = 0;
    uint64_t m_invalidations = 0;
};

} // namespace lumen
