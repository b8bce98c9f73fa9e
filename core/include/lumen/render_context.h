#pragma once

/**
 * @file render_context.h
 * @brief Explicit rendering context: device, layouts, shaders, resources, pipelines
 *
 * Components receive the context (or the parts of it they need) explicitly;
 * there is no global renderer state.
 */

#include <lumen/binding_layouts.h>
#include <lumen/device.h>
#include <lumen/pipeline_registry.h>
#include <lumen/resource_manager.h>
#include <lumen/shaders.h>
#include <cstdint>
#include <memory>

namespace lumen {

class RenderContext {
public:
    explicit RenderContext(std::unique_ptr<Device> device);
    ~RenderContext();

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    Device& device() { return *m_device; }
    const BindingLayouts& layouts() const { return *m_layouts; }
    ShaderLibrary& shaders() { return m_shaders; }
    GpuResourceManager& resources() { return *m_resources; }
    PipelineRegistry& pipelines() { return *m_pipelines; }

    /**
     * @brief Rebuild after device loss
     *
     * Recreates the device and binding layouts, and drops every cached
     * pipeline and every mesh, texture, material and buffer handle. Callers
     * must re-upload their assets; components holding per-device state watch
     * epoch() and rebuild when it changes.
     */
    void recoverFromDeviceLoss();

    /// Incremented by every recoverFromDeviceLoss()
    uint64_t epoch() const { return m_epoch; }

private:
    std::unique_ptr<Device> m_device;
    ShaderLibrary m_shaders;
    std::unique_ptr<BindingLayouts> m_layouts;
    std::unique_ptr<GpuResourceManager> m_resources;
    std::unique_ptr<PipelineRegistry> m_pipelines;
    uint64_t m_epoch = 0;
};

} // namespace lumen
