// Lumen - Render Context Implementation

#include <lumen/render_context.h>
#include <iostream>
#include <stdexcept>

namespace lumen {

RenderContext::RenderContext(std::unique_ptr<Device> device)
    : m_device(std::move(device)) {
    if (!m_device) {
        throw std::invalid_argument("RenderContext requires a device");
    }
    m_layouts = std::make_unique<BindingLayouts>(*m_device);
    m_resources = std::make_unique<GpuResourceManager>(*m_device, *m_layouts);
    m_pipelines = std::make_unique<PipelineRegistry>(*m_device, *m_layouts, m_shaders);
    std::cout << "[RenderContext] Using " << m_device->backendName() << " device\n";
}

RenderContext::~RenderContext() {
    // Resources release device objects, so they go before the device
    m_pipelines.reset();
    m_resources.reset();
    m_layouts.reset();
    m_device.reset();
}

void RenderContext::recoverFromDeviceLoss() {
    std::cerr << "[RenderContext] Rebuilding after device loss\n";

    m_device->recreate();

    // Old ids belong to the lost device; forget them without destroying
    m_pipelines->invalidateAll();
    m_resources->invalidateAll();
    *m_layouts = BindingLayouts(*m_device);

    ++m_epoch;
}

} // namespace lumen
