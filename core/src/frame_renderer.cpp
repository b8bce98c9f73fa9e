// Lumen - Frame Renderer Implementation

#include <lumen/frame_renderer.h>
#include <lumen/binding_layouts.h>
#include <lumen/error.h>
#include <lumen/stereo_view.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace lumen {

const char* toString(FrameStatus status) {
    switch (status) {
        case FrameStatus::Ok: return "Ok";
        case FrameStatus::SurfaceLost: return "SurfaceLost";
        case FrameStatus::Timeout: return "Timeout";
        case FrameStatus::DeviceLost: return "DeviceLost";
    }
    return "Unknown";
}

FrameRenderer::FrameRenderer(RenderContext& context, const RendererConfig& config)
    : m_context(context)
    , m_config(config)
    , m_epoch(context.epoch()) {
    m_config.validate();
    m_uniforms = std::make_unique<UniformFrameState>(
        m_context.device(), m_context.resources(), m_context.layouts(), m_config.framesInFlight);
}

FrameRenderer::~FrameRenderer() {
    if (m_state == FrameState::Recording) {
        m_uniforms->abandonFrame(m_token);
    }
}

void FrameRenderer::syncWithContext() {
    if (m_context.epoch() == m_epoch) return;

    // New device: everything per-device is rebuilt, in-flight results are discarded
    m_uniforms = std::make_unique<UniformFrameState>(
        m_context.device(), m_context.resources(), m_context.layouts(), m_config.framesInFlight);
    m_epoch = m_context.epoch();
    m_state = FrameState::Idle;
    m_token = FrameToken{};
    m_draws.clear();
    m_lastSubmission = 0;
}

// -------------------------------------------------------------------------
// Idle -> Recording
// -------------------------------------------------------------------------

FrameStatus FrameRenderer::beginFrame(const CameraData& camera, const LightData& light) {
    return begin(TargetKind::Mono, camera, light);
}

FrameStatus FrameRenderer::beginFrame(const StereoCameraData& camera, const LightData& light) {
    return begin(TargetKind::Stereo, camera, light);
}

template <typename CameraT>
FrameStatus FrameRenderer::begin(TargetKind target, const CameraT& camera, const LightData& light) {
    const FrameStatus status = acquire(target);
    if (status != FrameStatus::Ok) return status;
    start(target, camera, light);
    return FrameStatus::Ok;
}

FrameStatus FrameRenderer::acquire(TargetKind target) {
    if (m_state == FrameState::Recording) {
        throw std::logic_error("[FrameRenderer] beginFrame called while recording");
    }
    syncWithContext();

    Device& device = m_context.device();
    if (device.isLost()) {
        return FrameStatus::DeviceLost;
    }
    poll();

    const AcquiredTarget acquired = device.acquireTarget(target);
    switch (acquired.status) {
        case AcquireStatus::Success:
            break;
        case AcquireStatus::Outdated:
        case AcquireStatus::Lost:
            ++m_surfaceLostCount;
            std::cerr << "[FrameRenderer] Surface lost, reconfigure before the next frame\n";
            return FrameStatus::SurfaceLost;
        case AcquireStatus::Timeout:
            return FrameStatus::Timeout;
        case AcquireStatus::DeviceLost:
            std::cerr << "[FrameRenderer] Device lost\n";
            return FrameStatus::DeviceLost;
    }

    m_targetWidth = acquired.width;
    m_targetHeight = acquired.height;
    return FrameStatus::Ok;
}

template <typename CameraT>
void FrameRenderer::start(TargetKind target, const CameraT& camera, const LightData& light) {
    m_token = m_uniforms->beginFrame(camera, light);
    m_frameTarget = target;
    m_draws.clear();
    m_state = FrameState::Recording;
}

// -------------------------------------------------------------------------
// Recording
// -------------------------------------------------------------------------

void FrameRenderer::draw(const RenderObject& object) {
    if (m_state != FrameState::Recording) {
        throw std::logic_error("[FrameRenderer] draw called outside a frame");
    }

    try {
        GpuResourceManager& resources = m_context.resources();
        const GpuMesh& mesh = resources.mesh(object.mesh);
        const GpuMaterial& material = resources.material(object.material);

        const VertexAttributes required = requiredAttributes(material.signature);
        if (!hasAttributes(mesh.attributes, required)) {
            throw GpuError(ErrorKind::InvalidGeometry,
                           "mesh '" + mesh.label + "' lacks vertex attributes required by " +
                           toString(material.signature) + " material '" + material.name + "'");
        }

        DrawItem item;
        item.pipeline = m_context.pipelines().getOrCreate(material.signature, m_frameTarget);
        item.vertexBuffer = mesh.vertexBuffer;
        item.vertexBufferSize = mesh.vertexBufferSize();
        item.indexBuffer = mesh.indexBuffer;
        item.indexBufferSize = mesh.indexBufferSize();
        item.indexCount = mesh.indexCount;
        item.materialGroup = material.bindGroup;
        item.offset = m_uniforms->stageObject(m_token, object.transform);
        m_draws.push_back(item);
    } catch (const GpuError& e) {
        std::cerr << "[FrameRenderer] Dropping frame: " << e.what() << "\n";
        dropFrame();
        throw;
    }
}

void FrameRenderer::dropFrame() {
    m_uniforms->abandonFrame(m_token);
    m_draws.clear();
    m_state = FrameState::Idle;
}

// -------------------------------------------------------------------------
// Recording -> Submitted
// -------------------------------------------------------------------------

void FrameRenderer::record(const PackedFrame& packed) {
    // Group by pipeline; groups run in pipeline creation order
    std::stable_sort(m_draws.begin(), m_draws.end(), [](const DrawItem& a, const DrawItem& b) {
        return a.pipeline->creationOrder < b.pipeline->creationOrder;
    });

    m_commands.clear();
    m_stats = FrameStats{};
    m_stats.objects = static_cast<uint32_t>(m_draws.size());

    BeginPassCmd pass;
    pass.target = m_frameTarget;
    pass.viewCount = viewCount(m_frameTarget);
    pass.clearColor = m_config.clearColor;
    pass.clearDepth = 1.0f;
    m_commands.beginPass(pass);

    PipelineHandle currentPipeline = nullptr;
    BindGroupId currentMaterial;
    BufferId currentVertices;
    for (const DrawItem& item : m_draws) {
        if (item.pipeline != currentPipeline) {
            m_commands.setPipeline(item.pipeline->pipeline);
            m_commands.setBindGroup(CAMERA_GROUP, packed.cameraGroup);
            m_commands.setBindGroup(LIGHT_GROUP, packed.lightGroup);
            currentPipeline = item.pipeline;
            currentMaterial = {};
            currentVertices = {};
            ++m_stats.pipelineBinds;
        }
        m_commands.setBindGroup(MODEL_GROUP, packed.modelGroup, item.offset);
        if (item.materialGroup != currentMaterial) {
            m_commands.setBindGroup(MATERIAL_GROUP, item.materialGroup);
            currentMaterial = item.materialGroup;
            ++m_stats.materialBinds;
        }
        if (item.vertexBuffer != currentVertices) {
            m_commands.setVertexBuffer(0, item.vertexBuffer, item.vertexBufferSize);
            m_commands.setIndexBuffer(item.indexBuffer, item.indexBufferSize);
            currentVertices = item.vertexBuffer;
        }
        if (item.indexCount > 0) {
            m_commands.drawIndexed(item.indexCount);
            ++m_stats.drawCalls;
        }
    }

    m_commands.endPass();
}

SubmissionId FrameRenderer::endFrame() {
    if (m_state != FrameState::Recording) {
        throw std::logic_error("[FrameRenderer] endFrame called outside a frame");
    }

    Device& device = m_context.device();
    SubmissionId id = 0;
    try {
        m_packed = m_uniforms->endFrame(m_token);
        record(m_packed);

        id = device.submit(m_commands);
        m_uniforms->markSubmitted(m_packed, id);
        m_context.resources().markSubmitted(id);
        m_lastSubmission = id;
        device.present(m_frameTarget);
    } catch (const GpuError& e) {
        std::cerr << "[FrameRenderer] Dropping frame: " << e.what() << "\n";
        // Packed but never submitted: the slot goes back to the pool
        if (!m_token.valid()) m_uniforms->abandonFrame(m_packed);
        dropFrame();
        throw;
    }

    m_draws.clear();
    m_state = FrameState::Submitted;
    ++m_framesSubmitted;
    return id;
}

FrameStatus FrameRenderer::render(const Scene& scene) {
    FrameStatus status;
    if (m_config.target == TargetKind::Stereo) {
        // Eye projections use the acquired eye extent, not the window aspect
        status = acquire(TargetKind::Stereo);
        if (status != FrameStatus::Ok) return status;
        const float aspect = m_targetHeight > 0
            ? static_cast<float>(m_targetWidth) / static_cast<float>(m_targetHeight)
            : scene.camera().getAspect();
        start(TargetKind::Stereo,
              stereoFromCamera(scene.camera(), m_config.interpupillaryDistance, aspect),
              scene.light());
    } else {
        status = beginFrame(scene.camera().data(), scene.light());
        if (status != FrameStatus::Ok) return status;
    }

    for (const RenderObject& object : scene.objects()) {
        draw(object);
    }
    endFrame();
    return FrameStatus::Ok;
}

// -------------------------------------------------------------------------
// Submitted -> Idle
// -------------------------------------------------------------------------

void FrameRenderer::poll() {
    Device& device = m_context.device();
    m_uniforms->slots().poll();
    const SubmissionId completed = device.completedSubmission();
    m_context.resources().collectGarbage(completed);
    if (m_state == FrameState::Submitted && completed >= m_lastSubmission) {
        m_state = FrameState::Idle;
    }
}

void FrameRenderer::reconfigure(uint32_t width, uint32_t height) {
    if (m_state == FrameState::Recording) {
        throw std::logic_error("[FrameRenderer] reconfigure during a frame");
    }
    m_context.device().configureSurface(width, height);
    m_config.width = width;
    m_config.height = height;
    std::cout << "[FrameRenderer] Surface reconfigured to " << width << "x" << height << "\n";
}

} // namespace lumen
