#pragma once

/**
 * @file frame_renderer.h
 * @brief Per-frame orchestration: acquire, pack, group by pipeline, submit
 *
 * State machine:
 *
 *   Idle --beginFrame--> Recording --endFrame--> Submitted --poll--> Idle
 *
 * beginFrame() acquires the output target and then a uniform slot. Slot
 * acquisition is the only place the renderer blocks. A frame may be begun
 * while the previous one is still Submitted; the slot pool bounds how far
 * the CPU runs ahead.
 */

#include <lumen/command_list.h>
#include <lumen/config.h>
#include <lumen/gpu_structs.h>
#include <lumen/pipeline_registry.h>
#include <lumen/render_context.h>
#include <lumen/scene.h>
#include <lumen/uniform_frame_state.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace lumen {

enum class FrameStatus : uint8_t {
    Ok,
    SurfaceLost,  ///< Reconfigure the output, then begin again
    Timeout,      ///< No target available this time; try again next frame
    DeviceLost,   ///< RenderContext::recoverFromDeviceLoss() and re-upload assets
};

enum class FrameState : uint8_t { Idle, Recording, Submitted };

const char* toString(FrameStatus status);

struct FrameStats {
    uint32_t objects = 0;
    uint32_t drawCalls = 0;
    uint32_t pipelineBinds = 0;
    uint32_t materialBinds = 0;
};

class FrameRenderer {
public:
    FrameRenderer(RenderContext& context, const RendererConfig& config);
    ~FrameRenderer();

    FrameRenderer(const FrameRenderer&) = delete;
    FrameRenderer& operator=(const FrameRenderer&) = delete;

    // -------------------------------------------------------------------------
    /// @name Frame
    /// @{

    /// Begin a mono frame
    FrameStatus beginFrame(const CameraData& camera, const LightData& light);

    /// Begin a stereo frame; eye 0 renders to layer 0
    FrameStatus beginFrame(const StereoCameraData& camera, const LightData& light);

    /**
     * @brief Queue one object for this frame
     *
     * Throws GpuError(InvalidGeometry) if the mesh lacks a vertex attribute its
     * material's pipeline reads, GpuError(InvalidHandle) for stale handles.
     * Either way the frame is dropped and the renderer returns to Idle.
     */
    void draw(const RenderObject& object);

    /// Record the command stream, submit and present
    SubmissionId endFrame();

    /// beginFrame + draw every object + endFrame for the configured target
    FrameStatus render(const Scene& scene);

    /// @}

    /// Reconfigure the output surface after SurfaceLost (e.g. new window size)
    void reconfigure(uint32_t width, uint32_t height);

    /// Free slots and garbage whose submissions completed; Submitted -> Idle
    void poll();

    FrameState state() const { return m_state; }
    TargetKind target() const { return m_config.target; }
    const CommandList& lastCommands() const { return m_commands; }
    const FrameStats& lastStats() const { return m_stats; }
    const PackedFrame& lastPackedFrame() const { return m_packed; }
    SubmissionId lastSubmission() const { return m_lastSubmission; }
    uint64_t surfaceLostCount() const { return m_surfaceLostCount; }
    uint64_t framesSubmitted() const { return m_framesSubmitted; }
    UniformFrameState& uniforms() { return *m_uniforms; }

private:
    struct DrawItem {
        PipelineHandle pipeline = nullptr;
        BufferId vertexBuffer;
        uint64_t vertexBufferSize = 0;
        BufferId indexBuffer;
        uint64_t indexBufferSize = 0;
        uint32_t indexCount = 0;
        BindGroupId materialGroup;
        ObjectUniformOffset offset = 0;
    };

    template <typename CameraT>
    FrameStatus begin(TargetKind target, const CameraT& camera, const LightData& light);
    FrameStatus acquire(TargetKind target);
    template <typename CameraT>
    void start(TargetKind target, const CameraT& camera, const LightData& light);
    void syncWithContext();
    void dropFrame();
    void record(const PackedFrame& packed);

    RenderContext& m_context;
    RendererConfig m_config;
    std::unique_ptr<UniformFrameState> m_uniforms;
    uint64_t m_epoch = 0;

    FrameState m_state = FrameState::Idle;
    TargetKind m_frameTarget = TargetKind::Mono;
    uint32_t m_targetWidth = 0;
    uint32_t m_targetHeight = 0;
    FrameToken m_token;
    std::vector<DrawItem> m_draws;

    CommandList m_commands;
    FrameStats m_stats;
    PackedFrame m_packed;
    SubmissionId m_lastSubmission = 0;
    uint64_t m_surfaceLostCount = 0;
    uint64_t m_framesSubmitted = 0;
};

} // namespace lumen
