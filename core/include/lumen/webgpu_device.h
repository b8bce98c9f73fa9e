#pragma once

/**
 * @file webgpu_device.h
 * @brief Device implementation on wgpu-native
 *
 * Owns instance, surface, adapter, device and queue for one GLFW window.
 * Stereo passes render to a two-layer eye texture; since webgpu.h exposes
 * no multiview, the pass body is replayed once per layer with the layer
 * index passed as firstInstance (the stereo shaders read it as
 * instance_index). When the surface allows it both eyes are mirrored to
 * the window side by side.
 */

#include <lumen/device.h>
#include <lumen/submission_tracker.h>
#include <webgpu/webgpu.h>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

struct GLFWwindow;

namespace lumen {

struct WebGpuDeviceOptions {
    bool vsync = true;
    uint32_t eyeWidth = 1024;   ///< Eye size when there is no surface to derive it from
    uint32_t eyeHeight = 1024;
};

class WebGpuDevice : public Device {
public:
    /// Throws GpuError(DeviceLost) if no adapter or device is available
    static std::unique_ptr<WebGpuDevice> create(GLFWwindow* window,
                                                const WebGpuDeviceOptions& options = {});
    ~WebGpuDevice() override;

    WebGpuDevice(const WebGpuDevice&) = delete;
    WebGpuDevice& operator=(const WebGpuDevice&) = delete;

    const char* backendName() const override { return "wgpu-native"; }

    BufferId createBuffer(const BufferDesc& desc) override;
    void writeBuffer(BufferId buffer, uint64_t offset, const void* data, size_t size) override;
    void destroyBuffer(BufferId buffer) override;

    TextureId createTexture(const TextureDesc& desc) override;
    void writeTexture(TextureId texture, const void* pixels, size_t size,
                      uint32_t bytesPerRow) override;
    void destroyTexture(TextureId texture) override;

    SamplerId createSampler(const SamplerDesc& desc) override;

    BindGroupLayoutId createBindGroupLayout(const BindGroupLayoutDesc& desc) override;
    BindGroupId createBindGroup(const BindGroupDesc& desc) override;
    void destroyBindGroup(BindGroupId bindGroup) override;

    ShaderModuleId createShaderModule(const ShaderModuleDesc& desc) override;
    PipelineId createRenderPipeline(const RenderPipelineDesc& desc) override;

    TextureFormat colorFormat(TargetKind target) const override;
    AcquiredTarget acquireTarget(TargetKind target) override;
    void configureSurface(uint32_t width, uint32_t height) override;
    void present(TargetKind target) override;

    SubmissionId submit(const CommandList& commands) override;
    SubmissionId completedSubmission() override;
    void waitForSubmission(SubmissionId id) override;

    bool isLost() const override { return m_tracker.lost(); }
    void recreate() override;

    WGPUDevice handle() const { return m_device; }

private:
    struct TextureRecord {
        WGPUTexture texture = nullptr;
        WGPUTextureView view = nullptr;
        uint32_t width = 0;
        uint32_t height = 0;
        TextureFormat format = TextureFormat::Undefined;
    };

    /// Depth (and for stereo, color) attachments with one view per layer
    struct RenderTarget {
        WGPUTexture color = nullptr;
        WGPUTexture depth = nullptr;
        std::array<WGPUTextureView, 2> colorViews{};
        std::array<WGPUTextureView, 2> depthViews{};
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t layers = 0;
    };

    struct ScopeResult {
        bool failed = false;
        std::string message;
    };

    WebGpuDevice(GLFWwindow* window, const WebGpuDeviceOptions& options);

    void requestAdapter();
    void requestDevice();
    void releaseDeviceObjects();
    void ensureTarget(RenderTarget& target, uint32_t width, uint32_t height, uint32_t layers,
                      bool ownsColor);
    void releaseTarget(RenderTarget& target);
    void releaseSurfaceTexture();
    void encodePass(WGPUCommandEncoder encoder, const CommandList& commands,
                    size_t begin, size_t end);
    void mirrorEyes(WGPUCommandEncoder encoder);

    void pushScope(WGPUErrorFilter filter);
    ScopeResult popScope();

    uint64_t nextId() { return m_nextId++; }

    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);
    static void onUncapturedError(WGPUDevice const* device, WGPUErrorType type,
                                  WGPUStringView message, void* userdata1, void* userdata2);
    static void onWorkDone(WGPUQueueWorkDoneStatus status, void* userdata1, void* userdata2);

    GLFWwindow* m_window = nullptr;
    WebGpuDeviceOptions m_options;

    WGPUInstance m_instance = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8UnormSrgb;
    WGPUPresentMode m_presentMode = WGPUPresentMode_Fifo;
    WGPUCompositeAlphaMode m_alphaMode = WGPUCompositeAlphaMode_Auto;
    bool m_surfaceCopyDst = false;
    bool m_surfaceConfigured = false;
    uint32_t m_width = 0;
    uint32_t m_height = 0;

    WGPUTexture m_surfaceTexture = nullptr;
    WGPUTextureView m_surfaceView = nullptr;
    RenderTarget m_monoTarget;
    RenderTarget m_stereoTarget;

    uint64_t m_nextId = 1;
    std::unordered_map<uint64_t, WGPUBuffer> m_buffers;
    std::unordered_map<uint64_t, TextureRecord> m_textures;
    std::unordered_map<uint64_t, WGPUSampler> m_samplers;
    std::unordered_map<uint64_t, WGPUBindGroupLayout> m_bindGroupLayouts;
    std::unordered_map<uint64_t, WGPUBindGroup> m_bindGroups;
    std::unordered_map<uint64_t, WGPUShaderModule> m_shaderModules;
    std::unordered_map<uint64_t, WGPURenderPipeline> m_pipelines;

    SubmissionTracker m_tracker;
};

} // namespace lumen
