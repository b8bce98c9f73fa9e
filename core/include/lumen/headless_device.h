#pragma once

/**
 * @file headless_device.h
 * @brief Device that records submissions instead of talking to a GPU
 *
 * Used by the test suite and `lumen --headless`. It keeps buffer contents in
 * host memory, stores every submitted CommandList, and can simulate the
 * failure modes of a real device: surface invalidation, device loss, shader
 * compile errors and memory exhaustion. Completion is either immediate
 * (auto-complete) or driven manually from another thread.
 */

#include <lumen/device.h>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace lumen {

struct HeadlessDeviceOptions {
    uint32_t width = 1280;
    uint32_t height = 720;
    uint32_t eyeWidth = 1024;
    uint32_t eyeHeight = 1024;
    bool autoComplete = true;
    uint64_t memoryBudget = 0;  ///< 0 = unlimited
};

class HeadlessDevice : public Device {
public:
    explicit HeadlessDevice(const HeadlessDeviceOptions& options = {});
    ~HeadlessDevice() override = default;

    const char* backendName() const override { return "headless"; }

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

    bool isLost() const override;
    void recreate() override;

    // -------------------------------------------------------------------------
    /// @name Simulation controls
    /// @{

    /// Resize the output. The next mono acquire reports Outdated once.
    void simulateResize(uint32_t width, uint32_t height);

    /// Mark the device lost. Pending waits return immediately.
    void simulateDeviceLoss();

    /// Complete every submission up to and including `id`
    void completeSubmission(SubmissionId id);

    void setAutoComplete(bool enabled);
    void setMemoryBudget(uint64_t bytes);

    /// @}

    // -------------------------------------------------------------------------
    /// @name Inspection
    /// @{

    const std::vector<CommandList>& submissions() const { return m_submissions; }
    const CommandList& lastSubmission() const;

    /// Host copy of a buffer's contents. Throws std::out_of_range for unknown ids.
    const std::vector<uint8_t>& bufferContents(BufferId buffer) const;
    uint64_t bufferSize(BufferId buffer) const;

    bool hasBuffer(BufferId buffer) const { return m_buffers.count(buffer.value) != 0; }
    bool hasTexture(TextureId texture) const { return m_textures.count(texture.value) != 0; }

    const RenderPipelineDesc& pipelineDesc(PipelineId pipeline) const;
    const std::string& shaderSource(ShaderModuleId shader) const;

    size_t liveBufferCount() const { return m_buffers.size(); }
    size_t liveTextureCount() const { return m_textures.size(); }
    size_t samplerCount() const { return m_samplers.size(); }
    size_t pipelineCount() const { return m_pipelines.size(); }
    size_t presentCount() const { return m_presentCount; }
    uint64_t allocatedBytes() const { return m_allocatedBytes; }
    uint32_t surfaceWidth() const { return m_width; }
    uint32_t surfaceHeight() const { return m_height; }
    uint32_t deviceGeneration() const { return m_deviceGeneration; }

    /// @}

private:
    struct BufferRecord {
        BufferDesc desc;
        std::vector<uint8_t> data;
    };

    struct TextureRecord {
        TextureDesc desc;
        uint64_t byteSize = 0;
        std::vector<uint8_t> pixels;
    };

    uint64_t nextId() { return ++m_nextId; }
    void reserveMemory(uint64_t bytes, const std::string& label);
    void clearObjects();

    HeadlessDeviceOptions m_options;
    uint64_t m_nextId = 0;
    uint32_t m_width;
    uint32_t m_height;
    bool m_surfaceOutdated = false;
    uint64_t m_allocatedBytes = 0;
    uint32_t m_deviceGeneration = 1;
    size_t m_presentCount = 0;

    std::unordered_map<uint64_t, BufferRecord> m_buffers;
    std::unordered_map<uint64_t, TextureRecord> m_textures;
    std::unordered_map<uint64_t, SamplerDesc> m_samplers;
    std::unordered_map<uint64_t, BindGroupLayoutDesc> m_layouts;
    std::unordered_map<uint64_t, BindGroupDesc> m_bindGroups;
    std::unordered_map<uint64_t, std::string> m_shaders;
    std::unordered_map<uint64_t, RenderPipelineDesc> m_pipelines;
    std::vector<CommandList> m_submissions;

    // Completion state is shared with the thread that completes submissions
    mutable std::mutex m_mutex;
    std::condition_variable m_completed;
    SubmissionId m_lastSubmitted = 0;
    SubmissionId m_lastCompleted = 0;
    bool m_autoComplete;
    bool m_lost = false;
};

} // namespace lumen
