#pragma once

/**
 * @file device.h
 * @brief Abstract graphics device
 *
 * Everything above this interface (resource manager, pipeline registry,
 * uniform state, frame renderer) is backend-neutral. WebGpuDevice drives
 * wgpu-native; HeadlessDevice records and simulates for tests and CI.
 *
 * Object creation is synchronous. Failures throw GpuError.
 */

#include <lumen/command_list.h>
#include <lumen/types.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lumen {

// -------------------------------------------------------------------------
// Descriptors
// -------------------------------------------------------------------------

enum class BufferUsage : uint32_t {
    None = 0,
    Vertex = 1u << 0,
    Index = 1u << 1,
    Uniform = 1u << 2,
    CopyDst = 1u << 3,
};

constexpr BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr bool hasUsage(BufferUsage usage, BufferUsage flag) {
    return (static_cast<uint32_t>(usage) & static_cast<uint32_t>(flag)) != 0;
}

struct BufferDesc {
    std::string label;
    uint64_t size = 0;
    BufferUsage usage = BufferUsage::None;
};

struct TextureDesc {
    std::string label;
    uint32_t width = 0;
    uint32_t height = 0;
    TextureFormat format = TextureFormat::RGBA8Unorm;
};

enum class FilterMode : uint8_t { Nearest, Linear };
enum class AddressMode : uint8_t { Repeat, MirrorRepeat, ClampToEdge };

struct SamplerDesc {
    FilterMode magFilter = FilterMode::Linear;
    FilterMode minFilter = FilterMode::Linear;
    AddressMode addressU = AddressMode::Repeat;
    AddressMode addressV = AddressMode::Repeat;

    bool operator==(const SamplerDesc&) const = default;

    /// Packed key used by the sampler cache
    uint32_t key() const {
        return static_cast<uint32_t>(magFilter) | (static_cast<uint32_t>(minFilter) << 8) |
               (static_cast<uint32_t>(addressU) << 16) | (static_cast<uint32_t>(addressV) << 24);
    }
};

enum class BindingType : uint8_t {
    UniformBuffer,
    DynamicUniformBuffer,
    Texture2D,
    Sampler,
};

enum class ShaderStage : uint8_t {
    Vertex = 1u << 0,
    Fragment = 1u << 1,
    VertexFragment = Vertex | Fragment,
};

struct BindGroupLayoutEntry {
    uint32_t binding = 0;
    BindingType type = BindingType::UniformBuffer;
    ShaderStage visibility = ShaderStage::VertexFragment;
    uint64_t minBindingSize = 0;
};

struct BindGroupLayoutDesc {
    std::string label;
    std::vector<BindGroupLayoutEntry> entries;
};

/// One resource binding. Exactly one of buffer / texture / sampler is set.
struct BindGroupEntry {
    uint32_t binding = 0;
    BufferId buffer;
    uint64_t offset = 0;
    uint64_t size = 0;
    TextureId texture;
    SamplerId sampler;
};

struct BindGroupDesc {
    std::string label;
    BindGroupLayoutId layout;
    std::vector<BindGroupEntry> entries;
};

struct ShaderModuleDesc {
    std::string label;
    std::string wgsl;
};

enum class VertexFormat : uint8_t { Float32x2, Float32x3, Float32x4 };

struct VertexAttributeDesc {
    VertexFormat format = VertexFormat::Float32x3;
    uint32_t offset = 0;
    uint32_t location = 0;

    bool operator==(const VertexAttributeDesc&) const = default;
};

enum class CullMode : uint8_t { None, Front, Back };
enum class CompareFunction : uint8_t { Less, LessEqual, Always };

struct RenderPipelineDesc {
    std::string label;
    ShaderModuleId shader;
    std::vector<BindGroupLayoutId> bindGroupLayouts;
    uint32_t vertexStride = 0;
    std::vector<VertexAttributeDesc> attributes;
    TextureFormat colorFormat = TextureFormat::BGRA8UnormSrgb;
    TextureFormat depthFormat = TextureFormat::Depth32Float;
    uint32_t viewCount = 1;
    CullMode cullMode = CullMode::Back;
    bool depthWrite = true;
    CompareFunction depthCompare = CompareFunction::Less;
};

// -------------------------------------------------------------------------
// Target acquisition
// -------------------------------------------------------------------------

enum class AcquireStatus : uint8_t {
    Success,
    Outdated,    ///< Surface no longer matches (resize); reconfigure
    Lost,        ///< Surface lost; reconfigure
    Timeout,
    DeviceLost,
};

struct AcquiredTarget {
    AcquireStatus status = AcquireStatus::Success;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t layers = 1;
};

// -------------------------------------------------------------------------
// Device
// -------------------------------------------------------------------------

class Device {
public:
    virtual ~Device() = default;

    virtual const char* backendName() const = 0;

    /// @name Resources
    /// @{
    virtual BufferId createBuffer(const BufferDesc& desc) = 0;
    virtual void writeBuffer(BufferId buffer, uint64_t offset, const void* data, size_t size) = 0;
    virtual void destroyBuffer(BufferId buffer) = 0;

    virtual TextureId createTexture(const TextureDesc& desc) = 0;
    virtual void writeTexture(TextureId texture, const void* pixels, size_t size,
                              uint32_t bytesPerRow) = 0;
    virtual void destroyTexture(TextureId texture) = 0;

    virtual SamplerId createSampler(const SamplerDesc& desc) = 0;

    virtual BindGroupLayoutId createBindGroupLayout(const BindGroupLayoutDesc& desc) = 0;
    virtual BindGroupId createBindGroup(const BindGroupDesc& desc) = 0;
    virtual void destroyBindGroup(BindGroupId bindGroup) = 0;
    /// @}

    /// @name Pipelines
    /// @{
    /// Throws GpuError(ShaderCompilationError) when the source does not compile
    virtual ShaderModuleId createShaderModule(const ShaderModuleDesc& desc) = 0;
    virtual PipelineId createRenderPipeline(const RenderPipelineDesc& desc) = 0;
    /// @}

    /// @name Targets
    /// @{
    /// Color format of the given target kind
    virtual TextureFormat colorFormat(TargetKind target) const = 0;
    virtual AcquiredTarget acquireTarget(TargetKind target) = 0;
    virtual void configureSurface(uint32_t width, uint32_t height) = 0;
    virtual void present(TargetKind target) = 0;
    /// @}

    /// @name Submission
    /// @{
    virtual SubmissionId submit(const CommandList& commands) = 0;
    /// Highest submission id known to be complete (non-blocking)
    virtual SubmissionId completedSubmission() = 0;
    /// Block until `id` has completed or the device is lost
    virtual void waitForSubmission(SubmissionId id) = 0;
    /// @}

    /// @name Loss
    /// @{
    virtual bool isLost() const = 0;
    /// Replace the lost device with a fresh one. Every previously issued id is invalid.
    virtual void recreate() = 0;
    /// @}
};

} // namespace lumen
