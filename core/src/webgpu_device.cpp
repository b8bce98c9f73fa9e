// Lumen - WebGPU Device Implementation
// wgpu-native backend with a GLFW window surface

#include <lumen/webgpu_device.h>
#include <lumen/error.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <variant>
#include <vector>

namespace lumen {

namespace {

WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

std::string fromStringView(WGPUStringView sv) {
    if (!sv.data) return "unknown";
    size_t len = sv.length == WGPU_STRLEN ? strlen(sv.data) : sv.length;
    return std::string(sv.data, len);
}

WGPUTextureFormat toWGPU(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm: return WGPUTextureFormat_R8Unorm;
        case TextureFormat::RG8Unorm: return WGPUTextureFormat_RG8Unorm;
        case TextureFormat::RGBA8Unorm: return WGPUTextureFormat_RGBA8Unorm;
        case TextureFormat::RGBA8UnormSrgb: return WGPUTextureFormat_RGBA8UnormSrgb;
        case TextureFormat::BGRA8Unorm: return WGPUTextureFormat_BGRA8Unorm;
        case TextureFormat::BGRA8UnormSrgb: return WGPUTextureFormat_BGRA8UnormSrgb;
        case TextureFormat::RGBA16Float: return WGPUTextureFormat_RGBA16Float;
        case TextureFormat::RGBA32Float: return WGPUTextureFormat_RGBA32Float;
        case TextureFormat::BC1RGBAUnorm: return WGPUTextureFormat_BC1RGBAUnorm;
        case TextureFormat::BC3RGBAUnorm: return WGPUTextureFormat_BC3RGBAUnorm;
        case TextureFormat::Depth32Float: return WGPUTextureFormat_Depth32Float;
        default: return WGPUTextureFormat_Undefined;
    }
}

TextureFormat fromWGPU(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_RGBA8Unorm: return TextureFormat::RGBA8Unorm;
        case WGPUTextureFormat_RGBA8UnormSrgb: return TextureFormat::RGBA8UnormSrgb;
        case WGPUTextureFormat_BGRA8Unorm: return TextureFormat::BGRA8Unorm;
        case WGPUTextureFormat_BGRA8UnormSrgb: return TextureFormat::BGRA8UnormSrgb;
        case WGPUTextureFormat_RGBA16Float: return TextureFormat::RGBA16Float;
        default: return TextureFormat::Undefined;
    }
}

WGPUBufferUsage toWGPU(BufferUsage usage) {
    WGPUBufferUsage result = WGPUBufferUsage_None;
    if (hasUsage(usage, BufferUsage::Vertex)) result |= WGPUBufferUsage_Vertex;
    if (hasUsage(usage, BufferUsage::Index)) result |= WGPUBufferUsage_Index;
    if (hasUsage(usage, BufferUsage::Uniform)) result |= WGPUBufferUsage_Uniform;
    if (hasUsage(usage, BufferUsage::CopyDst)) result |= WGPUBufferUsage_CopyDst;
    return result;
}

WGPUShaderStage toWGPU(ShaderStage stage) {
    WGPUShaderStage result = WGPUShaderStage_None;
    const auto bits = static_cast<uint32_t>(stage);
    if (bits & static_cast<uint32_t>(ShaderStage::Vertex)) result |= WGPUShaderStage_Vertex;
    if (bits & static_cast<uint32_t>(ShaderStage::Fragment)) result |= WGPUShaderStage_Fragment;
    return result;
}

WGPUFilterMode toWGPU(FilterMode mode) {
    return mode == FilterMode::Nearest ? WGPUFilterMode_Nearest : WGPUFilterMode_Linear;
}

WGPUAddressMode toWGPU(AddressMode mode) {
    switch (mode) {
        case AddressMode::Repeat: return WGPUAddressMode_Repeat;
        case AddressMode::MirrorRepeat: return WGPUAddressMode_MirrorRepeat;
        case AddressMode::ClampToEdge: return WGPUAddressMode_ClampToEdge;
    }
    return WGPUAddressMode_Repeat;
}

WGPUVertexFormat toWGPU(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return WGPUVertexFormat_Float32x2;
        case VertexFormat::Float32x3: return WGPUVertexFormat_Float32x3;
        case VertexFormat::Float32x4: return WGPUVertexFormat_Float32x4;
    }
    return WGPUVertexFormat_Float32x3;
}

WGPUCullMode toWGPU(CullMode mode) {
    switch (mode) {
        case CullMode::None: return WGPUCullMode_None;
        case CullMode::Front: return WGPUCullMode_Front;
        case CullMode::Back: return WGPUCullMode_Back;
    }
    return WGPUCullMode_Back;
}

WGPUCompareFunction toWGPU(CompareFunction func) {
    switch (func) {
        case CompareFunction::Less: return WGPUCompareFunction_Less;
        case CompareFunction::LessEqual: return WGPUCompareFunction_LessEqual;
        case CompareFunction::Always: return WGPUCompareFunction_Always;
    }
    return WGPUCompareFunction_Less;
}

template <typename Map>
auto lookup(const Map& map, uint64_t id, const char* what) {
    auto it = map.find(id);
    if (it == map.end()) {
        throw std::out_of_range(std::string("[WebGpuDevice] unknown ") + what + " id " +
                                std::to_string(id));
    }
    return it->second;
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[WebGpuDevice] Adapter request failed: " << fromStringView(message) << "\n";
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[WebGpuDevice] Device request failed: " << fromStringView(message) << "\n";
    }
    data->done = true;
}

struct ScopeUserData {
    bool done = false;
    bool failed = false;
    std::string message;
};

void onPopErrorScope(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                     WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<ScopeUserData*>(userdata1);
    if (status == WGPUPopErrorScopeStatus_Success && type != WGPUErrorType_NoError) {
        data->failed = true;
        data->message = fromStringView(message);
    }
    data->done = true;
}

} // namespace

// -------------------------------------------------------------------------
// Creation
// -------------------------------------------------------------------------

std::unique_ptr<WebGpuDevice> WebGpuDevice::create(GLFWwindow* window,
                                                   const WebGpuDeviceOptions& options) {
    if (!window) {
        throw std::invalid_argument("WebGpuDevice requires a window");
    }
    std::unique_ptr<WebGpuDevice> device(new WebGpuDevice(window, options));
    device->requestAdapter();
    device->requestDevice();

    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(window, &width, &height);
    device->configureSurface(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    return device;
}

WebGpuDevice::WebGpuDevice(GLFWwindow* window, const WebGpuDeviceOptions& options)
    : m_window(window)
    , m_options(options) {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        throw GpuError(ErrorKind::DeviceLost, "failed to create WebGPU instance");
    }

    m_surface = glfwCreateWindowWGPUSurface(m_instance, window);
    if (!m_surface) {
        wgpuInstanceRelease(m_instance);
        throw GpuError(ErrorKind::DeviceLost, "failed to create window surface");
    }
}

WebGpuDevice::~WebGpuDevice() {
    releaseDeviceObjects();
    if (m_surface) {
        if (m_surfaceConfigured) wgpuSurfaceUnconfigure(m_surface);
        wgpuSurfaceRelease(m_surface);
    }
    if (m_adapter) wgpuAdapterRelease(m_adapter);
    if (m_instance) wgpuInstanceRelease(m_instance);
}

void WebGpuDevice::requestAdapter() {
    if (m_adapter) {
        wgpuAdapterRelease(m_adapter);
        m_adapter = nullptr;
    }

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo callback = {};
    callback.mode = WGPUCallbackMode_AllowSpontaneous;
    callback.callback = onAdapterRequestEnded;
    callback.userdata1 = &adapterData;
    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, callback);

    // wgpu-native resolves the request before returning
    if (!adapterData.done || !adapterData.adapter) {
        throw GpuError(ErrorKind::DeviceLost, "no compatible GPU adapter");
    }
    m_adapter = adapterData.adapter;

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[WebGpuDevice] Adapter: " << fromStringView(info.device) << "\n";
    wgpuAdapterInfoFreeMembers(info);

    // Surface format, present mode and mirror support
    WGPUSurfaceCapabilities caps = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &caps);
    m_surfaceFormat = caps.formatCount > 0 ? caps.formats[0] : WGPUTextureFormat_BGRA8Unorm;
    for (size_t i = 0; i < caps.formatCount; ++i) {
        if (caps.formats[i] == WGPUTextureFormat_BGRA8UnormSrgb) {
            m_surfaceFormat = caps.formats[i];
            break;
        }
    }
    m_presentMode = WGPUPresentMode_Fifo;
    if (!m_options.vsync) {
        for (size_t i = 0; i < caps.presentModeCount; ++i) {
            if (caps.presentModes[i] == WGPUPresentMode_Immediate) {
                m_presentMode = WGPUPresentMode_Immediate;
            }
        }
    }
    m_alphaMode = caps.alphaModeCount > 0 ? caps.alphaModes[0] : WGPUCompositeAlphaMode_Auto;
    m_surfaceCopyDst = (caps.usages & WGPUTextureUsage_CopyDst) != 0;
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    if (fromWGPU(m_surfaceFormat) == TextureFormat::Undefined) {
        throw GpuError(ErrorKind::UnsupportedFormat, "surface has no usable color format");
    }
}

void WebGpuDevice::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("Lumen Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onUncapturedError;
    deviceDesc.uncapturedErrorCallbackInfo.userdata1 = this;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo callback = {};
    callback.mode = WGPUCallbackMode_AllowSpontaneous;
    callback.callback = onDeviceRequestEnded;
    callback.userdata1 = &deviceData;
    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, callback);

    if (!deviceData.done || !deviceData.device) {
        throw GpuError(ErrorKind::DeviceLost, "failed to create GPU device");
    }
    m_device = deviceData.device;
    m_queue = wgpuDeviceGetQueue(m_device);
}

void WebGpuDevice::releaseDeviceObjects() {
    releaseSurfaceTexture();
    releaseTarget(m_monoTarget);
    releaseTarget(m_stereoTarget);

    for (auto& [id, pipeline] : m_pipelines) wgpuRenderPipelineRelease(pipeline);
    for (auto& [id, module] : m_shaderModules) wgpuShaderModuleRelease(module);
    for (auto& [id, group] : m_bindGroups) wgpuBindGroupRelease(group);
    for (auto& [id, layout] : m_bindGroupLayouts) wgpuBindGroupLayoutRelease(layout);
    for (auto& [id, sampler] : m_samplers) wgpuSamplerRelease(sampler);
    for (auto& [id, tex] : m_textures) {
        wgpuTextureViewRelease(tex.view);
        wgpuTextureRelease(tex.texture);
    }
    for (auto& [id, buffer] : m_buffers) wgpuBufferRelease(buffer);
    m_pipelines.clear();
    m_shaderModules.clear();
    m_bindGroups.clear();
    m_bindGroupLayouts.clear();
    m_samplers.clear();
    m_textures.clear();
    m_buffers.clear();

    if (m_queue) {
        wgpuQueueRelease(m_queue);
        m_queue = nullptr;
    }
    if (m_device) {
        wgpuDeviceRelease(m_device);
        m_device = nullptr;
    }
}

void WebGpuDevice::recreate() {
    std::cerr << "[WebGpuDevice] Recreating device\n";
    releaseDeviceObjects();
    if (m_surfaceConfigured) {
        wgpuSurfaceUnconfigure(m_surface);
        m_surfaceConfigured = false;
    }

    requestAdapter();
    requestDevice();
    m_tracker.resetForNewDevice();

    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window, &width, &height);
    configureSurface(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
}

// -------------------------------------------------------------------------
// Callbacks
// -------------------------------------------------------------------------

void WebGpuDevice::onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                                WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    // Explicit release reports Destroyed; that is not a loss
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    auto* self = static_cast<WebGpuDevice*>(userdata1);
    if (!self) return;
    // A device released by recreate() can still report late
    if (device && *device != self->m_device) return;
    std::cerr << "[WebGpuDevice] Device lost: " << fromStringView(message) << "\n";
    self->m_tracker.markLost();
}

void WebGpuDevice::onUncapturedError(WGPUDevice const* /*device*/, WGPUErrorType type,
                                     WGPUStringView message, void* /*userdata1*/,
                                     void* /*userdata2*/) {
    std::cerr << "[WebGpuDevice] Error (" << static_cast<int>(type)
              << "): " << fromStringView(message) << "\n";
}

void WebGpuDevice::onWorkDone(WGPUQueueWorkDoneStatus status, void* userdata1, void* userdata2) {
    auto* self = static_cast<WebGpuDevice*>(userdata1);
    const auto id = static_cast<SubmissionId>(reinterpret_cast<uintptr_t>(userdata2));
    self->m_tracker.complete(id, status == WGPUQueueWorkDoneStatus_Success);
}

void WebGpuDevice::pushScope(WGPUErrorFilter filter) {
    wgpuDevicePushErrorScope(m_device, filter);
}

WebGpuDevice::ScopeResult WebGpuDevice::popScope() {
    ScopeUserData data;
    WGPUPopErrorScopeCallbackInfo callback = {};
    callback.mode = WGPUCallbackMode_AllowSpontaneous;
    callback.callback = onPopErrorScope;
    callback.userdata1 = &data;
    wgpuDevicePopErrorScope(m_device, callback);
    if (!data.done) {
        wgpuDevicePoll(m_device, false, nullptr);
    }
    return {data.failed, data.message};
}

// -------------------------------------------------------------------------
// Buffers
// -------------------------------------------------------------------------

BufferId WebGpuDevice::createBuffer(const BufferDesc& desc) {
    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView(desc.label.c_str());
    bufferDesc.size = desc.size;
    bufferDesc.usage = toWGPU(desc.usage);

    pushScope(WGPUErrorFilter_OutOfMemory);
    WGPUBuffer buffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
    ScopeResult result = popScope();
    if (result.failed || !buffer) {
        if (buffer) wgpuBufferRelease(buffer);
        throw GpuError(ErrorKind::OutOfDeviceMemory,
                       desc.label + " (" + std::to_string(desc.size) + " bytes): " + result.message);
    }

    const uint64_t id = nextId();
    m_buffers.emplace(id, buffer);
    return BufferId{id};
}

void WebGpuDevice::writeBuffer(BufferId buffer, uint64_t offset, const void* data, size_t size) {
    wgpuQueueWriteBuffer(m_queue, lookup(m_buffers, buffer.value, "buffer"), offset, data, size);
}

void WebGpuDevice::destroyBuffer(BufferId buffer) {
    auto it = m_buffers.find(buffer.value);
    if (it == m_buffers.end()) return;
    wgpuBufferDestroy(it->second);
    wgpuBufferRelease(it->second);
    m_buffers.erase(it);
}

// -------------------------------------------------------------------------
// Textures and samplers
// -------------------------------------------------------------------------

TextureId WebGpuDevice::createTexture(const TextureDesc& desc) {
    const WGPUTextureFormat format = toWGPU(desc.format);
    if (format == WGPUTextureFormat_Undefined) {
        throw GpuError(ErrorKind::UnsupportedFormat, desc.label + ": " + toString(desc.format));
    }

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(desc.label.c_str());
    texDesc.size = {desc.width, desc.height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = format;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

    pushScope(WGPUErrorFilter_OutOfMemory);
    WGPUTexture texture = wgpuDeviceCreateTexture(m_device, &texDesc);
    ScopeResult result = popScope();
    if (result.failed || !texture) {
        if (texture) wgpuTextureRelease(texture);
        throw GpuError(ErrorKind::OutOfDeviceMemory, desc.label + ": " + result.message);
    }

    TextureRecord record;
    record.texture = texture;
    record.view = wgpuTextureCreateView(texture, nullptr);
    record.width = desc.width;
    record.height = desc.height;
    record.format = desc.format;

    const uint64_t id = nextId();
    m_textures.emplace(id, record);
    return TextureId{id};
}

void WebGpuDevice::writeTexture(TextureId texture, const void* pixels, size_t size,
                                uint32_t bytesPerRow) {
    const TextureRecord record = lookup(m_textures, texture.value, "texture");

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = record.texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout layout = {};
    layout.offset = 0;
    layout.bytesPerRow = bytesPerRow;
    layout.rowsPerImage = record.height;

    WGPUExtent3D extent = {record.width, record.height, 1};
    wgpuQueueWriteTexture(m_queue, &destination, pixels, size, &layout, &extent);
}

void WebGpuDevice::destroyTexture(TextureId texture) {
    auto it = m_textures.find(texture.value);
    if (it == m_textures.end()) return;
    wgpuTextureViewRelease(it->second.view);
    wgpuTextureDestroy(it->second.texture);
    wgpuTextureRelease(it->second.texture);
    m_textures.erase(it);
}

SamplerId WebGpuDevice::createSampler(const SamplerDesc& desc) {
    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = toWGPU(desc.addressU);
    samplerDesc.addressModeV = toWGPU(desc.addressV);
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = toWGPU(desc.magFilter);
    samplerDesc.minFilter = toWGPU(desc.minFilter);
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Linear;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 32.0f;
    samplerDesc.maxAnisotropy = 1;

    const uint64_t id = nextId();
    m_samplers.emplace(id, wgpuDeviceCreateSampler(m_device, &samplerDesc));
    return SamplerId{id};
}

// -------------------------------------------------------------------------
// Bind groups
// -------------------------------------------------------------------------

BindGroupLayoutId WebGpuDevice::createBindGroupLayout(const BindGroupLayoutDesc& desc) {
    std::vector<WGPUBindGroupLayoutEntry> entries(desc.entries.size());
    for (size_t i = 0; i < desc.entries.size(); ++i) {
        const BindGroupLayoutEntry& src = desc.entries[i];
        WGPUBindGroupLayoutEntry& entry = entries[i];
        entry = {};
        entry.binding = src.binding;
        entry.visibility = toWGPU(src.visibility);
        switch (src.type) {
            case BindingType::UniformBuffer:
            case BindingType::DynamicUniformBuffer:
                entry.buffer.type = WGPUBufferBindingType_Uniform;
                entry.buffer.hasDynamicOffset = src.type == BindingType::DynamicUniformBuffer;
                entry.buffer.minBindingSize = src.minBindingSize;
                break;
            case BindingType::Texture2D:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                entry.texture.multisampled = false;
                break;
            case BindingType::Sampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
        }
    }

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView(desc.label.c_str());
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();

    const uint64_t id = nextId();
    m_bindGroupLayouts.emplace(id, wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc));
    return BindGroupLayoutId{id};
}

BindGroupId WebGpuDevice::createBindGroup(const BindGroupDesc& desc) {
    std::vector<WGPUBindGroupEntry> entries(desc.entries.size());
    for (size_t i = 0; i < desc.entries.size(); ++i) {
        const BindGroupEntry& src = desc.entries[i];
        WGPUBindGroupEntry& entry = entries[i];
        entry = {};
        entry.binding = src.binding;
        if (src.buffer) {
            entry.buffer = lookup(m_buffers, src.buffer.value, "buffer");
            entry.offset = src.offset;
            entry.size = src.size;
        } else if (src.texture) {
            entry.textureView = lookup(m_textures, src.texture.value, "texture").view;
        } else if (src.sampler) {
            entry.sampler = lookup(m_samplers, src.sampler.value, "sampler");
        }
    }

    WGPUBindGroupDescriptor groupDesc = {};
    groupDesc.label = toStringView(desc.label.c_str());
    groupDesc.layout = lookup(m_bindGroupLayouts, desc.layout.value, "bind group layout");
    groupDesc.entryCount = entries.size();
    groupDesc.entries = entries.data();

    const uint64_t id = nextId();
    m_bindGroups.emplace(id, wgpuDeviceCreateBindGroup(m_device, &groupDesc));
    return BindGroupId{id};
}

void WebGpuDevice::destroyBindGroup(BindGroupId bindGroup) {
    auto it = m_bindGroups.find(bindGroup.value);
    if (it == m_bindGroups.end()) return;
    wgpuBindGroupRelease(it->second);
    m_bindGroups.erase(it);
}

// -------------------------------------------------------------------------
// Shaders and pipelines
// -------------------------------------------------------------------------

ShaderModuleId WebGpuDevice::createShaderModule(const ShaderModuleDesc& desc) {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(desc.wgsl.c_str());

    WGPUShaderModuleDescriptor moduleDesc = {};
    moduleDesc.nextInChain = &wgslDesc.chain;
    moduleDesc.label = toStringView(desc.label.c_str());

    pushScope(WGPUErrorFilter_Validation);
    WGPUShaderModule module = wgpuDeviceCreateShaderModule(m_device, &moduleDesc);
    ScopeResult result = popScope();
    if (result.failed || !module) {
        if (module) wgpuShaderModuleRelease(module);
        throw GpuError(ErrorKind::ShaderCompilationError, desc.label + ": " + result.message);
    }

    const uint64_t id = nextId();
    m_shaderModules.emplace(id, module);
    return ShaderModuleId{id};
}

PipelineId WebGpuDevice::createRenderPipeline(const RenderPipelineDesc& desc) {
    WGPUShaderModule module = lookup(m_shaderModules, desc.shader.value, "shader module");

    std::vector<WGPUBindGroupLayout> groupLayouts;
    groupLayouts.reserve(desc.bindGroupLayouts.size());
    for (BindGroupLayoutId layout : desc.bindGroupLayouts) {
        groupLayouts.push_back(lookup(m_bindGroupLayouts, layout.value, "bind group layout"));
    }

    WGPUPipelineLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView(desc.label.c_str());
    layoutDesc.bindGroupLayoutCount = groupLayouts.size();
    layoutDesc.bindGroupLayouts = groupLayouts.data();
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &layoutDesc);

    std::vector<WGPUVertexAttribute> attributes(desc.attributes.size());
    for (size_t i = 0; i < desc.attributes.size(); ++i) {
        attributes[i] = {};
        attributes[i].format = toWGPU(desc.attributes[i].format);
        attributes[i].offset = desc.attributes[i].offset;
        attributes[i].shaderLocation = desc.attributes[i].location;
    }

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = desc.vertexStride;
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = attributes.size();
    vertexLayout.attributes = attributes.data();

    // No blend state = replace
    WGPUColorTargetState colorTarget = {};
    colorTarget.format = toWGPU(desc.colorFormat);
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = module;
    fragment.entryPoint = toStringView("fs_main");
    fragment.targetCount = 1;
    fragment.targets = &colorTarget;

    WGPUStencilFaceState stencilFace = {};
    stencilFace.compare = WGPUCompareFunction_Always;
    stencilFace.failOp = WGPUStencilOperation_Keep;
    stencilFace.depthFailOp = WGPUStencilOperation_Keep;
    stencilFace.passOp = WGPUStencilOperation_Keep;

    WGPUDepthStencilState depthStencil = {};
    depthStencil.format = toWGPU(desc.depthFormat);
    depthStencil.depthWriteEnabled = desc.depthWrite ? WGPUOptionalBool_True : WGPUOptionalBool_False;
    depthStencil.depthCompare = toWGPU(desc.depthCompare);
    depthStencil.stencilFront = stencilFace;
    depthStencil.stencilBack = stencilFace;
    depthStencil.stencilReadMask = 0;
    depthStencil.stencilWriteMask = 0;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(desc.label.c_str());
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = module;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexLayout;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = toWGPU(desc.cullMode);
    pipelineDesc.depthStencil = &depthStencil;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragment;

    // Interface mismatches between shader and layout surface here
    pushScope(WGPUErrorFilter_Validation);
    WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    ScopeResult result = popScope();
    wgpuPipelineLayoutRelease(pipelineLayout);
    if (result.failed || !pipeline) {
        if (pipeline) wgpuRenderPipelineRelease(pipeline);
        throw GpuError(ErrorKind::ShaderCompilationError, desc.label + ": " + result.message);
    }

    const uint64_t id = nextId();
    m_pipelines.emplace(id, pipeline);
    return PipelineId{id};
}

// -------------------------------------------------------------------------
// Targets
// -------------------------------------------------------------------------

TextureFormat WebGpuDevice::colorFormat(TargetKind /*target*/) const {
    // Eye layers share the surface format so they can be copied to it
    return fromWGPU(m_surfaceFormat);
}

void WebGpuDevice::configureSurface(uint32_t width, uint32_t height) {
    releaseSurfaceTexture();
    m_width = width;
    m_height = height;
    if (width == 0 || height == 0) {
        // Minimized; acquire keeps reporting Outdated until a real size arrives
        m_surfaceConfigured = false;
        return;
    }

    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    if (m_surfaceCopyDst) config.usage |= WGPUTextureUsage_CopyDst;
    config.width = width;
    config.height = height;
    config.presentMode = m_presentMode;
    config.alphaMode = m_alphaMode;
    wgpuSurfaceConfigure(m_surface, &config);
    m_surfaceConfigured = true;
}

void WebGpuDevice::releaseSurfaceTexture() {
    if (m_surfaceView) {
        wgpuTextureViewRelease(m_surfaceView);
        m_surfaceView = nullptr;
    }
    if (m_surfaceTexture) {
        wgpuTextureRelease(m_surfaceTexture);
        m_surfaceTexture = nullptr;
    }
}

void WebGpuDevice::releaseTarget(RenderTarget& target) {
    for (uint32_t layer = 0; layer < target.layers; ++layer) {
        if (target.colorViews[layer]) wgpuTextureViewRelease(target.colorViews[layer]);
        if (target.depthViews[layer]) wgpuTextureViewRelease(target.depthViews[layer]);
    }
    if (target.color) {
        wgpuTextureDestroy(target.color);
        wgpuTextureRelease(target.color);
    }
    if (target.depth) {
        wgpuTextureDestroy(target.depth);
        wgpuTextureRelease(target.depth);
    }
    target = RenderTarget{};
}

void WebGpuDevice::ensureTarget(RenderTarget& target, uint32_t width, uint32_t height,
                                uint32_t layers, bool ownsColor) {
    if (target.depth && target.width == width && target.height == height &&
        target.layers == layers) {
        return;
    }
    releaseTarget(target);

    auto makeLayered = [&](WGPUTextureFormat format, WGPUTextureUsage usage, const char* label,
                           WGPUTexture& texture, std::array<WGPUTextureView, 2>& views) {
        WGPUTextureDescriptor desc = {};
        desc.label = toStringView(label);
        desc.size = {width, height, layers};
        desc.mipLevelCount = 1;
        desc.sampleCount = 1;
        desc.dimension = WGPUTextureDimension_2D;
        desc.format = format;
        desc.usage = usage;

        pushScope(WGPUErrorFilter_OutOfMemory);
        texture = wgpuDeviceCreateTexture(m_device, &desc);
        ScopeResult result = popScope();
        if (result.failed || !texture) {
            throw GpuError(ErrorKind::OutOfDeviceMemory, std::string(label) + ": " + result.message);
        }

        for (uint32_t layer = 0; layer < layers; ++layer) {
            WGPUTextureViewDescriptor viewDesc = {};
            viewDesc.format = format;
            viewDesc.dimension = WGPUTextureViewDimension_2D;
            viewDesc.baseMipLevel = 0;
            viewDesc.mipLevelCount = 1;
            viewDesc.baseArrayLayer = layer;
            viewDesc.arrayLayerCount = 1;
            viewDesc.aspect = WGPUTextureAspect_All;
            views[layer] = wgpuTextureCreateView(texture, &viewDesc);
        }
    };

    target.width = width;
    target.height = height;
    target.layers = layers;
    makeLayered(WGPUTextureFormat_Depth32Float, WGPUTextureUsage_RenderAttachment,
                "Depth Target", target.depth, target.depthViews);
    if (ownsColor) {
        makeLayered(m_surfaceFormat, WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_CopySrc,
                    "Eye Targets", target.color, target.colorViews);
    }
    std::cout << "[WebGpuDevice] Render target " << width << "x" << height << "x" << layers << "\n";
}

AcquiredTarget WebGpuDevice::acquireTarget(TargetKind target) {
    AcquiredTarget acquired;
    if (m_tracker.lost()) {
        acquired.status = AcquireStatus::DeviceLost;
        return acquired;
    }
    if (!m_surfaceConfigured) {
        acquired.status = AcquireStatus::Outdated;
        return acquired;
    }

    releaseSurfaceTexture();
    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    switch (surfaceTexture.status) {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            acquired.status = AcquireStatus::Timeout;
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
            acquired.status = AcquireStatus::Outdated;
            break;
        default:
            acquired.status = AcquireStatus::Lost;
            break;
    }
    if (acquired.status != AcquireStatus::Success) {
        if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
        return acquired;
    }

    m_surfaceTexture = surfaceTexture.texture;
    m_surfaceView = wgpuTextureCreateView(m_surfaceTexture, nullptr);

    if (target == TargetKind::Mono) {
        ensureTarget(m_monoTarget, m_width, m_height, 1, false);
        acquired.width = m_width;
        acquired.height = m_height;
        acquired.layers = 1;
    } else {
        // Eyes split the window when it can show them; fixed size otherwise
        const uint32_t eyeWidth = m_surfaceCopyDst ? std::max(1u, m_width / 2) : m_options.eyeWidth;
        const uint32_t eyeHeight = m_surfaceCopyDst ? m_height : m_options.eyeHeight;
        ensureTarget(m_stereoTarget, eyeWidth, eyeHeight, 2, true);
        acquired.width = eyeWidth;
        acquired.height = eyeHeight;
        acquired.layers = 2;
    }
    return acquired;
}

void WebGpuDevice::present(TargetKind /*target*/) {
    if (!m_surfaceTexture) return;
    wgpuSurfacePresent(m_surface);
    // wgpu-native: release the surface texture after presenting
    releaseSurfaceTexture();
}

// -------------------------------------------------------------------------
// Submission
// -------------------------------------------------------------------------

void WebGpuDevice::encodePass(WGPUCommandEncoder encoder, const CommandList& commands,
                              size_t begin, size_t end) {
    const auto& list = commands.commands();
    const auto& pass = std::get<BeginPassCmd>(list[begin]);
    const bool stereo = pass.target == TargetKind::Stereo;
    RenderTarget& target = stereo ? m_stereoTarget : m_monoTarget;
    const uint32_t layers = stereo ? std::min(pass.viewCount, target.layers) : 1;

    for (uint32_t layer = 0; layer < layers; ++layer) {
        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = stereo ? target.colorViews[layer] : m_surfaceView;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.clearValue = {pass.clearColor.r, pass.clearColor.g,
                                      pass.clearColor.b, pass.clearColor.a};

        WGPURenderPassDepthStencilAttachment depthAttachment = {};
        depthAttachment.view = target.depthViews[layer];
        depthAttachment.depthLoadOp = WGPULoadOp_Clear;
        depthAttachment.depthStoreOp = WGPUStoreOp_Discard;
        depthAttachment.depthClearValue = pass.clearDepth;
        depthAttachment.stencilLoadOp = WGPULoadOp_Undefined;
        depthAttachment.stencilStoreOp = WGPUStoreOp_Undefined;

        WGPURenderPassDescriptor passDesc = {};
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;
        passDesc.depthStencilAttachment = &depthAttachment;

        WGPURenderPassEncoder encoderPass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);

        for (size_t i = begin + 1; i < end; ++i) {
            const Command& cmd = list[i];
            if (auto* c = std::get_if<SetPipelineCmd>(&cmd)) {
                wgpuRenderPassEncoderSetPipeline(encoderPass,
                                                 lookup(m_pipelines, c->pipeline.value, "pipeline"));
            } else if (auto* c = std::get_if<SetBindGroupCmd>(&cmd)) {
                wgpuRenderPassEncoderSetBindGroup(encoderPass, c->group,
                                                  lookup(m_bindGroups, c->bindGroup.value, "bind group"),
                                                  c->dynamicOffsetCount,
                                                  c->dynamicOffsetCount ? &c->dynamicOffset : nullptr);
            } else if (auto* c = std::get_if<SetVertexBufferCmd>(&cmd)) {
                wgpuRenderPassEncoderSetVertexBuffer(encoderPass, c->slot,
                                                     lookup(m_buffers, c->buffer.value, "buffer"),
                                                     c->offset, c->size);
            } else if (auto* c = std::get_if<SetIndexBufferCmd>(&cmd)) {
                if (!c->buffer) continue;
                wgpuRenderPassEncoderSetIndexBuffer(encoderPass,
                                                    lookup(m_buffers, c->buffer.value, "buffer"),
                                                    WGPUIndexFormat_Uint32, c->offset, c->size);
            } else if (auto* c = std::get_if<DrawIndexedCmd>(&cmd)) {
                // The stereo shaders take the eye index from instance_index
                wgpuRenderPassEncoderDrawIndexed(encoderPass, c->indexCount, c->instanceCount,
                                                 c->firstIndex, c->baseVertex,
                                                 c->firstInstance + layer);
            }
        }

        wgpuRenderPassEncoderEnd(encoderPass);
        wgpuRenderPassEncoderRelease(encoderPass);
    }

    if (stereo) {
        mirrorEyes(encoder);
    }
}

void WebGpuDevice::mirrorEyes(WGPUCommandEncoder encoder) {
    if (!m_surfaceCopyDst || !m_surfaceTexture) return;

    const uint32_t copyWidth = std::min(m_stereoTarget.width, m_width / 2);
    const uint32_t copyHeight = std::min(m_stereoTarget.height, m_height);
    if (copyWidth == 0 || copyHeight == 0) return;

    for (uint32_t eye = 0; eye < 2; ++eye) {
        WGPUTexelCopyTextureInfo source = {};
        source.texture = m_stereoTarget.color;
        source.origin = {0, 0, eye};
        source.aspect = WGPUTextureAspect_All;

        WGPUTexelCopyTextureInfo destination = {};
        destination.texture = m_surfaceTexture;
        destination.origin = {eye * copyWidth, 0, 0};
        destination.aspect = WGPUTextureAspect_All;

        WGPUExtent3D extent = {copyWidth, copyHeight, 1};
        wgpuCommandEncoderCopyTextureToTexture(encoder, &source, &destination, &extent);
    }
}

SubmissionId WebGpuDevice::submit(const CommandList& commands) {
    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = toStringView("Lumen Frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    const auto& list = commands.commands();
    size_t passBegin = list.size();
    for (size_t i = 0; i < list.size(); ++i) {
        if (std::holds_alternative<BeginPassCmd>(list[i])) {
            passBegin = i;
        } else if (std::holds_alternative<EndPassCmd>(list[i]) && passBegin < list.size()) {
            encodePass(encoder, commands, passBegin, i);
            passBegin = list.size();
        }
    }

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    const SubmissionId id = m_tracker.next();
    WGPUQueueWorkDoneCallbackInfo doneInfo = {};
    doneInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    doneInfo.callback = onWorkDone;
    doneInfo.userdata1 = this;
    doneInfo.userdata2 = reinterpret_cast<void*>(static_cast<uintptr_t>(id));
    wgpuQueueOnSubmittedWorkDone(m_queue, doneInfo);
    return id;
}

SubmissionId WebGpuDevice::completedSubmission() {
    if (m_tracker.lost()) return m_tracker.submitted();
    wgpuDevicePoll(m_device, false, nullptr);
    return m_tracker.completed();
}

void WebGpuDevice::waitForSubmission(SubmissionId id) {
    while (!m_tracker.lost() && m_tracker.completed() < id) {
        wgpuDevicePoll(m_device, true, nullptr);
    }
}

} // namespace lumen
