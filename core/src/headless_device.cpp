// Lumen - Headless Device Implementation

#include <lumen/headless_device.h>
#include <lumen/error.h>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace lumen {

namespace {

// Minimal structural check standing in for a WGSL front end
bool looksCompilable(const std::string& wgsl, std::string& reason) {
    if (wgsl.empty()) {
        reason = "empty source";
        return false;
    }
    if (wgsl.find("@vertex") == std::string::npos || wgsl.find("fn vs_main") == std::string::npos) {
        reason = "missing vertex entry point vs_main";
        return false;
    }
    if (wgsl.find("@fragment") == std::string::npos || wgsl.find("fn fs_main") == std::string::npos) {
        reason = "missing fragment entry point fs_main";
        return false;
    }
    int depth = 0;
    for (char c : wgsl) {
        if (c == '{') ++depth;
        if (c == '}' && --depth < 0) break;
    }
    if (depth != 0) {
        reason = "unbalanced braces";
        return false;
    }
    return true;
}

} // anonymous namespace

HeadlessDevice::HeadlessDevice(const HeadlessDeviceOptions& options)
    : m_options(options)
    , m_width(options.width)
    , m_height(options.height)
    , m_autoComplete(options.autoComplete) {
}

// -------------------------------------------------------------------------
// Resources
// -------------------------------------------------------------------------

void HeadlessDevice::reserveMemory(uint64_t bytes, const std::string& label) {
    if (m_options.memoryBudget != 0 && m_allocatedBytes + bytes > m_options.memoryBudget) {
        throw GpuError(ErrorKind::OutOfDeviceMemory,
                       "allocation of " + std::to_string(bytes) + " bytes for '" + label +
                       "' exceeds device budget");
    }
    m_allocatedBytes += bytes;
}

BufferId HeadlessDevice::createBuffer(const BufferDesc& desc) {
    reserveMemory(desc.size, desc.label);
    uint64_t id = nextId();
    m_buffers[id] = BufferRecord{desc, std::vector<uint8_t>(desc.size, 0)};
    return BufferId{id};
}

void HeadlessDevice::writeBuffer(BufferId buffer, uint64_t offset, const void* data, size_t size) {
    auto it = m_buffers.find(buffer.value);
    if (it == m_buffers.end()) {
        throw std::out_of_range("[HeadlessDevice] writeBuffer: unknown buffer");
    }
    if (offset + size > it->second.data.size()) {
        throw std::out_of_range("[HeadlessDevice] writeBuffer: write past end of '" +
                                it->second.desc.label + "'");
    }
    if (size > 0) {
        std::memcpy(it->second.data.data() + offset, data, size);
    }
}

void HeadlessDevice::destroyBuffer(BufferId buffer) {
    auto it = m_buffers.find(buffer.value);
    if (it == m_buffers.end()) return;
    m_allocatedBytes -= it->second.desc.size;
    m_buffers.erase(it);
}

TextureId HeadlessDevice::createTexture(const TextureDesc& desc) {
    uint64_t bytes = static_cast<uint64_t>(desc.width) * desc.height * bytesPerTexel(desc.format);
    reserveMemory(bytes, desc.label);
    uint64_t id = nextId();
    m_textures[id] = TextureRecord{desc, bytes, {}};
    return TextureId{id};
}

void HeadlessDevice::writeTexture(TextureId texture, const void* pixels, size_t size,
                                  uint32_t bytesPerRow) {
    auto it = m_textures.find(texture.value);
    if (it == m_textures.end()) {
        throw std::out_of_range("[HeadlessDevice] writeTexture: unknown texture");
    }
    const TextureDesc& desc = it->second.desc;
    if (static_cast<uint64_t>(bytesPerRow) * desc.height != size) {
        throw std::out_of_range("[HeadlessDevice] writeTexture: size mismatch for '" +
                                desc.label + "'");
    }
    const auto* bytes = static_cast<const uint8_t*>(pixels);
    it->second.pixels.assign(bytes, bytes + size);
}

void HeadlessDevice::destroyTexture(TextureId texture) {
    auto it = m_textures.find(texture.value);
    if (it == m_textures.end()) return;
    m_allocatedBytes -= it->second.byteSize;
    m_textures.erase(it);
}

SamplerId HeadlessDevice::createSampler(const SamplerDesc& desc) {
    uint64_t id = nextId();
    m_samplers[id] = desc;
    return SamplerId{id};
}

BindGroupLayoutId HeadlessDevice::createBindGroupLayout(const BindGroupLayoutDesc& desc) {
    uint64_t id = nextId();
    m_layouts[id] = desc;
    return BindGroupLayoutId{id};
}

BindGroupId HeadlessDevice::createBindGroup(const BindGroupDesc& desc) {
    auto layout = m_layouts.find(desc.layout.value);
    if (layout == m_layouts.end()) {
        throw std::invalid_argument("[HeadlessDevice] bind group '" + desc.label +
                                    "' references unknown layout");
    }
    if (layout->second.entries.size() != desc.entries.size()) {
        throw std::invalid_argument("[HeadlessDevice] bind group '" + desc.label +
                                    "' entry count does not match its layout");
    }
    for (const auto& entry : desc.entries) {
        if (entry.buffer && !m_buffers.count(entry.buffer.value)) {
            throw std::invalid_argument("[HeadlessDevice] bind group '" + desc.label +
                                        "' references a destroyed buffer");
        }
        if (entry.texture && !m_textures.count(entry.texture.value)) {
            throw std::invalid_argument("[HeadlessDevice] bind group '" + desc.label +
                                        "' references a destroyed texture");
        }
    }
    uint64_t id = nextId();
    m_bindGroups[id] = desc;
    return BindGroupId{id};
}

void HeadlessDevice::destroyBindGroup(BindGroupId bindGroup) {
    m_bindGroups.erase(bindGroup.value);
}

// -------------------------------------------------------------------------
// Pipelines
// -------------------------------------------------------------------------

ShaderModuleId HeadlessDevice::createShaderModule(const ShaderModuleDesc& desc) {
    std::string reason;
    if (!looksCompilable(desc.wgsl, reason)) {
        throw GpuError(ErrorKind::ShaderCompilationError, desc.label + ": " + reason);
    }
    uint64_t id = nextId();
    m_shaders[id] = desc.wgsl;
    return ShaderModuleId{id};
}

PipelineId HeadlessDevice::createRenderPipeline(const RenderPipelineDesc& desc) {
    if (!m_shaders.count(desc.shader.value)) {
        throw GpuError(ErrorKind::ShaderCompilationError,
                       desc.label + ": pipeline references unknown shader module");
    }
    uint64_t id = nextId();
    m_pipelines[id] = desc;
    return PipelineId{id};
}

const RenderPipelineDesc& HeadlessDevice::pipelineDesc(PipelineId pipeline) const {
    return m_pipelines.at(pipeline.value);
}

const std::string& HeadlessDevice::shaderSource(ShaderModuleId shader) const {
    return m_shaders.at(shader.value);
}

// -------------------------------------------------------------------------
// Targets
// -------------------------------------------------------------------------

TextureFormat HeadlessDevice::colorFormat(TargetKind) const {
    return TextureFormat::BGRA8UnormSrgb;
}

AcquiredTarget HeadlessDevice::acquireTarget(TargetKind target) {
    AcquiredTarget result;
    if (isLost()) {
        result.status = AcquireStatus::DeviceLost;
        return result;
    }
    if (target == TargetKind::Stereo) {
        result.width = m_options.eyeWidth;
        result.height = m_options.eyeHeight;
        result.layers = 2;
        return result;
    }
    if (m_surfaceOutdated) {
        result.status = AcquireStatus::Outdated;
        return result;
    }
    result.width = m_width;
    result.height = m_height;
    return result;
}

void HeadlessDevice::configureSurface(uint32_t width, uint32_t height) {
    m_width = width;
    m_height = height;
    m_surfaceOutdated = false;
}

void HeadlessDevice::present(TargetKind) {
    ++m_presentCount;
}

void HeadlessDevice::simulateResize(uint32_t width, uint32_t height) {
    m_width = width;
    m_height = height;
    m_surfaceOutdated = true;
}

// -------------------------------------------------------------------------
// Submission
// -------------------------------------------------------------------------

const CommandList& HeadlessDevice::lastSubmission() const {
    if (m_submissions.empty()) {
        throw std::out_of_range("[HeadlessDevice] nothing submitted");
    }
    return m_submissions.back();
}

const std::vector<uint8_t>& HeadlessDevice::bufferContents(BufferId buffer) const {
    return m_buffers.at(buffer.value).data;
}

uint64_t HeadlessDevice::bufferSize(BufferId buffer) const {
    return m_buffers.at(buffer.value).desc.size;
}

SubmissionId HeadlessDevice::submit(const CommandList& commands) {
    m_submissions.push_back(commands);
    std::lock_guard<std::mutex> lock(m_mutex);
    SubmissionId id = ++m_lastSubmitted;
    if (m_autoComplete) {
        m_lastCompleted = id;
        m_completed.notify_all();
    }
    return id;
}

SubmissionId HeadlessDevice::completedSubmission() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastCompleted;
}

void HeadlessDevice::waitForSubmission(SubmissionId id) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_completed.wait(lock, [&] { return m_lost || m_lastCompleted >= id; });
}

void HeadlessDevice::completeSubmission(SubmissionId id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastCompleted = std::max(m_lastCompleted, std::min(id, m_lastSubmitted));
    }
    m_completed.notify_all();
}

void HeadlessDevice::setAutoComplete(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_autoComplete = enabled;
}

void HeadlessDevice::setMemoryBudget(uint64_t bytes) {
    m_options.memoryBudget = bytes;
}

// -------------------------------------------------------------------------
// Loss
// -------------------------------------------------------------------------

bool HeadlessDevice::isLost() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lost;
}

void HeadlessDevice::simulateDeviceLoss() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lost = true;
    }
    m_completed.notify_all();
    std::cerr << "[HeadlessDevice] Device lost (simulated)\n";
}

void HeadlessDevice::clearObjects() {
    m_buffers.clear();
    m_textures.clear();
    m_samplers.clear();
    m_layouts.clear();
    m_bindGroups.clear();
    m_shaders.clear();
    m_pipelines.clear();
    m_allocatedBytes = 0;
}

void HeadlessDevice::recreate() {
    clearObjects();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Ids keep increasing so nothing from the old device aliases a new object;
        // every earlier submission is treated as finished.
        m_lastCompleted = m_lastSubmitted;
        m_lost = false;
    }
    m_surfaceOutdated = false;
    ++m_deviceGeneration;
    std::cout << "[HeadlessDevice] Device recreated (generation " << m_deviceGeneration << ")\n";
}

} // namespace lumen
