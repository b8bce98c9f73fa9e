// Lumen - Uniform Frame State Implementation

#include <lumen/uniform_frame_state.h>
#include <lumen/error.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace lumen {

UniformFrameState::UniformFrameState(Device& device, GpuResourceManager& resources,
                                     const BindingLayouts& layouts, uint32_t framesInFlight,
                                     uint32_t initialObjectCapacity)
    : m_device(device)
    , m_resources(resources)
    , m_layouts(layouts)
    , m_slots(device, framesInFlight)
    , m_slotResources(framesInFlight) {
    const uint32_t capacity = std::max(initialObjectCapacity, 1u);
    for (uint32_t i = 0; i < framesInFlight; ++i) {
        allocate(m_slotResources[i], i, capacity);
    }
}

UniformFrameState::~UniformFrameState() {
    if (m_device.isLost()) return;
    for (auto& slot : m_slotResources) {
        release(slot);
    }
}

void UniformFrameState::allocate(SlotResources& slot, uint32_t index, uint32_t capacity) {
    const uint64_t size = frameBufferSize(capacity);
    const std::string name = "Frame Uniforms " + std::to_string(index);

    slot.buffer = m_resources.createBuffer(size, BufferUsage::Uniform | BufferUsage::CopyDst, name);
    slot.gpuBuffer = m_resources.buffer(slot.buffer).buffer;
    slot.capacity = capacity;
    slot.staging.assign(size, 0);

    try {
        slot.camera[static_cast<size_t>(TargetKind::Mono)] = m_device.createBindGroup(
            {name + " Camera", m_layouts.camera(TargetKind::Mono),
             {{0, slot.gpuBuffer, CAMERA_REGION_OFFSET, sizeof(CameraUniform), {}, {}}}});
        slot.camera[static_cast<size_t>(TargetKind::Stereo)] = m_device.createBindGroup(
            {name + " Stereo Camera", m_layouts.camera(TargetKind::Stereo),
             {{0, slot.gpuBuffer, CAMERA_REGION_OFFSET, sizeof(StereoCameraUniform), {}, {}}}});
        slot.light = m_device.createBindGroup(
            {name + " Light", m_layouts.light(),
             {{0, slot.gpuBuffer, LIGHT_REGION_OFFSET, sizeof(LightUniform), {}, {}}}});
        slot.model = m_device.createBindGroup(
            {name + " Model", m_layouts.model(),
             {{0, slot.gpuBuffer, OBJECT_REGION_OFFSET, sizeof(ModelUniform), {}, {}}}});
    } catch (const GpuError&) {
        release(slot);
        throw;
    }
}

void UniformFrameState::release(SlotResources& slot) {
    for (auto& group : slot.camera) {
        if (group) m_device.destroyBindGroup(group);
        group = {};
    }
    if (slot.light) m_device.destroyBindGroup(slot.light);
    if (slot.model) m_device.destroyBindGroup(slot.model);
    slot.light = {};
    slot.model = {};
    m_resources.destroyBuffer(slot.buffer);
    slot.buffer = {};
    slot.gpuBuffer = {};
    slot.capacity = 0;
}

template <typename T>
void UniformFrameState::writeStaging(SlotResources& slot, uint32_t offset, const T& value) {
    if (offset + sizeof(T) > slot.staging.size()) {
        slot.staging.resize(offset + sizeof(T), 0);
    }
    std::memcpy(slot.staging.data() + offset, &value, sizeof(T));
}

// -------------------------------------------------------------------------
// Frame packing
// -------------------------------------------------------------------------

FrameToken UniformFrameState::beginFrame(const CameraData& camera, const LightData& light) {
    CameraUniform u = makeCameraUniform(camera);
    return begin(TargetKind::Mono, &u, sizeof(u), light);
}

FrameToken UniformFrameState::beginFrame(const StereoCameraData& camera, const LightData& light) {
    StereoCameraUniform u = makeStereoCameraUniform(camera);
    return begin(TargetKind::Stereo, &u, sizeof(u), light);
}

FrameToken UniformFrameState::begin(TargetKind target, const void* camera, size_t cameraSize,
                                    const LightData& light) {
    if (m_activeSerial != 0) {
        throw std::logic_error("[UniformFrameState] beginFrame while a frame is being packed");
    }

    const uint32_t index = m_slots.acquire();
    SlotResources& slot = m_slotResources[index];
    slot.objectCount = 0;
    std::fill(slot.staging.begin(), slot.staging.end(), 0);

    std::memcpy(slot.staging.data() + CAMERA_REGION_OFFSET, camera, cameraSize);
    writeStaging(slot, LIGHT_REGION_OFFSET, makeLightUniform(light));

    m_activeSerial = m_nextSerial++;
    return FrameToken{index, m_activeSerial, target};
}

void UniformFrameState::checkToken(const FrameToken& token) const {
    if (!token.valid() || token.serial != m_activeSerial) {
        throw std::logic_error("[UniformFrameState] stale frame token");
    }
}

ObjectUniformOffset UniformFrameState::stageObject(const FrameToken& token, const glm::mat4& model) {
    checkToken(token);
    SlotResources& slot = m_slotResources[token.slot];
    const uint32_t offset = slot.objectCount * OBJECT_STRIDE;
    writeStaging(slot, OBJECT_REGION_OFFSET + offset, ModelUniform{model});
    ++slot.objectCount;
    return offset;
}

PackedFrame UniformFrameState::endFrame(FrameToken& token) {
    checkToken(token);
    SlotResources& slot = m_slotResources[token.slot];

    if (slot.objectCount > slot.capacity) {
        // The slot is not in flight, so its buffer can be replaced right away.
        // The old buffer stays intact until the new one exists.
        const uint32_t capacity = std::max(slot.objectCount, slot.capacity * 2);
        SlotResources grown;
        allocate(grown, token.slot, capacity);
        grown.objectCount = slot.objectCount;
        slot.staging.resize(grown.staging.size(), 0);
        grown.staging = std::move(slot.staging);
        release(slot);
        slot = std::move(grown);
    }

    const uint64_t used = frameBufferSize(slot.objectCount);
    m_resources.updateBuffer(slot.buffer, 0, slot.staging.data(), used);

    PackedFrame frame;
    frame.slot = token.slot;
    frame.target = token.target;
    frame.buffer = slot.buffer;
    frame.gpuBuffer = slot.gpuBuffer;
    frame.cameraGroup = slot.camera[static_cast<size_t>(token.target)];
    frame.lightGroup = slot.light;
    frame.modelGroup = slot.model;
    frame.objectCount = slot.objectCount;
    frame.byteSize = used;

    m_activeSerial = 0;
    token = FrameToken{};
    return frame;
}

void UniformFrameState::abandonFrame(FrameToken& token) {
    if (!token.valid() || token.serial != m_activeSerial) return;
    m_slots.abandon(token.slot);
    m_activeSerial = 0;
    token = FrameToken{};
}

void UniformFrameState::abandonFrame(const PackedFrame& frame) {
    m_slots.abandon(frame.slot);
}

void UniformFrameState::markSubmitted(const PackedFrame& frame, SubmissionId submission) {
    m_resources.markBufferUsed(frame.buffer, submission);
    m_slots.submit(frame.slot, submission);
}

const std::vector<uint8_t>& UniformFrameState::stagedBytes(uint32_t slot) const {
    if (slot >= m_slotResources.size()) {
        throw std::out_of_range("[UniformFrameState] slot " + std::to_string(slot) + " out of range");
    }
    return m_slotResources[slot].staging;
}

uint32_t UniformFrameState::objectCapacity(uint32_t slot) const {
    if (slot >= m_slotResources.size()) {
        throw std::out_of_range("[UniformFrameState] slot " + std::to_string(slot) + " out of range");
    }
    return m_slotResources[slot].capacity;
}

} // namespace lumen
