#pragma once

/**
 * @file uniform_frame_state.h
 * @brief Per-frame camera, light and model uniforms packed into slot buffers
 *
 * Each frame slot owns one uniform buffer laid out as
 *
 *   [0, 512)     camera (CameraUniform or StereoCameraUniform)
 *   [512, 768)   light
 *   [768, ...)   one ModelUniform per object, 256-byte stride
 *
 * Objects are addressed with a dynamic offset into the model region. A slot
 * is written only after the frame slot pool has confirmed the device is done
 * with it.
 */

#include <lumen/binding_layouts.h>
#include <lumen/device.h>
#include <lumen/frame_slots.h>
#include <lumen/gpu_structs.h>
#include <lumen/resource_manager.h>
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace lumen {

/// Dynamic offset of an object's ModelUniform within the model binding
using ObjectUniformOffset = uint32_t;

/// Identifies the frame being packed. Invalid after endFrame().
struct FrameToken {
    uint32_t slot = 0;
    uint64_t serial = 0;
    TargetKind target = TargetKind::Mono;

    bool valid() const { return serial != 0; }
};

/// Result of endFrame(): everything needed to bind the frame's uniforms
struct PackedFrame {
    uint32_t slot = 0;
    TargetKind target = TargetKind::Mono;
    BufferHandle buffer;
    BufferId gpuBuffer;
    BindGroupId cameraGroup;
    BindGroupId lightGroup;
    BindGroupId modelGroup;
    uint32_t objectCount = 0;
    uint64_t byteSize = 0;
};

class UniformFrameState {
public:
    UniformFrameState(Device& device, GpuResourceManager& resources, const BindingLayouts& layouts,
                      uint32_t framesInFlight, uint32_t initialObjectCapacity = 64);
    ~UniformFrameState();

    UniformFrameState(const UniformFrameState&) = delete;
    UniformFrameState& operator=(const UniformFrameState&) = delete;

    /// @name Frame packing
    /// @{

    /// Acquire a slot (may block on the device) and pack camera + light
    FrameToken beginFrame(const CameraData& camera, const LightData& light);
    FrameToken beginFrame(const StereoCameraData& camera, const LightData& light);

    /// Pack one model matrix. The offset stays valid until endFrame().
    ObjectUniformOffset stageObject(const FrameToken& token, const glm::mat4& model);

    /// Upload the packed bytes and invalidate the token
    PackedFrame endFrame(FrameToken& token);

    /// Give up on a frame that will not be submitted
    void abandonFrame(FrameToken& token);

    /// Give back the slot of a packed frame whose submission failed
    void abandonFrame(const PackedFrame& frame);

    /// Hand the slot to the device until `submission` completes
    void markSubmitted(const PackedFrame& frame, SubmissionId submission);

    /// @}

    /// CPU copy of a slot's packed bytes (what endFrame() uploaded)
    const std::vector<uint8_t>& stagedBytes(uint32_t slot) const;

    uint32_t objectCapacity(uint32_t slot) const;
    FrameSlotPool& slots() { return m_slots; }
    const FrameSlotPool& slots() const { return m_slots; }
    bool recording() const { return m_activeSerial != 0; }

private:
    struct SlotResources {
        BufferHandle buffer;
        BufferId gpuBuffer;
        uint32_t capacity = 0;
        std::array<BindGroupId, 2> camera;
        BindGroupId light;
        BindGroupId model;
        std::vector<uint8_t> staging;
        uint32_t objectCount = 0;
    };

    FrameToken begin(TargetKind target, const void* camera, size_t cameraSize,
                     const LightData& light);
    void checkToken(const FrameToken& token) const;
    void allocate(SlotResources& slot, uint32_t index, uint32_t capacity);
    void release(SlotResources& slot);

    template <typename T>
    void writeStaging(SlotResources& slot, uint32_t offset, const T& value);

    Device& m_device;
    GpuResourceManager& m_resources;
    const BindingLayouts& m_layouts;
    FrameSlotPool m_slots;
    std::vector<SlotResources> m_slotResources;
    uint64_t m_nextSerial = 1;
    uint64_t m_activeSerial = 0;
};

} // namespace lumen
