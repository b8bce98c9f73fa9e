#pragma once

/**
 * @file frame_slots.h
 * @brief Fixed ring of per-frame slots bounding the frames in flight
 *
 * A slot is Free, Recording (owned by the frame being built) or InFlight
 * (submitted, waiting for the device). acquire() is the single blocking point
 * of the renderer: it waits on the device until the next slot's submission
 * has completed.
 */

#include <lumen/device.h>
#include <lumen/types.h>
#include <cstdint>
#include <vector>

namespace lumen {

constexpr uint32_t MIN_FRAMES_IN_FLIGHT = 2;
constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 3;

class FrameSlotPool {
public:
    enum class SlotState : uint8_t { Free, Recording, InFlight };

    /// Throws std::invalid_argument unless 2 <= slotCount <= 3
    FrameSlotPool(Device& device, uint32_t slotCount);

    /// Next slot in ring order, blocking until its previous frame completed
    uint32_t acquire();

    /// Hand a recorded slot to the device; it stays owned until `fence` completes
    void submit(uint32_t slot, SubmissionId fence);

    /// Return a recorded slot that was never submitted
    void abandon(uint32_t slot);

    /// Poll the device and free slots whose fence completed
    void poll();

    /// Forget every fence (device recreated)
    void reset();

    SlotState state(uint32_t slot) const;
    SubmissionId fence(uint32_t slot) const;
    uint32_t slotCount() const { return static_cast<uint32_t>(m_slots.size()); }
    uint32_t inFlightCount() const;

private:
    struct Slot {
        SlotState state = SlotState::Free;
        SubmissionId fence = 0;
    };

    Slot& at(uint32_t slot);
    const Slot& at(uint32_t slot) const;

    Device& m_device;
    std::vector<Slot> m_slots;
    uint32_t m_next = 0;
};

} // namespace lumen
