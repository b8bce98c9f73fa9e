// Lumen - Frame slot pool

#include <lumen/frame_slots.h>
#include <stdexcept>
#include <string>

namespace lumen {

FrameSlotPool::FrameSlotPool(Device& device, uint32_t slotCount)
    : m_device(device) {
    if (slotCount < MIN_FRAMES_IN_FLIGHT || slotCount > MAX_FRAMES_IN_FLIGHT) {
        throw std::invalid_argument("frames in flight must be between 2 and 3, got " +
                                    std::to_string(slotCount));
    }
    m_slots.resize(slotCount);
}

FrameSlotPool::Slot& FrameSlotPool::at(uint32_t slot) {
    if (slot >= m_slots.size()) {
        throw std::out_of_range("frame slot " + std::to_string(slot) + " out of range");
    }
    return m_slots[slot];
}

const FrameSlotPool::Slot& FrameSlotPool::at(uint32_t slot) const {
    return const_cast<FrameSlotPool*>(this)->at(slot);
}

uint32_t FrameSlotPool::acquire() {
    const uint32_t index = m_next;
    Slot& slot = m_slots[index];

    if (slot.state == SlotState::Recording) {
        throw std::logic_error("frame slot " + std::to_string(index) + " is already recording");
    }
    if (slot.state == SlotState::InFlight) {
        if (m_device.completedSubmission() < slot.fence) {
            m_device.waitForSubmission(slot.fence);
        }
        if (m_device.completedSubmission() < slot.fence && !m_device.isLost()) {
            throw std::logic_error("frame slot " + std::to_string(index) +
                                   " released before its submission completed");
        }
    }

    slot.state = SlotState::Recording;
    slot.fence = 0;
    m_next = (m_next + 1) % slotCount();
    return index;
}

void FrameSlotPool::submit(uint32_t slot, SubmissionId fence) {
    Slot& s = at(slot);
    if (s.state != SlotState::Recording) {
        throw std::logic_error("frame slot " + std::to_string(slot) + " submitted without recording");
    }
    s.state = SlotState::InFlight;
    s.fence = fence;
}

void FrameSlotPool::abandon(uint32_t slot) {
    Slot& s = at(slot);
    if (s.state != SlotState::Recording) return;
    s.state = SlotState::Free;
    // Hand the same slot out again next time
    m_next = slot;
}

void FrameSlotPool::poll() {
    const SubmissionId completed = m_device.completedSubmission();
    for (auto& slot : m_slots) {
        if (slot.state == SlotState::InFlight && slot.fence <= completed) {
            slot.state = SlotState::Free;
            slot.fence = 0;
        }
    }
}

void FrameSlotPool::reset() {
    for (auto& slot : m_slots) {
        slot.state = SlotState::Free;
        slot.fence = 0;
    }
    m_next = 0;
}

FrameSlotPool::SlotState FrameSlotPool::state(uint32_t slot) const {
    return at(slot).state;
}

SubmissionId FrameSlotPool::fence(uint32_t slot) const {
    return at(slot).fence;
}

uint32_t FrameSlotPool::inFlightCount() const {
    uint32_t n = 0;
    for (const auto& slot : m_slots) {
        if (slot.state == SlotState::InFlight) ++n;
    }
    return n;
}

} // namespace lumen
