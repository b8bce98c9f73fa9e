#pragma once

/**
 * @file resource_pool.h
 * @brief Generational arena addressed by Handle<Tag>
 */

#include <lumen/types.h>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace lumen {

/**
 * @brief Slot arena with generation-checked handles
 *
 * Entries are heap allocated so pointers returned by get() survive later
 * insertions. remove() and clear() bump the slot generation; stale handles
 * then resolve to nullptr. Render-thread only.
 */
template <typename T, typename Tag>
class ResourcePool {
public:
    using HandleType = Handle<Tag>;

    ResourcePool() = default;

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    HandleType add(T value) {
        uint32_t index;
        if (!m_freeIndices.empty()) {
            index = m_freeIndices.back();
            m_freeIndices.pop_back();
        } else {
            index = static_cast<uint32_t>(m_slots.size());
            m_slots.emplace_back();
        }

        Slot& slot = m_slots[index];
        slot.data = std::make_unique<T>(std::move(value));
        ++slot.generation;
        ++m_size;
        return {index, slot.generation};
    }

    T* get(HandleType handle) {
        if (handle.index >= m_slots.size()) return nullptr;
        Slot& slot = m_slots[handle.index];
        if (!slot.data || slot.generation != handle.generation) return nullptr;
        return slot.data.get();
    }

    const T* get(HandleType handle) const {
        return const_cast<ResourcePool*>(this)->get(handle);
    }

    bool contains(HandleType handle) const { return get(handle) != nullptr; }

    /// Remove an entry and hand it back. Returns nullptr for stale handles.
    std::unique_ptr<T> remove(HandleType handle) {
        if (!contains(handle)) return nullptr;
        Slot& slot = m_slots[handle.index];
        std::unique_ptr<T> removed = std::move(slot.data);
        ++slot.generation;
        m_freeIndices.push_back(handle.index);
        --m_size;
        return removed;
    }

    /// Drop every entry. Slots are kept so generations keep increasing.
    void clear() {
        m_freeIndices.clear();
        for (uint32_t i = 0; i < m_slots.size(); ++i) {
            Slot& slot = m_slots[i];
            if (slot.data) {
                slot.data.reset();
                ++slot.generation;
            }
            m_freeIndices.push_back(i);
        }
        m_size = 0;
    }

    template <typename F>
    void forEach(F&& fn) {
        for (uint32_t i = 0; i < m_slots.size(); ++i) {
            Slot& slot = m_slots[i];
            if (slot.data) fn(HandleType{i, slot.generation}, *slot.data);
        }
    }

    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }

private:
    struct Slot {
        std::unique_ptr<T> data;
        uint32_t generation = 0;
    };

    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_freeIndices;
    size_t m_size = 0;
};

} // namespace lumen
