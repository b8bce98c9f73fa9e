#pragma once

/**
 * @file command_list.h
 * @brief Backend-neutral recorded command stream for one frame
 *
 * FrameRenderer records a CommandList and hands it to Device::submit(), which
 * encodes it for the real backend (or stores it, for the headless device).
 */

#include <lumen/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <variant>
#include <vector>

namespace lumen {

// -------------------------------------------------------------------------
// Device object ids
// -------------------------------------------------------------------------

/// Opaque id of an object owned by a Device. 0 is the null id.
template <typename Tag>
struct DeviceId {
    uint64_t value = 0;

    constexpr explicit operator bool() const { return value != 0; }
    constexpr bool operator==(const DeviceId&) const = default;
};

using BufferId = DeviceId<struct BufferIdTag>;
using TextureId = DeviceId<struct TextureIdTag>;
using SamplerId = DeviceId<struct SamplerIdTag>;
using BindGroupLayoutId = DeviceId<struct BindGroupLayoutIdTag>;
using BindGroupId = DeviceId<struct BindGroupIdTag>;
using ShaderModuleId = DeviceId<struct ShaderModuleIdTag>;
using PipelineId = DeviceId<struct PipelineIdTag>;

// -------------------------------------------------------------------------
// Commands
// -------------------------------------------------------------------------

/// Begin a render pass against the currently acquired target of `target`
struct BeginPassCmd {
    TargetKind target = TargetKind::Mono;
    uint32_t viewCount = 1;  ///< 2 = multiview over both array layers
    glm::vec4 clearColor{0.1f, 0.2f, 0.3f, 1.0f};
    float clearDepth = 1.0f;
};

struct SetPipelineCmd {
    PipelineId pipeline;
};

struct SetBindGroupCmd {
    uint32_t group = 0;
    BindGroupId bindGroup;
    uint32_t dynamicOffsetCount = 0;
    uint32_t dynamicOffset = 0;
};

struct SetVertexBufferCmd {
    uint32_t slot = 0;
    BufferId buffer;
    uint64_t offset = 0;
    uint64_t size = 0;
};

/// Indices are always uint32
struct SetIndexBufferCmd {
    BufferId buffer;
    uint64_t offset = 0;
    uint64_t size = 0;
};

struct DrawIndexedCmd {
    uint32_t indexCount = 0;
    uint32_t instanceCount = 1;
    uint32_t firstIndex = 0;
    int32_t baseVertex = 0;
    uint32_t firstInstance = 0;
};

struct EndPassCmd {};

using Command = std::variant<BeginPassCmd, SetPipelineCmd, SetBindGroupCmd,
                             SetVertexBufferCmd, SetIndexBufferCmd, DrawIndexedCmd,
                             EndPassCmd>;

class CommandList {
public:
    void beginPass(const BeginPassCmd& cmd) { m_commands.emplace_back(cmd); }
    void setPipeline(PipelineId pipeline) { m_commands.emplace_back(SetPipelineCmd{pipeline}); }
    void setBindGroup(uint32_t group, BindGroupId bindGroup) {
        m_commands.emplace_back(SetBindGroupCmd{group, bindGroup, 0, 0});
    }
    void setBindGroup(uint32_t group, BindGroupId bindGroup, uint32_t dynamicOffset) {
        m_commands.emplace_back(SetBindGroupCmd{group, bindGroup, 1, dynamicOffset});
    }
    void setVertexBuffer(uint32_t slot, BufferId buffer, uint64_t size) {
        m_commands.emplace_back(SetVertexBufferCmd{slot, buffer, 0, size});
    }
    void setIndexBuffer(BufferId buffer, uint64_t size) {
        m_commands.emplace_back(SetIndexBufferCmd{buffer, 0, size});
    }
    void drawIndexed(uint32_t indexCount) {
        DrawIndexedCmd cmd;
        cmd.indexCount = indexCount;
        m_commands.emplace_back(cmd);
    }
    void endPass() { m_commands.emplace_back(EndPassCmd{}); }

    const std::vector<Command>& commands() const { return m_commands; }
    bool empty() const { return m_commands.empty(); }
    size_t size() const { return m_commands.size(); }
    void clear() { m_commands.clear(); }

    /// Number of recorded commands of type T
    template <typename T>
    size_t count() const {
        size_t n = 0;
        for (const auto& cmd : m_commands) {
            if (std::holds_alternative<T>(cmd)) ++n;
        }
        return n;
    }

    /// Pointers to every recorded command of type T, in recording order
    template <typename T>
    std::vector<const T*> all() const {
        std::vector<const T*> result;
        for (const auto& cmd : m_commands) {
            if (const T* typed = std::get_if<T>(&cmd)) result.push_back(typed);
        }
        return result;
    }

private:
    std::vector<Command> m_commands;
};

} // namespace lumen
