#pragma once

/**
 * @file resource_manager.h
 * @brief Owner of every mesh, texture, material and buffer on the device
 *
 * All creation is synchronous and reports failure by throwing GpuError.
 * Textures are shared by materials and reference counted; when the last
 * reference goes away the device texture is destroyed once every submission
 * that could still sample it has completed.
 */

#include <lumen/binding_layouts.h>
#include <lumen/device.h>
#include <lumen/resource_pool.h>
#include <lumen/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen {

// -------------------------------------------------------------------------
// Entries
// -------------------------------------------------------------------------

struct GpuMesh {
    std::string label;
    BufferId vertexBuffer;
    BufferId indexBuffer;
    uint32_t vertexCount = 0;
    uint32_t indexCount = 0;
    VertexAttributes attributes = VertexAttributes::All;

    uint64_t vertexBufferSize() const { return static_cast<uint64_t>(vertexCount) * sizeof(Vertex); }
    uint64_t indexBufferSize() const { return static_cast<uint64_t>(indexCount) * sizeof(uint32_t); }
};

struct GpuTexture {
    std::string label;
    std::string cacheKey;
    TextureId texture;
    SamplerId sampler;
    uint32_t width = 0;
    uint32_t height = 0;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    uint32_t refCount = 0;
};

struct GpuMaterial {
    std::string name;
    MaterialSignature signature;
    TextureHandle diffuse;
    TextureHandle normal;
    BufferId params;
    BindGroupId bindGroup;
};

struct GpuBuffer {
    std::string label;
    BufferId buffer;
    uint64_t size = 0;
    SubmissionId lastUse = 0;  ///< Last submission that reads this buffer
};

// -------------------------------------------------------------------------
// Creation parameters
// -------------------------------------------------------------------------

struct TextureOptions {
    std::string label = "Texture";
    /// Non-empty: reuse a live texture created with the same key
    std::string cacheKey;
    SamplerDesc sampler;
};

struct MaterialDesc {
    std::string name = "Material";
    TextureHandle diffuse;
    TextureHandle normal;
    glm::vec4 baseColor{1.0f};
    float ambient = 1.0f;
    float specular = 0.5f;
    float shininess = 32.0f;
    float normalScale = 1.0f;
};

// -------------------------------------------------------------------------
// GpuResourceManager
// -------------------------------------------------------------------------

class GpuResourceManager {
public:
    GpuResourceManager(Device& device, const BindingLayouts& layouts);
    ~GpuResourceManager();

    GpuResourceManager(const GpuResourceManager&) = delete;
    GpuResourceManager& operator=(const GpuResourceManager&) = delete;

    /// @name Meshes
    /// @{

    /**
     * @brief Upload a mesh
     *
     * Throws GpuError(InvalidGeometry) when there are no vertices or an index
     * refers past the last vertex, GpuError(OutOfDeviceMemory) when the
     * buffers cannot be allocated.
     */
    MeshHandle createMesh(const std::vector<Vertex>& vertices,
                          const std::vector<uint32_t>& indices,
                          VertexAttributes attributes = VertexAttributes::All,
                          const std::string& label = "Mesh");
    void destroyMesh(MeshHandle handle);
    const GpuMesh& mesh(MeshHandle handle) const;
    bool isValid(MeshHandle handle) const { return m_meshes.contains(handle); }

    /// @}

    /// @name Textures
    /// @{

    /**
     * @brief Upload a 2D texture. The caller holds one reference.
     *
     * Throws GpuError(UnsupportedFormat) for anything but the 8-bit
     * uncompressed formats, GpuError(InvalidTextureData) when the pixel count
     * does not match, GpuError(OutOfDeviceMemory) on allocation failure.
     */
    TextureHandle createTexture(const std::vector<uint8_t>& pixels, uint32_t width,
                                uint32_t height, TextureFormat format,
                                const TextureOptions& options = {});
    void retainTexture(TextureHandle handle);
    void releaseTexture(TextureHandle handle);
    const GpuTexture& texture(TextureHandle handle) const;
    bool isValid(TextureHandle handle) const { return m_textures.contains(handle); }
    uint32_t textureRefCount(TextureHandle handle) const;

    /// Deduplicated sampler for a descriptor
    SamplerId sampler(const SamplerDesc& desc);

    /// @}

    /// @name Materials
    /// @{

    /// Throws GpuError(InvalidHandle) if a referenced texture is not live
    MaterialHandle createMaterial(const MaterialDesc& desc);
    void destroyMaterial(MaterialHandle handle);
    const GpuMaterial& material(MaterialHandle handle) const;
    bool isValid(MaterialHandle handle) const { return m_materials.contains(handle); }

    /// @}

    /// @name Buffers
    /// @{

    BufferHandle createBuffer(uint64_t size, BufferUsage usage, const std::string& label);

    /**
     * @brief Write into a buffer
     *
     * Throws std::logic_error when a submitted frame that reads the buffer has
     * not completed yet. Callers rotate buffers through the frame slot pool
     * rather than waiting here.
     */
    void updateBuffer(BufferHandle handle, uint64_t offset, const void* data, size_t size);

    /// Record that `submission` reads this buffer
    void markBufferUsed(BufferHandle handle, SubmissionId submission);
    void destroyBuffer(BufferHandle handle);
    const GpuBuffer& buffer(BufferHandle handle) const;
    bool isValid(BufferHandle handle) const { return m_buffers.contains(handle); }

    /// @}

    /// @name Frame bookkeeping
    /// @{

    /// Latest submission issued; destruction requested now waits for it
    void markSubmitted(SubmissionId submission) { m_lastSubmission = submission; }

    /// Destroy device objects whose last possible use has completed
    void collectGarbage(SubmissionId completed);

    /// Forget everything after device loss. Every handle issued so far goes stale.
    void invalidateAll();

    /// @}

    size_t meshCount() const { return m_meshes.size(); }
    size_t textureCount() const { return m_textures.size(); }
    size_t materialCount() const { return m_materials.size(); }
    size_t bufferCount() const { return m_buffers.size(); }
    size_t samplerCount() const { return m_samplers.size(); }
    size_t pendingDestroyCount() const { return m_garbage.size(); }

private:
    struct Garbage {
        SubmissionId after = 0;
        BufferId buffer;
        TextureId texture;
        BindGroupId bindGroup;
    };

    void defer(Garbage item);
    void destroyNow(const Garbage& item);
    void destroyAll();

    Device& m_device;
    const BindingLayouts& m_layouts;

    ResourcePool<GpuMesh, MeshTag> m_meshes;
    ResourcePool<GpuTexture, TextureTag> m_textures;
    ResourcePool<GpuMaterial, MaterialTag> m_materials;
    ResourcePool<GpuBuffer, BufferTag> m_buffers;

    std::unordered_map<uint32_t, SamplerId> m_samplers;
    std::unordered_map<std::string, TextureHandle> m_textureCache;
    std::vector<Garbage> m_garbage;
    SubmissionId m_lastSubmission = 0;
};

} // namespace lumen
