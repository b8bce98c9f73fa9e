// Lumen - GPU Resource Manager Implementation

#include <lumen/resource_manager.h>
#include <lumen/error.h>
#include <lumen/gpu_structs.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace lumen {

GpuResourceManager::GpuResourceManager(Device& device, const BindingLayouts& layouts)
    : m_device(device)
    , m_layouts(layouts) {
}

GpuResourceManager::~GpuResourceManager() {
    if (!m_device.isLost()) {
        destroyAll();
    }
}

// -------------------------------------------------------------------------
// Meshes
// -------------------------------------------------------------------------

MeshHandle GpuResourceManager::createMesh(const std::vector<Vertex>& vertices,
                                          const std::vector<uint32_t>& indices,
                                          VertexAttributes attributes,
                                          const std::string& label) {
    if (vertices.empty()) {
        throw GpuError(ErrorKind::InvalidGeometry, label + ": mesh has no vertices");
    }
    const uint32_t vertexCount = static_cast<uint32_t>(vertices.size());
    auto bad = std::find_if(indices.begin(), indices.end(),
                            [&](uint32_t i) { return i >= vertexCount; });
    if (bad != indices.end()) {
        throw GpuError(ErrorKind::InvalidGeometry,
                       label + ": index " + std::to_string(*bad) + " at position " +
                       std::to_string(bad - indices.begin()) + " exceeds vertex count " +
                       std::to_string(vertexCount));
    }

    GpuMesh mesh;
    mesh.label = label;
    mesh.vertexCount = vertexCount;
    mesh.indexCount = static_cast<uint32_t>(indices.size());
    mesh.attributes = attributes;

    mesh.vertexBuffer = m_device.createBuffer(
        {label + " Vertex Buffer", mesh.vertexBufferSize(), BufferUsage::Vertex | BufferUsage::CopyDst});
    m_device.writeBuffer(mesh.vertexBuffer, 0, vertices.data(), mesh.vertexBufferSize());

    try {
        // Zero-size buffers are legal; keep one so every mesh binds the same way
        mesh.indexBuffer = m_device.createBuffer(
            {label + " Index Buffer", mesh.indexBufferSize(), BufferUsage::Index | BufferUsage::CopyDst});
    } catch (const GpuError&) {
        m_device.destroyBuffer(mesh.vertexBuffer);
        throw;
    }
    if (!indices.empty()) {
        m_device.writeBuffer(mesh.indexBuffer, 0, indices.data(), mesh.indexBufferSize());
    }

    return m_meshes.add(std::move(mesh));
}

void GpuResourceManager::destroyMesh(MeshHandle handle) {
    auto mesh = m_meshes.remove(handle);
    if (!mesh) return;
    defer({m_lastSubmission, mesh->vertexBuffer, {}, {}});
    defer({m_lastSubmission, mesh->indexBuffer, {}, {}});
}

const GpuMesh& GpuResourceManager::mesh(MeshHandle handle) const {
    const GpuMesh* mesh = m_meshes.get(handle);
    if (!mesh) throw GpuError(ErrorKind::InvalidHandle, "stale mesh handle");
    return *mesh;
}

// -------------------------------------------------------------------------
// Textures
// -------------------------------------------------------------------------

TextureHandle GpuResourceManager::createTexture(const std::vector<uint8_t>& pixels,
                                                uint32_t width, uint32_t height,
                                                TextureFormat format,
                                                const TextureOptions& options) {
    if (!isSupportedTextureFormat(format)) {
        throw GpuError(ErrorKind::UnsupportedFormat,
                       options.label + ": format " + toString(format) +
                       " is not an uncompressed 8-bit layout");
    }
    const uint64_t expected = static_cast<uint64_t>(width) * height * bytesPerTexel(format);
    if (width == 0 || height == 0 || pixels.size() != expected) {
        throw GpuError(ErrorKind::InvalidTextureData,
                       options.label + ": expected " + std::to_string(expected) +
                       " bytes for " + std::to_string(width) + "x" + std::to_string(height) +
                       " " + toString(format) + ", got " + std::to_string(pixels.size()));
    }

    if (!options.cacheKey.empty()) {
        auto cached = m_textureCache.find(options.cacheKey);
        if (cached != m_textureCache.end() && m_textures.contains(cached->second)) {
            retainTexture(cached->second);
            return cached->second;
        }
    }

    GpuTexture tex;
    tex.label = options.label;
    tex.cacheKey = options.cacheKey;
    tex.width = width;
    tex.height = height;
    tex.format = format;
    tex.refCount = 1;
    tex.sampler = sampler(options.sampler);
    tex.texture = m_device.createTexture({options.label, width, height, format});
    m_device.writeTexture(tex.texture, pixels.data(), pixels.size(), width * bytesPerTexel(format));

    TextureHandle handle = m_textures.add(std::move(tex));
    if (!options.cacheKey.empty()) {
        m_textureCache[options.cacheKey] = handle;
    }
    std::cout << "[GpuResourceManager] Loaded texture '" << options.label << "' (" << width
              << "x" << height << " " << toString(format) << ")\n";
    return handle;
}

void GpuResourceManager::retainTexture(TextureHandle handle) {
    GpuTexture* tex = m_textures.get(handle);
    if (!tex) throw GpuError(ErrorKind::InvalidHandle, "retain of stale texture handle");
    ++tex->refCount;
}

void GpuResourceManager::releaseTexture(TextureHandle handle) {
    GpuTexture* tex = m_textures.get(handle);
    if (!tex) return;
    if (--tex->refCount > 0) return;

    if (!tex->cacheKey.empty()) {
        m_textureCache.erase(tex->cacheKey);
    }
    defer({m_lastSubmission, {}, tex->texture, {}});
    m_textures.remove(handle);
}

const GpuTexture& GpuResourceManager::texture(TextureHandle handle) const {
    const GpuTexture* tex = m_textures.get(handle);
    if (!tex) throw GpuError(ErrorKind::InvalidHandle, "stale texture handle");
    return *tex;
}

uint32_t GpuResourceManager::textureRefCount(TextureHandle handle) const {
    const GpuTexture* tex = m_textures.get(handle);
    return tex ? tex->refCount : 0;
}

SamplerId GpuResourceManager::sampler(const SamplerDesc& desc) {
    auto it = m_samplers.find(desc.key());
    if (it != m_samplers.end()) return it->second;
    SamplerId id = m_device.createSampler(desc);
    m_samplers.emplace(desc.key(), id);
    return id;
}

// -------------------------------------------------------------------------
// Materials
// -------------------------------------------------------------------------

MaterialHandle GpuResourceManager::createMaterial(const MaterialDesc& desc) {
    const GpuTexture* diffuse = nullptr;
    const GpuTexture* normal = nullptr;
    if (desc.diffuse) {
        diffuse = m_textures.get(desc.diffuse);
        if (!diffuse) throw GpuError(ErrorKind::InvalidHandle, desc.name + ": stale diffuse texture");
    }
    if (desc.normal) {
        normal = m_textures.get(desc.normal);
        if (!normal) throw GpuError(ErrorKind::InvalidHandle, desc.name + ": stale normal texture");
    }

    GpuMaterial mat;
    mat.name = desc.name;
    mat.signature = MaterialSignature::make(diffuse != nullptr, normal != nullptr);
    mat.diffuse = desc.diffuse;
    mat.normal = desc.normal;

    MaterialUniform params;
    params.baseColor = desc.baseColor;
    params.factors = glm::vec4(desc.ambient, desc.specular, desc.shininess, desc.normalScale);

    mat.params = m_device.createBuffer(
        {desc.name + " Params", sizeof(MaterialUniform), BufferUsage::Uniform | BufferUsage::CopyDst});
    m_device.writeBuffer(mat.params, 0, &params, sizeof(params));

    BindGroupDesc group;
    group.label = desc.name + " Bind Group";
    group.layout = m_layouts.material(mat.signature);
    group.entries.push_back({MATERIAL_PARAMS_BINDING, mat.params, 0, sizeof(MaterialUniform), {}, {}});
    if (diffuse) {
        group.entries.push_back({DIFFUSE_TEXTURE_BINDING, {}, 0, 0, diffuse->texture, {}});
        group.entries.push_back({DIFFUSE_SAMPLER_BINDING, {}, 0, 0, {}, diffuse->sampler});
    }
    if (normal) {
        group.entries.push_back({NORMAL_TEXTURE_BINDING, {}, 0, 0, normal->texture, {}});
        group.entries.push_back({NORMAL_SAMPLER_BINDING, {}, 0, 0, {}, normal->sampler});
    }

    try {
        mat.bindGroup = m_device.createBindGroup(group);
    } catch (const GpuError&) {
        m_device.destroyBuffer(mat.params);
        throw;
    }

    if (mat.diffuse) retainTexture(mat.diffuse);
    if (mat.normal) retainTexture(mat.normal);
    return m_materials.add(std::move(mat));
}

void GpuResourceManager::destroyMaterial(MaterialHandle handle) {
    auto mat = m_materials.remove(handle);
    if (!mat) return;
    defer({m_lastSubmission, mat->params, {}, mat->bindGroup});
    releaseTexture(mat->diffuse);
    releaseTexture(mat->normal);
}

const GpuMaterial& GpuResourceManager::material(MaterialHandle handle) const {
    const GpuMaterial* mat = m_materials.get(handle);
    if (!mat) throw GpuError(ErrorKind::InvalidHandle, "stale material handle");
    return *mat;
}

// -------------------------------------------------------------------------
// Buffers
// -------------------------------------------------------------------------

BufferHandle GpuResourceManager::createBuffer(uint64_t size, BufferUsage usage,
                                              const std::string& label) {
    GpuBuffer buf;
    buf.label = label;
    buf.size = size;
    buf.buffer = m_device.createBuffer({label, size, usage});
    return m_buffers.add(std::move(buf));
}

void GpuResourceManager::updateBuffer(BufferHandle handle, uint64_t offset, const void* data,
                                      size_t size) {
    GpuBuffer* buf = m_buffers.get(handle);
    if (!buf) throw GpuError(ErrorKind::InvalidHandle, "update of stale buffer handle");
    if (offset + size > buf->size) {
        throw std::out_of_range("[GpuResourceManager] write past end of '" + buf->label + "'");
    }
    if (buf->lastUse > m_device.completedSubmission()) {
        throw std::logic_error("[GpuResourceManager] '" + buf->label +
                               "' is still read by submission " + std::to_string(buf->lastUse));
    }
    m_device.writeBuffer(buf->buffer, offset, data, size);
}

void GpuResourceManager::markBufferUsed(BufferHandle handle, SubmissionId submission) {
    GpuBuffer* buf = m_buffers.get(handle);
    if (!buf) throw GpuError(ErrorKind::InvalidHandle, "stale buffer handle");
    buf->lastUse = std::max(buf->lastUse, submission);
}

void GpuResourceManager::destroyBuffer(BufferHandle handle) {
    auto buf = m_buffers.remove(handle);
    if (!buf) return;
    defer({std::max(buf->lastUse, m_lastSubmission), buf->buffer, {}, {}});
}

const GpuBuffer& GpuResourceManager::buffer(BufferHandle handle) const {
    const GpuBuffer* buf = m_buffers.get(handle);
    if (!buf) throw GpuError(ErrorKind::InvalidHandle, "stale buffer handle");
    return *buf;
}

// -------------------------------------------------------------------------
// Deferred destruction
// -------------------------------------------------------------------------

void GpuResourceManager::defer(Garbage item) {
    if (item.after <= m_device.completedSubmission()) {
        destroyNow(item);
    } else {
        m_garbage.push_back(item);
    }
}

void GpuResourceManager::destroyNow(const Garbage& item) {
    if (item.bindGroup) m_device.destroyBindGroup(item.bindGroup);
    if (item.buffer) m_device.destroyBuffer(item.buffer);
    if (item.texture) m_device.destroyTexture(item.texture);
}

void GpuResourceManager::collectGarbage(SubmissionId completed) {
    auto done = std::stable_partition(m_garbage.begin(), m_garbage.end(),
                                      [&](const Garbage& g) { return g.after > completed; });
    for (auto it = done; it != m_garbage.end(); ++it) {
        destroyNow(*it);
    }
    m_garbage.erase(done, m_garbage.end());
}

void GpuResourceManager::destroyAll() {
    for (const auto& g : m_garbage) destroyNow(g);
    m_garbage.clear();

    m_materials.forEach([&](MaterialHandle, GpuMaterial& mat) {
        destroyNow({0, mat.params, {}, mat.bindGroup});
    });
    m_textures.forEach([&](TextureHandle, GpuTexture& tex) {
        destroyNow({0, {}, tex.texture, {}});
    });
    m_meshes.forEach([&](MeshHandle, GpuMesh& mesh) {
        destroyNow({0, mesh.vertexBuffer, {}, {}});
        destroyNow({0, mesh.indexBuffer, {}, {}});
    });
    m_buffers.forEach([&](BufferHandle, GpuBuffer& buf) {
        destroyNow({0, buf.buffer, {}, {}});
    });
}

void GpuResourceManager::invalidateAll() {
    // The device that owned these objects is gone; only the bookkeeping remains
    std::cerr << "[GpuResourceManager] Invalidating " << m_meshes.size() << " meshes, "
              << m_textures.size() << " textures, " << m_materials.size() << " materials, "
              << m_buffers.size() << " buffers\n";
    m_meshes.clear();
    m_textures.clear();
    m_materials.clear();
    m_buffers.clear();
    m_samplers.clear();
    m_textureCache.clear();
    m_garbage.clear();
    m_lastSubmission = 0;
}

} // namespace lumen
