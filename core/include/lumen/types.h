#pragma once

/**
 * @file types.h
 * @brief Handles, vertex format and the small closed enums shared by the renderer
 */

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace lumen {

// -------------------------------------------------------------------------
// Generational handles
// -------------------------------------------------------------------------

/**
 * @brief Index into a resource arena plus the generation it was issued for
 *
 * A handle stays valid until its slot is freed. Freeing bumps the slot
 * generation, so every outstanding copy of the old handle resolves to nothing.
 */
template <typename Tag>
struct Handle {
    static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

    uint32_t index = INVALID_INDEX;
    uint32_t generation = 0;

    constexpr bool isValid() const { return index != INVALID_INDEX; }
    constexpr explicit operator bool() const { return isValid(); }

    constexpr bool operator==(const Handle&) const = default;
};

struct MeshTag;
struct TextureTag;
struct MaterialTag;
struct BufferTag;

using MeshHandle = Handle<MeshTag>;
using TextureHandle = Handle<TextureTag>;
using MaterialHandle = Handle<MaterialTag>;
using BufferHandle = Handle<BufferTag>;

/// Monotonic id of a queue submission. 0 means "nothing submitted".
using SubmissionId = uint64_t;

// -------------------------------------------------------------------------
// Render targets
// -------------------------------------------------------------------------

enum class TargetKind : uint8_t {
    Mono = 0,    ///< One 2D color attachment + depth
    Stereo = 1,  ///< Two-layer color array + two-layer depth array
};

constexpr uint32_t viewCount(TargetKind kind) {
    return kind == TargetKind::Stereo ? 2u : 1u;
}

const char* toString(TargetKind kind);

// -------------------------------------------------------------------------
// Material capability signature
// -------------------------------------------------------------------------

/**
 * @brief Closed capability bitset describing the shape of a material
 *
 * Pipeline selection is a pure function of this value and the target kind.
 */
struct MaterialSignature {
    static constexpr uint8_t DIFFUSE_TEXTURE = 1u << 0;
    static constexpr uint8_t NORMAL_MAP = 1u << 1;
    static constexpr uint8_t VARIANT_COUNT = 4;

    uint8_t bits = 0;

    constexpr bool hasDiffuseTexture() const { return (bits & DIFFUSE_TEXTURE) != 0; }
    constexpr bool hasNormalMap() const { return (bits & NORMAL_MAP) != 0; }
    constexpr bool isTextured() const { return bits != 0; }

    static constexpr MaterialSignature make(bool diffuse, bool normalMap) {
        return MaterialSignature{static_cast<uint8_t>((diffuse ? DIFFUSE_TEXTURE : 0) |
                                                      (normalMap ? NORMAL_MAP : 0))};
    }

    static constexpr MaterialSignature fromIndex(uint32_t index) {
        return MaterialSignature{static_cast<uint8_t>(index & 0x3u)};
    }

    constexpr bool operator==(const MaterialSignature&) const = default;
};

const char* toString(MaterialSignature signature);

// -------------------------------------------------------------------------
// Vertex format
// -------------------------------------------------------------------------

/// Optional vertex attributes a mesh carries (position is always present)
enum class VertexAttributes : uint8_t {
    Position = 0,
    TexCoord = 1u << 0,
    Normal = 1u << 1,
    Tangent = 1u << 2,
    All = TexCoord | Normal | Tangent,
};

constexpr VertexAttributes operator|(VertexAttributes a, VertexAttributes b) {
    return static_cast<VertexAttributes>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr VertexAttributes operator&(VertexAttributes a, VertexAttributes b) {
    return static_cast<VertexAttributes>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

/// True when every attribute in `required` is present in `available`
constexpr bool hasAttributes(VertexAttributes available, VertexAttributes required) {
    return (available & required) == required;
}

/// Attributes a pipeline variant consumes for a given material signature
constexpr VertexAttributes requiredAttributes(MaterialSignature signature) {
    VertexAttributes attrs = VertexAttributes::Normal;
    if (signature.isTextured()) attrs = attrs | VertexAttributes::TexCoord;
    if (signature.hasNormalMap()) attrs = attrs | VertexAttributes::Tangent;
    return attrs;
}

/// Interleaved vertex as stored in every vertex buffer
struct Vertex {
    glm::vec3 position{0.0f};   // offset 0,  location 0
    glm::vec2 uv{0.0f};         // offset 12, location 1
    glm::vec3 normal{0.0f, 1.0f, 0.0f};  // offset 20, location 2
    glm::vec4 tangent{1.0f, 0.0f, 0.0f, 1.0f};  // offset 32, location 3 (w = bitangent sign)

    Vertex() = default;
    Vertex(glm::vec3 pos) : position(pos) {}
    Vertex(glm::vec3 pos, glm::vec3 norm) : position(pos), normal(norm) {}
    Vertex(glm::vec3 pos, glm::vec3 norm, glm::vec2 texcoord)
        : position(pos), uv(texcoord), normal(norm) {}
    Vertex(glm::vec3 pos, glm::vec3 norm, glm::vec2 texcoord, glm::vec4 tan)
        : position(pos), uv(texcoord), normal(norm), tangent(tan) {}
};

static_assert(sizeof(Vertex) == 48, "Vertex must be 48 bytes");
static_assert(offsetof(Vertex, uv) == 12, "uv offset mismatch");
static_assert(offsetof(Vertex, normal) == 20, "normal offset mismatch");
static_assert(offsetof(Vertex, tangent) == 32, "tangent offset mismatch");

// -------------------------------------------------------------------------
// Texture formats
// -------------------------------------------------------------------------

enum class TextureFormat : uint8_t {
    Undefined,
    R8Unorm,
    RG8Unorm,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BGRA8Unorm,
    BGRA8UnormSrgb,
    RGBA16Float,
    RGBA32Float,
    BC1RGBAUnorm,
    BC3RGBAUnorm,
    Depth32Float,
};

/// Uncompressed 8-bit-per-channel formats accepted for sampled textures
bool isSupportedTextureFormat(TextureFormat format);

/// Bytes per texel for uncompressed formats, 0 for block-compressed/undefined
uint32_t bytesPerTexel(TextureFormat format);

const char* toString(TextureFormat format);

} // namespace lumen

namespace std {

template <typename Tag>
struct hash<lumen::Handle<Tag>> {
    size_t operator()(const lumen::Handle<Tag>& h) const noexcept {
        return hash<uint64_t>{}((static_cast<uint64_t>(h.generation) << 32) | h.index);
    }
};

} // namespace std
