#pragma once

/**
 * @file shaders.h
 * @brief WGSL sources for the eight pipeline variants
 *
 * The built-in sources are composed from shared chunks: the camera block
 * differs per target kind, the material bindings and vertex inputs differ per
 * material signature. Any variant can be replaced before its pipeline is built.
 */

#include <lumen/types.h>
#include <array>
#include <optional>
#include <string>

namespace lumen {

class ShaderLibrary {
public:
    /// Source for a variant, the override if one is set
    std::string source(MaterialSignature signature, TargetKind target) const;

    /// Replace the source of one variant
    void setOverride(MaterialSignature signature, TargetKind target, std::string wgsl);
    void clearOverrides();

    /// Built-in composed source, ignoring overrides
    static std::string builtinSource(MaterialSignature signature, TargetKind target);

private:
    static size_t slot(MaterialSignature signature, TargetKind target) {
        return (static_cast<size_t>(target) << 2) | signature.bits;
    }

    std::array<std::optional<std::string>, 8> m_overrides;
};

} // namespace lumen
