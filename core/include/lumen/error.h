#pragma once

/**
 * @file error.h
 * @brief Error taxonomy for GPU resource creation and frame submission
 */

#include <stdexcept>
#include <string>

namespace lumen {

enum class ErrorKind {
    InvalidGeometry,         ///< Malformed mesh data
    UnsupportedFormat,       ///< Texture format outside the supported 8-bit layouts
    InvalidTextureData,      ///< Pixel byte count does not match the extent
    OutOfDeviceMemory,       ///< Device allocation failed
    ShaderCompilationError,  ///< Shader variant failed to compile (packaging defect)
    SurfaceLost,             ///< Output surface invalidated, reconfigure and retry
    DeviceLost,              ///< All GPU state gone, full rebuild required
    InvalidHandle,           ///< Handle is stale, destroyed or from a previous device
};

const char* toString(ErrorKind kind);

/// Exception thrown by resource creation and device operations
class GpuError : public std::runtime_error {
public:
    GpuError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message)
        , m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace lumen
