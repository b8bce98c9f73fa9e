// Lumen - Shared type helpers

#include <lumen/types.h>
#include <lumen/error.h>

namespace lumen {

const char* toString(TargetKind kind) {
    switch (kind) {
        case TargetKind::Mono: return "mono";
        case TargetKind::Stereo: return "stereo";
    }
    return "unknown";
}

const char* toString(MaterialSignature signature) {
    switch (signature.bits) {
        case 0: return "flat";
        case MaterialSignature::DIFFUSE_TEXTURE: return "textured";
        case MaterialSignature::NORMAL_MAP: return "normal-mapped";
        case MaterialSignature::DIFFUSE_TEXTURE | MaterialSignature::NORMAL_MAP:
            return "textured+normal-mapped";
    }
    return "unknown";
}

bool isSupportedTextureFormat(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm:
        case TextureFormat::RG8Unorm:
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::BGRA8UnormSrgb:
            return true;
        default:
            return false;
    }
}

uint32_t bytesPerTexel(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm: return 1;
        case TextureFormat::RG8Unorm: return 2;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::BGRA8UnormSrgb:
        case TextureFormat::Depth32Float:
            return 4;
        case TextureFormat::RGBA16Float: return 8;
        case TextureFormat::RGBA32Float: return 16;
        default: return 0;
    }
}

const char* toString(TextureFormat format) {
    switch (format) {
        case TextureFormat::Undefined: return "Undefined";
        case TextureFormat::R8Unorm: return "R8Unorm";
        case TextureFormat::RG8Unorm: return "RG8Unorm";
        case TextureFormat::RGBA8Unorm: return "RGBA8Unorm";
        case TextureFormat::RGBA8UnormSrgb: return "RGBA8UnormSrgb";
        case TextureFormat::BGRA8Unorm: return "BGRA8Unorm";
        case TextureFormat::BGRA8UnormSrgb: return "BGRA8UnormSrgb";
        case TextureFormat::RGBA16Float: return "RGBA16Float";
        case TextureFormat::RGBA32Float: return "RGBA32Float";
        case TextureFormat::BC1RGBAUnorm: return "BC1RGBAUnorm";
        case TextureFormat::BC3RGBAUnorm: return "BC3RGBAUnorm";
        case TextureFormat::Depth32Float: return "Depth32Float";
    }
    return "Unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidGeometry: return "InvalidGeometry";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::InvalidTextureData: return "InvalidTextureData";
        case ErrorKind::OutOfDeviceMemory: return "OutOfDeviceMemory";
        case ErrorKind::ShaderCompilationError: return "ShaderCompilationError";
        case ErrorKind::SurfaceLost: return "SurfaceLost";
        case ErrorKind::DeviceLost: return "DeviceLost";
        case ErrorKind::InvalidHandle: return "InvalidHandle";
    }
    return "Unknown";
}

} // namespace lumen
