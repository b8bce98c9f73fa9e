#pragma once

/**
 * @file config.h
 * @brief Renderer configuration from a JSON file and the command line
 */

#include <lumen/types.h>
#include <nlohmann/json_fwd.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>

namespace lumen {

constexpr const char* VERSION = "0.4.0";

struct RendererConfig {
    TargetKind target = TargetKind::Mono;
    uint32_t framesInFlight = 2;
    uint32_t width = 1280;
    uint32_t height = 720;
    uint32_t eyeWidth = 1024;   ///< Stereo layer size when no window dictates it
    uint32_t eyeHeight = 1024;
    glm::vec4 clearColor{0.1f, 0.2f, 0.3f, 1.0f};
    float fovY = 45.0f;         ///< Degrees
    float nearPlane = 0.1f;
    float farPlane = 100.0f;
    float interpupillaryDistance = 0.064f;  ///< Meters
    bool vsync = true;
    float targetFps = 60.0f;
    bool headless = false;
    uint32_t maxFrames = 0;     ///< 0 = run until the window closes

    /// Throws std::invalid_argument for out-of-range values
    void validate() const;

    /// Overlay keys present in `json` onto this config. Unknown keys are ignored.
    void apply(const nlohmann::json& json);

    /// Throws std::runtime_error if the file cannot be read or parsed
    static RendererConfig loadFile(const std::string& path);
};

/**
 * @brief Parse the command line into `config`
 *
 * @return -1 to continue running, otherwise the exit code (help, version,
 *         parse or config errors)
 */
int parseCommandLine(int argc, char** argv, RendererConfig& config);

} // namespace lumen
