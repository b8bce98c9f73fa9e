#pragma once

/**
 * @file stereo_view.h
 * @brief Per-eye view and projection matrices for the stereo target
 *
 * A head-mounted display reports each eye as a pose plus four half-angles of
 * an (often asymmetric) field of view. On a desktop the pair is derived from a
 * mono camera by offsetting each eye half the interpupillary distance.
 */

#include <lumen/camera.h>
#include <lumen/gpu_structs.h>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace lumen {

/// Eye position and orientation in world space
struct EyePose {
    glm::vec3 position{0.0f};
    glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
};

/// Field of view half-angles in radians. Left and down are negative.
struct EyeFov {
    float angleLeft = -0.785398f;
    float angleRight = 0.785398f;
    float angleUp = 0.785398f;
    float angleDown = -0.785398f;

    /// Symmetric FOV from a vertical angle (degrees) and aspect ratio
    static EyeFov symmetric(float verticalDegrees, float aspect);
};

/// Off-axis perspective projection, right-handed, depth in [0, 1]
glm::mat4 eyeProjection(const EyeFov& fov, float nearPlane, float farPlane);

/// World-to-eye transform: inverse of the pose's rotation + translation
glm::mat4 eyeView(const EyePose& pose);

/// Matrices for one eye
CameraData eyeCameraData(const EyePose& pose, const EyeFov& fov, float nearPlane, float farPlane);

/// Left/right pair from per-eye poses and fields of view
StereoCameraData makeStereoCamera(const EyePose poses[2], const EyeFov fovs[2],
                                  float nearPlane, float farPlane);

/// Left/right pair for a mono camera, eyes separated by `ipd` along its right axis
StereoCameraData stereoFromCamera(const Camera& camera, float ipd, float eyeAspect);

} // namespace lumen
