// Lumen - Stereo eye matrices

#include <lumen/stereo_view.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace lumen {

EyeFov EyeFov::symmetric(float verticalDegrees, float aspect) {
    const float halfV = glm::radians(verticalDegrees) * 0.5f;
    const float halfH = std::atan(std::tan(halfV) * aspect);
    return EyeFov{-halfH, halfH, halfV, -halfV};
}

glm::mat4 eyeProjection(const EyeFov& fov, float nearPlane, float farPlane) {
    const float left = std::tan(fov.angleLeft) * nearPlane;
    const float right = std::tan(fov.angleRight) * nearPlane;
    const float top = std::tan(fov.angleUp) * nearPlane;
    const float bottom = std::tan(fov.angleDown) * nearPlane;
    return glm::frustumRH_ZO(left, right, bottom, top, nearPlane, farPlane);
}

glm::mat4 eyeView(const EyePose& pose) {
    glm::mat4 world = glm::translate(glm::mat4(1.0f), pose.position) * glm::mat4_cast(pose.orientation);
    return glm::inverse(world);
}

CameraData eyeCameraData(const EyePose& pose, const EyeFov& fov, float nearPlane, float farPlane) {
    CameraData d;
    d.view = eyeView(pose);
    d.projection = eyeProjection(fov, nearPlane, farPlane);
    d.position = pose.position;
    return d;
}

StereoCameraData makeStereoCamera(const EyePose poses[2], const EyeFov fovs[2],
                                  float nearPlane, float farPlane) {
    StereoCameraData stereo;
    for (int eye = 0; eye < 2; ++eye) {
        stereo.eyes[eye] = eyeCameraData(poses[eye], fovs[eye], nearPlane, farPlane);
    }
    return stereo;
}

StereoCameraData stereoFromCamera(const Camera& camera, float ipd, float eyeAspect) {
    const glm::vec3 offset = camera.right() * (ipd * 0.5f);
    const glm::vec3 eyePositions[2] = {camera.getPosition() - offset, camera.getPosition() + offset};

    StereoCameraData stereo;
    for (int eye = 0; eye < 2; ++eye) {
        // Parallel axes: both eyes look along the camera's forward vector
        CameraData& d = stereo.eyes[eye];
        d.position = eyePositions[eye];
        d.view = glm::lookAtRH(d.position, d.position + camera.forward(), camera.getUp());
        d.projection = glm::perspectiveRH_ZO(glm::radians(camera.getFov()), eyeAspect,
                                             camera.getNear(), camera.getFar());
    }
    return stereo;
}

} // namespace lumen
