#include <lumen/camera.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace lumen {

void Camera::lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up) {
    m_position = pos;
    m_target = target;
    m_up = up;
}

void Camera::orbit(glm::vec3 center, float distance, float azimuth, float elevation) {
    float x = distance * std::cos(elevation) * std::sin(azimuth);
    float y = distance * std::sin(elevation);
    float z = distance * std::cos(elevation) * std::cos(azimuth);
    m_position = center + glm::vec3(x, y, z);
    m_target = center;
}

glm::mat4 Camera::viewMatrix() const {
    return glm::lookAtRH(m_position, m_target, m_up);
}

glm::mat4 Camera::projectionMatrix() const {
    // WebGPU clip space: depth in [0, 1]
    return glm::perspectiveRH_ZO(glm::radians(m_fov), m_aspect, m_near, m_far);
}

glm::mat4 Camera::viewProjectionMatrix() const {
    return projectionMatrix() * viewMatrix();
}

CameraData Camera::data() const {
    CameraData d;
    d.view = viewMatrix();
    d.projection = projectionMatrix();
    d.position = m_position;
    return d;
}

glm::vec3 Camera::forward() const {
    return glm::normalize(m_target - m_position);
}

glm::vec3 Camera::right() const {
    return glm::normalize(glm::cross(forward(), m_up));
}

} // namespace lumen
