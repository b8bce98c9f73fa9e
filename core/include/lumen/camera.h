#pragma once

#include <lumen/gpu_structs.h>
#include <glm/glm.hpp>

namespace lumen {

/// Perspective camera producing right-handed, zero-to-one depth matrices
class Camera {
public:
    Camera() = default;

    // -------------------------------------------------------------------------
    /// @name Position and Orientation
    /// @{

    void position(glm::vec3 pos) { m_position = pos; }
    void target(glm::vec3 t) { m_target = t; }
    void up(glm::vec3 u) { m_up = u; }

    /// Set position, target, and up in one call
    void lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up = glm::vec3(0, 1, 0));

    /// Orbit around a center point at distance with azimuth and elevation (radians)
    void orbit(glm::vec3 center, float distance, float azimuth, float elevation);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Projection
    /// @{

    /// Vertical field of view in degrees
    void fov(float degrees) { m_fov = degrees; }
    void nearPlane(float n) { m_near = n; }
    void farPlane(float f) { m_far = f; }
    /// Width / height
    void aspect(float a) { m_aspect = a; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Computed Matrices
    /// @{

    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;
    glm::mat4 viewProjectionMatrix() const;

    /// View, projection and position for uniform packing
    CameraData data() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Accessors
    /// @{

    glm::vec3 getPosition() const { return m_position; }
    glm::vec3 getTarget() const { return m_target; }
    glm::vec3 getUp() const { return m_up; }
    float getFov() const { return m_fov; }
    float getNear() const { return m_near; }
    float getFar() const { return m_far; }
    float getAspect() const { return m_aspect; }

    glm::vec3 forward() const;
    glm::vec3 right() const;

    /// @}

private:
    glm::vec3 m_position = glm::vec3(0, 0, 5);
    glm::vec3 m_target = glm::vec3(0, 0, 0);
    glm::vec3 m_up = glm::vec3(0, 1, 0);
    float m_fov = 45.0f;
    float m_near = 0.1f;
    float m_far = 100.0f;
    float m_aspect = 16.0f / 9.0f;
};

} // namespace lumen
