// Lumen - Uniform packing

#include <lumen/gpu_structs.h>
#include <cstring>
#include <stdexcept>

namespace lumen {

CameraUniform makeCameraUniform(const CameraData& camera) {
    CameraUniform u;
    u.viewProjection = camera.projection * camera.view;
    u.view = camera.view;
    u.projection = camera.projection;
    u.position = glm::vec4(camera.position, 1.0f);
    return u;
}

StereoCameraUniform makeStereoCameraUniform(const StereoCameraData& camera) {
    StereoCameraUniform u;
    for (int eye = 0; eye < 2; ++eye) {
        const CameraData& e = camera.eyes[eye];
        u.view[eye] = e.view;
        u.projection[eye] = e.projection;
        u.viewProjection[eye] = e.projection * e.view;
        u.eyePosition[eye] = glm::vec4(e.position, 1.0f);
    }
    return u;
}

LightUniform makeLightUniform(const LightData& light) {
    LightUniform u;
    u.direction = glm::vec4(light.direction, 0.0f);
    u.color = glm::vec4(light.color, 1.0f);
    u.ambient = glm::vec4(light.ambient, 1.0f);
    return u;
}

glm::mat4 eyeViewProjection(const uint8_t* packed, size_t size, uint32_t viewIndex) {
    if (viewIndex > 1) {
        throw std::out_of_range("eyeViewProjection: view index must be 0 or 1");
    }
    size_t offset = offsetof(StereoCameraUniform, viewProjection) + viewIndex * sizeof(glm::mat4);
    if (offset + sizeof(glm::mat4) > size) {
        throw std::out_of_range("eyeViewProjection: packed buffer too small");
    }
    glm::mat4 result;
    std::memcpy(&result, packed + offset, sizeof(glm::mat4));
    return result;
}

} // namespace lumen
