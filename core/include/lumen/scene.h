#pragma once

#include <lumen/camera.h>
#include <lumen/gpu_structs.h>
#include <lumen/types.h>
#include <glm/glm.hpp>
#include <vector>

namespace lumen {

/// A mesh drawn with a material at a world transform
struct RenderObject {
    MeshHandle mesh;
    MaterialHandle material;
    glm::mat4 transform = glm::mat4(1.0f);

    RenderObject() = default;
    RenderObject(MeshHandle m, MaterialHandle mat)
        : mesh(m), material(mat) {}
    RenderObject(MeshHandle m, MaterialHandle mat, const glm::mat4& t)
        : mesh(m), material(mat), transform(t) {}
};

/// The camera, the directional light and the objects of one view
class Scene {
public:
    Scene() = default;

    // -------------------------------------------------------------------------
    /// @name Objects
    /// @{

    Scene& add(MeshHandle mesh, MaterialHandle material);
    Scene& add(MeshHandle mesh, MaterialHandle material, const glm::mat4& transform);
    Scene& add(const RenderObject& object);

    const std::vector<RenderObject>& objects() const { return m_objects; }
    std::vector<RenderObject>& objects() { return m_objects; }
    size_t objectCount() const { return m_objects.size(); }
    bool empty() const { return m_objects.empty(); }

    void clear();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Camera and Light
    /// @{

    Camera& camera() { return m_camera; }
    const Camera& camera() const { return m_camera; }

    LightData& light() { return m_light; }
    const LightData& light() const { return m_light; }

    /// @}

private:
    std::vector<RenderObject> m_objects;
    Camera m_camera;
    LightData m_light;
};

} // namespace lumen
