#include <lumen/scene.h>

namespace lumen {

Scene& Scene::add(MeshHandle mesh, MaterialHandle material) {
    m_objects.emplace_back(mesh, material);
    return *this;
}

Scene& Scene::add(MeshHandle mesh, MaterialHandle material, const glm::mat4& transform) {
    m_objects.emplace_back(mesh, material, transform);
    return *this;
}

Scene& Scene::add(const RenderObject& object) {
    m_objects.push_back(object);
    return *this;
}

void Scene::clear() {
    m_objects.clear();
}

} // namespace lumen
