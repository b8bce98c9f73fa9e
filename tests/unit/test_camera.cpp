/**
 * @file test_camera.cpp
 * @brief Unit tests for Camera, stereo eye matrices and procedural primitives
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lumen/camera.h>
#include <lumen/primitives.h>
#include <lumen/stereo_view.h>
#include <glm/glm.hpp>
#include <cmath>

using namespace lumen;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Camera
// =============================================================================

TEST_CASE("Camera defaults", "[camera]") {
    Camera camera;
    REQUIRE(camera.getPosition() == glm::vec3(0, 0, 5));
    REQUIRE(camera.getTarget() == glm::vec3(0));
    REQUIRE_THAT(camera.getFov(), WithinAbs(45.0f, 0.001f));
    REQUIRE_THAT(camera.forward().z, WithinAbs(-1.0f, 1e-6f));
    REQUIRE_THAT(camera.right().x, WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Camera projection is right-handed with zero-to-one depth", "[camera]") {
    Camera camera;
    camera.nearPlane(0.1f);
    camera.farPlane(100.0f);
    camera.aspect(1.0f);
    camera.fov(60.0f);

    const glm::mat4 p = camera.projectionMatrix();
    REQUIRE_THAT(p[2][3], WithinAbs(-1.0f, 1e-6f));
    REQUIRE_THAT(p[3][3], WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(p[2][2], WithinRel(100.0f / (0.1f - 100.0f), 1e-5f));
    REQUIRE_THAT(p[1][1], WithinRel(1.0f / std::tan(glm::radians(30.0f)), 1e-5f));

    // Near plane maps to depth 0, far plane to depth 1
    const glm::vec4 nearPoint = p * glm::vec4(0, 0, -0.1f, 1);
    const glm::vec4 farPoint = p * glm::vec4(0, 0, -100.0f, 1);
    REQUIRE_THAT(nearPoint.z / nearPoint.w, WithinAbs(0.0f, 1e-5f));
    REQUIRE_THAT(farPoint.z / farPoint.w, WithinAbs(1.0f, 1e-4f));
}

TEST_CASE("Camera data matches its matrices", "[camera]") {
    Camera camera;
    camera.lookAt(glm::vec3(3, 4, 5), glm::vec3(0));
    const CameraData data = camera.data();
    REQUIRE(data.position == glm::vec3(3, 4, 5));
    REQUIRE(data.view == camera.viewMatrix());
    REQUIRE(data.projection == camera.projectionMatrix());

    // Target ends up straight ahead on the view axis
    const glm::vec4 target = data.view * glm::vec4(0, 0, 0, 1);
    REQUIRE_THAT(target.x, WithinAbs(0.0f, 1e-5f));
    REQUIRE_THAT(target.y, WithinAbs(0.0f, 1e-5f));
    REQUIRE(target.z < 0.0f);
}

// =============================================================================
// Stereo
// =============================================================================

TEST_CASE("stereoFromCamera separates the eyes along the right axis", "[camera][stereo]") {
    Camera camera;
    camera.lookAt(glm::vec3(0, 1, 4), glm::vec3(0, 1, 0));
    const float ipd = 0.064f;

    const StereoCameraData stereo = stereoFromCamera(camera, ipd, 1.0f);
    const glm::vec3 separation = stereo.eyes[1].position - stereo.eyes[0].position;
    REQUIRE_THAT(glm::length(separation), WithinRel(ipd, 1e-5f));
    REQUIRE_THAT(glm::dot(glm::normalize(separation), camera.right()), WithinAbs(1.0f, 1e-5f));

    // Each eye sits at its own origin
    const glm::vec4 left = stereo.eyes[0].view * glm::vec4(stereo.eyes[0].position, 1.0f);
    REQUIRE_THAT(glm::length(glm::vec3(left)), WithinAbs(0.0f, 1e-5f));

    REQUIRE(stereo.eyes[0].projection == stereo.eyes[1].projection);
    REQUIRE(stereo.eyes[0].view != stereo.eyes[1].view);
}

TEST_CASE("EyeFov and off-axis projection", "[camera][stereo]") {
    const EyeFov fov = EyeFov::symmetric(90.0f, 1.0f);
    REQUIRE_THAT(fov.angleUp, WithinAbs(glm::radians(45.0f), 1e-5f));
    REQUIRE_THAT(fov.angleLeft, WithinAbs(-fov.angleRight, 1e-6f));
    REQUIRE_THAT(fov.angleRight, WithinAbs(glm::radians(45.0f), 1e-5f));

    // A symmetric frustum matches the equivalent perspective projection
    const glm::mat4 p = eyeProjection(fov, 0.1f, 100.0f);
    REQUIRE_THAT(p[0][0], WithinRel(1.0f, 1e-5f));
    REQUIRE_THAT(p[2][0], WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(p[2][3], WithinAbs(-1.0f, 1e-6f));

    // Asymmetric fov shifts the projection center
    EyeFov asym = fov;
    asym.angleLeft = glm::radians(-50.0f);
    asym.angleRight = glm::radians(40.0f);
    REQUIRE(eyeProjection(asym, 0.1f, 100.0f)[2][0] != 0.0f);

    EyePose pose;
    pose.position = glm::vec3(1, 2, 3);
    const glm::vec4 origin = eyeView(pose) * glm::vec4(1, 2, 3, 1);
    REQUIRE_THAT(glm::length(glm::vec3(origin)), WithinAbs(0.0f, 1e-5f));
}

// =============================================================================
// Primitives
// =============================================================================

TEST_CASE("Procedural meshes", "[primitives]") {
    const MeshData triangle = makeTriangle();
    REQUIRE(triangle.vertices.size() == 3);
    REQUIRE(triangle.indices.size() == 3);
    REQUIRE(triangle.attributes == VertexAttributes::All);

    const MeshData plane = makePlane(2.0f, 4.0f);
    REQUIRE(plane.vertices.size() == 4);
    REQUIRE(plane.indices.size() == 6);
    REQUIRE_THAT(plane.vertices[1].uv.x, WithinAbs(4.0f, 1e-6f));

    const MeshData cube = makeCube(2.0f);
    REQUIRE(cube.vertices.size() == 24);
    REQUIRE(cube.indices.size() == 36);
    for (const auto& v : cube.vertices) {
        REQUIRE_THAT(std::abs(v.position.x), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(glm::length(v.normal), WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(glm::dot(glm::vec3(v.tangent), v.normal), WithinAbs(0.0f, 1e-5f));
    }
}

TEST_CASE("Triangle tangents follow the uv layout", "[primitives]") {
    const MeshData triangle = makeTriangle();
    const glm::vec4 t = triangle.vertices[0].tangent;
    // u increases along +X
    REQUIRE_THAT(t.x, WithinAbs(1.0f, 1e-5f));
    REQUIRE_THAT(std::abs(t.w), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Procedural images", "[primitives]") {
    const auto checker = makeCheckerTexture(16, 2, {255, 255, 255, 255}, {0, 0, 0, 255});
    REQUIRE(checker.size() == 16 * 16 * 4);
    REQUIRE(checker[0] == 255);
    // First texel of the second cell in the first row
    REQUIRE(checker[8 * 4] == 0);

    const auto normals = makeBumpNormalMap(32, 2);
    REQUIRE(normals.size() == 32 * 32 * 4);
    // Flat regions point straight out: (128, 128, 255)
    REQUIRE(normals[2] >= 250);
}
