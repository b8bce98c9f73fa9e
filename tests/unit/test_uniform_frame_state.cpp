/**
 * @file test_uniform_frame_state.cpp
 * @brief Unit tests for uniform packing and the frame slot ring
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lumen/binding_layouts.h>
#include <lumen/error.h>
#include <lumen/gpu_structs.h>
#include <lumen/headless_device.h>
#include <lumen/resource_manager.h>
#include <lumen/uniform_frame_state.h>
#include <glm/gtc/matrix_transform.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <thread>

using namespace lumen;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
    HeadlessDevice device;
    BindingLayouts layouts{device};
    GpuResourceManager resources{device, layouts};
};

template <typename T>
T readAt(const std::vector<uint8_t>& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

CameraData testCamera() {
    CameraData camera;
    camera.view = glm::lookAt(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    camera.projection = glm::perspectiveRH_ZO(glm::radians(60.0f), 1.0f, 0.1f, 100.0f);
    camera.position = glm::vec3(0.0f, 0.0f, 5.0f);
    return camera;
}

bool matricesEqual(const glm::mat4& a, const glm::mat4& b) {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            if (std::abs(a[c][r] - b[c][r]) > 1e-5f) return false;
        }
    }
    return true;
}

} // namespace

// =============================================================================
// Packing
// =============================================================================

TEST_CASE("Mono frame packs camera, light and objects at fixed offsets", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2, 8);

    const CameraData camera = testCamera();
    LightData light;
    light.direction = glm::vec3(0.0f, -1.0f, 0.0f);
    light.color = glm::vec3(1.0f, 0.5f, 0.25f);

    FrameToken token = state.beginFrame(camera, light);
    REQUIRE(token.valid());
    REQUIRE(state.recording());

    const glm::mat4 first = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
    const glm::mat4 second = glm::scale(glm::mat4(1.0f), glm::vec3(2.0f));
    REQUIRE(state.stageObject(token, first) == 0);
    REQUIRE(state.stageObject(token, second) == OBJECT_STRIDE);

    PackedFrame frame = state.endFrame(token);
    REQUIRE_FALSE(token.valid());
    REQUIRE_FALSE(state.recording());
    REQUIRE(frame.objectCount == 2);
    REQUIRE(frame.byteSize == frameBufferSize(2));
    REQUIRE(frame.target == TargetKind::Mono);

    const auto& bytes = f.device.bufferContents(frame.gpuBuffer);
    REQUIRE(bytes.size() >= frame.byteSize);

    const auto cameraU = readAt<CameraUniform>(bytes, CAMERA_REGION_OFFSET);
    REQUIRE(matricesEqual(cameraU.viewProjection, camera.projection * camera.view));
    REQUIRE_THAT(cameraU.position.w, WithinAbs(1.0, 1e-6));

    const auto lightU = readAt<LightUniform>(bytes, LIGHT_REGION_OFFSET);
    REQUIRE_THAT(lightU.direction.y, WithinAbs(-1.0, 1e-6));
    REQUIRE_THAT(lightU.direction.w, WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(lightU.color.y, WithinAbs(0.5, 1e-6));

    REQUIRE(matricesEqual(readAt<ModelUniform>(bytes, OBJECT_REGION_OFFSET).model, first));
    REQUIRE(matricesEqual(readAt<ModelUniform>(bytes, OBJECT_REGION_OFFSET + OBJECT_STRIDE).model, second));

    // The staged copy matches what was uploaded
    const auto& staged = state.stagedBytes(frame.slot);
    REQUIRE(std::memcmp(staged.data(), bytes.data(), frame.byteSize) == 0);
}

TEST_CASE("Stereo frame packs both eyes", "[uniforms][stereo]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2, 4);

    StereoCameraData camera;
    camera.eyes[0] = testCamera();
    camera.eyes[1] = testCamera();
    camera.eyes[0].view = glm::translate(camera.eyes[0].view, glm::vec3(0.032f, 0.0f, 0.0f));
    camera.eyes[1].view = glm::translate(camera.eyes[1].view, glm::vec3(-0.032f, 0.0f, 0.0f));

    FrameToken token = state.beginFrame(camera, LightData{});
    REQUIRE(token.target == TargetKind::Stereo);
    state.stageObject(token, glm::mat4(1.0f));
    PackedFrame frame = state.endFrame(token);
    REQUIRE(frame.target == TargetKind::Stereo);

    const auto& bytes = f.device.bufferContents(frame.gpuBuffer);
    const glm::mat4 left = eyeViewProjection(bytes.data(), bytes.size(), 0);
    const glm::mat4 right = eyeViewProjection(bytes.data(), bytes.size(), 1);
    REQUIRE(matricesEqual(left, camera.eyes[0].projection * camera.eyes[0].view));
    REQUIRE(matricesEqual(right, camera.eyes[1].projection * camera.eyes[1].view));
    REQUIRE_FALSE(matricesEqual(left, right));

    REQUIRE_THROWS_AS(eyeViewProjection(bytes.data(), bytes.size(), 2), std::out_of_range);
    REQUIRE_THROWS_AS(eyeViewProjection(bytes.data(), 64, 0), std::out_of_range);

    // The light region follows the full stereo camera region
    const auto lightU = readAt<LightUniform>(bytes, LIGHT_REGION_OFFSET);
    REQUIRE_THAT(lightU.direction.w, WithinAbs(0.0, 1e-6));
}

TEST_CASE("Object capacity grows past the initial size", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2, 2);
    REQUIRE(state.objectCapacity(0) == 2);

    FrameToken token = state.beginFrame(testCamera(), LightData{});
    glm::mat4 last(1.0f);
    for (int i = 0; i < 5; ++i) {
        last = glm::translate(glm::mat4(1.0f), glm::vec3(static_cast<float>(i), 0.0f, 0.0f));
        REQUIRE(state.stageObject(token, last) == static_cast<uint32_t>(i) * OBJECT_STRIDE);
    }
    PackedFrame frame = state.endFrame(token);

    REQUIRE(frame.objectCount == 5);
    REQUIRE(state.objectCapacity(frame.slot) >= 5);
    REQUIRE(f.device.bufferSize(frame.gpuBuffer) >= frameBufferSize(5));

    const auto& bytes = f.device.bufferContents(frame.gpuBuffer);
    REQUIRE(matricesEqual(readAt<ModelUniform>(bytes, OBJECT_REGION_OFFSET + 4 * OBJECT_STRIDE).model, last));
}

TEST_CASE("Failed growth leaves the slot usable", "[uniforms][errors]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2, 2);
    const uint64_t allocated = f.device.allocatedBytes();
    f.device.setMemoryBudget(allocated);

    FrameToken token = state.beginFrame(testCamera(), LightData{});
    const uint32_t slot = token.slot;
    for (int i = 0; i < 3; ++i) {
        state.stageObject(token, glm::mat4(1.0f));
    }

    try {
        state.endFrame(token);
        FAIL("expected OutOfDeviceMemory");
    } catch (const GpuError& e) {
        REQUIRE(e.kind() == ErrorKind::OutOfDeviceMemory);
    }

    // Old buffer and bind groups are still in place, the token is still live
    REQUIRE(token.valid());
    REQUIRE(state.recording());
    REQUIRE(state.objectCapacity(slot) == 2);
    REQUIRE(f.device.allocatedBytes() == allocated);

    state.abandonFrame(token);
    REQUIRE_FALSE(state.recording());
    REQUIRE(state.slots().state(slot) == FrameSlotPool::SlotState::Free);

    f.device.setMemoryBudget(0);
    FrameToken retry = state.beginFrame(testCamera(), LightData{});
    REQUIRE(retry.slot == slot);
    for (int i = 0; i < 3; ++i) {
        state.stageObject(retry, glm::mat4(1.0f));
    }
    PackedFrame frame = state.endFrame(retry);
    REQUIRE(frame.objectCount == 3);
    REQUIRE(state.objectCapacity(slot) >= 3);
}

TEST_CASE("A packed frame that was never submitted returns its slot", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2);

    FrameToken token = state.beginFrame(testCamera(), LightData{});
    PackedFrame frame = state.endFrame(token);
    REQUIRE(state.slots().state(frame.slot) == FrameSlotPool::SlotState::Recording);

    state.abandonFrame(frame);
    REQUIRE(state.slots().state(frame.slot) == FrameSlotPool::SlotState::Free);
    REQUIRE(state.beginFrame(testCamera(), LightData{}).slot == frame.slot);
}

TEST_CASE("Frame tokens are single use", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2);

    FrameToken token = state.beginFrame(testCamera(), LightData{});
    FrameToken copy = token;
    REQUIRE_THROWS_AS(state.beginFrame(testCamera(), LightData{}), std::logic_error);

    state.endFrame(token);
    REQUIRE_THROWS_AS(state.stageObject(copy, glm::mat4(1.0f)), std::logic_error);
    REQUIRE_THROWS_AS(state.endFrame(copy), std::logic_error);
}

TEST_CASE("Abandoned frames give their slot back", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 2);

    FrameToken token = state.beginFrame(testCamera(), LightData{});
    const uint32_t slot = token.slot;
    state.abandonFrame(token);
    REQUIRE_FALSE(state.recording());
    REQUIRE(state.slots().state(slot) == FrameSlotPool::SlotState::Free);

    FrameToken next = state.beginFrame(testCamera(), LightData{});
    REQUIRE(next.slot == slot);
    state.abandonFrame(next);
}

TEST_CASE("Out-of-range slot queries throw", "[uniforms]") {
    Fixture f;
    UniformFrameState state(f.device, f.resources, f.layouts, 3);
    REQUIRE_NOTHROW(state.stagedBytes(2));
    REQUIRE_THROWS_AS(state.stagedBytes(3), std::out_of_range);
    REQUIRE_THROWS_AS(state.objectCapacity(3), std::out_of_range);
}

// =============================================================================
// Frame slot pool
// =============================================================================

TEST_CASE("FrameSlotPool accepts two or three slots", "[uniforms][slots]") {
    HeadlessDevice device;
    REQUIRE_THROWS_AS(FrameSlotPool(device, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(FrameSlotPool(device, 4), std::invalid_argument);
    REQUIRE_NOTHROW(FrameSlotPool(device, 2));
    REQUIRE_NOTHROW(FrameSlotPool(device, 3));
}

TEST_CASE("FrameSlotPool cycles slots in ring order", "[uniforms][slots]") {
    HeadlessDevice device;
    FrameSlotPool pool(device, 3);

    for (uint32_t expected : {0u, 1u, 2u, 0u}) {
        const uint32_t slot = pool.acquire();
        REQUIRE(slot == expected);
        REQUIRE(pool.state(slot) == FrameSlotPool::SlotState::Recording);
        pool.submit(slot, device.submit(CommandList{}));
        REQUIRE(pool.state(slot) == FrameSlotPool::SlotState::InFlight);
    }

    pool.poll();
    REQUIRE(pool.inFlightCount() == 0);
    REQUIRE_THROWS_AS(pool.submit(1, 1), std::logic_error);
}

TEST_CASE("FrameSlotPool blocks until the oldest frame completes", "[uniforms][slots]") {
    HeadlessDevice device;
    device.setAutoComplete(false);
    FrameSlotPool pool(device, 2);

    const uint32_t a = pool.acquire();
    const SubmissionId first = device.submit(CommandList{});
    pool.submit(a, first);
    const uint32_t b = pool.acquire();
    pool.submit(b, device.submit(CommandList{}));
    REQUIRE(pool.inFlightCount() == 2);

    std::atomic<bool> completed{false};
    std::thread gpu([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        completed = true;
        device.completeSubmission(first);
    });

    // Slot a is only handed out once submission `first` has completed
    const uint32_t c = pool.acquire();
    REQUIRE(completed);
    REQUIRE(c == a);
    REQUIRE(device.completedSubmission() >= first);
    REQUIRE(pool.state(b) == FrameSlotPool::SlotState::InFlight);

    gpu.join();
}

TEST_CASE("FrameSlotPool reset forgets fences", "[uniforms][slots]") {
    HeadlessDevice device;
    device.setAutoComplete(false);
    FrameSlotPool pool(device, 2);

    pool.submit(pool.acquire(), device.submit(CommandList{}));
    pool.reset();
    REQUIRE(pool.inFlightCount() == 0);
    REQUIRE(pool.acquire() == 0);
}
