// Lumen - Main Entry Point
// Opens a window (or the headless device), uploads the demo scene and runs the frame loop

#include <lumen/lumen.h>
#include <GLFW/glfw3.h>
#include <glm/gtc/matrix_transform.hpp>
#include <array>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

using namespace lumen;

namespace {

struct DemoAssets {
    MeshHandle floor;
    MeshHandle cube;
    MaterialHandle floorMaterial;
    std::array<MaterialHandle, MaterialSignature::VARIANT_COUNT> cubeMaterials;
};

// Checker floor plus one cube per material variant
DemoAssets uploadDemoAssets(GpuResourceManager& resources) {
    DemoAssets assets;

    MeshData plane = makePlane(20.0f, 8.0f);
    assets.floor = resources.createMesh(plane.vertices, plane.indices, plane.attributes, "Floor");
    MeshData cube = makeCube(1.5f);
    assets.cube = resources.createMesh(cube.vertices, cube.indices, cube.attributes, "Cube");

    TextureOptions checkerOptions;
    checkerOptions.label = "Checker";
    checkerOptions.cacheKey = "demo/checker";
    TextureHandle checker = resources.createTexture(
        makeCheckerTexture(256, 8, {220, 220, 220, 255}, {60, 60, 70, 255}), 256, 256,
        TextureFormat::RGBA8UnormSrgb, checkerOptions);

    TextureOptions bumpOptions;
    bumpOptions.label = "Bumps";
    bumpOptions.cacheKey = "demo/bumps";
    TextureHandle bumps = resources.createTexture(makeBumpNormalMap(256, 4, 1.0f), 256, 256,
                                                  TextureFormat::RGBA8Unorm, bumpOptions);

    MaterialDesc floorDesc;
    floorDesc.name = "Floor";
    floorDesc.diffuse = checker;
    floorDesc.specular = 0.2f;
    assets.floorMaterial = resources.createMaterial(floorDesc);

    const glm::vec4 tints[] = {
        {0.9f, 0.3f, 0.2f, 1.0f},
        {1.0f, 1.0f, 1.0f, 1.0f},
        {0.3f, 0.6f, 0.9f, 1.0f},
        {1.0f, 0.9f, 0.7f, 1.0f},
    };
    for (uint32_t i = 0; i < MaterialSignature::VARIANT_COUNT; ++i) {
        const MaterialSignature sig = MaterialSignature::fromIndex(i);
        MaterialDesc desc;
        desc.name = std::string("Cube ") + toString(sig);
        desc.baseColor = tints[i];
        if (sig.hasDiffuseTexture()) desc.diffuse = checker;
        if (sig.hasNormalMap()) desc.normal = bumps;
        assets.cubeMaterials[i] = resources.createMaterial(desc);
    }

    // Materials hold their own references
    resources.releaseTexture(checker);
    resources.releaseTexture(bumps);
    return assets;
}

void buildScene(Scene& scene, const DemoAssets& assets) {
    scene.clear();
    scene.add(assets.floor, assets.floorMaterial,
              glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, -0.75f, 0.0f)));
    for (uint32_t i = 0; i < MaterialSignature::VARIANT_COUNT; ++i) {
        const float x = (static_cast<float>(i) - 1.5f) * 3.0f;
        scene.add(assets.cube, assets.cubeMaterials[i],
                  glm::translate(glm::mat4(1.0f), glm::vec3(x, 0.0f, 0.0f)));
    }
}

void animateScene(Scene& scene, double time) {
    auto& objects = scene.objects();
    for (size_t i = 1; i < objects.size(); ++i) {
        const float x = (static_cast<float>(i - 1) - 1.5f) * 3.0f;
        glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(x, 0.0f, 0.0f));
        m = glm::rotate(m, static_cast<float>(time) * (0.5f + 0.2f * i), glm::vec3(0.3f, 1.0f, 0.1f));
        objects[i].transform = m;
    }
}

} // namespace

int main(int argc, char** argv) {
    RendererConfig config;
    const int parsed = parseCommandLine(argc, argv, config);
    if (parsed >= 0) {
        return parsed;
    }

    std::cout << "Lumen v" << VERSION << " (" << toString(config.target) << ")\n";

    // Device
    GLFWwindow* window = nullptr;
    std::unique_ptr<Device> device;
    try {
        if (config.headless) {
            HeadlessDeviceOptions options;
            options.width = config.width;
            options.height = config.height;
            options.eyeWidth = config.eyeWidth;
            options.eyeHeight = config.eyeHeight;
            device = std::make_unique<HeadlessDevice>(options);
        } else {
            if (!glfwInit()) {
                std::cerr << "Failed to initialize GLFW\n";
                return 1;
            }
            glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
            window = glfwCreateWindow(static_cast<int>(config.width), static_cast<int>(config.height),
                                      "Lumen", nullptr, nullptr);
            if (!window) {
                std::cerr << "Failed to create window\n";
                glfwTerminate();
                return 1;
            }
            WebGpuDeviceOptions options;
            options.vsync = config.vsync;
            options.eyeWidth = config.eyeWidth;
            options.eyeHeight = config.eyeHeight;
            device = WebGpuDevice::create(window, options);
        }
    } catch (const GpuError& e) {
        std::cerr << "Device creation failed: " << e.what() << "\n";
        if (window) {
            glfwDestroyWindow(window);
            glfwTerminate();
        }
        return 1;
    }

    int exitCode = 0;
    {
        RenderContext context(std::move(device));

        // Every variant of the chosen target compiles before the first frame
        try {
            context.pipelines().prewarm(config.target);
        } catch (const GpuError& e) {
            std::cerr << "Pipeline prewarm failed: " << e.what() << "\n";
            exitCode = 1;
        }

        if (exitCode == 0) {
            FrameRenderer renderer(context, config);
            FrameTimer timer(config.targetFps);

            Scene scene;
            DemoAssets assets = uploadDemoAssets(context.resources());
            buildScene(scene, assets);

            Camera& camera = scene.camera();
            camera.lookAt(glm::vec3(0.0f, 8.0f, 16.0f), glm::vec3(0.0f));
            camera.fov(config.fovY);
            camera.nearPlane(config.nearPlane);
            camera.farPlane(config.farPlane);
            // Stereo frames take their aspect from the eye target instead
            camera.aspect(static_cast<float>(config.width) / static_cast<float>(config.height));
            scene.light().direction = glm::normalize(glm::vec3(-0.5f, -1.0f, -0.5f));

            auto lastStats = FrameTimer::Clock::now();
            uint64_t frame = 0;
            while (config.maxFrames == 0 || frame < config.maxFrames) {
                if (window) {
                    glfwPollEvents();
                    if (glfwWindowShouldClose(window)) break;
                }

                animateScene(scene, static_cast<double>(frame) / config.targetFps);

                timer.beginFrame();
                FrameStatus status = FrameStatus::Ok;
                try {
                    status = renderer.render(scene);
                } catch (const GpuError& e) {
                    std::cerr << "Frame " << frame << " dropped: " << e.what() << "\n";
                }

                if (status == FrameStatus::SurfaceLost) {
                    int width = static_cast<int>(config.width);
                    int height = static_cast<int>(config.height);
                    if (window) {
                        glfwGetFramebufferSize(window, &width, &height);
                        if (width == 0 || height == 0) {
                            glfwWaitEvents();  // Minimized
                            continue;
                        }
                    }
                    renderer.reconfigure(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
                    camera.aspect(static_cast<float>(width) / static_cast<float>(height));
                    continue;
                }
                if (status == FrameStatus::DeviceLost) {
                    try {
                        context.recoverFromDeviceLoss();
                        context.pipelines().prewarm(config.target);
                        assets = uploadDemoAssets(context.resources());
                        buildScene(scene, assets);
                    } catch (const GpuError& e) {
                        std::cerr << "Device recovery failed: " << e.what() << "\n";
                        exitCode = 1;
                        break;
                    }
                    continue;
                }
                if (status == FrameStatus::Timeout) {
                    continue;
                }
                timer.endFrame();
                ++frame;

                const auto now = FrameTimer::Clock::now();
                if (now - lastStats >= std::chrono::seconds(1)) {
                    const FrameTimingStats& stats = timer.stats();
                    std::cout << "[Lumen] " << std::round(stats.fps) << " fps, "
                              << stats.averageFrameTimeMs << " ms avg, "
                              << stats.droppedFrames << " slow, "
                              << renderer.lastStats().drawCalls << " draws\n";
                    lastStats = now;
                }
            }

            std::cout << "[Lumen] " << renderer.framesSubmitted() << " frames submitted, "
                      << renderer.surfaceLostCount() << " surface reconfigurations\n";
        }
    }

    if (window) {
        glfwDestroyWindow(window);
        glfwTerminate();
    }
    return exitCode;
}
