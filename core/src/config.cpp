// Lumen - Configuration
// JSON config file (--config) plus command line overrides

#include <lumen/config.h>
#include <lumen/frame_slots.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace lumen {

void RendererConfig::validate() const {
    if (framesInFlight < MIN_FRAMES_IN_FLIGHT || framesInFlight > MAX_FRAMES_IN_FLIGHT) {
        throw std::invalid_argument("framesInFlight must be 2 or 3");
    }
    if (width == 0 || height == 0 || eyeWidth == 0 || eyeHeight == 0) {
        throw std::invalid_argument("window and eye sizes must be non-zero");
    }
    if (!(fovY > 0.0f && fovY < 180.0f)) {
        throw std::invalid_argument("fovY must be in (0, 180) degrees");
    }
    if (!(nearPlane > 0.0f) || !(farPlane > nearPlane)) {
        throw std::invalid_argument("clip planes must satisfy 0 < near < far");
    }
    if (!(targetFps > 0.0f)) {
        throw std::invalid_argument("targetFps must be positive");
    }
    if (interpupillaryDistance < 0.0f) {
        throw std::invalid_argument("interpupillaryDistance must not be negative");
    }
}

void RendererConfig::apply(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }
    try {
        if (j.contains("mode")) {
            const std::string mode = j.at("mode").get<std::string>();
            if (mode == "mono" || mode == "flat") {
                target = TargetKind::Mono;
            } else if (mode == "stereo" || mode == "vr") {
                target = TargetKind::Stereo;
            } else {
                throw std::invalid_argument("unknown mode '" + mode + "'");
            }
        }
        framesInFlight = j.value("framesInFlight", framesInFlight);
        width = j.value("width", width);
        height = j.value("height", height);
        eyeWidth = j.value("eyeWidth", eyeWidth);
        eyeHeight = j.value("eyeHeight", eyeHeight);
        fovY = j.value("fovY", fovY);
        nearPlane = j.value("near", nearPlane);
        farPlane = j.value("far", farPlane);
        interpupillaryDistance = j.value("ipd", interpupillaryDistance);
        vsync = j.value("vsync", vsync);
        targetFps = j.value("targetFps", targetFps);
        headless = j.value("headless", headless);
        maxFrames = j.value("maxFrames", maxFrames);
        if (j.contains("clearColor")) {
            const auto& c = j.at("clearColor");
            if (!c.is_array() || c.size() != 4) {
                throw std::invalid_argument("clearColor must be an array of 4 numbers");
            }
            clearColor = glm::vec4(c[0].get<float>(), c[1].get<float>(),
                                   c[2].get<float>(), c[3].get<float>());
        }
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("config type error: ") + e.what());
    }
}

RendererConfig RendererConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config file " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("parse error in " + path + ": " + e.what());
    }

    RendererConfig config;
    config.apply(j);
    config.validate();
    std::cout << "[Config] Loaded: " << path << "\n";
    return config;
}

int parseCommandLine(int argc, char** argv, RendererConfig& config) {
    CLI::App app{"lumen - real-time mono and stereo mesh renderer"};
    app.set_version_flag("-v,--version", VERSION);

    std::string configPath;
    bool vr = false;
    bool flat = false;
    bool headless = false;
    uint32_t frames = 0;
    uint32_t framesInFlight = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    app.add_option("-c,--config", configPath, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_flag("--vr", vr, "Render the stereo target");
    app.add_flag("--flat", flat, "Render the mono target (default)");
    app.add_flag("--headless", headless, "Use the headless device (no window, no GPU)");
    app.add_option("-f,--frames", frames, "Stop after this many frames (0 = unlimited)");
    app.add_option("--frames-in-flight", framesInFlight, "Uniform slots in flight (2 or 3)")
        ->check(CLI::Range(MIN_FRAMES_IN_FLIGHT, MAX_FRAMES_IN_FLIGHT));
    app.add_option("--width", width, "Window width");
    app.add_option("--height", height, "Window height");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        if (!configPath.empty()) {
            config = RendererConfig::loadFile(configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    }

    if (vr && flat) {
        std::cerr << "[Config] Both --vr and --flat given, using mono\n";
        config.target = TargetKind::Mono;
    } else if (vr) {
        config.target = TargetKind::Stereo;
    } else if (flat) {
        config.target = TargetKind::Mono;
    }
    if (headless) config.headless = true;
    if (frames > 0) config.maxFrames = frames;
    if (framesInFlight > 0) config.framesInFlight = framesInFlight;
    if (width > 0) config.width = width;
    if (height > 0) config.height = height;

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    }
    return -1;
}

} // namespace lumen
