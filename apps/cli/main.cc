#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "core/log.h"
#include "core/parse_number.h"
#include "io/scene_loader.h"
#include "materials/material.h"
#include "scene/scene.h"
#include "session/render_options.h"
#include "session/render_session.h"

namespace {

const char* VERSION = "1.0";

struct Options {
    std::string sceneFile;
    bool demo = false;
    bool verbose = false;
    bool showHelp = false;

    // Overrides, applied on top of the scene file. -1 / empty = keep
    int workers = -1;
    uint64_t seed = 0;
    bool seedSet = false;
    int passes = -1;
    int frameMs = -1;
    int maxTicks = -1;
    int width = -1;
    std::string outfile;
    std::string exrfile;
};

void printUsage(const char* programName) {
    std::cout << "Strata progressive path tracer v" << VERSION << "\n\n"
              << "Usage: " << programName << " [options] [scene.json]\n\n"
              << "Options:\n"
              << "  --demo             Render the built-in demo scene (default without a scene)\n"
              << "  --workers N        Number of strips / worker threads (0 = auto)\n"
              << "  --seed N           Base RNG seed\n"
              << "  --passes N         Stop once every strip finished N passes\n"
              << "  --frame-ms N       Time budget of one render tick (default: 16)\n"
              << "  --max-ticks N      Stop after N ticks (default: 600)\n"
              << "  --width N          Image width in pixels\n"
              << "  --out FILE         PPM output path\n"
              << "  --exr FILE         Also write a linear OpenEXR\n"
              << "  --verbose, -v      Detailed logging\n"
              << "  --help, -h         Show this help message\n\n"
              << "Example:\n"
              << "  " << programName << " --passes 64 --exr out.exr scenes/three_spheres.json\n";
}

// Reads the integer following argv[i]; false on a missing, malformed or out of
// range value
template <typename T>
bool readNumber(int argc, char* argv[], int& i, T& out) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value\n";
        return false;
    }
    if (!strata::ParseNonNegative(std::string(argv[++i]), &out)) {
        std::cerr << "Error: Invalid value for " << flag << ": " << argv[i] << "\n";
        return false;
    }
    return true;
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
            return true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--demo" || arg == "-d") {
            opts.demo = true;
        } else if (arg == "--workers") {
            if (!readNumber(argc, argv, i, opts.workers)) return false;
        } else if (arg == "--seed") {
            if (!readNumber(argc, argv, i, opts.seed)) return false;
            opts.seedSet = true;
        } else if (arg == "--passes") {
            if (!readNumber(argc, argv, i, opts.passes)) return false;
        } else if (arg == "--frame-ms") {
            if (!readNumber(argc, argv, i, opts.frameMs)) return false;
        } else if (arg == "--max-ticks") {
            if (!readNumber(argc, argv, i, opts.maxTicks)) return false;
        } else if (arg == "--width") {
            if (!readNumber(argc, argv, i, opts.width)) return false;
        } else if (arg == "--out" || arg == "--exr") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file name\n";
                return false;
            }
            (arg == "--out" ? opts.outfile : opts.exrfile) = argv[++i];
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        } else {
            if (!opts.sceneFile.empty()) {
                std::cerr << "Error: Only one scene file may be given\n";
                return false;
            }
            opts.sceneFile = arg;
        }
    }

    if (opts.demo && !opts.sceneFile.empty()) {
        std::cerr << "Error: --demo and a scene file are mutually exclusive\n";
        return false;
    }

    return true;
}

// Ground, a diffuse centre sphere, a hollow glass sphere and a rough metal one
strata::SceneFile buildDemoScene(const strata::RenderOptions& defaults) {
    using namespace strata;

    SceneFile demo;
    demo.scene = std::make_shared<Scene>();
    demo.options = defaults;
    Scene& scene = *demo.scene;

    uint32_t ground = scene.AddMaterial(Material::MakeLambertian(RGB(0.8, 0.8, 0.0)));
    uint32_t center = scene.AddMaterial(Material::MakeLambertian(RGB(0.1, 0.2, 0.5)));
    uint32_t glass = scene.AddMaterial(Material::MakeDielectric(1.50));
    uint32_t bubble = scene.AddMaterial(Material::MakeDielectric(1.00 / 1.50));
    uint32_t metal = scene.AddMaterial(Material::MakeMetal(RGB(0.8, 0.6, 0.2), 1.0));

    scene.AddSphere(Sphere{Point3(0.0, -100.5, -1.0), 100.0, ground});
    scene.AddSphere(Sphere{Point3(0.0, 0.0, -1.2), 0.5, center});
    scene.AddSphere(Sphere{Point3(-1.0, 0.0, -1.0), 0.5, glass});
    scene.AddSphere(Sphere{Point3(-1.0, 0.0, -1.0), 0.4, bubble});
    scene.AddSphere(Sphere{Point3(1.0, 0.0, -1.0), 0.5, metal});

    CameraConfig& cam = demo.options.camera_config;
    cam.vfov = 20;
    cam.look_from = Point3(-2, 2, 1);
    cam.look_at = Point3(0, 0, -1);
    cam.vup = Vec3(0, 1, 0);

    return demo;
}

void applyOverrides(const Options& opts, strata::RenderOptions& options) {
    if (opts.workers >= 0) options.integrator_config.num_workers = opts.workers;
    if (opts.seedSet) options.integrator_config.seed = opts.seed;
    if (opts.passes >= 0) options.session_config.target_passes = opts.passes;
    if (opts.frameMs >= 0) options.session_config.frame_ms = opts.frameMs;
    if (opts.maxTicks >= 0) options.session_config.max_ticks = opts.maxTicks;
    if (opts.width >= 0) options.image_config.width = opts.width;
    if (!opts.outfile.empty()) options.image_config.outfile = opts.outfile;
    if (!opts.exrfile.empty()) options.image_config.exrfile = opts.exrfile;

    // 0 = auto is a host convenience; the session only takes an explicit count
    options.integrator_config.num_workers = strata::ResolveWorkerCount(
        options.integrator_config.num_workers, options.image_config.width);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace strata;

    Options opts;

    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    SetVerbose(opts.verbose);

    try {
        RenderOptions defaults;
        defaults.integrator_config.num_workers = 0;  // auto unless the scene or a flag says otherwise
        SceneFile setup = opts.sceneFile.empty() ? buildDemoScene(defaults)
                                                 : LoadSceneFile(opts.sceneFile, defaults);
        if (opts.sceneFile.empty()) {
            Log("Main", "Rendering built-in demo scene");
        }
        applyOverrides(opts, setup.options);

        Timer totalTimer;
        RenderSession session(setup.scene, setup.options);

        const SessionConfig& sc = setup.options.session_config;
        const auto frame = std::chrono::milliseconds(sc.frame_ms);

        int passes = 0;
        int reported = 0;
        int ticks = 0;
        while (ticks < sc.max_ticks) {
            passes = session.Render(RenderSession::Clock::now() + frame);
            ++ticks;

            if (passes > reported) {
                reported = passes;
                LogVerbose("Main", "Pass " + std::to_string(passes) + " complete after " +
                                       std::to_string(ticks) + " ticks (" +
                                       totalTimer.ElapsedString() + ")");
            }
            if (sc.target_passes > 0 && passes >= sc.target_passes) {
                break;
            }
        }

        Log("Main", std::to_string(passes) + " passes in " + std::to_string(ticks) + " ticks, " +
                        totalTimer.ElapsedString());
        session.SaveSnapshot();
    } catch (const std::exception& e) {
        LogError("Main", e.what());
        return 1;
    }

    return 0;
}
