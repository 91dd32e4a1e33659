/**
 * Easel CLI
 *
 * Command-line interface for running the built-in sketches.
 *
 * Usage:
 *   easel run <sketch>                 Run a sketch
 *   easel run images --asset ball.png  Run with image assets
 *   easel list                         List the sketches
 *   easel --version                    Show version information
 *   easel --help                       Show help
 */

#include "easel/runtime.h"
#include "sketches.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

void printVersion() {
    std::cout << "Easel v" << easel::getVersion() << std::endl;
    std::cout << "Simple GUI drawing runtime - libuv + SDL3 + Skia build" << std::endl;
}

void printHelp() {
    std::cout << R"(
Easel CLI - Native runtime for simple GUI sketches

USAGE:
    easel run <sketch> [options]      Run a built-in sketch
    easel list                        List the built-in sketches
    easel --version                   Show version information
    easel --help                      Show this help message

RUN OPTIONS:
    --width <n>           Canvas width (default: the sketch's own)
    --height <n>          Canvas height (default: the sketch's own)
    --headless            Run with hidden windows (background mode)
    --debug               Verbose logging (tracking, cache, windows)
    --quiet, -q           Suppress all output except errors
    --fps-interval <ms>   Draw tick period (default: 17)
    --asset <url>         Image path or URL for the sketch (repeatable)
    --sound <url>         Sound path or URL for the sketch
    --no-audio            Load sounds without opening a playback device

HEADLESS MODE:
    Windows are created hidden; timers, loading and drawing run normally:

    easel run bounce --headless
    EASEL_HEADLESS=1 easel run bounce

EXAMPLES:
    easel run welcome                                   # The default demo
    easel run bounce --width 800 --height 600           # Custom canvas size
    easel run images --asset ball.png --asset https://example.com/logo.png
    easel run images --asset ship.png --sound thrust.wav

ENVIRONMENT:
    EASEL_HEADLESS=1        Run in headless mode (hidden windows)
    EASEL_DEBUG=1           Enable verbose debug logging

)" << std::endl;
}

void printSketches() {
    for (const auto& sketch : easel::cli::sketches()) {
        std::cout << "    " << sketch.name << "\t" << sketch.description << std::endl;
    }
}

struct CLIOptions {
    std::string command;
    std::string sketchName;
    int width = 0;
    int height = 0;
    bool showHelp = false;
    bool showVersion = false;
    bool headless = false;
    bool debug = false;
    bool quiet = false;
    bool noAudio = false;
    int drawIntervalMs = 0;  // 0 = default
    std::vector<std::string> assets;
    std::string sound;
};

CLIOptions parseArgs(int argc, char* argv[]) {
    CLIOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else if (arg == "--version" || arg == "-v") {
            opts.showVersion = true;
        } else if (arg == "--width" && i + 1 < argc) {
            opts.width = std::stoi(argv[++i]);
        } else if (arg == "--height" && i + 1 < argc) {
            opts.height = std::stoi(argv[++i]);
        } else if (arg == "--fps-interval" && i + 1 < argc) {
            opts.drawIntervalMs = std::stoi(argv[++i]);
        } else if (arg == "--asset" && i + 1 < argc) {
            opts.assets.push_back(argv[++i]);
        } else if (arg == "--sound" && i + 1 < argc) {
            opts.sound = argv[++i];
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--headless") {
            opts.headless = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--no-audio") {
            opts.noAudio = true;
        } else if ((arg == "run" || arg == "list") && opts.command.empty()) {
            opts.command = arg;
        } else if (opts.command == "run" && opts.sketchName.empty() && (arg.empty() || arg[0] != '-')) {
            opts.sketchName = arg;
        } else {
            std::cerr << "Warning: Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return opts;
}

int runSketch(const CLIOptions& opts) {
    const easel::cli::Sketch* sketch = easel::cli::findSketch(opts.sketchName);
    if (!sketch) {
        std::cerr << "Error: Unknown sketch '" << opts.sketchName << "'. Available sketches:" << std::endl;
        printSketches();
        return 1;
    }
    if (opts.width < 0 || opts.height < 0 || opts.drawIntervalMs < 0) {
        std::cerr << "Error: --width, --height and --fps-interval must not be negative" << std::endl;
        return 1;
    }

    easel::RuntimeConfig config;
    config.headless = opts.headless;
    config.debug = opts.debug;
    config.quiet = opts.quiet;
    config.audioEnabled = !opts.noAudio;
    if (opts.drawIntervalMs > 0) {
        config.drawIntervalMs = static_cast<uint64_t>(opts.drawIntervalMs);
    }

    auto runtime = easel::Runtime::create(config);
    if (!runtime) {
        std::cerr << "Error: Failed to create runtime" << std::endl;
        return 1;
    }

    easel::cli::SketchOptions sketchOptions;
    sketchOptions.width = opts.width;
    sketchOptions.height = opts.height;
    sketchOptions.assets = opts.assets;
    sketchOptions.sound = opts.sound;
    sketchOptions.quiet = runtime->config().quiet;

    if (!sketchOptions.quiet) {
        std::cout << "[Easel] Running sketch: " << sketch->name << std::endl;
    }

    int exitCode = runtime->exec([&](easel::Runtime& rt) { sketch->setup(rt, sketchOptions); });

    if (!sketchOptions.quiet) {
        std::cout << "[Easel] Sketch finished (exit code " << exitCode << ")" << std::endl;
    }
    return exitCode;
}

int main(int argc, char* argv[]) {
    CLIOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    // Handle --version
    if (opts.showVersion) {
        printVersion();
        return 0;
    }

    // Handle --help
    if (opts.showHelp) {
        printHelp();
        return 0;
    }

    if (opts.command.empty()) {
        printHelp();
        return 1;
    }

    // Handle 'list' command
    if (opts.command == "list") {
        std::cout << "Built-in sketches:" << std::endl;
        printSketches();
        return 0;
    }

    // Handle 'run' command
    if (opts.sketchName.empty()) {
        std::cerr << "Error: No sketch specified." << std::endl;
        std::cerr << "Usage: easel run <sketch>" << std::endl;
        return 1;
    }
    return runSketch(opts);
}
