/**
 * Embed Example
 *
 * This example demonstrates how to embed the Easel runtime in your own
 * C++ application instead of using the CLI.
 *
 * Use this as a reference when:
 * - You want to write a sketch as part of a native app
 * - You need your own configuration or exit handling
 *
 * The sketch is a stopwatch with Start / Stop and Reset buttons; R also
 * resets it. Closing the window ends the program.
 *
 * For the built-in sketches, use the CLI instead:
 *   easel run welcome
 */

#include "easel/input/keys.h"
#include "easel/runtime.h"
#include <iostream>
#include <memory>
#include <string>

// Format tenths of a second as M:SS.T
static std::string formatTime(int tenths) {
    int minutes = tenths / 600;
    int seconds = (tenths / 10) % 60;
    std::string secs = std::to_string(seconds);
    if (seconds < 10) secs = "0" + secs;
    return std::to_string(minutes) + ":" + secs + "." + std::to_string(tenths % 10);
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    std::cout << "=== Easel Embed Example ===" << std::endl;
    std::cout << "Version: " << easel::getVersion() << std::endl;
    std::cout << std::endl;
    std::cout << "This demonstrates embedding the runtime in a C++ app." << std::endl;
    std::cout << "For the built-in sketches, use the CLI: easel run welcome" << std::endl;
    std::cout << std::endl;

    // Step 1: Configure the runtime
    easel::RuntimeConfig config;
    config.drawIntervalMs = 33;

    // Step 2: Create the runtime
    auto runtime = easel::Runtime::create(config);
    if (!runtime) {
        std::cerr << "Failed to create runtime!" << std::endl;
        return 1;
    }

    // Step 3: Run the sketch
    // This blocks until the window is closed and nothing else is running
    int exitCode = runtime->exec([](easel::Runtime& rt) {
        auto tenths = std::make_shared<int>(0);

        easel::Timer* timer = &rt.createTimer(100, [tenths]() { ++*tenths; });

        easel::Frame& frame = rt.createFrame("Stopwatch", 300, 200);
        frame.setCanvasBackground("rgb(20, 40, 60)");

        std::string sample = formatTime(0);
        int textWidth = frame.getCanvasTextwidth(sample, 48, "monospace");

        frame.setDrawHandler([tenths, textWidth](easel::canvas::Canvas& canvas) {
            canvas.drawText(formatTime(*tenths), {(300 - textWidth) / 2.0, 115}, 48, "White", "monospace");
        });

        frame.addButton("Start / Stop", [timer]() {
            if (timer->isRunning()) {
                timer->stop();
            } else {
                timer->start();
            }
        }, 120);
        frame.addButton("Reset", [tenths]() { *tenths = 0; }, 120);

        const int resetKey = easel::input::keyCode("r");
        frame.setKeydownHandler([tenths, resetKey](int key) {
            if (key == resetKey) {
                *tenths = 0;
            }
        });

        frame.start();
    });

    std::cout << "=== Example finished ===" << std::endl;
    return exitCode;
}
