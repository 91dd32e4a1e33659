#include "sketches.h"
#include "easel/input/keys.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>

namespace easel {
namespace cli {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kBallRadius = 20;

int sizeOr(int requested, int fallback) {
    return requested > 0 ? requested : fallback;
}

// ============================================================================
// welcome: every primitive, panel controls and a restarting timer
// ============================================================================

void setupWelcome(Runtime& runtime, const SketchOptions& options) {
    struct State {
        std::string message = "Welcome!";
        int face = 0;
        int calls = 0;
        Timer* timer = nullptr;
    };
    auto state = std::make_shared<State>();
    static const char* const faces[] = {"serif", "sans-serif", "monospace"};

    int width = sizeOr(options.width, 300);
    int height = sizeOr(options.height, 200);
    double cx = width / 2.0;
    double cy = height / 2.0;

    Frame& frame = runtime.createFrame("Home", width, height);
    frame.setCanvasBackground("aqua");
    frame.addButton("Click me", [state]() {
        state->message = "Good job!";
        state->face = (state->face + 1) % 3;
    });
    Control label = frame.addLabel("lAB1", 120);
    frame.addInput("INPgUT", [label](const std::string& text) mutable { label.setText(text); }, 300);
    frame.setMouseclickHandler([](canvas::Point) {});
    frame.setKeydownHandler([](int) {});
    frame.setKeyupHandler([](int) {});
    frame.setMousedragHandler([](canvas::Point) {});

    bool quiet = options.quiet;
    state->timer = &runtime.createTimer(500, [state, quiet]() {
        state->calls++;
        if (state->calls % 10 == 0) {
            state->timer->stop();
            if (!quiet) std::cout << "stop" << std::endl;
            state->timer->start();
            if (!quiet) std::cout << "start" << std::endl;
            if (state->calls % 30 == 0) {
                if (!quiet) std::cout << "real stop" << std::endl;
                state->timer->stop();
            }
        }
    });
    state->timer->start();

    frame.setDrawHandler([state, width, height, cx, cy](canvas::Canvas& canvas) {
        double right = width - 1;
        double bottom = height - 1;
        canvas.drawCircle({cx, cy}, std::min(cx, cy) - 1, 2, "green", std::string("purple"));
        canvas.drawLine({cx - 50, 0}, {cx - 50, bottom}, 3, "red");
        canvas.drawPoint({cx, cy}, "yellow");
        canvas.drawPoint({0, 0}, "red");
        canvas.drawPoint({right, bottom}, "red");
        canvas.drawPoint({right, 0}, "red");
        canvas.drawPoint({0, bottom}, "red");
        canvas.drawPolyline({{0, bottom}, {cx, cy}, {cx, cy + 50}}, 2, "green");
        canvas.drawPolygon({{0, cy}, {cx, cy - 50}, {0, cy - 50}}, 2, "green", std::string("blue"));
        canvas.drawArc({cx, cy}, 50, 0, kPi / 2, 2, "orange");
        canvas.drawText(state->message, {0, bottom}, 48, "Red", faces[state->face]);
    });

    frame.start();
}

// ============================================================================
// bounce: a ball moved by a timer, steered with the arrow keys
// ============================================================================

void setupBounce(Runtime& runtime, const SketchOptions& options) {
    struct Ball {
        double x = 0;
        double y = 0;
        double vx = 3;
        double vy = 2;
        int bounces = 0;
    };
    int width = sizeOr(options.width, 600);
    int height = sizeOr(options.height, 400);
    auto ball = std::make_shared<Ball>();
    ball->x = width / 2.0;
    ball->y = height / 2.0;

    Frame& frame = runtime.createFrame("Bounce", width, height);

    runtime.createTimer(20, [ball, width, height]() {
        ball->x += ball->vx;
        ball->y += ball->vy;
        if (ball->x < kBallRadius || ball->x > width - kBallRadius) {
            ball->vx = -ball->vx;
            ball->bounces++;
        }
        if (ball->y < kBallRadius || ball->y > height - kBallRadius) {
            ball->vy = -ball->vy;
            ball->bounces++;
        }
    }).start();

    const int left = input::keyCode("left");
    const int right = input::keyCode("right");
    const int up = input::keyCode("up");
    const int down = input::keyCode("down");
    frame.setKeydownHandler([ball, left, right, up, down](int key) {
        if (key == left) ball->vx -= 1;
        else if (key == right) ball->vx += 1;
        else if (key == up) ball->vy -= 1;
        else if (key == down) ball->vy += 1;
    });
    frame.setMouseclickHandler([ball](canvas::Point p) {
        ball->x = p.x;
        ball->y = p.y;
    });

    frame.setDrawHandler([ball, width](canvas::Canvas& canvas) {
        canvas.drawCircle({ball->x, ball->y}, kBallRadius, 2, "White", std::string("Orange"));
        std::string label = "Bounces: " + std::to_string(ball->bounces);
        canvas.drawText(label, {10, 30}, 20, "rgb(200, 200, 200)", "sans-serif");
        canvas.drawLine({0, 40}, {static_cast<double>(width), 40}, 1, "hsla(0, 0%, 100%, 0.4)");
    });

    frame.start();
}

// ============================================================================
// images: loads --asset URLs and spins them; --sound plays on click
// ============================================================================

void setupImages(Runtime& runtime, const SketchOptions& options) {
    struct State {
        std::vector<std::shared_ptr<assets::ImageAsset>> images;
        std::shared_ptr<Sound> sound;
        double angle = 0;
    };
    auto state = std::make_shared<State>();

    int width = sizeOr(options.width, 640);
    int height = sizeOr(options.height, 480);

    for (const auto& url : options.assets) {
        state->images.push_back(runtime.loadImage(url));
    }
    if (!options.sound.empty()) {
        state->sound = runtime.loadSound(options.sound);
    }

    Frame& frame = runtime.createFrame("Images", width, height);
    frame.setCanvasBackground("#202020");

    runtime.createTimer(30, [state]() {
        state->angle = std::fmod(state->angle + 0.05, 2 * kPi);
    }).start();

    frame.setMouseclickHandler([state](canvas::Point) {
        if (!state->sound) return;
        if (state->sound->isPlaying()) {
            state->sound->rewind();
        } else {
            state->sound->play();
        }
    });

    frame.setDrawHandler([state, width, height](canvas::Canvas& canvas) {
        if (state->images.empty()) {
            canvas.drawText("Pass images with --asset <url>", {20, height / 2.0}, 18, "White", "sans-serif");
            return;
        }

        double slot = static_cast<double>(width) / state->images.size();
        for (size_t i = 0; i < state->images.size(); i++) {
            const auto& image = state->images[i];
            double cx = slot * i + slot / 2;
            double cy = height / 2.0;

            std::string status;
            switch (image->state()) {
                case assets::AssetState::Loading: status = "loading"; break;
                case assets::AssetState::Failed: status = "failed"; break;
                case assets::AssetState::Ready:
                    status = std::to_string(image->width()) + "x" + std::to_string(image->height());
                    break;
            }
            canvas.drawText(status, {cx - slot / 2 + 8, 24}, 14, "Silver", "monospace");

            double w = image->width();
            double h = image->height();
            if (w == 0 || h == 0) continue;

            double scale = std::min(1.0, std::min((slot - 16) / w, (height - 64) / h));
            canvas.drawImage(image, {w / 2, h / 2}, {w, h}, {cx, cy}, {w * scale, h * scale}, state->angle);
        }
    });

    frame.start();
}

} // namespace

const std::vector<Sketch>& sketches() {
    static const std::vector<Sketch> all = {
        {"welcome", "The classic default demo: every primitive, a button, a label, an input and a timer", setupWelcome},
        {"bounce", "A ball animated by a timer; arrow keys steer, click moves it", setupBounce},
        {"images", "Loads --asset images and rotates them; --sound plays on click", setupImages},
    };
    return all;
}

const Sketch* findSketch(const std::string& name) {
    for (const auto& sketch : sketches()) {
        if (name == sketch.name) {
            return &sketch;
        }
    }
    return nullptr;
}

} // namespace cli
} // namespace easel
