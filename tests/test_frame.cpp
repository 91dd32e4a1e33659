#include <doctest/doctest.h>

#include "easel/errors.h"
#include "easel/input/keys.h"
#include "easel/runtime/frame.h"
#include "test_support.h"

#include <string>
#include <vector>

using easel::Frame;
using easel::canvas::Point;
using easel::testing::ContextFixture;

namespace {

// Control width 200: the canvas starts at window (216, 8)
constexpr int kCanvasLeft = 2 * easel::kFrameMargin + easel::kDefaultControlWidth;
constexpr int kCanvasTop = easel::kFrameMargin;

struct FrameFixture : ContextFixture {
    Frame frame{context, "Test", 300, 200};
    std::vector<Point> clicks;
    std::vector<Point> drags;
    std::vector<int> keys;

    FrameFixture() {
        frame.setMouseclickHandler([this](Point p) { clicks.push_back(p); });
        frame.setMousedragHandler([this](Point p) { drags.push_back(p); });
        frame.setKeydownHandler([this](int key) { keys.push_back(key); });
    }
};

} // namespace

TEST_CASE("an open frame counts toward the program's windows") {
    ContextFixture f;
    Frame frame(f.context, "Counted", 300, 200);
    CHECK(f.context.lifecycle().openWindowCount() == 0);

    // Without a display the window may fail; then the frame is not counted
    bool opened = frame.open();
    CHECK(frame.isOpen() == opened);
    CHECK(f.context.lifecycle().openWindowCount() == (opened ? 1u : 0u));

    frame.close();
    CHECK_FALSE(frame.isOpen());
    CHECK(f.context.lifecycle().openWindowCount() == 0);

    frame.close();
    CHECK(f.context.lifecycle().openWindowCount() == 0);
}

TEST_CASE("frame sizes are validated") {
    ContextFixture f;
    CHECK_THROWS_AS(Frame(f.context, "Bad", 0, 200), easel::ArgumentError);
    CHECK_THROWS_AS(Frame(f.context, "Bad", 300, -1), easel::ArgumentError);
    CHECK_THROWS_AS(Frame(f.context, "Bad", 300, 200, -5), easel::ArgumentError);
}

TEST_CASE("nothing reaches the handlers before start") {
    FrameFixture f;

    f.frame.onMouseDown(kCanvasLeft + 10, kCanvasTop + 10);
    f.frame.onMouseUp(kCanvasLeft + 10, kCanvasTop + 10);
    f.frame.onKeyDown(65);

    CHECK(f.clicks.empty());
    CHECK(f.keys.empty());
    CHECK(f.frame.controlPanel().mouseStatus() == "Mouse: ");
}

TEST_CASE("a click fires on release after a press on the canvas") {
    FrameFixture f;
    f.frame.start();

    f.frame.onMouseDown(226, 18);
    CHECK(f.clicks.empty());
    f.frame.onMouseUp(226, 18);
    REQUIRE(f.clicks.size() == 1);
    CHECK(f.clicks[0] == Point{10, 10});
    CHECK(f.frame.controlPanel().mouseStatus() == "Mouse: Click 10, 10");

    // Pressed in the panel, released on the canvas
    f.frame.onMouseDown(20, 20);
    f.frame.onMouseUp(226, 18);
    CHECK(f.clicks.size() == 1);

    // Released outside the canvas: clamped to its edge
    f.frame.onMouseDown(226, 18);
    f.frame.onMouseUp(1000, 500);
    REQUIRE(f.clicks.size() == 2);
    CHECK(f.clicks[1] == Point{299, 199});
}

TEST_CASE("drags need the button held after a press on the canvas") {
    FrameFixture f;
    f.frame.start();

    // Motion with no button
    f.frame.onMouseMove(226, 18, false);
    CHECK(f.drags.empty());

    // Button held, but pressed in the panel
    f.frame.onMouseDown(20, 20);
    f.frame.onMouseMove(226, 18, true);
    CHECK(f.drags.empty());
    f.frame.onMouseUp(20, 20);

    f.frame.onMouseDown(226, 18);
    f.frame.onMouseMove(1000, 18, true);
    f.frame.onMouseMove(kCanvasLeft + 5, -40, true);
    REQUIRE(f.drags.size() == 2);
    CHECK(f.drags[0] == Point{299, 10});
    CHECK(f.drags[1] == Point{5, 0});
    CHECK(f.frame.controlPanel().mouseStatus() == "Mouse: Move - 5, 0");
}

TEST_CASE("key events update the status line") {
    FrameFixture f;
    f.frame.start();

    f.frame.onKeyDown(easel::input::keyCode("a"));
    CHECK(f.keys == std::vector<int>{65});
    CHECK(f.frame.controlPanel().keyStatus() == "Key: Down A");

    f.frame.onKeyUp(easel::input::keyCode("space"));
    CHECK(f.frame.controlPanel().keyStatus() == "Key: Up space");
}

TEST_CASE("a panel button fires from a press in the window") {
    FrameFixture f;
    int pressed = 0;
    easel::Control button = f.frame.addButton("Go", [&pressed]() { pressed++; }, 80);
    f.frame.start();

    // Panel (12, 12) is window (20, 20)
    f.frame.onMouseDown(20, 20);
    f.frame.onMouseUp(20, 20);
    CHECK(pressed == 1);
    CHECK(f.clicks.empty());
    CHECK(button.getText() == "Go");

    CHECK_THROWS_AS(f.frame.addLabel("bad", 0), easel::ArgumentError);
}

TEST_CASE("a focused input field takes the keys from the key handlers") {
    FrameFixture f;
    std::vector<std::string> entered;
    easel::Control input = f.frame.addInput("Name", [&entered](const std::string& text) {
        entered.push_back(text);
    }, 150);
    f.frame.start();

    // The field starts 18px below the caption: panel y 18-41
    f.frame.onMouseDown(20, kCanvasTop + 25);
    f.frame.onMouseUp(20, kCanvasTop + 25);
    REQUIRE(f.frame.controlPanel().hasFocus());

    f.frame.onKeyDown(easel::input::keyCode("h"));
    f.frame.onTextInput("hi");
    f.frame.onKeyUp(easel::input::keyCode("h"));
    CHECK(f.keys.empty());
    CHECK(input.getText() == "hi");

    f.frame.onKeyDown(easel::input::kEnterKeyCode);
    f.frame.onKeyUp(easel::input::kEnterKeyCode);
    CHECK(entered == std::vector<std::string>{"hi"});
    CHECK_FALSE(f.frame.controlPanel().hasFocus());

    f.frame.onKeyDown(easel::input::keyCode("h"));
    CHECK(f.keys == std::vector<int>{72});
}

TEST_CASE("a press on the canvas takes the focus from an input field") {
    FrameFixture f;
    f.frame.addInput("Name", [](const std::string&) {}, 150);
    f.frame.start();

    f.frame.onMouseDown(20, kCanvasTop + 25);
    f.frame.onMouseUp(20, kCanvasTop + 25);
    REQUIRE(f.frame.controlPanel().hasFocus());

    f.frame.onMouseDown(226, 18);
    f.frame.onMouseUp(226, 18);
    CHECK_FALSE(f.frame.controlPanel().hasFocus());
    CHECK(f.clicks.size() == 1);
}
