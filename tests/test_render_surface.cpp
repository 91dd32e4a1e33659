#include <doctest/doctest.h>

#include "easel/async/event_loop.h"
#include "easel/canvas/colour.h"
#include "easel/canvas/render_surface.h"

#include <stdexcept>
#include <string>

using namespace easel;
using namespace easel::canvas;

namespace {

struct RepaintSpy : RepaintTarget {
    int repaints = 0;
    void requestRepaint() override { repaints++; }
};

struct LoopFixture {
    async::EventLoop loop;
    LoopFixture() { REQUIRE(loop.init()); }
    ~LoopFixture() { loop.shutdown(); }

    void runFor(uint64_t ms) {
        loop.defer([this]() { loop.stop(); }, ms);
        loop.run();
    }
};

} // namespace

TEST_CASE("five identical ticks request exactly one repaint") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy);

    int calls = 0;
    surface.setDrawHandler([&calls](Canvas& canvas) {
        calls++;
        canvas.drawCircle({150, 100}, 99, 2, "green", std::string("purple"));
    });

    for (int i = 0; i < 5; i++) {
        surface.tick();
    }

    CHECK(calls == 5);
    CHECK(surface.tickCount() == 5);
    CHECK(spy.repaints == 1);
    CHECK(surface.repaintCount() == 1);
    REQUIRE(surface.frameBuffer().size() == 1);
    REQUIRE(std::holds_alternative<CirclePrimitive>(surface.frameBuffer()[0]));
    const auto& circle = std::get<CirclePrimitive>(surface.frameBuffer()[0]);
    CHECK(circle.center == Point{150, 100});
    CHECK(circle.radius == 99);
    CHECK(circle.lineColour == "green");
    CHECK(*circle.fillColour == "purple");
}

TEST_CASE("a changed frame buffer replaces the old one and repaints once") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy);

    double x = 10;
    surface.setDrawHandler([&x](Canvas& canvas) { canvas.drawPoint({x, 5}, "Red"); });

    CHECK(surface.tick());
    CHECK_FALSE(surface.tick());
    x = 11;
    CHECK(surface.tick());
    CHECK_FALSE(surface.tick());
    // Truncation hides sub-pixel movement
    x = 11.6;
    CHECK_FALSE(surface.tick());

    CHECK(spy.repaints == 2);
    CHECK(std::get<PointPrimitive>(surface.frameBuffer()[0]).point == Point{11, 5});
}

TEST_CASE("nothing is drawn before start") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy, 5);

    int calls = 0;
    surface.setDrawHandler([&calls](Canvas&) { calls++; });
    CHECK_FALSE(surface.isTicking());

    f.runFor(40);
    CHECK(calls == 0);
    CHECK(spy.repaints == 0);
}

TEST_CASE("started surface ticks on the loop and suppresses identical frames") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy, 5);

    surface.setDrawHandler([](Canvas& canvas) { canvas.drawLine({0, 0}, {10, 10}, 1, "White"); });
    surface.start();
    surface.start();
    CHECK(surface.isStarted());
    CHECK(surface.isTicking());

    f.runFor(120);
    CHECK(surface.tickCount() >= 3);
    CHECK(spy.repaints == 1);
}

TEST_CASE("start without a handler waits for one") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy, 5);

    surface.start();
    CHECK_FALSE(surface.isTicking());

    surface.setDrawHandler([](Canvas& canvas) { canvas.drawPoint({1, 1}, "Red"); });
    CHECK(surface.isTicking());

    f.runFor(60);
    CHECK(surface.tickCount() >= 1);
    CHECK(spy.repaints == 1);
}

TEST_CASE("closing the surface cancels future ticks") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy, 5);

    int calls = 0;
    surface.setDrawHandler([&](Canvas&) {
        calls++;
        // Window teardown from inside the draw callback
        surface.close();
    });
    surface.start();

    f.runFor(60);
    CHECK(calls == 1);
    CHECK_FALSE(surface.isTicking());
    CHECK(spy.repaints == 0);
}

TEST_CASE("background changes are validated and repaint once") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy);

    CHECK(surface.background() == "Black");
    surface.setBackground("aqua");
    CHECK(surface.background() == "aqua");
    CHECK(spy.repaints == 1);

    surface.setBackground("aqua");
    CHECK(spy.repaints == 1);

    CHECK_THROWS_AS(surface.setBackground("nope"), ColourParseError);
    CHECK(surface.background() == "aqua");
}

TEST_CASE("an exception from the draw handler reaches the loop's fault boundary") {
    LoopFixture f;
    RepaintSpy spy;
    RenderSurface surface(f.loop, spy, 5);

    surface.setDrawHandler([](Canvas&) { throw std::runtime_error("draw failed"); });
    CHECK_THROWS_AS(surface.tick(), std::runtime_error);

    surface.start();
    f.loop.defer([&f]() { f.loop.stop(); }, 500);
    CHECK_THROWS_WITH_AS(f.loop.run(), "draw failed", std::runtime_error);
    CHECK(spy.repaints == 0);
}
