#include <doctest/doctest.h>

#include "easel/errors.h"
#include "easel/runtime/runtime_context.h"
#include "easel/runtime/timer.h"

using easel::ArgumentError;
using easel::RuntimeContext;
using easel::Timer;

namespace {

struct ContextFixture {
    RuntimeContext context;
    ContextFixture() { REQUIRE(context.init()); }

    void armWatchdog(uint64_t ms = 2000) {
        context.loop().defer([this]() { context.lifecycle().exit(99); }, ms);
    }
};

} // namespace

TEST_CASE("interval and handler are validated") {
    ContextFixture f;
    CHECK_THROWS_AS(Timer(f.context, 0, []() {}), ArgumentError);
    CHECK_THROWS_AS(Timer(f.context, -5, []() {}), ArgumentError);
    CHECK_THROWS_AS(Timer(f.context, 10, {}), ArgumentError);
}

TEST_CASE("a running timer is tracked until stopped") {
    ContextFixture f;
    Timer timer(f.context, 10, []() {});
    CHECK(timer.interval() == 10);
    CHECK_FALSE(timer.isRunning());

    timer.start();
    CHECK(timer.isRunning());
    CHECK(f.context.lifecycle().isTracked(&timer));

    // Restarting does not double-track
    timer.start();
    CHECK(f.context.lifecycle().trackedCount() == 1);

    timer.stop();
    CHECK_FALSE(timer.isRunning());
    CHECK_FALSE(f.context.lifecycle().isTracked(&timer));
}

TEST_CASE("dispose releases a running timer") {
    ContextFixture f;
    Timer timer(f.context, 10, []() {});
    timer.start();
    timer.dispose();
    CHECK_FALSE(timer.isRunning());
    CHECK(f.context.lifecycle().trackedCount() == 0);
}

TEST_CASE("a timer that stops itself lets the program exit") {
    ContextFixture f;
    f.armWatchdog();

    int ticks = 0;
    Timer* self = nullptr;
    Timer timer(f.context, 10, [&]() {
        if (++ticks == 3) {
            self->stop();
        }
    });
    self = &timer;

    int code = f.context.lifecycle().run([&timer]() { timer.start(); });
    CHECK(code == 0);
    CHECK(ticks == 3);
}

TEST_CASE("a stopped timer can be started again from another timer") {
    ContextFixture f;
    f.armWatchdog();

    int firstTicks = 0;
    int secondTicks = 0;
    Timer* first = nullptr;
    Timer* second = nullptr;

    Timer a(f.context, 10, [&]() {
        firstTicks++;
        first->stop();
        if (firstTicks < 3) {
            second->start();
        }
    });
    Timer b(f.context, 10, [&]() {
        secondTicks++;
        second->stop();
        first->start();
    });
    first = &a;
    second = &b;

    int code = f.context.lifecycle().run([&a]() { a.start(); });
    CHECK(code == 0);
    CHECK(firstTicks == 3);
    CHECK(secondTicks == 2);
}
