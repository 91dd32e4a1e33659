#include <doctest/doctest.h>

#include "easel/async/event_loop.h"
#include "easel/async/interval_timer.h"
#include "easel/runtime/config.h"
#include "easel/runtime/lifecycle.h"

#include <stdexcept>

using easel::Lifecycle;
using easel::RuntimeConfig;
using easel::async::EventLoop;
using easel::async::IntervalTimer;

namespace {

constexpr int kWatchdogExit = 99;

struct LifecycleFixture {
    RuntimeConfig config;
    EventLoop loop;
    Lifecycle lifecycle{loop, config};

    LifecycleFixture() { REQUIRE(loop.init()); }
    ~LifecycleFixture() { loop.shutdown(); }

    // A hung test fails with the watchdog's code instead of blocking
    void armWatchdog(uint64_t ms = 2000) {
        loop.defer([this]() { lifecycle.exit(kWatchdogExit); }, ms);
    }
};

} // namespace

TEST_CASE("a sketch that registers nothing exits right after setup") {
    LifecycleFixture f;
    f.armWatchdog();

    bool setupRan = false;
    int code = f.lifecycle.run([&setupRan]() { setupRan = true; });

    CHECK(setupRan);
    CHECK(code == 0);
    CHECK(f.lifecycle.state() == Lifecycle::State::Exited);
}

TEST_CASE("tracking is a set") {
    LifecycleFixture f;
    int resource = 0;

    f.lifecycle.track(&resource);
    f.lifecycle.track(&resource);
    CHECK(f.lifecycle.trackedCount() == 1);
    CHECK(f.lifecycle.isTracked(&resource));

    f.lifecycle.untrack(&resource);
    CHECK(f.lifecycle.trackedCount() == 0);
    CHECK_FALSE(f.lifecycle.isTracked(&resource));
}

TEST_CASE("track never schedules a check, untrack always does") {
    LifecycleFixture f;
    int resource = 0;

    f.lifecycle.track(&resource);
    CHECK(f.lifecycle.pendingChecks() == 0);

    f.lifecycle.untrack(&resource);
    CHECK(f.lifecycle.pendingChecks() == 1);

    // Untracking something unknown still schedules a check
    f.lifecycle.untrack(&f);
    CHECK(f.lifecycle.pendingChecks() == 2);
}

TEST_CASE("checks before the loop starts never exit") {
    LifecycleFixture f;
    CHECK_FALSE(f.lifecycle.checkQuiescence());
    CHECK(f.lifecycle.state() == Lifecycle::State::NotStarted);
}

TEST_CASE("the deferred check re-reads state when it runs") {
    LifecycleFixture f;
    f.armWatchdog();
    int first = 0;
    int second = 0;

    int code = f.lifecycle.run([&]() {
        f.lifecycle.track(&first);
        f.loop.defer([&]() {
            // Unregister then register a successor in the same callback:
            // the check scheduled by untrack must see the successor
            f.lifecycle.untrack(&first);
            f.lifecycle.track(&second);
            f.loop.defer([&]() { f.lifecycle.untrack(&second); }, 30);
        }, 10);
    });

    CHECK(code == 0);
    CHECK(f.lifecycle.trackedCount() == 0);
}

TEST_CASE("two self-stopping timers where the second starts inside the first's stop") {
    LifecycleFixture f;
    f.armWatchdog();

    IntervalTimer t1(f.loop);
    IntervalTimer t2(f.loop);
    int t1Fires = 0;
    int t2Fires = 0;

    auto startT2 = [&]() {
        t2.start(10, [&]() {
            if (++t2Fires == 2) {
                t2.stop();
                f.lifecycle.untrack(&t2);
            }
        });
        f.lifecycle.track(&t2);
    };

    int code = f.lifecycle.run([&]() {
        t1.start(10, [&]() {
            if (++t1Fires == 3) {
                t1.stop();
                f.lifecycle.untrack(&t1);
                startT2();
            }
        });
        f.lifecycle.track(&t1);
    });

    CHECK(code == 0);
    CHECK(t1Fires == 3);
    CHECK(t2Fires == 2);
    CHECK(f.lifecycle.state() == Lifecycle::State::Exited);
}

TEST_CASE("an open window keeps the loop running until it closes") {
    LifecycleFixture f;
    f.armWatchdog();
    int window = 0;
    bool closed = false;

    int code = f.lifecycle.run([&]() {
        f.lifecycle.windowOpened(&window);
        f.loop.defer([&]() {
            closed = true;
            f.lifecycle.windowClosed(&window);
        }, 30);
    });

    CHECK(code == 0);
    CHECK(closed);
    CHECK(f.lifecycle.openWindowCount() == 0);
}

TEST_CASE("a tracked resource outlives the last window") {
    LifecycleFixture f;
    f.armWatchdog();
    int window = 0;
    int timer = 0;
    bool timerDone = false;

    int code = f.lifecycle.run([&]() {
        f.lifecycle.windowOpened(&window);
        f.lifecycle.track(&timer);
        f.loop.defer([&]() { f.lifecycle.windowClosed(&window); }, 10);
        f.loop.defer([&]() {
            timerDone = true;
            f.lifecycle.untrack(&timer);
        }, 40);
    });

    CHECK(code == 0);
    CHECK(timerDone);
}

TEST_CASE("run happens once") {
    LifecycleFixture f;
    f.armWatchdog();

    CHECK(f.lifecycle.run({}) == 0);
    CHECK(f.lifecycle.run({}) == -1);
}

TEST_CASE("exit from setup returns its code without running the loop") {
    LifecycleFixture f;
    int code = f.lifecycle.run([&f]() { f.lifecycle.exit(3); });
    CHECK(code == 3);
    CHECK(f.lifecycle.state() == Lifecycle::State::Exited);
}

TEST_CASE("exceptions from setup and from callbacks propagate") {
    SUBCASE("setup") {
        LifecycleFixture f;
        CHECK_THROWS_AS(f.lifecycle.run([]() { throw std::runtime_error("setup"); }), std::runtime_error);
    }
    SUBCASE("callback") {
        LifecycleFixture f;
        f.armWatchdog();
        int resource = 0;
        CHECK_THROWS_WITH_AS(f.lifecycle.run([&]() {
            f.lifecycle.track(&resource);
            f.loop.defer([]() { throw std::runtime_error("tick"); }, 10);
        }), "tick", std::runtime_error);
        CHECK(f.lifecycle.state() == Lifecycle::State::Exited);
    }
}
