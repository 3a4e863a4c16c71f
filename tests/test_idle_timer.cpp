#include <catch2/catch_test_macros.hpp>

#include "idle_timer.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Polls `pred` until it holds or `limit` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST_CASE("IdleTimer", "[idle]") {
    std::atomic<int> fired{0};
    auto on_expire = [&fired] { fired.fetch_add(1); };

    SECTION("StartsDisarmed") {
        IdleTimer timer(50ms, on_expire);
        REQUIRE_FALSE(timer.armed());
        std::this_thread::sleep_for(120ms);
        REQUIRE(fired.load() == 0);
    }

    SECTION("FiresOnceAfterTimeout") {
        IdleTimer timer(100ms, on_expire);
        timer.arm();
        REQUIRE(timer.armed());

        REQUIRE(eventually([&] { return fired.load() == 1; }, 2000ms));
        REQUIRE_FALSE(timer.armed());
        REQUIRE(timer.fired_count() == 1);

        // Single-shot: no second expiry without a new arm().
        std::this_thread::sleep_for(250ms);
        REQUIRE(fired.load() == 1);
    }

    SECTION("DoesNotFireEarly") {
        std::chrono::steady_clock::time_point fired_at;
        IdleTimer timer(300ms, [&] {
            fired_at = std::chrono::steady_clock::now();
            fired = 1;
        });
        auto armed_at = std::chrono::steady_clock::now();
        timer.arm();

        REQUIRE(eventually([&] { return fired.load() == 1; }, 2000ms));
        REQUIRE(fired_at - armed_at >= 300ms);
    }

    SECTION("DisarmCancels") {
        IdleTimer timer(100ms, on_expire);
        timer.arm();
        timer.disarm();
        REQUIRE_FALSE(timer.armed());
        std::this_thread::sleep_for(250ms);
        REQUIRE(fired.load() == 0);
    }

    SECTION("ReArmRestartsCountdown") {
        IdleTimer timer(200ms, on_expire);
        timer.arm();
        for (int i = 0; i < 5; ++i) {
            std::this_thread::sleep_for(100ms);
            timer.arm();
        }
        // 500ms have passed since the first arm, but never 200ms of quiet.
        REQUIRE(fired.load() == 0);
        REQUIRE(eventually([&] { return fired.load() == 1; }, 2000ms));
    }

    SECTION("ArmAfterFireRestarts") {
        IdleTimer timer(50ms, on_expire);
        timer.arm();
        REQUIRE(eventually([&] { return fired.load() == 1; }, 2000ms));
        timer.arm();
        REQUIRE(eventually([&] { return fired.load() == 2; }, 2000ms));
        REQUIRE(timer.fired_count() == 2);
    }

    SECTION("DestroyWhileArmed") {
        {
            IdleTimer timer(10s, on_expire);
            timer.arm();
        }
        REQUIRE(fired.load() == 0);
    }
}
