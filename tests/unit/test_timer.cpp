#include <catch2/catch_test_macros.hpp>
#include <relay/time/timer.hpp>
#include <relay/runtime/async_main.hpp>
#include <relay/coro/cancel_token.hpp>
#include <thread>
#include "../test_main.cpp"

using namespace relay;
using namespace relay::coro;
using namespace relay::test;
using namespace std::chrono_literals;

TEST_CASE("sleep_for waits out the duration", "[time][sleep]") {
    auto start = std::chrono::steady_clock::now();
    auto outcome = relay::run(time::sleep_for(50ms), 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome == cancel_result::completed);
    REQUIRE(elapsed >= 50ms);
    REQUIRE(elapsed < scaled_ms(2000));
}

TEST_CASE("sleep_for with zero duration returns at once", "[time][sleep]") {
    REQUIRE(relay::run(time::sleep_for(0ms), 1) == cancel_result::completed);
}

TEST_CASE("cancelling the token ends the sleep early", "[time][sleep][cancel]") {
    cancel_source source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(scaled_ms(50));
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = relay::run(time::sleep_for(10s, source.get_token()), 1);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(outcome == cancel_result::cancelled);
    REQUIRE(elapsed < scaled_ms(2000));
}

TEST_CASE("an already cancelled token does not sleep", "[time][sleep][cancel]") {
    cancel_source source;
    source.cancel();
    REQUIRE(relay::run(time::sleep_for(10s, source.get_token()), 1) == cancel_result::cancelled);
}

TEST_CASE("sleeping tasks share one worker", "[time][sleep]") {
    auto both = []() -> task<int> {
        auto first = time::sleep_for(200ms).spawn();
        auto second = time::sleep_for(200ms).spawn();
        int completed = 0;
        if (co_await first == cancel_result::completed) ++completed;
        if (co_await second == cancel_result::completed) ++completed;
        co_return completed;
    };

    auto start = std::chrono::steady_clock::now();
    REQUIRE(relay::run(both(), 1) == 2);
    REQUIRE(std::chrono::steady_clock::now() - start < scaled_ms(380));
}
