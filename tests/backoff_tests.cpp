// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scribe/core/backoff.hpp>
#include <limits>

using namespace scribe::core;
using namespace std::chrono_literals;

TEST_CASE("Backoff::delay", "[backoff]") {
    const Backoff backoff(100ms, 1s);

    SECTION("Doubles per failure") {
        CHECK(backoff.delay(0) == 0ms);
        CHECK(backoff.delay(1) == 100ms);
        CHECK(backoff.delay(2) == 200ms);
        CHECK(backoff.delay(3) == 400ms);
        CHECK(backoff.delay(4) == 800ms);
    }

    SECTION("Capped") {
        CHECK(backoff.delay(5) == 1s);
        CHECK(backoff.delay(60) == 1s);
        CHECK(backoff.delay(std::numeric_limits<std::uint32_t>::max()) == 1s);
    }

    SECTION("A longer server hint wins, even past the cap") {
        CHECK(backoff.delay(1, 250ms) == 250ms);
        CHECK(backoff.delay(3, 50ms) == 400ms);
        CHECK(backoff.delay(2, 5s) == 5s);
    }

    SECTION("Cap below base is raised to base") {
        const Backoff odd(500ms, 100ms);
        CHECK(odd.cap() == 500ms);
        CHECK(odd.delay(3) == 500ms);
    }
}

TEST_CASE("sleep_for", "[backoff]") {
    SECTION("Sleeps the full duration") {
        const auto start = std::chrono::steady_clock::now();
        CHECK(sleep_for(20ms, {}));
        CHECK(std::chrono::steady_clock::now() - start >= 20ms);
    }

    SECTION("Returns early on a stop request") {
        std::stop_source stop;
        stop.request_stop();
        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(sleep_for(10s, stop.get_token()));
        CHECK(std::chrono::steady_clock::now() - start < 1s);
    }
}
