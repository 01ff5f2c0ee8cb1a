#include <catch2/catch.hpp>

#include "scope/RateQuantizer.h"

#include <limits>

using scope::quantize_rate;

TEST_CASE("rate quantizer snaps to the device clock divider", "[rate]") {
    SECTION("51.2 Hz divides the clock exactly") {
        auto q = quantize_rate(51.2);
        CHECK(q.divider == 640);
        CHECK(q.applied_hz == Approx(51.2));
    }

    SECTION("50 Hz rounds to divider 655") {
        auto q = quantize_rate(50.0);
        CHECK(q.divider == 655);
        CHECK(q.applied_hz == Approx(50.0275).margin(1e-4));
    }

    SECTION("rates above the clock clamp to divider 1") {
        auto q = quantize_rate(1e9);
        CHECK(q.divider == 1);
        CHECK(q.applied_hz == Approx(scope::kDeviceClockHz));
    }

    SECTION("halves round away from zero") {
        auto q = quantize_rate(4.0, 10.0);
        CHECK(q.divider == 3);
        CHECK(q.applied_hz == Approx(10.0 / 3.0));
    }
}

TEST_CASE("applied rate is a fixed point of the quantizer", "[rate]") {
    for (double hz : {1.0, 10.0, 50.0, 51.2, 100.0, 333.3, 512.0, 1000.0}) {
        auto first = quantize_rate(hz);
        auto second = quantize_rate(first.applied_hz);
        INFO("requested " << hz);
        CHECK(second.divider == first.divider);
        CHECK(second.applied_hz == Approx(first.applied_hz));
        CHECK(first.applied_hz > 0.0);
        CHECK(first.applied_hz <= scope::kDeviceClockHz);
    }
}

TEST_CASE("non-positive rates are rejected", "[rate]") {
    CHECK_THROWS_AS(quantize_rate(0.0), scope::InvalidSamplingRate);
    CHECK_THROWS_AS(quantize_rate(-5.0), scope::InvalidSamplingRate);
    CHECK_THROWS_AS(quantize_rate(std::numeric_limits<double>::quiet_NaN()), scope::InvalidSamplingRate);

    try {
        quantize_rate(-2.0);
        FAIL("expected InvalidSamplingRate");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("> 0 Hz") != std::string::npos);
    }
}

TEST_CASE("tiny rates give a large divider without overflow", "[rate]") {
    auto q = quantize_rate(1e-300);
    CHECK(q.divider == std::numeric_limits<long>::max());
    CHECK(q.applied_hz > 0.0);
}
