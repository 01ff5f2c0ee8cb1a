#include <catch2/catch.hpp>

#include "scope/FrameDecoder.h"

#include <limits>

using namespace scope;

static SensorSet battery_and_a6() {
    SensorSet s = SensorSet::none();
    s.set(Sensor::Battery, true);
    s.set(Sensor::ExtA6, true);
    return s;
}

TEST_CASE("decoder layout derives battery percent", "[decoder]") {
    FrameDecoder dec(battery_and_a6());
    CHECK(dec.raw_fields() == std::vector<std::string>{"BatteryVoltage", "ExtADC_A6"});
    CHECK(dec.channels() == std::vector<std::string>{"BatteryVoltage", "BatteryPercent", "ExtADC_A6"});
}

TEST_CASE("millivolt readings are converted to volts", "[decoder]") {
    FrameDecoder dec(battery_and_a6());

    Frame f;
    f.x = {4100.0f, 1650.0f};
    auto v = dec.decode(f);
    REQUIRE(v);
    REQUIRE(v->size() == 3);
    CHECK((*v)[0] == Approx(4.1f));
    CHECK((*v)[1] == Approx(97.0f));
    CHECK((*v)[2] == Approx(1.65f));
}

TEST_CASE("battery percent curve", "[decoder]") {
    CHECK(battery_percent(3.0f) == 0.0f);
    CHECK(battery_percent(3.3f) == 0.0f);
    CHECK(battery_percent(3.7f) == Approx(48.5f));
    CHECK(battery_percent(4.15f) == Approx(98.5f));
    CHECK(battery_percent(4.2f) == 100.0f);
    CHECK(battery_percent(4.5f) == 100.0f);
}

TEST_CASE("a missing reading drops the whole tick", "[decoder]") {
    FrameDecoder dec(battery_and_a6());
    std::string why;

    Frame missing;
    missing.x = {std::nullopt, 1650.0f};
    CHECK_FALSE(dec.decode(missing, &why));
    CHECK(why.find("BatteryVoltage") != std::string::npos);

    Frame nan;
    nan.x = {4000.0f, std::numeric_limits<float>::quiet_NaN()};
    CHECK_FALSE(dec.decode(nan, &why));
    CHECK(why.find("ExtADC_A6") != std::string::npos);

    Frame short_frame;
    short_frame.x = {4000.0f};
    CHECK_FALSE(dec.decode(short_frame, &why));
    CHECK(why.find("expected 2") != std::string::npos);
}

TEST_CASE("motion sensors pass through unchanged", "[decoder]") {
    SensorSet s = SensorSet::none();
    s.set(Sensor::Gyroscope, true);
    FrameDecoder dec(s);

    Frame f;
    f.x = {1.5f, -2.0f, 300.0f};
    auto v = dec.decode(f);
    REQUIRE(v);
    CHECK(*v == std::vector<float>{1.5f, -2.0f, 300.0f});
}
