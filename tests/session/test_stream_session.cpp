#include <catch2/catch.hpp>

#include "FakeDevice.h"
#include "StreamSession.h"

#include <memory>

static scope::SessionConfig gyro_battery_config() {
    scope::SessionConfig cfg;
    cfg.sensors = scope::SensorSet::none();
    cfg.sensors.set(scope::Sensor::Gyroscope, true);
    cfg.sensors.set(scope::Sensor::Battery, true);
    return cfg;
}

static FakeDevice* attach(StreamSession& s) {
    auto dev = std::make_unique<FakeDevice>();
    FakeDevice* raw = dev.get();
    s.setDevice(std::move(dev));
    return raw;
}

TEST_CASE("session sizes the registry from the applied rate", "[session]") {
    StreamSession s(gyro_battery_config());
    CHECK(s.rateState().requested_hz == Approx(51.2));
    CHECK(s.rateState().applied_hz == Approx(51.2));
    CHECK(s.registry().capacity() == 1024);
    CHECK(s.enabledChannels() == QStringList{"GyroscopeX", "GyroscopeY", "GyroscopeZ",
                                             "BatteryVoltage", "BatteryPercent"});
}

TEST_CASE("start connects, writes the rate and starts streaming", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);

    REQUIRE(s.start());
    CHECK(s.streaming());
    CHECK(dev->calls.connect == 1);
    CHECK(dev->calls.start == 1);
    REQUIRE(dev->calls.rates.size() == 1);
    CHECK(dev->calls.rates[0] == Approx(51.2));
}

TEST_CASE("failed connect is reported, not thrown", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);
    dev->fail_connect = true;

    QString last;
    QObject::connect(&s, &StreamSession::statusText, [&](const QString& t) { last = t; });

    CHECK_FALSE(s.start());
    CHECK_FALSE(s.streaming());
    CHECK(last.startsWith("Start failed"));
}

TEST_CASE("ingested frames land in every channel with one timestamp", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);

    int ticks = 0;
    QObject::connect(&s, &StreamSession::tickAppended, [&](int) { ++ticks; });

    dev->push({1.0f, 2.0f, 3.0f, 4100.0f});
    s.tickConsumed();
    dev->push({1.5f, 2.5f, 3.5f, 4100.0f});

    CHECK(ticks == 2);
    CHECK(s.framesOk() == 2);

    auto gx = s.snapshot("GyroscopeX");
    auto pct = s.snapshot("BatteryPercent");
    REQUIRE(gx.values.size() == 2);
    CHECK(gx.values.back() == 1.5f);
    CHECK(gx.timestamps_ms == pct.timestamps_ms);
    CHECK(gx.timestamps_ms.front() == 20);
    CHECK(pct.values.back() == Approx(97.0f));
}

TEST_CASE("a frame with a missing reading is dropped whole", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);

    dev->push({1.0f, std::nullopt, 3.0f, 4000.0f});
    dev->push({1.0f, 2.0f, 3.0f});

    CHECK(s.framesBad() == 2);
    CHECK(s.framesOk() == 0);
    CHECK(s.registry().sample_counter() == 0);
    CHECK(s.snapshot("GyroscopeX").values.empty());
}

TEST_CASE("ticks are coalesced until the receiver catches up", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);

    int ticks = 0;
    QObject::connect(&s, &StreamSession::tickAppended, [&](int) { ++ticks; });

    for (int i = 0; i < 10; ++i) dev->push({1.0f, 2.0f, 3.0f, 4000.0f});
    CHECK(ticks == 1);
    CHECK(s.framesOk() == 10);
    CHECK(s.snapshot("GyroscopeX").values.size() == 10);

    s.tickConsumed();
    dev->push({1.0f, 2.0f, 3.0f, 4000.0f});
    CHECK(ticks == 2);
}

TEST_CASE("undecodable device input counts as a bad frame", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);

    dev->push({1.0f, 2.0f, 3.0f, 4000.0f});
    dev->garble("unparsable line");
    dev->garble("unparsable line");

    CHECK(s.framesBad() == 2);
    CHECK(s.framesOk() == 1);
    CHECK(s.registry().sample_counter() == 1);
}

TEST_CASE("rate change brackets the device and resets the buffers", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);
    REQUIRE(s.start());
    dev->push({1.0f, 2.0f, 3.0f, 4000.0f});

    int resets = 0;
    double applied = 0.0;
    QObject::connect(&s, &StreamSession::buffersReset, [&]() { ++resets; });
    QObject::connect(&s, &StreamSession::samplingRateApplied, [&](double, double a) { applied = a; });

    auto q = s.applySamplingRate(50.0);

    CHECK(q.divider == 655);
    CHECK(applied == Approx(50.0275).margin(1e-4));
    CHECK(resets == 1);
    CHECK(dev->calls.stop == 1);
    CHECK(dev->calls.start == 2);
    CHECK(dev->calls.rates.back() == Approx(q.applied_hz));

    CHECK(s.rateState().requested_hz == 50.0);
    CHECK(s.rateState().applied_hz == Approx(q.applied_hz));
    CHECK(s.registry().sample_counter() == 0);
    CHECK(s.snapshot("GyroscopeX").values.empty());
    CHECK(s.registry().capacity() == 1001);
}

TEST_CASE("stop/start failures during a rate change are not fatal", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);
    REQUIRE(s.start());

    dev->fail_stop = true;
    dev->fail_start = true;
    dev->fail_rate = true;

    scope::QuantizedRate q;
    REQUIRE_NOTHROW(q = s.applySamplingRate(100.0));
    CHECK(q.divider == 328);
    CHECK(s.rateState().applied_hz == Approx(32768.0 / 328.0));
    CHECK(s.streaming());
}

TEST_CASE("invalid rate leaves the session untouched", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);
    dev->push({1.0f, 2.0f, 3.0f, 4000.0f});

    CHECK_THROWS_AS(s.applySamplingRate(0.0), scope::InvalidSamplingRate);
    CHECK(s.rateState().applied_hz == Approx(51.2));
    CHECK(s.snapshot("GyroscopeX").values.size() == 1);
    CHECK(dev->calls.rates.empty());
}

TEST_CASE("window change keeps buffered history", "[session]") {
    StreamSession s(gyro_battery_config());
    FakeDevice* dev = attach(s);
    for (int i = 0; i < 100; ++i) dev->push({(float)i, 0.0f, 0.0f, 4000.0f});

    s.setTimeWindow(1.0);
    CHECK(s.registry().capacity() == 52);
    CHECK(s.snapshot("GyroscopeX").values.size() == 52);
    CHECK(s.snapshot("GyroscopeX").values.back() == 99.0f);
    CHECK(s.registry().sample_counter() == 100);
}
