#include <catch2/catch.hpp>

#include "scope/StreamRegistry.h"

#include <atomic>
#include <thread>

using scope::StreamRegistry;

TEST_CASE("registry keeps at most capacity samples per channel", "[registry]") {
    StreamRegistry reg({"a", "b"}, 1.0, 10.0);
    REQUIRE(reg.capacity() == 10);

    for (int i = 1; i <= 25; ++i) {
        int32_t t = reg.append_tick({(float)i, (float)-i});
        CHECK(t == i * 100);
        CHECK(reg.size("a") <= reg.capacity());
    }

    auto s = reg.snapshot("a");
    REQUIRE(s.values.size() == 10);
    REQUIRE(s.timestamps_ms.size() == 10);
    CHECK(s.values.front() == 16.0f);
    CHECK(s.values.back() == 25.0f);
    CHECK(s.timestamps_ms.front() == 1600);
    CHECK(s.timestamps_ms.back() == 2500);
    CHECK(reg.sample_counter() == 25);
}

TEST_CASE("one tick shares one timestamp across channels", "[registry]") {
    StreamRegistry reg({"x", "y", "z"}, 20.0, 51.2);
    for (int i = 0; i < 7; ++i) reg.append_tick({1.0f, 2.0f, 3.0f});

    auto x = reg.snapshot("x");
    auto y = reg.snapshot("y");
    auto z = reg.snapshot("z");
    CHECK(x.timestamps_ms == y.timestamps_ms);
    CHECK(y.timestamps_ms == z.timestamps_ms);
    // First tick lands one period after the start.
    CHECK(x.timestamps_ms.front() == 20);
}

TEST_CASE("tick with the wrong value count is refused", "[registry]") {
    StreamRegistry reg({"a", "b"}, 1.0, 10.0);
    CHECK(reg.append_tick({1.0f}) == -1);
    CHECK(reg.sample_counter() == 0);
    CHECK(reg.size("a") == 0);
}

TEST_CASE("window change re-trims and keeps history", "[registry]") {
    StreamRegistry reg({"a"}, 2.0, 10.0);
    for (int i = 1; i <= 20; ++i) reg.append_tick({(float)i});
    REQUIRE(reg.size("a") == 20);

    reg.set_time_window(0.5);
    CHECK(reg.capacity() == 5);
    CHECK(reg.size("a") == 5);
    CHECK(reg.snapshot("a").values.front() == 16.0f);
    CHECK(reg.sample_counter() == 20);
    CHECK(reg.append_tick({21.0f}) == 2100);

    reg.set_time_window(3.0);
    CHECK(reg.capacity() == 30);
    CHECK(reg.size("a") == 5);
}

TEST_CASE("rate change starts every buffer over", "[registry]") {
    StreamRegistry reg({"a", "b"}, 1.0, 10.0);
    for (int i = 0; i < 8; ++i) reg.append_tick({1.0f, 2.0f});

    reg.reset_for_rate(20.0);
    CHECK(reg.size("a") == 0);
    CHECK(reg.size("b") == 0);
    CHECK(reg.sample_counter() == 0);
    CHECK(reg.capacity() == 20);
    CHECK(reg.sampling_rate() == 20.0);
    CHECK(reg.append_tick({1.0f, 2.0f}) == 50);
}

TEST_CASE("unknown channels are ignored", "[registry]") {
    StreamRegistry reg({"a", "a", "b"}, 1.0, 10.0);
    CHECK(reg.channels().size() == 2);

    reg.append("nope", 1.0f, 0);
    CHECK_FALSE(reg.has_channel("nope"));
    CHECK(reg.snapshot("nope").values.empty());

    reg.append("b", 4.0f, 100);
    CHECK(reg.size("b") == 1);
}

TEST_CASE("collect concatenates the named channels", "[registry]") {
    StreamRegistry reg({"a", "b", "c"}, 1.0, 10.0);
    reg.append_tick({1.0f, 2.0f, 3.0f});
    reg.append_tick({4.0f, 5.0f, 6.0f});

    auto v = reg.collect({"a", "c", "missing"});
    CHECK(v == std::vector<float>{1.0f, 4.0f, 3.0f, 6.0f});

    reg.clear_all();
    CHECK(reg.collect({"a", "b", "c"}).empty());
}

TEST_CASE("extent spans the named channels", "[registry]") {
    StreamRegistry reg({"a", "b", "c"}, 1.0, 2.0);
    float lo = 0.0f, hi = 0.0f;
    CHECK_FALSE(reg.extent({"a", "b"}, lo, hi));

    reg.append_tick({1.0f, -3.0f, 50.0f});
    reg.append_tick({4.0f, 2.0f, 60.0f});
    REQUIRE(reg.extent({"a", "b", "missing"}, lo, hi));
    CHECK(lo == -3.0f);
    CHECK(hi == 4.0f);

    reg.append_tick({0.0f, 0.0f, 0.0f});
    REQUIRE(reg.extent({"a", "b"}, lo, hi));
    CHECK(lo == 0.0f);
    CHECK(hi == 4.0f);

    CHECK_FALSE(reg.extent({"missing"}, lo, hi));
}

TEST_CASE("snapshots are consistent while a producer appends", "[registry][threads]") {
    StreamRegistry reg({"a", "b"}, 1.0, 100.0);
    std::atomic<bool> done{false};

    std::thread producer([&]() {
        for (int i = 0; i < 5000; ++i) reg.append_tick({(float)i, (float)i});
        done.store(true);
    });

    size_t bad = 0;
    while (!done.load()) {
        auto s = reg.snapshot("a");
        if (s.values.size() != s.timestamps_ms.size()) ++bad;
        if (s.values.size() > 100) ++bad;
        for (size_t i = 1; i < s.timestamps_ms.size(); ++i) {
            if (s.timestamps_ms[i] <= s.timestamps_ms[i - 1]) ++bad;
        }
    }
    producer.join();

    CHECK(bad == 0);
    CHECK(reg.size("a") == 100);
    CHECK(reg.snapshot("b").values.back() == 4999.0f);
}
