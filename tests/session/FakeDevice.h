#ifndef SENSORSCOPE_TESTS_FAKEDEVICE_H
#define SENSORSCOPE_TESTS_FAKEDEVICE_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "scope/Device.h"

// Synchronous device: frames are pushed from the test thread. The counters
// stay readable after the session takes ownership through the raw pointer.
class FakeDevice : public scope::IDevice {
public:
    struct Calls {
        int connect = 0;
        int start = 0;
        int stop = 0;
        std::vector<double> rates;
    };

    void connect() override {
        ++calls.connect;
        if (fail_connect) throw std::runtime_error("connect failed");
        connected_ = true;
    }
    void disconnect() override { connected_ = false; }
    bool is_connected() const override { return connected_; }

    void start_streaming() override {
        ++calls.start;
        if (fail_start) throw std::runtime_error("already streaming");
    }
    void stop_streaming() override {
        ++calls.stop;
        if (fail_stop) throw std::runtime_error("not streaming");
    }

    double sampling_rate() const override { return rate_; }
    void set_sampling_rate(double hz) override {
        calls.rates.push_back(hz);
        if (fail_rate) throw std::runtime_error("write failed");
        rate_ = hz;
    }

    void set_frame_handler(FrameHandler handler) override { handler_ = std::move(handler); }
    void set_drop_handler(DropHandler handler) override { drop_ = std::move(handler); }

    void push(std::vector<std::optional<float>> x) {
        scope::Frame f;
        f.x = std::move(x);
        if (handler_) handler_(f);
    }

    void garble(const std::string& why) {
        if (drop_) drop_(why);
    }

    Calls calls;
    bool fail_connect = false;
    bool fail_start = false;
    bool fail_stop = false;
    bool fail_rate = false;

private:
    bool connected_ = false;
    double rate_ = 0.0;
    FrameHandler handler_;
    DropHandler drop_;
};

#endif
