#ifndef SENSORSCOPE_CLI_SIMULATEDDEVICE_H
#define SENSORSCOPE_CLI_SIMULATEDDEVICE_H

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "scope/Channels.h"
#include "scope/Device.h"

// Stand-in for a real sensor: a worker thread emits one synthetic frame per
// tick at the configured rate, in the same raw layout the BLE device sends.
class SimulatedDevice : public scope::IDevice {
public:
    explicit SimulatedDevice(const scope::SensorSet& sensors);
    ~SimulatedDevice() override;

    void connect() override { connected_.store(true); }
    void disconnect() override;
    bool is_connected() const override { return connected_.load(); }

    void start_streaming() override;
    void stop_streaming() override;

    double sampling_rate() const override { return rate_hz_.load(); }
    void set_sampling_rate(double hz) override;

    void set_frame_handler(FrameHandler handler) override;
    // Every synthetic frame is well formed.
    void set_drop_handler(DropHandler) override {}

private:
    void run();
    float value_for(size_t field, double t_s) const;

private:
    std::vector<std::string> fields_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::atomic<double> rate_hz_{51.2};
    std::thread worker_;

    std::mutex handlerMu_;
    FrameHandler handler_;
};

#endif
