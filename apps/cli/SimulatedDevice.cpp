#include "SimulatedDevice.h"
#include "Logging.h"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "scope/FrameDecoder.h"

constexpr double kTwoPi = 6.283185307179586;

static inline bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

SimulatedDevice::SimulatedDevice(const scope::SensorSet& sensors)
    : fields_(scope::FrameDecoder(sensors).raw_fields()) {}

SimulatedDevice::~SimulatedDevice() {
    stop_streaming();
}

void SimulatedDevice::disconnect() {
    stop_streaming();
    connected_.store(false);
}

void SimulatedDevice::start_streaming() {
    if (!connected_.load()) throw std::runtime_error("start_streaming: not connected");
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { this->run(); });
}

void SimulatedDevice::stop_streaming() {
    running_.store(false);
    if (worker_.joinable()) worker_.join();
}

void SimulatedDevice::set_sampling_rate(double hz) {
    if (!(hz > 0.0)) throw std::invalid_argument("sampling rate must be > 0");
    rate_hz_.store(hz);
    qCDebug(lcDevice) << "simulator rate" << hz << "Hz";
}

void SimulatedDevice::set_frame_handler(FrameHandler handler) {
    std::lock_guard<std::mutex> lk(handlerMu_);
    handler_ = std::move(handler);
}

void SimulatedDevice::run() {
    using namespace std::chrono;

    const double rate = rate_hz_.load();
    const auto period = duration_cast<steady_clock::duration>(duration<double>(1.0 / rate));

    uint64_t n = 0;
    auto next = steady_clock::now();

    while (running_.load()) {
        double t_s = (double)n / rate;

        scope::Frame f;
        f.x.reserve(fields_.size());
        for (size_t i = 0; i < fields_.size(); ++i) f.x.emplace_back(value_for(i, t_s));

        {
            std::lock_guard<std::mutex> lk(handlerMu_);
            if (handler_) handler_(f);
        }

        ++n;
        next += period;
        std::this_thread::sleep_until(next);
    }
}

// Raw units as the sensor reports them: m/s², deg/s, local flux, °C, kPa, mV.
float SimulatedDevice::value_for(size_t field, double t_s) const {
    const std::string& name = fields_[field];
    const double w = kTwoPi * 0.5;
    const double phase = (double)field * 0.7;

    if (name.find("Accelerometer") != std::string::npos) {
        double g = ends_with(name, 'Z') ? 9.81 : 0.0;
        return (float)(g + 0.8 * std::sin(w * t_s + phase));
    }
    if (name.find("Gyroscope") == 0) return (float)(45.0 * std::sin(0.5 * w * t_s + phase));
    if (name.find("Magnetometer") == 0) return (float)(0.4 * std::cos(0.2 * w * t_s + phase));
    if (name == "Temperature_BMP180") return (float)(24.0 + 0.05 * std::sin(0.01 * w * t_s));
    if (name == "Pressure_BMP180") return (float)(100.9 + 0.02 * std::sin(0.02 * w * t_s));
    if (name == "BatteryVoltage") return (float)(3950.0 - 0.01 * t_s);
    return (float)(1650.0 + 400.0 * std::sin(0.3 * w * t_s + phase));
}
