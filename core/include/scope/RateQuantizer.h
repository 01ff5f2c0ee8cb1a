#pragma once
#include <stdexcept>
#include <string>

namespace scope {

// Shimmer3 base clock. The firmware samples at kDeviceClockHz / divider.
constexpr double kDeviceClockHz = 32768.0;

class InvalidSamplingRate : public std::invalid_argument {
public:
    explicit InvalidSamplingRate(double requested_hz);

    double requested_hz() const { return requested_; }

private:
    double requested_;
};

struct QuantizedRate {
    long divider = 1;
    double applied_hz = kDeviceClockHz;
};

struct SamplingRateState {
    double requested_hz = 51.2;
    double applied_hz = 51.2;
};

// divider = max(1, round(clock / requested)), halves rounded away from zero.
// Throws InvalidSamplingRate when requested_hz is not a positive number.
QuantizedRate quantize_rate(double requested_hz, double clock_hz = kDeviceClockHz);

}
