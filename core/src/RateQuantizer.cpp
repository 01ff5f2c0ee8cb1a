#include "scope/RateQuantizer.h"

#include <cmath>
#include <limits>
#include <sstream>

namespace scope {

static std::string invalid_rate_message(double hz) {
    std::ostringstream oss;
    oss << "sampling rate must be > 0 Hz (got " << hz << ")";
    return oss.str();
}

InvalidSamplingRate::InvalidSamplingRate(double requested_hz)
    : std::invalid_argument(invalid_rate_message(requested_hz)), requested_(requested_hz) {}

QuantizedRate quantize_rate(double requested_hz, double clock_hz) {
    if (!(requested_hz > 0.0)) throw InvalidSamplingRate(requested_hz);

    // std::round is half-away-from-zero: 0.5 -> 1, 2.5 -> 3.
    double d = std::round(clock_hz / requested_hz);

    QuantizedRate q;
    if (!(d < (double)std::numeric_limits<long>::max())) q.divider = std::numeric_limits<long>::max();
    else if (d < 1.0) q.divider = 1;
    else q.divider = (long)d;

    q.applied_hz = clock_hz / (double)q.divider;
    return q;
}

}
