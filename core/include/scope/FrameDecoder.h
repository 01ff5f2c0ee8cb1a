#ifndef SCOPE_FRAMEDECODER_H
#define SCOPE_FRAMEDECODER_H

#include <optional>
#include <string>
#include <vector>

#include "scope/Channels.h"
#include "scope/Frame.h"

namespace scope {

// Maps the device's raw readings to the session's channels. Battery voltage and
// the external ADCs arrive in millivolts; BatteryPercent is derived locally.
class FrameDecoder {
public:
    explicit FrameDecoder(const SensorSet& sensors);

    const std::vector<std::string>& raw_fields() const { return raw_; }
    const std::vector<std::string>& channels() const { return channels_; }

    // Values in channels() order, or nullopt when a field is missing, not finite,
    // or the field count is wrong. `why` receives a short reason on failure.
    std::optional<std::vector<float>> decode(const Frame& f, std::string* why = nullptr) const;

private:
    enum class Op {
        Copy,
        MilliToUnit,
        BatteryMilli,   // emits BatteryVoltage and BatteryPercent
    };

    std::vector<std::string> raw_;
    std::vector<Op> ops_;
    std::vector<std::string> channels_;
};

float battery_percent(float volts);

}

#endif
