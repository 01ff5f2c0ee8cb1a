#include "scope/FrameDecoder.h"

#include <algorithm>
#include <cmath>

namespace scope {

float battery_percent(float v) {
    // LiPo discharge curve: near-linear to 97% at 4.10 V, the last 3% above.
    float p = 0.0f;
    if (v <= 3.3f) p = 0.0f;
    else if (v >= 4.2f) p = 100.0f;
    else if (v <= 4.10f) p = (v - 3.3f) / (4.10f - 3.3f) * 97.0f;
    else p = 97.0f + (v - 4.10f) / (4.20f - 4.10f) * 3.0f;
    return std::clamp(p, 0.0f, 100.0f);
}

FrameDecoder::FrameDecoder(const SensorSet& sensors) {
    channels_ = enabled_channels(sensors);

    for (const auto& c : channel_table()) {
        if (!sensors.enabled(c.sensor)) continue;

        if (c.name == "BatteryPercent") continue;
        if (c.name == "BatteryVoltage") {
            raw_.emplace_back(c.name);
            ops_.push_back(Op::BatteryMilli);
            continue;
        }

        raw_.emplace_back(c.name);
        switch (c.sensor) {
            case Sensor::ExtA6:
            case Sensor::ExtA7:
            case Sensor::ExtA15:
                ops_.push_back(Op::MilliToUnit);
                break;
            default:
                ops_.push_back(Op::Copy);
                break;
        }
    }
}

std::optional<std::vector<float>> FrameDecoder::decode(const Frame& f, std::string* why) const {
    if (f.x.size() != raw_.size()) {
        if (why) *why = "expected " + std::to_string(raw_.size()) + " fields, got " + std::to_string(f.x.size());
        return std::nullopt;
    }

    std::vector<float> out;
    out.reserve(channels_.size());

    for (size_t i = 0; i < raw_.size(); ++i) {
        const auto& field = f.x[i];
        if (!field || !std::isfinite(*field)) {
            if (why) *why = "missing value for " + raw_[i];
            return std::nullopt;
        }

        float v = *field;
        switch (ops_[i]) {
            case Op::Copy:
                out.push_back(v);
                break;
            case Op::MilliToUnit:
                out.push_back(v / 1000.0f);
                break;
            case Op::BatteryMilli: {
                float volts = v / 1000.0f;
                out.push_back(volts);
                out.push_back(battery_percent(volts));
                break;
            }
        }
    }
    return out;
}

}
