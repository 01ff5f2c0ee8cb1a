#ifndef SCOPE_CHANNELS_H
#define SCOPE_CHANNELS_H

#include <string>
#include <string_view>
#include <vector>

namespace scope {

enum class Sensor : int {
    LowNoiseAccelerometer = 0,
    WideRangeAccelerometer,
    Gyroscope,
    Magnetometer,
    PressureTemperature,
    Battery,
    ExtA6,
    ExtA7,
    ExtA15,
};

struct AxisRange {
    double min = 0.0;
    double max = 1.0;

    bool valid() const { return min < max; }
};

struct ChannelInfo {
    std::string_view name;
    Sensor sensor;
    std::string_view group;   // empty when the channel is not part of an X/Y/Z group
    std::string_view label;
    std::string_view unit;
    AxisRange fallback;
};

// Which sensors are streamed in this session.
struct SensorSet {
    bool low_noise_accel = true;
    bool wide_range_accel = true;
    bool gyroscope = true;
    bool magnetometer = true;
    bool pressure_temperature = true;
    bool battery = true;
    bool ext_a6 = true;
    bool ext_a7 = true;
    bool ext_a15 = true;

    bool enabled(Sensor s) const;
    void set(Sensor s, bool on);

    static SensorSet none();
};

const std::vector<ChannelInfo>& channel_table();
const ChannelInfo* find_channel(std::string_view name);

std::vector<std::string> enabled_channels(const SensorSet& sensors);
std::vector<std::string> selectable_parameters(const SensorSet& sensors);

bool is_group(std::string_view name);
std::vector<std::string> group_members(std::string_view group);

// Static bounds used when nothing is buffered yet, for a channel or a group.
AxisRange fallback_range(std::string_view name);

std::string_view sensor_name(Sensor s);
bool parse_sensor(std::string_view name, Sensor& out);

}

#endif
