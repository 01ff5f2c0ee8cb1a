#include "scope/Channels.h"

#include <array>

namespace scope {

namespace {

struct GroupInfo {
    std::string_view name;
    Sensor sensor;
    AxisRange fallback;
};

constexpr std::string_view kLowNoise = "Low-Noise Accelerometer";
constexpr std::string_view kWideRange = "Wide-Range Accelerometer";
constexpr std::string_view kGyro = "Gyroscope";
constexpr std::string_view kMag = "Magnetometer";

const std::array<GroupInfo, 4>& group_table() {
    static const std::array<GroupInfo, 4> groups = {{
        {kLowNoise,  Sensor::LowNoiseAccelerometer,  {-20.0, 20.0}},
        {kWideRange, Sensor::WideRangeAccelerometer, {-20.0, 20.0}},
        {kGyro,      Sensor::Gyroscope,              {-250.0, 250.0}},
        {kMag,       Sensor::Magnetometer,           {-5.0, 5.0}},
    }};
    return groups;
}

const GroupInfo* find_group(std::string_view name) {
    for (const auto& g : group_table()) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

}

bool SensorSet::enabled(Sensor s) const {
    switch (s) {
        case Sensor::LowNoiseAccelerometer:  return low_noise_accel;
        case Sensor::WideRangeAccelerometer: return wide_range_accel;
        case Sensor::Gyroscope:              return gyroscope;
        case Sensor::Magnetometer:           return magnetometer;
        case Sensor::PressureTemperature:    return pressure_temperature;
        case Sensor::Battery:                return battery;
        case Sensor::ExtA6:                  return ext_a6;
        case Sensor::ExtA7:                  return ext_a7;
        case Sensor::ExtA15:                 return ext_a15;
    }
    return false;
}

void SensorSet::set(Sensor s, bool on) {
    switch (s) {
        case Sensor::LowNoiseAccelerometer:  low_noise_accel = on; break;
        case Sensor::WideRangeAccelerometer: wide_range_accel = on; break;
        case Sensor::Gyroscope:              gyroscope = on; break;
        case Sensor::Magnetometer:           magnetometer = on; break;
        case Sensor::PressureTemperature:    pressure_temperature = on; break;
        case Sensor::Battery:                battery = on; break;
        case Sensor::ExtA6:                  ext_a6 = on; break;
        case Sensor::ExtA7:                  ext_a7 = on; break;
        case Sensor::ExtA15:                 ext_a15 = on; break;
    }
}

SensorSet SensorSet::none() {
    SensorSet s;
    s.low_noise_accel = false;
    s.wide_range_accel = false;
    s.gyroscope = false;
    s.magnetometer = false;
    s.pressure_temperature = false;
    s.battery = false;
    s.ext_a6 = false;
    s.ext_a7 = false;
    s.ext_a15 = false;
    return s;
}

const std::vector<ChannelInfo>& channel_table() {
    // Canonical order: this is also the order of decoded values within a tick.
    static const std::vector<ChannelInfo> table = {
        {"Low-Noise AccelerometerX",  Sensor::LowNoiseAccelerometer,  kLowNoise,  "Low-Noise Accelerometer X",  "m/s²", {-5.0, 5.0}},
        {"Low-Noise AccelerometerY",  Sensor::LowNoiseAccelerometer,  kLowNoise,  "Low-Noise Accelerometer Y",  "m/s²", {-5.0, 5.0}},
        {"Low-Noise AccelerometerZ",  Sensor::LowNoiseAccelerometer,  kLowNoise,  "Low-Noise Accelerometer Z",  "m/s²", {-15.0, 15.0}},
        {"Wide-Range AccelerometerX", Sensor::WideRangeAccelerometer, kWideRange, "Wide-Range Accelerometer X", "m/s²", {-5.0, 5.0}},
        {"Wide-Range AccelerometerY", Sensor::WideRangeAccelerometer, kWideRange, "Wide-Range Accelerometer Y", "m/s²", {-5.0, 5.0}},
        {"Wide-Range AccelerometerZ", Sensor::WideRangeAccelerometer, kWideRange, "Wide-Range Accelerometer Z", "m/s²", {-15.0, 15.0}},
        {"GyroscopeX",                Sensor::Gyroscope,              kGyro,      "Gyroscope X",                "deg/s", {-250.0, 250.0}},
        {"GyroscopeY",                Sensor::Gyroscope,              kGyro,      "Gyroscope Y",                "deg/s", {-250.0, 250.0}},
        {"GyroscopeZ",                Sensor::Gyroscope,              kGyro,      "Gyroscope Z",                "deg/s", {-250.0, 250.0}},
        {"MagnetometerX",             Sensor::Magnetometer,           kMag,       "Magnetometer X",             "local_flux*", {-5.0, 5.0}},
        {"MagnetometerY",             Sensor::Magnetometer,           kMag,       "Magnetometer Y",             "local_flux*", {-5.0, 5.0}},
        {"MagnetometerZ",             Sensor::Magnetometer,           kMag,       "Magnetometer Z",             "local_flux*", {-5.0, 5.0}},
        {"Temperature_BMP180",        Sensor::PressureTemperature,    {},         "Temperature",                "°C", {15.0, 40.0}},
        {"Pressure_BMP180",           Sensor::PressureTemperature,    {},         "Pressure",                   "kPa", {90.0, 110.0}},
        {"BatteryVoltage",            Sensor::Battery,                {},         "Battery Voltage",            "V", {3.3, 4.2}},
        {"BatteryPercent",            Sensor::Battery,                {},         "Battery Percent",            "%", {0.0, 100.0}},
        {"ExtADC_A6",                 Sensor::ExtA6,                  {},         "External ADC A6",            "V", {0.0, 3.3}},
        {"ExtADC_A7",                 Sensor::ExtA7,                  {},         "External ADC A7",            "V", {0.0, 3.3}},
        {"ExtADC_A15",                Sensor::ExtA15,                 {},         "External ADC A15",           "V", {0.0, 3.3}},
    };
    return table;
}

const ChannelInfo* find_channel(std::string_view name) {
    for (const auto& c : channel_table()) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

std::vector<std::string> enabled_channels(const SensorSet& sensors) {
    std::vector<std::string> out;
    for (const auto& c : channel_table()) {
        if (sensors.enabled(c.sensor)) out.emplace_back(c.name);
    }
    return out;
}

std::vector<std::string> selectable_parameters(const SensorSet& sensors) {
    std::vector<std::string> out;

    for (const auto& g : group_table()) {
        if (!sensors.enabled(g.sensor)) continue;
        out.emplace_back(g.name);
        for (auto& m : group_members(g.name)) out.push_back(std::move(m));
    }

    for (const auto& c : channel_table()) {
        if (!c.group.empty()) continue;
        if (sensors.enabled(c.sensor)) out.emplace_back(c.name);
    }
    return out;
}

bool is_group(std::string_view name) {
    return find_group(name) != nullptr;
}

std::vector<std::string> group_members(std::string_view group) {
    std::vector<std::string> out;
    if (group.empty()) return out;
    for (const auto& c : channel_table()) {
        if (c.group == group) out.emplace_back(c.name);
    }
    return out;
}

AxisRange fallback_range(std::string_view name) {
    if (const auto* g = find_group(name)) return g->fallback;
    if (const auto* c = find_channel(name)) return c->fallback;
    return AxisRange{0.0, 1.0};
}

std::string_view sensor_name(Sensor s) {
    switch (s) {
        case Sensor::LowNoiseAccelerometer:  return "lna";
        case Sensor::WideRangeAccelerometer: return "wra";
        case Sensor::Gyroscope:              return "gyro";
        case Sensor::Magnetometer:           return "mag";
        case Sensor::PressureTemperature:    return "bmp";
        case Sensor::Battery:                return "battery";
        case Sensor::ExtA6:                  return "a6";
        case Sensor::ExtA7:                  return "a7";
        case Sensor::ExtA15:                 return "a15";
    }
    return {};
}

bool parse_sensor(std::string_view name, Sensor& out) {
    static const Sensor all[] = {
        Sensor::LowNoiseAccelerometer, Sensor::WideRangeAccelerometer, Sensor::Gyroscope,
        Sensor::Magnetometer, Sensor::PressureTemperature, Sensor::Battery,
        Sensor::ExtA6, Sensor::ExtA7, Sensor::ExtA15,
    };
    for (Sensor s : all) {
        if (sensor_name(s) == name) {
            out = s;
            return true;
        }
    }
    return false;
}

}
