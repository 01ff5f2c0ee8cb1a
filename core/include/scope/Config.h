#ifndef SCOPE_CONFIG_H
#define SCOPE_CONFIG_H

#include <string>

#include "scope/Channels.h"

namespace scope {

struct FieldLimits {
    double y_min = -100000.0;
    double y_max = 100000.0;

    int window_min_s = 1;
    int window_max_s = 600;

    int label_min = 1;
    int label_max = 1000;

    double rate_min_hz = 1.0;
    double rate_max_hz = 1000.0;
};

struct FieldDefaults {
    int window_s = 20;
    int label_interval = 5;
    double rate_hz = 51.2;
};

struct SessionConfig {
    SensorSet sensors;

    double sampling_rate_hz = 51.2;
    int time_window_s = 20;
    int label_interval = 5;

    bool auto_y = false;
    double y_min = 0.0;
    double y_max = 1.0;
    bool y_from_parameter = true;   // start from the selected parameter's fallback bounds

    std::string parameter = "Low-Noise AccelerometerX";

    FieldLimits limits;
    FieldDefaults defaults;
};

}

#endif
