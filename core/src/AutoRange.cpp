#include "scope/AutoRange.h"

#include <algorithm>
#include <cmath>

namespace scope {

double round_decimals(double v, int decimals) {
    double f = std::pow(10.0, (double)decimals);
    return std::round(v * f) / f;
}

AxisRange compute_auto_range(const std::vector<float>& values, const AxisRange& fallback) {
    if (values.empty()) return fallback;

    auto mm = std::minmax_element(values.begin(), values.end());
    return auto_range_for_extent((double)*mm.first, (double)*mm.second);
}

AxisRange auto_range_for_extent(double lo, double hi) {
    double span = hi - lo;

    AxisRange r;
    if (std::abs(span) < kFlatSignalSpan) {
        double center = (lo + hi) / 2.0;
        double margin = std::abs(center) * 0.1 + 0.1;
        r.min = center - margin;
        r.max = center + margin;
    } else {
        double margin = span * 0.1;
        r.min = lo - margin;
        r.max = hi + margin;
    }

    r.min = round_decimals(r.min, 3);
    r.max = round_decimals(r.max, 3);
    return r;
}

bool range_changed(const AxisRange& current, const AxisRange& candidate) {
    return std::abs(current.min - candidate.min) > kRangeHysteresis ||
           std::abs(current.max - candidate.max) > kRangeHysteresis;
}

}
