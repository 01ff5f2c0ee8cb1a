#pragma once
#include <vector>

#include "scope/Channels.h"

namespace scope {

constexpr double kFlatSignalSpan = 0.001;
constexpr double kRangeHysteresis = 0.01;

// Bounds for a set of buffered values: 10% margin around [min, max], or a
// margin of |center| * 0.1 + 0.1 for a flat signal. Both bounds rounded to
// 3 decimals. An empty set yields the fallback unchanged.
AxisRange compute_auto_range(const std::vector<float>& values, const AxisRange& fallback);

// Same rule applied to an already known extent [lo, hi].
AxisRange auto_range_for_extent(double lo, double hi);

double round_decimals(double v, int decimals);

// True when either bound moved by more than kRangeHysteresis.
bool range_changed(const AxisRange& current, const AxisRange& candidate);

}
