#pragma once
#include <cstddef>

namespace scope {

// Number of samples retained per channel: ceil(window_s * rate_hz).
// Returns 0 for a non-positive or non-finite product.
size_t window_capacity(double window_s, double rate_hz);

}
