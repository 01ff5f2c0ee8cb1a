#include "scope/Window.h"

#include <cmath>
#include <limits>

namespace scope {

size_t window_capacity(double window_s, double rate_hz) {
    double n = window_s * rate_hz;
    if (!std::isfinite(n) || n <= 0.0) return 0;

    // 20 s * 51.2 Hz must give 1024, not 1025.
    double c = std::ceil(n - 1e-9);
    if (c < 1.0) c = 1.0;
    if (c >= (double)std::numeric_limits<size_t>::max()) return std::numeric_limits<size_t>::max();
    return (size_t)c;
}

}
