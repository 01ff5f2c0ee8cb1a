#pragma once
#include <optional>
#include <vector>

namespace scope {

// One device tick in raw field order. A field the device failed to deliver
// is left empty.
struct Frame {
    std::vector<std::optional<float>> x;
};

}
