#pragma once
#include <optional>
#include <string_view>

#include "scope/Frame.h"

namespace scope {

// One text line per device tick. Fields are separated by ',', ';' or '|', or by
// whitespace alone. An empty field between two explicit separators is kept as a
// missing reading; "nan" marks one explicitly.
class CsvFrameParser {
public:
    std::optional<Frame> parse_line(std::string_view line) const;
};

}
