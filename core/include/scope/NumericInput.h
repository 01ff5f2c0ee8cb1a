#pragma once
#include <string>
#include <string_view>

namespace scope {

enum class InputKind {
    Empty,        // blank or whitespace only
    PartialSign,  // a lone "+" or "-" while typing
    Number,
    Invalid,
};

struct ParsedInput {
    InputKind kind = InputKind::Invalid;
    double value = 0.0;
};

// Decimal text: optional leading sign, digits, one '.' or ',' separator.
ParsedInput parse_decimal(std::string_view text);

// Integer text: optional leading sign and digits only; must fit in an int.
ParsedInput parse_integer(std::string_view text);

// Shortest locale-independent rendering used to restore a field's text.
std::string format_number(double v);

}
