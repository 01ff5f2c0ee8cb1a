#include "scope/NumericInput.h"

#include <cmath>
#include <limits>
#include <locale>
#include <sstream>

namespace scope {

static inline bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static inline std::string_view trim(std::string_view s) {
    while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
    return s;
}

static inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// The classic locale keeps '.' as the separator even after the host
// application has called setlocale().
static bool to_double(const std::string& s, double& out) {
    std::istringstream iss(s);
    iss.imbue(std::locale::classic());
    double v = 0.0;
    iss >> v;
    if (iss.fail()) return false;
    if (!iss.eof()) {
        iss >> std::ws;
        if (!iss.eof()) return false;
    }
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

ParsedInput parse_decimal(std::string_view text) {
    ParsedInput r;
    std::string_view t = trim(text);

    if (t.empty()) { r.kind = InputKind::Empty; return r; }
    if (t == "+" || t == "-") { r.kind = InputKind::PartialSign; return r; }

    std::string norm;
    norm.reserve(t.size());

    size_t digits = 0;
    size_t seps = 0;

    for (size_t i = 0; i < t.size(); ++i) {
        char c = t[i];
        if (c == '+' || c == '-') {
            if (i != 0) return r;
            norm.push_back(c);
        } else if (c == '.' || c == ',') {
            if (++seps > 1) return r;
            norm.push_back('.');
        } else if (is_digit(c)) {
            ++digits;
            norm.push_back(c);
        } else {
            return r;
        }
    }
    if (digits == 0) return r;

    double v = 0.0;
    if (!to_double(norm, v)) return r;

    r.kind = InputKind::Number;
    r.value = v;
    return r;
}

ParsedInput parse_integer(std::string_view text) {
    ParsedInput r;
    std::string_view t = trim(text);

    if (t.empty()) { r.kind = InputKind::Empty; return r; }
    if (t == "+" || t == "-") { r.kind = InputKind::PartialSign; return r; }

    bool neg = false;
    size_t i = 0;
    if (t[0] == '+' || t[0] == '-') {
        neg = (t[0] == '-');
        i = 1;
    }
    if (i >= t.size()) return r;

    long long acc = 0;
    for (; i < t.size(); ++i) {
        char c = t[i];
        if (!is_digit(c)) return r;
        acc = acc * 10 + (c - '0');
        if (acc > (long long)std::numeric_limits<int>::max() + 1) return r;
    }
    if (neg) acc = -acc;
    if (acc > std::numeric_limits<int>::max() || acc < std::numeric_limits<int>::min()) return r;

    r.kind = InputKind::Number;
    r.value = (double)acc;
    return r;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.precision(15);
    oss << v;
    return oss.str();
}

}
