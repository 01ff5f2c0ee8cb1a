#include "scope/Parser.h"

#include <cstdlib>
#include <string>

namespace scope {

static inline void skip_ws(const char*& p, const char* e) {
    while (p < e && (*p == ' ' || *p == '\t')) ++p;
}

static inline bool is_sep(char c) {
    return c == ',' || c == ';' || c == '|';
}

static inline bool is_number_start(char c) {
    return (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

static inline bool starts_nan(const char* p, const char* e) {
    if (e - p < 3) return false;
    auto lc = [](char c) { return (char)(c | 0x20); };
    return lc(p[0]) == 'n' && lc(p[1]) == 'a' && lc(p[2]) == 'n';
}

std::optional<Frame> CsvFrameParser::parse_line(std::string_view line) const {
    // strtof needs a terminated buffer.
    std::string buf(line);
    const char* p = buf.c_str();
    const char* e = p + buf.size();

    Frame f;
    f.x.reserve(32);

    bool expect_field = false;   // true right after an explicit separator
    bool any = false;

    for (;;) {
        skip_ws(p, e);
        if (p >= e) break;

        if (is_sep(*p)) {
            // ",," or a leading separator: a field with no reading.
            if (expect_field || !any) f.x.emplace_back(std::nullopt);
            any = true;
            expect_field = true;
            ++p;
            continue;
        }

        if (starts_nan(p, e)) {
            f.x.emplace_back(std::nullopt);
            p += 3;
        } else {
            if (!is_number_start(*p)) return std::nullopt;
            char* endp = nullptr;
            float v = std::strtof(p, &endp);
            if (endp == p) return std::nullopt;
            f.x.emplace_back(v);
            p = endp;
        }
        any = true;
        expect_field = false;

        skip_ws(p, e);
        if (p >= e) break;
        if (is_sep(*p) || is_number_start(*p) || starts_nan(p, e)) continue;

        return std::nullopt;
    }

    if (expect_field) f.x.emplace_back(std::nullopt);
    if (f.x.empty()) return std::nullopt;
    return f;
}

}
