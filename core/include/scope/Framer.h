#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scope {

// Splits a notification byte stream into text lines. A line that grows past
// max_line bytes without a terminator is discarded up to the next terminator.
class LineFramer {
public:
    explicit LineFramer(size_t max_line = 4096) : max_line_(max_line) {}

    std::vector<std::string> push(std::string_view chunk);
    void clear();

    size_t overflowed() const { return overflowed_; }

private:
    std::string buf_;
    size_t max_line_;
    bool skipping_ = false;
    size_t overflowed_ = 0;
};

}
