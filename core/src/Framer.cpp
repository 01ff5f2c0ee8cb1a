#include "scope/Framer.h"

namespace scope {

std::vector<std::string> LineFramer::push(std::string_view chunk) {
    buf_.append(chunk.data(), chunk.size());

    std::vector<std::string> out;
    size_t start = 0;

    for (;;) {
        size_t nl = buf_.find_first_of("\r\n", start);
        if (nl == std::string::npos) break;

        if (skipping_) {
            // Tail of an oversized line: drop it, resync on this terminator.
            skipping_ = false;
        } else if (nl > start) {
            out.emplace_back(buf_.substr(start, nl - start));
        }

        size_t adv = 1;
        if (buf_[nl] == '\r' && (nl + 1) < buf_.size() && buf_[nl + 1] == '\n') adv = 2;
        start = nl + adv;
    }

    if (start > 0) buf_.erase(0, start);

    if (buf_.size() > max_line_) {
        buf_.clear();
        skipping_ = true;
        ++overflowed_;
    }
    return out;
}

void LineFramer::clear() {
    buf_.clear();
    skipping_ = false;
}

}
