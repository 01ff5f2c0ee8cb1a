#include "scope/SeriesBuffer.h"

namespace scope {

void SeriesBuffer::push(float v, int32_t t_ms) {
    uint64_t seq = head_seq_ + pts_.size();
    pts_.push_back(Point{v, t_ms});

    while (!minq_.empty() && minq_.back().v >= v) minq_.pop_back();
    minq_.push_back(Mark{seq, v});

    while (!maxq_.empty() && maxq_.back().v <= v) maxq_.pop_back();
    maxq_.push_back(Mark{seq, v});
}

size_t SeriesBuffer::trim(size_t capacity) {
    size_t removed = 0;
    while (pts_.size() > capacity) {
        if (!minq_.empty() && minq_.front().seq == head_seq_) minq_.pop_front();
        if (!maxq_.empty() && maxq_.front().seq == head_seq_) maxq_.pop_front();
        pts_.pop_front();
        ++head_seq_;
        ++removed;
    }
    return removed;
}

void SeriesBuffer::clear() {
    pts_.clear();
    minq_.clear();
    maxq_.clear();
    head_seq_ = 0;
}

bool SeriesBuffer::extent(float& lo, float& hi) const {
    if (pts_.empty()) return false;
    lo = minq_.front().v;
    hi = maxq_.front().v;
    return true;
}

void SeriesBuffer::copy_to(Series& out) const {
    out.values.clear();
    out.timestamps_ms.clear();
    out.values.reserve(pts_.size());
    out.timestamps_ms.reserve(pts_.size());
    for (const auto& p : pts_) {
        out.values.push_back(p.v);
        out.timestamps_ms.push_back(p.t_ms);
    }
}

void SeriesBuffer::append_values(std::vector<float>& out) const {
    out.reserve(out.size() + pts_.size());
    for (const auto& p : pts_) out.push_back(p.v);
}

}
