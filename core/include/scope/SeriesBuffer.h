#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace scope {

struct Series {
    std::vector<float> values;
    std::vector<int32_t> timestamps_ms;
};

// Rolling (value, timestamp) history for one channel. Tail append, head eviction.
// The current min and max are tracked with monotonic queues, so extent() does
// not scan the history.
class SeriesBuffer {
public:
    void push(float v, int32_t t_ms);
    size_t trim(size_t capacity);
    void clear();

    size_t size() const { return pts_.size(); }
    bool empty() const { return pts_.empty(); }

    // False when empty; otherwise lo/hi receive the buffered min and max.
    bool extent(float& lo, float& hi) const;

    void copy_to(Series& out) const;
    void append_values(std::vector<float>& out) const;

private:
    struct Point {
        float v;
        int32_t t_ms;
    };

    struct Mark {
        uint64_t seq;
        float v;
    };

    std::deque<Point> pts_;
    std::deque<Mark> minq_;   // increasing values
    std::deque<Mark> maxq_;   // decreasing values
    uint64_t head_seq_ = 0;   // sequence number of pts_.front()
};

}
