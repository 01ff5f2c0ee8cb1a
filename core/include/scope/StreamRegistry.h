#ifndef SCOPE_STREAMREGISTRY_H
#define SCOPE_STREAMREGISTRY_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "scope/SeriesBuffer.h"

namespace scope {

// Owns one bounded SeriesBuffer per enabled channel. All operations take the
// same mutex, so a producer thread may append while a render thread snapshots.
class StreamRegistry {
public:
    StreamRegistry(const std::vector<std::string>& channels, double window_s, double rate_hz);

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    // Ignored when the channel was not created for this session.
    void append(std::string_view channel, float v, int32_t t_ms);

    // One device tick: values[i] belongs to channels()[i]. Every channel gets the
    // same timestamp, derived from the tick counter and the applied rate.
    // Returns the timestamp, or -1 when the value count does not match.
    int32_t append_tick(const std::vector<float>& values);

    Series snapshot(std::string_view channel) const;
    std::vector<float> collect(const std::vector<std::string>& channels) const;
    // Min and max over the named channels without copying them. False when
    // none of them holds a sample.
    bool extent(const std::vector<std::string>& channels, float& lo, float& hi) const;

    void clear_all();

    // Window change: evict down to the new capacity, history and counter kept.
    void set_time_window(double window_s);
    // Rate change: every buffer and the tick counter start over.
    void reset_for_rate(double rate_hz);

    const std::vector<std::string>& channels() const { return order_; }
    bool has_channel(std::string_view channel) const;

    size_t size(std::string_view channel) const;
    size_t capacity() const;
    uint64_t sample_counter() const;
    double time_window() const;
    double sampling_rate() const;

private:
    void trim_all_locked();

    mutable std::mutex mu_;
    std::vector<std::string> order_;
    std::map<std::string, SeriesBuffer, std::less<>> buffers_;

    double window_s_ = 20.0;
    double rate_hz_ = 51.2;
    size_t capacity_ = 0;
    uint64_t counter_ = 0;
};

}

#endif
