#include "scope/StreamRegistry.h"
#include "scope/Window.h"

#include <cmath>
#include <limits>

namespace scope {

static inline int32_t tick_timestamp_ms(uint64_t counter, double rate_hz) {
    if (rate_hz <= 0.0) return 0;
    double ms = std::round((double)counter / rate_hz * 1000.0);
    if (ms > (double)std::numeric_limits<int32_t>::max()) return std::numeric_limits<int32_t>::max();
    return (int32_t)ms;
}

StreamRegistry::StreamRegistry(const std::vector<std::string>& channels, double window_s, double rate_hz)
    : window_s_(window_s), rate_hz_(rate_hz) {
    for (const auto& name : channels) {
        if (buffers_.count(name)) continue;
        order_.push_back(name);
        buffers_.emplace(name, SeriesBuffer{});
    }
    capacity_ = window_capacity(window_s_, rate_hz_);
}

void StreamRegistry::append(std::string_view channel, float v, int32_t t_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = buffers_.find(channel);
    if (it == buffers_.end()) return;
    it->second.push(v, t_ms);
    it->second.trim(capacity_);
}

int32_t StreamRegistry::append_tick(const std::vector<float>& values) {
    std::lock_guard<std::mutex> lk(mu_);
    if (values.size() != order_.size()) return -1;

    ++counter_;
    int32_t t_ms = tick_timestamp_ms(counter_, rate_hz_);

    for (size_t i = 0; i < order_.size(); ++i) {
        auto& buf = buffers_.find(order_[i])->second;
        buf.push(values[i], t_ms);
        buf.trim(capacity_);
    }
    return t_ms;
}

Series StreamRegistry::snapshot(std::string_view channel) const {
    Series out;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = buffers_.find(channel);
    if (it != buffers_.end()) it->second.copy_to(out);
    return out;
}

std::vector<float> StreamRegistry::collect(const std::vector<std::string>& channels) const {
    std::vector<float> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& name : channels) {
        auto it = buffers_.find(name);
        if (it != buffers_.end()) it->second.append_values(out);
    }
    return out;
}

bool StreamRegistry::extent(const std::vector<std::string>& channels, float& lo, float& hi) const {
    bool any = false;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& name : channels) {
        auto it = buffers_.find(name);
        if (it == buffers_.end()) continue;

        float l = 0.0f, h = 0.0f;
        if (!it->second.extent(l, h)) continue;
        if (!any || l < lo) lo = l;
        if (!any || h > hi) hi = h;
        any = true;
    }
    return any;
}

void StreamRegistry::clear_all() {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& kv : buffers_) kv.second.clear();
}

void StreamRegistry::set_time_window(double window_s) {
    std::lock_guard<std::mutex> lk(mu_);
    window_s_ = window_s;
    capacity_ = window_capacity(window_s_, rate_hz_);
    trim_all_locked();
}

void StreamRegistry::reset_for_rate(double rate_hz) {
    std::lock_guard<std::mutex> lk(mu_);
    rate_hz_ = rate_hz;
    capacity_ = window_capacity(window_s_, rate_hz_);
    for (auto& kv : buffers_) kv.second.clear();
    counter_ = 0;
}

void StreamRegistry::trim_all_locked() {
    for (auto& kv : buffers_) kv.second.trim(capacity_);
}

bool StreamRegistry::has_channel(std::string_view channel) const {
    std::lock_guard<std::mutex> lk(mu_);
    return buffers_.find(channel) != buffers_.end();
}

size_t StreamRegistry::size(std::string_view channel) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = buffers_.find(channel);
    return it == buffers_.end() ? 0 : it->second.size();
}

size_t StreamRegistry::capacity() const {
    std::lock_guard<std::mutex> lk(mu_);
    return capacity_;
}

uint64_t StreamRegistry::sample_counter() const {
    std::lock_guard<std::mutex> lk(mu_);
    return counter_;
}

double StreamRegistry::time_window() const {
    std::lock_guard<std::mutex> lk(mu_);
    return window_s_;
}

double StreamRegistry::sampling_rate() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rate_hz_;
}

}
