#include <breakwater/windowed_counter.h>
#include <cmath>
#include <stdexcept>
#include <string>

namespace breakwater {

WindowedCounter::WindowedCounter(size_t capacity, Clock::duration span, TimePoint epoch)
    : span_(span), epoch_(epoch) {
    if (capacity == 0) {
        throw std::invalid_argument("WindowedCounter: capacity must be at least 1");
    }
    if (span <= Clock::duration::zero()) {
        throw std::invalid_argument("WindowedCounter: span must be positive");
    }
    buckets_.resize(capacity);
}

uint64_t WindowedCounter::span_index(TimePoint now) const {
    // A reading from before the epoch counts as the first span
    if (now <= epoch_) return 0;
    return static_cast<uint64_t>((now - epoch_) / span_);
}

void WindowedCounter::advance(TimePoint now) {
    const uint64_t target = span_index(now);
    if (target <= spans_seen_) return;

    const uint64_t steps = target - spans_seen_;
    const size_t size = buckets_.size();

    if (steps >= size) {
        for (auto& b : buckets_) b.clear();
    } else {
        for (uint64_t i = 1; i <= steps; ++i) {
            buckets_[(cursor_ + i) % size].clear();
        }
    }

    cursor_ = static_cast<size_t>(target % size);
    spans_seen_ = target;
}

void WindowedCounter::record_success(TimePoint now) {
    advance(now);
    buckets_[cursor_].success_count++;
}

void WindowedCounter::record_failure(TimePoint now) {
    advance(now);
    buckets_[cursor_].failure_count++;
}

double WindowedCounter::error_rate(uint64_t min_eval_size) const {
    uint64_t failures = 0;
    uint64_t total = 0;

    for (size_t i = 0; i < buckets_.size(); ++i) {
        if (i == cursor_) continue;
        failures += buckets_[i].failure_count;
        total += buckets_[i].total();
    }

    if (total == 0 || total < min_eval_size) return 0.0;

    const double ratio = static_cast<double>(failures) / static_cast<double>(total);
    return std::round(ratio * 10000.0) / 100.0;
}

void WindowedCounter::reset(TimePoint now) {
    for (auto& b : buckets_) b.clear();
    cursor_ = 0;
    spans_seen_ = 0;
    epoch_ = now;
}

const Bucket& WindowedCounter::bucket(size_t index) const {
    if (index >= buckets_.size()) {
        throw std::out_of_range("WindowedCounter: bucket index " + std::to_string(index) +
                                " out of range (capacity " + std::to_string(buckets_.size()) + ")");
    }
    return buckets_[index];
}

Clock::duration WindowedCounter::elapsed_in_span(TimePoint now) const {
    if (now <= epoch_) return Clock::duration::zero();
    return (now - epoch_) % span_;
}

} // namespace breakwater
