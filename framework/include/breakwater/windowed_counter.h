#ifndef BREAKWATER_WINDOWED_COUNTER_H
#define BREAKWATER_WINDOWED_COUNTER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace breakwater {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Outcomes observed during one span of the window.
 */
struct Bucket {
    uint64_t success_count = 0;
    uint64_t failure_count = 0;

    uint64_t total() const { return success_count + failure_count; }
    void clear() { success_count = 0; failure_count = 0; }

    bool operator==(const Bucket&) const = default;
};

/**
 * @brief Fixed-size ring of time-span buckets yielding a rolling error rate.
 *
 * The bucket under the cursor is the span currently being filled and never
 * takes part in the error rate. The cursor position is derived from the
 * absolute number of spans elapsed since the epoch, so advancing twice with
 * the same timestamp is a no-op.
 *
 * Not thread-safe; callers sharing a counter must serialize access.
 */
class WindowedCounter {
public:
    /**
     * @throws std::invalid_argument if capacity is 0 or span is not positive.
     */
    WindowedCounter(size_t capacity, Clock::duration span, TimePoint epoch = Clock::now());

    /**
     * @brief Moves the cursor forward by the whole spans elapsed since the last
     * advance, clearing every bucket it passes through or lands on.
     * Runs in O(capacity) no matter how much time has passed.
     */
    void advance(TimePoint now);

    void record_success(TimePoint now);
    void record_failure(TimePoint now);

    /**
     * @brief Failure percentage over all completed buckets, rounded to two decimals.
     * @return 0.0 when fewer than min_eval_size (or zero) outcomes are available.
     */
    double error_rate(uint64_t min_eval_size) const;

    /**
     * @brief Clears every bucket, returns the cursor to 0 and re-anchors the epoch.
     */
    void reset(TimePoint now);

    /**
     * @throws std::out_of_range if index >= capacity().
     */
    const Bucket& bucket(size_t index) const;

    size_t capacity() const { return buckets_.size(); }
    size_t cursor() const { return cursor_; }
    Clock::duration span() const { return span_; }

    // Time spent inside the current span.
    Clock::duration elapsed_in_span(TimePoint now) const;

private:
    std::vector<Bucket> buckets_;
    size_t cursor_ = 0;
    Clock::duration span_;
    TimePoint epoch_;
    uint64_t spans_seen_ = 0;

    uint64_t span_index(TimePoint now) const;
};

} // namespace breakwater

#endif // BREAKWATER_WINDOWED_COUNTER_H
