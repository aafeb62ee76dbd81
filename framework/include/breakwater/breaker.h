#ifndef BREAKWATER_BREAKER_H
#define BREAKWATER_BREAKER_H

#include <breakwater/windowed_counter.h>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <variant>

namespace breakwater {

/**
 * @brief Immutable tuning of a Breaker. Values are not validated by the
 * breaker itself; see validate() in breakwater/config.h.
 */
struct BreakerConfig {
    size_t capacity = 5;                                 // number of buckets
    std::chrono::milliseconds span{200000};              // duration of one bucket
    uint64_t min_eval_size = 100;                        // outcomes needed before the rate counts
    double error_threshold = 10.0;                       // percent, opens when strictly exceeded
    std::chrono::milliseconds retry_timeout{60000};      // Open -> HalfOpen delay
    uint64_t trial_success_required = 20;                // HalfOpen successes needed to close

    bool operator==(const BreakerConfig&) const = default;
};

struct Closed {
    bool operator==(const Closed&) const = default;
};

struct Open {
    TimePoint since;
    bool operator==(const Open&) const = default;
};

struct HalfOpen {
    bool operator==(const HalfOpen&) const = default;
};

using State = std::variant<Closed, Open, HalfOpen>;

enum class StateKind {
    Closed,
    Open,
    HalfOpen
};

StateKind kind_of(const State& state);
std::string_view to_string(StateKind kind);

/**
 * @brief Three-state circuit breaker driven by a rolling error rate.
 *
 * There is no background timer: every call reconciles time-based transitions
 * (Open -> HalfOpen, bucket expiry) lazily before doing anything else. Every
 * operation has an overload taking the caller's clock reading; the others read
 * Clock::now() once.
 *
 * Not thread-safe. A breaker shared between threads must be guarded by the caller.
 */
class Breaker {
public:
    explicit Breaker(BreakerConfig config = {}, TimePoint now = Clock::now());

    /**
     * @brief Reports the outcome of a protected call.
     * Ignored while Open. In HalfOpen the first failure reopens the breaker.
     */
    void report_outcome(bool success);
    void report_outcome(bool success, TimePoint now);

    /**
     * @brief Applies pending transitions and returns the resulting state.
     * Callers should skip the protected call when this is Open.
     */
    State current_state();
    State current_state(TimePoint now);

    bool allow_request();
    bool allow_request(TimePoint now);

    double error_rate() const { return counter_.error_rate(config_.min_eval_size); }

    /**
     * @throws std::out_of_range if index >= config().capacity.
     */
    const Bucket& inspect_bucket(size_t index) const { return counter_.bucket(index); }

    const BreakerConfig& config() const { return config_; }

    // State as of the last evaluation, without applying pending transitions.
    const State& state() const { return state_; }
    uint64_t trial_success() const { return trial_success_; }
    const WindowedCounter& counter() const { return counter_; }

private:
    BreakerConfig config_;
    WindowedCounter counter_;
    State state_{Closed{}};
    uint64_t trial_success_ = 0;

    void evaluate(TimePoint now);
    void transition(State next);
};

} // namespace breakwater

#endif // BREAKWATER_BREAKER_H
