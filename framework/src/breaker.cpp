#include <breakwater/breaker.h>
#include <breakwater/logger.h>
#include <iomanip>
#include <sstream>

namespace breakwater {

StateKind kind_of(const State& state) {
    if (std::holds_alternative<Open>(state)) return StateKind::Open;
    if (std::holds_alternative<HalfOpen>(state)) return StateKind::HalfOpen;
    return StateKind::Closed;
}

std::string_view to_string(StateKind kind) {
    switch (kind) {
        case StateKind::Closed:   return "Closed";
        case StateKind::Open:     return "Open";
        case StateKind::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

Breaker::Breaker(BreakerConfig config, TimePoint now)
    : config_(config),
      counter_(config.capacity, config.span, now) {}

void Breaker::report_outcome(bool success) {
    report_outcome(success, Clock::now());
}

void Breaker::report_outcome(bool success, TimePoint now) {
    evaluate(now);

    switch (kind_of(state_)) {
        case StateKind::Open:
            // Nothing is recorded while open
            break;

        case StateKind::HalfOpen:
            if (success) {
                ++trial_success_;
                evaluate(now);
            } else {
                transition(Open{now});
            }
            break;

        case StateKind::Closed:
            if (success) {
                counter_.record_success(now);
            } else {
                counter_.record_failure(now);
                evaluate(now);
            }
            break;
    }
}

State Breaker::current_state() {
    return current_state(Clock::now());
}

State Breaker::current_state(TimePoint now) {
    evaluate(now);
    return state_;
}

bool Breaker::allow_request() {
    return allow_request(Clock::now());
}

bool Breaker::allow_request(TimePoint now) {
    return kind_of(current_state(now)) != StateKind::Open;
}

void Breaker::evaluate(TimePoint now) {
    switch (kind_of(state_)) {
        case StateKind::Closed:
            counter_.advance(now);
            if (error_rate() > config_.error_threshold) {
                transition(Open{now});
            }
            break;

        case StateKind::Open: {
            const auto& open = std::get<Open>(state_);
            if (now - open.since >= config_.retry_timeout) {
                transition(HalfOpen{});
            }
            break;
        }

        case StateKind::HalfOpen:
            if (trial_success_ >= config_.trial_success_required) {
                counter_.reset(now);
                transition(Closed{});
            }
            break;
    }
}

void Breaker::transition(State next) {
    const StateKind from = kind_of(state_);
    const StateKind to = kind_of(next);

    std::ostringstream ss;
    ss << "breaker: " << to_string(from) << " -> " << to_string(to)
       << std::fixed << std::setprecision(2)
       << " (error rate " << error_rate() << "%, threshold " << config_.error_threshold
       << "%, trial " << trial_success_ << "/" << config_.trial_success_required << ")";

    if (to == StateKind::Open) {
        Logger::instance().warn(ss.str());
    } else {
        Logger::instance().info(ss.str());
    }

    trial_success_ = 0;
    state_ = next;
}

} // namespace breakwater
