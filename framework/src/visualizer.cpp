#include <breakwater/visualizer.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace breakwater {

namespace {
    constexpr const char* kReset = "\x1b[0m";

    const char* badge_color(StateKind state) {
        switch (state) {
            case StateKind::Closed:   return "\x1b[42m";
            case StateKind::Open:     return "\x1b[41m";
            case StateKind::HalfOpen: return "\x1b[43m";
        }
        return kReset;
    }

    const char* badge_text(StateKind state) {
        switch (state) {
            case StateKind::Closed:   return "CLOSED";
            case StateKind::Open:     return "OPEN";
            case StateKind::HalfOpen: return "HALF-OPEN";
        }
        return "?";
    }

    // 'x' for failures, '=' for successes, '.' when the bucket is empty
    std::string outcome_bar(const Bucket& bucket, size_t width) {
        if (bucket.total() == 0) return std::string(width, '.');

        const double share = static_cast<double>(bucket.failure_count) / static_cast<double>(bucket.total());
        const auto failures = static_cast<size_t>(std::lround(share * static_cast<double>(width)));
        return std::string(failures, 'x') + std::string(width - failures, '=');
    }
}

std::string render_state(StateKind state, bool color) {
    std::string badge = std::string("[ ") + badge_text(state) + " ]";
    if (!color) return badge;
    return badge_color(state) + badge + kReset;
}

std::string render(const Breaker& breaker, TimePoint now, const RenderOptions& options) {
    const BreakerConfig& config = breaker.config();
    const WindowedCounter& counter = breaker.counter();
    const StateKind state = kind_of(breaker.state());

    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    out << "State:      " << render_state(state, options.color) << "\n";
    out << "Error rate: " << breaker.error_rate() << "% (threshold "
        << config.error_threshold << "%, min eval " << config.min_eval_size << ")\n";

    if (state == StateKind::HalfOpen) {
        out << "Trial:      " << breaker.trial_success() << "/" << config.trial_success_required << "\n";
    } else if (state == StateKind::Open) {
        const auto& open = std::get<Open>(breaker.state());
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - open.since);
        out << "Retry in:   " << std::max<int64_t>(0, (config.retry_timeout - waited).count()) << "ms\n";
    }

    out << "Buckets:\n";
    for (size_t i = 0; i < counter.capacity(); ++i) {
        const Bucket& bucket = counter.bucket(i);
        const bool current = (i == counter.cursor());

        out << (current ? "  > #" : "    #") << std::setw(2) << i
            << "  S " << std::setw(6) << bucket.success_count
            << "  F " << std::setw(6) << bucket.failure_count
            << "  [" << outcome_bar(bucket, options.bar_width) << "]";

        if (current) {
            const double progress = static_cast<double>(counter.elapsed_in_span(now).count()) /
                                    static_cast<double>(counter.span().count());
            out << std::setprecision(0) << "  " << progress * 100.0 << "% of span" << std::setprecision(2);
        }
        out << "\n";
    }

    return out.str();
}

} // namespace breakwater
