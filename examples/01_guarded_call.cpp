/**
 * Example 01: Guarded Call
 *
 * This example wraps a flaky dependency with a breaker.
 * Concepts:
 * - allow_request() before calling the dependency
 * - report_outcome() after the call
 * - Skipping the call while the breaker is open
 */

#include <breakwater/breaker.h>
#include <breakwater/logger.h>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>

using namespace breakwater;
using namespace std::chrono_literals;

// Stand-in for a remote service that fails most of the time
int fetch_quote(std::mt19937& rng) {
    std::bernoulli_distribution down(0.7);
    if (down(rng)) {
        throw std::runtime_error("upstream timed out");
    }
    return 42;
}

int main() {
    Logger::instance().set_level(LogLevel::INFO);

    BreakerConfig config;
    config.capacity = 4;
    config.span = 500ms;
    config.min_eval_size = 5;
    config.error_threshold = 50.0;
    config.retry_timeout = 1s;
    config.trial_success_required = 2;

    Breaker breaker(config);
    std::mt19937 rng{7};

    for (int i = 0; i < 60; ++i) {
        if (!breaker.allow_request()) {
            std::cout << "#" << i << " short-circuited" << std::endl;
        } else {
            try {
                int quote = fetch_quote(rng);
                breaker.report_outcome(true);
                std::cout << "#" << i << " got " << quote << std::endl;
            } catch (const std::runtime_error& e) {
                breaker.report_outcome(false);
                std::cout << "#" << i << " failed: " << e.what() << std::endl;
            }
        }
        std::this_thread::sleep_for(100ms);
    }

    Logger::instance().flush();
    return 0;
}
