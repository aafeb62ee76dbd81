/**
 * Example 02: Shared Breaker
 *
 * A Breaker is not thread-safe. This example shares one between worker
 * threads by guarding it with a mutex.
 * Concepts:
 * - One breaker per dependency, many callers
 * - Holding the lock only around breaker calls, never around the request
 */

#include <breakwater/breaker.h>
#include <breakwater/logger.h>
#include <atomic>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

using namespace breakwater;
using namespace std::chrono_literals;

class GuardedBreaker {
public:
    explicit GuardedBreaker(BreakerConfig config) : breaker_(config) {}

    bool allow_request() {
        std::lock_guard<std::mutex> lock(mutex_);
        return breaker_.allow_request();
    }

    void report_outcome(bool success) {
        std::lock_guard<std::mutex> lock(mutex_);
        breaker_.report_outcome(success);
    }

    double error_rate() {
        std::lock_guard<std::mutex> lock(mutex_);
        return breaker_.error_rate();
    }

private:
    std::mutex mutex_;
    Breaker breaker_;
};

int main() {
    Logger::instance().set_level(LogLevel::INFO);

    BreakerConfig config;
    config.capacity = 5;
    config.span = 200ms;
    config.min_eval_size = 20;
    config.error_threshold = 30.0;
    config.retry_timeout = 500ms;
    config.trial_success_required = 5;

    GuardedBreaker breaker(config);
    std::atomic<int> served{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> workers;
    for (unsigned id = 0; id < 4; ++id) {
        workers.emplace_back([&, id] {
            std::mt19937 rng{id};
            std::bernoulli_distribution fails(0.4);
            for (int i = 0; i < 200; ++i) {
                if (!breaker.allow_request()) {
                    ++rejected;
                } else {
                    std::this_thread::sleep_for(5ms); // the protected call
                    breaker.report_outcome(!fails(rng));
                    ++served;
                }
                std::this_thread::sleep_for(5ms);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    std::cout << "served " << served << ", rejected " << rejected
              << ", final error rate " << breaker.error_rate() << "%" << std::endl;

    Logger::instance().flush();
    return 0;
}
