#include <breakwater/snapshot.h>
#include <boost/json/src.hpp>

namespace breakwater {

Snapshot take_snapshot(const Breaker& breaker) {
    Snapshot snap;
    snap.state = kind_of(breaker.state());
    snap.error_rate = breaker.error_rate();
    snap.trial_success = breaker.trial_success();
    snap.cursor = breaker.counter().cursor();
    snap.config = breaker.config();

    const size_t capacity = breaker.counter().capacity();
    snap.buckets.reserve(capacity);
    for (size_t i = 0; i < capacity; ++i) {
        snap.buckets.push_back(breaker.inspect_bucket(i));
    }
    return snap;
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Bucket& bucket) {
    jv = {
        {"success_count", bucket.success_count},
        {"failure_count", bucket.failure_count}
    };
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const BreakerConfig& config) {
    jv = {
        {"buffer_size", config.capacity},
        {"buffer_span_duration_ms", config.span.count()},
        {"min_eval_size", config.min_eval_size},
        {"error_threshold", config.error_threshold},
        {"retry_timeout_ms", config.retry_timeout.count()},
        {"trial_success_required", config.trial_success_required}
    };
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Snapshot& snapshot) {
    boost::json::array buckets;
    buckets.reserve(snapshot.buckets.size());
    for (const auto& b : snapshot.buckets) {
        buckets.push_back(boost::json::value_from(b));
    }

    boost::json::object obj;
    obj["state"] = to_string(snapshot.state);
    obj["error_rate"] = snapshot.error_rate;
    obj["trial_success"] = snapshot.trial_success;
    obj["cursor"] = snapshot.cursor;
    obj["buckets"] = std::move(buckets);
    obj["config"] = boost::json::value_from(snapshot.config);
    jv = std::move(obj);
}

std::string to_json(const Snapshot& snapshot) {
    return boost::json::serialize(boost::json::value_from(snapshot));
}

} // namespace breakwater
