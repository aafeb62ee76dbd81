#ifndef BREAKWATER_SNAPSHOT_H
#define BREAKWATER_SNAPSHOT_H

#include <breakwater/breaker.h>
#include <boost/json.hpp>
#include <string>
#include <vector>

namespace breakwater {

/**
 * @brief Point-in-time copy of a breaker for diagnostics and display.
 */
struct Snapshot {
    StateKind state = StateKind::Closed;
    double error_rate = 0.0;
    uint64_t trial_success = 0;
    size_t cursor = 0;
    std::vector<Bucket> buckets;
    BreakerConfig config;
};

/**
 * @brief Copies the breaker's observable state. Pending time-based transitions
 * are not applied; call Breaker::current_state() first for a fresh view.
 */
Snapshot take_snapshot(const Breaker& breaker);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Bucket& bucket);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const BreakerConfig& config);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Snapshot& snapshot);

std::string to_json(const Snapshot& snapshot);

} // namespace breakwater

#endif // BREAKWATER_SNAPSHOT_H
