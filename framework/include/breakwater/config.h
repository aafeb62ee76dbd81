#ifndef BREAKWATER_CONFIG_H
#define BREAKWATER_CONFIG_H

#include <breakwater/breaker.h>
#include <string>
#include <string_view>
#include <vector>

namespace breakwater {

/**
 * @brief Reads BREAKWATER_* environment variables on top of `base`:
 * BREAKWATER_BUFFER_SIZE, BREAKWATER_SPAN_MS, BREAKWATER_MIN_EVAL_SIZE,
 * BREAKWATER_ERROR_THRESHOLD, BREAKWATER_RETRY_TIMEOUT_MS,
 * BREAKWATER_TRIAL_SUCCESS_REQUIRED. Unset variables keep the base value.
 * @throws ConfigError if a variable is set but unparsable.
 */
BreakerConfig config_from_env(BreakerConfig base = {});

/**
 * @brief Reads a JSON object with any of the keys buffer_size,
 * buffer_span_duration_ms, min_eval_size, error_threshold, retry_timeout_ms,
 * trial_success_required on top of `base`.
 * @throws ConfigError on malformed JSON or a value of the wrong type.
 */
BreakerConfig config_from_json(std::string_view text, BreakerConfig base = {});

/**
 * @brief Applies command line flags on top of `base`. Durations are in seconds.
 * Unknown flags are skipped.
 * @throws ConfigError when a flag is missing its value, the value is not a
 * non-negative number, or a duration does not fit in milliseconds.
 */
BreakerConfig parse_args(const std::vector<std::string>& args, BreakerConfig base = {});

/**
 * @brief Rejects configurations a Breaker cannot be built from (zero buckets,
 * zero span) and negative retry timeouts.
 * @throws ConfigError
 */
void validate(const BreakerConfig& config);

/**
 * @brief Options of the breakwater command line tool.
 */
struct CliOptions {
    BreakerConfig breaker;
    bool autoplay = true;
    double failure_ratio = 0.25;
    bool json = false;
    bool help = false;
    bool version = false;
};

CliOptions parse_cli_options(const std::vector<std::string>& args, BreakerConfig base = {});

std::string usage();

} // namespace breakwater

#endif // BREAKWATER_CONFIG_H
