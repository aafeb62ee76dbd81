#include <breakwater/config.h>
#include <breakwater/environment.h>
#include <breakwater/exceptions.h>
#include <breakwater/util/string.h>
#include <boost/json.hpp>
#include <chrono>
#include <optional>

namespace breakwater {

namespace {

    struct Flag {
        std::string_view short_name;
        std::string_view long_name;
        std::string_view name;
    };

    constexpr Flag kBufferSize{"-b", "--buffer_size", "buffer_size"};
    constexpr Flag kSpan{"-s", "--buffer_span_duration", "buffer_span_duration"};
    constexpr Flag kMinEvalSize{"-m", "--min_eval_size", "min_eval_size"};
    constexpr Flag kErrorThreshold{"-e", "--error_threshold", "error_threshold"};
    constexpr Flag kRetryTimeout{"-r", "--retry_timeout", "retry_timeout"};
    constexpr Flag kTrialSuccess{"-t", "--trial_success_required", "trial_success_required"};
    constexpr Flag kFailureRatio{"-f", "--failure_ratio", "failure_ratio"};

    bool matches(const Flag& flag, std::string_view arg) {
        return arg == flag.short_name || arg == flag.long_name;
    }

    template<typename T>
    T flag_value(const Flag& flag, const std::vector<std::string>& args, size_t& i) {
        if (i + 1 >= args.size()) {
            throw ConfigError("The " + std::string(flag.name) + " flag requires an additional argument");
        }
        const std::string& raw = args[++i];
        try {
            return convert_string<T>(raw);
        } catch (const ConfigError&) {
            throw ConfigError("The " + std::string(flag.name) + " argument must be a number");
        }
    }

    // Flag durations are given in seconds and must fit in milliseconds
    std::chrono::milliseconds seconds_flag(const Flag& flag, const std::vector<std::string>& args, size_t& i) {
        constexpr uint64_t kMaxSeconds =
            static_cast<uint64_t>(std::chrono::milliseconds::max().count()) / 1000;

        const uint64_t seconds = flag_value<uint64_t>(flag, args, i);
        if (seconds > kMaxSeconds) {
            throw ConfigError("The " + std::string(flag.name) + " argument is too large");
        }
        return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
    }

    uint64_t json_unsigned(const boost::json::object& obj, std::string_view key, uint64_t fallback) {
        const boost::json::value* v = obj.if_contains(key);
        if (v == nullptr) return fallback;
        if (v->is_uint64()) return v->get_uint64();
        if (v->is_int64() && v->get_int64() >= 0) return static_cast<uint64_t>(v->get_int64());
        throw ConfigError("JSON key '" + std::string(key) + "' must be a non-negative integer");
    }

    std::chrono::milliseconds json_millis(const boost::json::object& obj, std::string_view key,
                                          std::chrono::milliseconds fallback) {
        if (!obj.contains(key)) return fallback;

        const uint64_t ms = json_unsigned(obj, key, 0);
        if (ms > static_cast<uint64_t>(std::chrono::milliseconds::max().count())) {
            throw ConfigError("JSON key '" + std::string(key) + "' is too large");
        }
        return std::chrono::milliseconds(static_cast<int64_t>(ms));
    }

    double json_number(const boost::json::object& obj, std::string_view key, double fallback) {
        const boost::json::value* v = obj.if_contains(key);
        if (v == nullptr) return fallback;
        if (!v->is_number()) {
            throw ConfigError("JSON key '" + std::string(key) + "' must be a number");
        }
        return v->to_number<double>();
    }

} // namespace

BreakerConfig config_from_env(BreakerConfig base) {
    BreakerConfig config = base;

    config.capacity = env<size_t>("BREAKWATER_BUFFER_SIZE", config.capacity);
    config.span = std::chrono::milliseconds(
        env<int64_t>("BREAKWATER_SPAN_MS", config.span.count()));
    config.min_eval_size = env<uint64_t>("BREAKWATER_MIN_EVAL_SIZE", config.min_eval_size);
    config.error_threshold = env<double>("BREAKWATER_ERROR_THRESHOLD", config.error_threshold);
    config.retry_timeout = std::chrono::milliseconds(
        env<int64_t>("BREAKWATER_RETRY_TIMEOUT_MS", config.retry_timeout.count()));
    config.trial_success_required =
        env<uint64_t>("BREAKWATER_TRIAL_SUCCESS_REQUIRED", config.trial_success_required);

    return config;
}

BreakerConfig config_from_json(std::string_view text, BreakerConfig base) {
    boost::json::error_code ec;
    boost::json::value jv = boost::json::parse(text, ec);
    if (ec) {
        throw ConfigError("Invalid JSON configuration: " + ec.message());
    }
    if (!jv.is_object()) {
        throw ConfigError("JSON configuration must be an object");
    }

    const boost::json::object& obj = jv.as_object();
    BreakerConfig config = base;

    config.capacity = static_cast<size_t>(json_unsigned(obj, "buffer_size", config.capacity));
    config.span = json_millis(obj, "buffer_span_duration_ms", config.span);
    config.min_eval_size = json_unsigned(obj, "min_eval_size", config.min_eval_size);
    config.error_threshold = json_number(obj, "error_threshold", config.error_threshold);
    config.retry_timeout = json_millis(obj, "retry_timeout_ms", config.retry_timeout);
    config.trial_success_required =
        json_unsigned(obj, "trial_success_required", config.trial_success_required);

    return config;
}

BreakerConfig parse_args(const std::vector<std::string>& args, BreakerConfig base) {
    BreakerConfig config = base;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (matches(kBufferSize, arg)) {
            config.capacity = flag_value<size_t>(kBufferSize, args, i);
        } else if (matches(kSpan, arg)) {
            config.span = seconds_flag(kSpan, args, i);
        } else if (matches(kMinEvalSize, arg)) {
            config.min_eval_size = flag_value<uint64_t>(kMinEvalSize, args, i);
        } else if (matches(kErrorThreshold, arg)) {
            config.error_threshold = flag_value<double>(kErrorThreshold, args, i);
        } else if (matches(kRetryTimeout, arg)) {
            config.retry_timeout = seconds_flag(kRetryTimeout, args, i);
        } else if (matches(kTrialSuccess, arg)) {
            config.trial_success_required = flag_value<uint64_t>(kTrialSuccess, args, i);
        }
    }

    return config;
}

void validate(const BreakerConfig& config) {
    if (config.capacity == 0) {
        throw ConfigError("buffer_size must be at least 1");
    }
    if (config.span <= std::chrono::milliseconds::zero()) {
        throw ConfigError("buffer_span_duration must be greater than zero");
    }
    if (config.retry_timeout < std::chrono::milliseconds::zero()) {
        throw ConfigError("retry_timeout must not be negative");
    }
}

CliOptions parse_cli_options(const std::vector<std::string>& args, BreakerConfig base) {
    CliOptions options;
    options.breaker = parse_args(args, base);

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-v" || arg == "-V" || arg == "--version") {
            options.version = true;
        } else if (arg == "-a" || arg == "--noautoplay") {
            options.autoplay = false;
        } else if (arg == "--json") {
            options.json = true;
        } else if (matches(kFailureRatio, arg)) {
            options.failure_ratio = flag_value<double>(kFailureRatio, args, i);
            if (options.failure_ratio < 0.0 || options.failure_ratio > 1.0) {
                throw ConfigError("The failure_ratio argument must be between 0 and 1");
            }
        }
    }

    return options;
}

std::string usage() {
    return R"(
Usage: breakwater [OPTIONS]

Options:
  -b, --buffer_size            SIZE    Specify the capacity of the ring buffer.
  -m, --min_eval_size          NUMBER  Define the minimum number of events
                                       required in the buffer to evaluate the
                                       error rate.
  -e, --error_threshold        FLOAT   Set the error rate percentage that will
                                       trigger the circuit to open.
  -r, --retry_timeout          SECONDS Specify the duration (in seconds) the
                                       circuit breaker remains open before
                                       transitioning to half-open.
  -s, --buffer_span_duration   SECONDS Determine the duration (in seconds) each
                                       bucket in the buffer stores data.
  -t, --trial_success_required NUMBER  Set the number of consecutive successes
                                       required to close a half-open circuit.
  -f, --failure_ratio          FLOAT   Probability (0-1) that generated traffic
                                       fails while auto-playing.
  -a, --noautoplay                     Don't generate traffic; read s/f/q
                                       commands from stdin instead.
      --json                           Print JSON snapshots instead of frames.
  -h, --help                           Display this help message and exit.
  -v, --version                        Display version information and exit.

Environment:
  BREAKWATER_BUFFER_SIZE, BREAKWATER_SPAN_MS, BREAKWATER_MIN_EVAL_SIZE,
  BREAKWATER_ERROR_THRESHOLD, BREAKWATER_RETRY_TIMEOUT_MS,
  BREAKWATER_TRIAL_SUCCESS_REQUIRED set defaults (read after .env).
  BREAKWATER_LOG (stdout, /dev/null or a file) and BREAKWATER_LOG_LEVEL
  configure logging.
)";
}

} // namespace breakwater
