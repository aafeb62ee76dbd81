#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <breakwater/config.h>
#include <breakwater/exceptions.h>
#include <cstdlib>

using namespace breakwater;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("Config: Command Line Flags", "[config]") {
    SECTION("Long flags") {
        BreakerConfig config = parse_args({
            "--buffer_size", "42",
            "--min_eval_size", "11",
            "--error_threshold", "10.78",
            "--retry_timeout", "200",
            "--buffer_span_duration", "550",
            "--trial_success_required", "666",
            "--unknown"
        });

        CHECK(config.capacity == 42);
        CHECK(config.min_eval_size == 11);
        CHECK(config.error_threshold == 10.78);
        CHECK(config.retry_timeout == 200s);
        CHECK(config.span == 550s);
        CHECK(config.trial_success_required == 666);
    }

    SECTION("Short flags") {
        BreakerConfig config = parse_args({
            "-b", "0", "-m", "875", "-e", "5647.1", "-r", "62", "-s", "279", "-t", "0", "-x"
        });

        CHECK(config.capacity == 0);
        CHECK(config.min_eval_size == 875);
        CHECK(config.error_threshold == 5647.1);
        CHECK(config.retry_timeout == 62s);
        CHECK(config.span == 279s);
        CHECK(config.trial_success_required == 0);
    }

    SECTION("Unspecified flags keep the base values") {
        BreakerConfig config = parse_args({"-b", "10"});
        BreakerConfig expected;
        expected.capacity = 10;
        CHECK(config == expected);

        BreakerConfig base;
        base.min_eval_size = 3;
        CHECK(parse_args({}, base) == base);
    }

    SECTION("Missing values are rejected") {
        CHECK_THROWS_AS(parse_args({"-b"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"--error_threshold"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-t", "-t"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-e", "-e"}), ConfigError);
    }

    SECTION("Negative and non-numeric values are rejected") {
        CHECK_THROWS_AS(parse_args({"-b", "-9"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-m", "-9"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-r", "-9"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-s", "ten"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-e", "1.5x"}), ConfigError);
    }

    SECTION("Durations too large for milliseconds are rejected") {
        CHECK_THROWS_AS(parse_args({"-r", "18446744073709551615"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"-s", "9300000000000000"}), ConfigError);
        CHECK_THROWS_AS(parse_args({"--retry_timeout", "9223372036854776"}), ConfigError);

        // Largest whole number of seconds that still fits
        BreakerConfig config = parse_args({"-r", "9223372036854775"});
        CHECK(config.retry_timeout == std::chrono::milliseconds(9223372036854775000));
        CHECK(config.retry_timeout > 0ms);
    }

    SECTION("Error message names the flag") {
        try {
            parse_args({"--min_eval_size"});
            FAIL("expected ConfigError");
        } catch (const ConfigError& e) {
            CHECK(std::string(e.what()) == "The min_eval_size flag requires an additional argument");
        }
    }
}

TEST_CASE("Config: CLI Options", "[config]") {
    SECTION("Defaults") {
        CliOptions options = parse_cli_options({});
        CHECK(options.autoplay);
        CHECK_FALSE(options.json);
        CHECK_FALSE(options.help);
        CHECK_FALSE(options.version);
        CHECK(options.breaker == BreakerConfig{});
    }

    SECTION("Tool flags alongside breaker flags") {
        CliOptions options = parse_cli_options({"-a", "--json", "-f", "0.5", "-b", "7", "-V"});
        CHECK_FALSE(options.autoplay);
        CHECK(options.json);
        CHECK(options.version);
        CHECK(options.failure_ratio == 0.5);
        CHECK(options.breaker.capacity == 7);
    }

    SECTION("Failure ratio must be a probability") {
        CHECK_THROWS_AS(parse_cli_options({"--failure_ratio", "1.5"}), ConfigError);
        CHECK_THROWS_AS(parse_cli_options({"-f"}), ConfigError);
    }

    SECTION("Help lists every flag") {
        CHECK(parse_cli_options({"--help"}).help);
        const std::string help = usage();
        for (const char* flag : {"--buffer_size", "--buffer_span_duration", "--min_eval_size",
                                 "--error_threshold", "--retry_timeout", "--trial_success_required",
                                 "--failure_ratio", "--noautoplay", "--json", "--help", "--version"}) {
            CHECK(help.find(flag) != std::string::npos);
        }
    }
}

TEST_CASE("Config: Validation", "[config]") {
    CHECK_NOTHROW(validate(BreakerConfig{}));

    BreakerConfig empty_window;
    empty_window.capacity = 0;
    CHECK_THROWS_AS(validate(empty_window), ConfigError);

    BreakerConfig zero_span;
    zero_span.span = 0ms;
    CHECK_THROWS_AS(validate(zero_span), ConfigError);

    BreakerConfig negative_retry;
    negative_retry.retry_timeout = -1000ms;
    CHECK_THROWS_AS(validate(negative_retry), ConfigError);

    BreakerConfig immediate_retry;
    immediate_retry.retry_timeout = 0ms;
    CHECK_NOTHROW(validate(immediate_retry));

    // Aggressive but valid
    BreakerConfig aggressive;
    aggressive.min_eval_size = 0;
    aggressive.error_threshold = 0.0;
    aggressive.trial_success_required = 0;
    CHECK_NOTHROW(validate(aggressive));
}

TEST_CASE("Config: Environment Variables", "[config]") {
    setenv("BREAKWATER_BUFFER_SIZE", "12", 1);
    setenv("BREAKWATER_SPAN_MS", "1500", 1);
    setenv("BREAKWATER_ERROR_THRESHOLD", "25.5", 1);
    unsetenv("BREAKWATER_MIN_EVAL_SIZE");
    unsetenv("BREAKWATER_RETRY_TIMEOUT_MS");
    unsetenv("BREAKWATER_TRIAL_SUCCESS_REQUIRED");

    BreakerConfig config = config_from_env();
    CHECK(config.capacity == 12);
    CHECK(config.span == 1500ms);
    CHECK(config.error_threshold == 25.5);
    CHECK(config.min_eval_size == BreakerConfig{}.min_eval_size);
    CHECK(config.retry_timeout == BreakerConfig{}.retry_timeout);

    setenv("BREAKWATER_TRIAL_SUCCESS_REQUIRED", "many", 1);
    CHECK_THROWS_AS(config_from_env(), ConfigError);

    unsetenv("BREAKWATER_BUFFER_SIZE");
    unsetenv("BREAKWATER_SPAN_MS");
    unsetenv("BREAKWATER_ERROR_THRESHOLD");
    unsetenv("BREAKWATER_TRIAL_SUCCESS_REQUIRED");

    // A negative timeout parses but cannot be used
    setenv("BREAKWATER_RETRY_TIMEOUT_MS", "-1000", 1);
    BreakerConfig negative = config_from_env();
    CHECK(negative.retry_timeout == -1000ms);
    CHECK_THROWS_AS(validate(negative), ConfigError);
    unsetenv("BREAKWATER_RETRY_TIMEOUT_MS");
}

TEST_CASE("Config: JSON Documents", "[config]") {
    SECTION("All keys") {
        BreakerConfig config = config_from_json(R"({
            "buffer_size": 8,
            "buffer_span_duration_ms": 250,
            "min_eval_size": 4,
            "error_threshold": 39.99,
            "retry_timeout_ms": 200,
            "trial_success_required": 3
        })");

        CHECK(config.capacity == 8);
        CHECK(config.span == 250ms);
        CHECK(config.min_eval_size == 4);
        CHECK_THAT(config.error_threshold, WithinAbs(39.99, 1e-9));
        CHECK(config.retry_timeout == 200ms);
        CHECK(config.trial_success_required == 3);
    }

    SECTION("Integer threshold and partial documents") {
        BreakerConfig config = config_from_json(R"({"error_threshold": 50})");
        CHECK(config.error_threshold == 50.0);
        CHECK(config.capacity == BreakerConfig{}.capacity);
    }

    SECTION("Malformed input") {
        CHECK_THROWS_AS(config_from_json("{not json"), ConfigError);
        CHECK_THROWS_AS(config_from_json("[1, 2]"), ConfigError);
        CHECK_THROWS_AS(config_from_json(R"({"buffer_size": -1})"), ConfigError);
        CHECK_THROWS_AS(config_from_json(R"({"error_threshold": "high"})"), ConfigError);
    }

    SECTION("Durations beyond the millisecond range") {
        CHECK_THROWS_AS(config_from_json(R"({"retry_timeout_ms": 18446744073709551615})"), ConfigError);
        CHECK_THROWS_AS(config_from_json(R"({"buffer_span_duration_ms": 9223372036854775808})"), ConfigError);

        BreakerConfig config = config_from_json(R"({"retry_timeout_ms": 9223372036854775807})");
        CHECK(config.retry_timeout == std::chrono::milliseconds::max());
    }
}
