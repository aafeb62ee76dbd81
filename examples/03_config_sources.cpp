/**
 * Example 03: Configuration Sources
 *
 * Layers the breaker configuration from defaults, a .env file, a JSON
 * document and finally command line flags.
 * Concepts:
 * - load_env() and BREAKWATER_* variables
 * - config_from_json() for a service's own config file
 * - parse_args() and validate()
 */

#include <breakwater/config.h>
#include <breakwater/environment.h>
#include <breakwater/exceptions.h>
#include <breakwater/snapshot.h>
#include <iostream>

using namespace breakwater;

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        load_env(); // optional, a missing .env is not an error

        BreakerConfig config = config_from_env();
        config = config_from_json(R"({"error_threshold": 25, "retry_timeout_ms": 5000})", config);
        config = parse_args(args, config);
        validate(config);

        Breaker breaker(config);
        std::cout << to_json(take_snapshot(breaker)) << std::endl;
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
