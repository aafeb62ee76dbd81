#pragma once

#include <string>
#include <optional>
#include <cstdlib>
#include <breakwater/exceptions.h>
#include <breakwater/util/string.h>

namespace breakwater {

    /**
     * @brief Loads KEY=VALUE lines from a .env file into the process environment.
     * Existing variables are overwritten. Returns false if the file cannot be opened.
     */
    bool load_env(const std::string& path = ".env");

    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr) {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw ConfigError("Missing environment variable: " + key);
        }

        try {
            return convert_string<T>(util::trim(val));
        } catch (const ConfigError& e) {
            throw ConfigError(key + ": " + e.what());
        }
    }
}
