#ifndef BREAKWATER_UTIL_STRING_H
#define BREAKWATER_UTIL_STRING_H

#include <string>
#include <string_view>
#include <type_traits>
#include <charconv>
#include <breakwater/exceptions.h>

namespace breakwater::util {

/**
 * @brief Strips leading and trailing spaces and tabs.
 */
std::string_view trim(std::string_view str);

/**
 * @brief Converts a string_view to a numeric or boolean type.
 * The whole input must be consumed; unsigned targets reject a leading '-'.
 * @throws ConfigError if parsing fails.
 */
template<typename T>
T convert_string(std::string_view s) {
    using PureT = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<PureT, std::string>) {
        return std::string(s);
    } else if constexpr (std::is_same_v<PureT, bool>) {
        if (s == "true" || s == "1" || s == "yes" || s == "t") return true;
        if (s == "false" || s == "0" || s == "no" || s == "f") return false;
        throw ConfigError("Invalid boolean format: " + std::string(s));
    } else if constexpr (std::is_integral_v<PureT>) {
        PureT val{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
        if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
            throw ConfigError("Invalid integer format: " + std::string(s));
        }
        return val;
    } else if constexpr (std::is_floating_point_v<PureT>) {
        // from_chars for floating point is missing on older libc++
        std::string copy(s);
        size_t consumed = 0;
        PureT val{};
        try {
            val = static_cast<PureT>(std::stod(copy, &consumed));
        } catch (const std::exception&) {
            throw ConfigError("Invalid floating point format: " + copy);
        }
        if (consumed != copy.size()) {
            throw ConfigError("Invalid floating point format: " + copy);
        }
        return val;
    } else {
        static_assert(sizeof(PureT) == 0, "Unsupported type for breakwater::convert_string");
    }
}

} // namespace breakwater::util

namespace breakwater {
    using util::convert_string;
}

#endif // BREAKWATER_UTIL_STRING_H
