#ifndef BREAKWATER_EXCEPTIONS_H
#define BREAKWATER_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace breakwater {

/**
 * @brief Base class for all errors raised by breakwater outside the core.
 *
 * Precondition violations in the core use the standard exceptions
 * (std::invalid_argument, std::out_of_range).
 */
class BreakwaterError : public std::runtime_error {
public:
    explicit BreakwaterError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Invalid or unparsable configuration (flags, environment, JSON). */
class ConfigError : public BreakwaterError {
public:
    explicit ConfigError(const std::string& msg) : BreakwaterError(msg) {}
};

} // namespace breakwater

#endif // BREAKWATER_EXCEPTIONS_H
