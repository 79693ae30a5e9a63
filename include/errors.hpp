#pragma once

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception types raised by the nesting library.
 *
 * All errors are fatal for the computation that raised them. They derive
 * from `std::runtime_error` so callers that only care about failure can
 * catch that.
 */

namespace nestinit
{

/**
 * @brief Invalid geometry, grids, nesting placement or options.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An iterative solve exhausted its iteration budget.
 */
class NumericalError : public std::runtime_error
{
public:
    explicit NumericalError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Missing or malformed external (reanalysis) data.
 */
class DataError : public std::runtime_error
{
public:
    explicit DataError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace nestinit
