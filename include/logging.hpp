#pragma once

#include <string>

/**
 * @file logging.hpp
 * @brief Runtime log profile shared by the library and the driver.
 *
 * Progress goes to stdout with a bracketed subsystem tag, warnings and
 * errors go to stderr. The active profile decides which progress messages
 * are printed.
 */

namespace nestinit
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

extern LogProfile global_log_profile;

/**
 * @brief Returns whether current logging level includes the target level.
 * @param level Minimum desired logging level.
 * @return True when logging at the requested level is enabled.
 */
inline bool log_at_least(LogProfile level)
{
    return static_cast<int>(global_log_profile) >= static_cast<int>(level);
}

/**
 * @brief Returns whether normal logging output is enabled.
 */
inline bool log_normal_enabled()
{
    return log_at_least(LogProfile::normal);
}

/**
 * @brief Returns whether debug logging output is enabled.
 */
inline bool log_debug_enabled()
{
    return log_at_least(LogProfile::debug);
}

/**
 * @brief Returns a string label for a log profile.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile, `normal` when the input is not recognized.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

} // namespace nestinit
