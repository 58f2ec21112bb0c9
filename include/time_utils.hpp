#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Get the current UTC time in ISO 8601 form (YYYY-MM-DDTHH:MM:SSZ).
 */
std::string iso_timestamp();

#endif // TIME_UTILS_HPP
