#ifndef TETHER_UTILS_TIME_FORMAT_HPP
#define TETHER_UTILS_TIME_FORMAT_HPP

#include <chrono>
#include <optional>
#include <string>

namespace tether {
namespace utils {

/**
 * @brief Format a wall-clock time as ISO-8601 UTC with millisecond precision,
 *        e.g. "2024-05-01T12:30:45.120Z".
 */
std::string formatIso8601(std::chrono::system_clock::time_point time);

/**
 * @brief Parse the output of formatIso8601. Fractional seconds are optional.
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text);

} // namespace utils
} // namespace tether

#endif // TETHER_UTILS_TIME_FORMAT_HPP
