#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define DOTSYNC_COLOR_RESET "\033[0m"
#define DOTSYNC_COLOR_INFO  "\033[32m"
#define DOTSYNC_COLOR_WARN  "\033[33m"
#define DOTSYNC_COLOR_ERROR "\033[31m"

namespace Dotsync {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << DOTSYNC_COLOR_INFO << "[INFO] " << DOTSYNC_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << DOTSYNC_COLOR_WARN << "[WARN] " << DOTSYNC_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << DOTSYNC_COLOR_ERROR << "[ERROR] " << DOTSYNC_COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
std::string trim(const std::string& input);

/**
 * @brief Splits a comma separated list, trimming each item and dropping
 *        empty ones.
 *
 * @param input e.g. "/home/me, /root,"
 * @return The items in their original order.
 */
std::vector<std::string> splitCommaList(const std::string& input);

/**
 * @brief Joins items with ", " wrapping each in single quotes.
 */
std::string joinQuoted(const std::vector<std::string>& items);

} // namespace Dotsync

#endif // UTILS_HPP
