#ifndef BROOM_UTILS_HPP
#define BROOM_UTILS_HPP

#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

// ANSI color codes for console output.
#define BROOM_COLOR_RESET "\033[0m"
#define BROOM_COLOR_DEBUG "\033[36m"
#define BROOM_COLOR_INFO  "\033[32m"
#define BROOM_COLOR_WARN  "\033[33m"
#define BROOM_COLOR_ERROR "\033[31m"

namespace Broom {

/**
 * @brief Mutex guarding stderr/stdout so messages from worker tasks
 *        are not interleaved with the coordinator's output.
 */
std::mutex& outputMutex();

/**
 * @brief Enables or disables debug-level logging.
 */
void setVerbose(bool verbose);

/**
 * @return True if debug-level logging is enabled.
 */
bool isVerbose();

/**
 * @brief Logs a debug message to standard error, only in verbose mode.
 *
 * @param message The message to log.
 */
inline void log_debug(const std::string &message)
{
    if (!isVerbose()) {
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << BROOM_COLOR_DEBUG << "[DEBUG] " << BROOM_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << BROOM_COLOR_INFO << "[INFO] " << BROOM_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << BROOM_COLOR_WARN << "[WARN] " << BROOM_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << BROOM_COLOR_ERROR << "[ERROR] " << BROOM_COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Returns the current user's home directory.
 *
 * Uses $HOME when set and non-empty, otherwise the passwd entry of the
 * effective user. Returns an empty string if neither is available.
 */
std::string homeDirectory();

/**
 * @brief Expands a leading "~" token to the given home directory.
 *
 * "~" and "~/rest" are expanded; "~user" forms and any other input are
 * returned unchanged.
 *
 * @param path The path that may start with "~".
 * @param home The home directory to substitute.
 */
std::string expandHome(const std::string& path, const std::string& home);

/**
 * @brief Returns a copy of the string without leading and trailing whitespace.
 */
std::string trimmed(const std::string& s);

/**
 * @brief Returns an ASCII-lowercased copy of the string.
 */
std::string toLower(const std::string& s);

/**
 * @brief Lowercases the string and removes all whitespace from it.
 *
 * Used to compare application names such as "Visual Studio Code" against
 * folder names such as "visualstudiocode".
 */
std::string normalizeName(const std::string& s);

/**
 * @brief Generates a random RFC 4122 version 4 identifier string.
 */
std::string generateId();

/**
 * @brief Formats a byte count for humans ("1.5 MB", "512 B").
 */
std::string formatBytes(std::uint64_t bytes);

} // namespace Broom

#endif // BROOM_UTILS_HPP
