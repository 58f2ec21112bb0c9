#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/// Structured key/value context attached to a log entry.
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending. Calling it again switches to
 * the new file; if that fails the previous file stays active.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/// Set the global minimum log level.
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * When enabled each entry is written as one JSON object per line with
 * `timestamp`, `level`, `msg` and any structured fields.
 */
void set_json_logging(bool enable);

/// Gzip rotated log files (`<file>.1.gz`, ...).
void set_log_compression(bool enable);

/// Configure how many rotated log files are retained.
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if a log file is open; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR).
 *
 * Matching is case-insensitive.
 *
 * @throws std::runtime_error for an unknown name.
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Log a message with the specified severity.
 *
 * Messages below the configured level are discarded. Without an open log
 * file messages are only mirrored to syslog (when enabled).
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const LogFields& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const LogFields& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const LogFields& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * Only effective on Linux; a no-op elsewhere.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/// Flush buffered output to the log file.
void flush_logger();

/// Close the log file and syslog connection.
void shutdown_logger();

#endif // LOGGER_HPP
