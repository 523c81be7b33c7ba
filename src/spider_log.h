#ifndef SPIDER_LOG_H
#define SPIDER_LOG_H

#include <string>

/**
 * @file spider_log.h
 * @brief Tagged console logging shared by every SpiderMotion module
 *
 * Each line is written as "[Tag] message". Debug and info go to stdout,
 * warnings and errors to stderr. Output is serialized because the range
 * monitor and pose worker threads log concurrently with the caller.
 */

namespace spider_log {

enum LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARNING = 2,
    LOG_ERROR = 3,
    LOG_NONE = 4 //< Disable all output
};

/** Set the minimum level that is printed. */
void setLevel(LogLevel level);
/** Current minimum printed level. */
LogLevel getLevel();

void debug(const char *tag, const std::string &message);
void info(const char *tag, const std::string &message);
void warning(const char *tag, const std::string &message);
void error(const char *tag, const std::string &message);

} // namespace spider_log

#endif // SPIDER_LOG_H
