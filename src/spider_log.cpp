#include "spider_log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace spider_log {

namespace {
std::atomic<int> g_level{LOG_INFO};
std::mutex g_output_mutex;

void write(LogLevel level, const char *tag, const std::string &message) {
    if (static_cast<int>(level) < g_level.load())
        return;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream &out = (level >= LOG_WARNING) ? std::cerr : std::cout;
    out << "[" << tag << "] ";
    if (level == LOG_WARNING)
        out << "WARNING: ";
    else if (level == LOG_ERROR)
        out << "ERROR: ";
    out << message << std::endl;
}
} // namespace

void setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel getLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void debug(const char *tag, const std::string &message) { write(LOG_DEBUG, tag, message); }
void info(const char *tag, const std::string &message) { write(LOG_INFO, tag, message); }
void warning(const char *tag, const std::string &message) { write(LOG_WARNING, tag, message); }
void error(const char *tag, const std::string &message) { write(LOG_ERROR, tag, message); }

} // namespace spider_log
