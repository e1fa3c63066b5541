/**
 * SuperKit - Logger
 *
 * Levelled, timestamped console logging with optional file mirror.
 * Safe to call from GPIO edge notification threads.
 */

#ifndef SUPERKIT_LOGGER_H
#define SUPERKIT_LOGGER_H

#include <iostream>
#include <fstream>
#include <ctime>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_level = level;
    }

    LogLevel getLevel() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_level;
    }

    /**
     * Map a config string ("debug", "info", "warn", "error") to a level.
     * Returns false and leaves level untouched for unknown names.
     */
    static bool parseLevel(const std::string& name, LogLevel& level) {
        if (name == "DEBUG" || name == "debug") level = LogLevel::DEBUG;
        else if (name == "INFO" || name == "info") level = LogLevel::INFO;
        else if (name == "WARN" || name == "warn") level = LogLevel::WARN;
        else if (name == "ERROR" || name == "error") level = LogLevel::ERROR;
        else return false;
        return true;
    }

    bool openFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
        m_file.open(path, std::ios::app);
        if (!m_file.is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << path << std::endl;
            return false;
        }
        return true;
    }

    void closeFile() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
    }

    void log(LogLevel level, const char* tag, const char* fmt, ...) {
        char msg[512];
        va_list args;
        va_start(args, fmt);
        vsnprintf(msg, sizeof(msg), fmt, args);
        va_end(args);

        char timestamp[32];
        getTimestamp(timestamp, sizeof(timestamp));

        std::lock_guard<std::mutex> lock(m_mutex);
        if (level < m_level) return;

        // Warnings and errors go to stderr so they survive stdout redirection
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << timestamp << " [" << levelToString(level) << "] [" << tag << "] " << msg << std::endl;

        if (m_file.is_open()) {
            m_file << timestamp << " [" << levelToString(level) << "] [" << tag << "] " << msg << std::endl;
            m_file.flush();
        }
    }

private:
    Logger() : m_level(LogLevel::INFO) {}
    ~Logger() { closeFile(); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void getTimestamp(char* buf, size_t size) {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        struct tm tm_info;
        localtime_r(&ts.tv_sec, &tm_info);
        int ms = ts.tv_nsec / 1000000;
        snprintf(buf, size, "%02d:%02d:%02d.%03d",
            tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec, ms);
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
        }
        return "?????";
    }

    LogLevel m_level;
    std::ofstream m_file;
    std::mutex m_mutex;
};

#define LOG_DEBUG(tag, fmt, ...) Logger::instance().log(LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  Logger::instance().log(LogLevel::INFO,  tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  Logger::instance().log(LogLevel::WARN,  tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) Logger::instance().log(LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#endif // SUPERKIT_LOGGER_H
