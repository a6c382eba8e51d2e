#ifndef __LOGGER_H__
#define __LOGGER_H__

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <stdarg.h>
#include <string>
#include <syslog.h>

/*
#define LOG_EMERG   0
#define LOG_ALERT   1
#define LOG_CRIT    2
#define LOG_ERR     3
#define LOG_WARNING 4
#define LOG_NOTICE  5
#define LOG_INFO    6
#define LOG_DEBUG   7
*/
#define LOG_VERBOSE (LOG_DEBUG + 1)

class Logger {
public:
    static constexpr const char* tag[] = {
        "[EMERG]",
        "[ALERT]",
        "[CRIT]",
        "[ERROR]",
        "[WARNING]",
        "[NOTICE]",
        "[INFO]",
        "[DEBUG]",
        "[VERB]",
    };
    static const uint8_t max_level = LOG_VERBOSE;

    Logger(const std::string& id, uint8_t level = LOG_WARNING, bool console = true,
        int opt = LOG_PID, int fac = LOG_DAEMON)
    {
        // openlog() keeps the pointer, the ident must outlive the logger
        _ident = id;
        _console = console;
        set_level(level);
        openlog(_ident.c_str(), opt, fac);
    }

    ~Logger()
    {
        closelog();
    }

    static void set_level(uint8_t level)
    {
        _log_level = (level > max_level) ? LOG_WARNING : level;
        setlogmask(LOG_UPTO(_log_level > LOG_DEBUG ? LOG_DEBUG : _log_level));
    }

    static uint8_t level()
    {
        return _log_level;
    }

    static void log(uint8_t level, const char* format, ...)
    {
        if (level > _log_level)
            return;

        std::lock_guard<std::mutex> lock(_log_mutex);
        va_list args;

        // syslog has no verbose priority
        va_start(args, format);
        vsyslog(level > LOG_DEBUG ? LOG_DEBUG : level, format, args);
        va_end(args);

        if (_console) {
            va_start(args, format);
            vfprintf(level <= LOG_WARNING ? stderr : stdout, format, args);
            va_end(args);
        }
    }

private:
    static inline std::mutex _log_mutex;
    static inline uint8_t _log_level = LOG_WARNING;
    static inline bool _console = true;
    static inline std::string _ident;
};

#define _LOG(_level, fmt, ...) \
    Logger::log(_level, "%s %s,%d: " fmt "\n", Logger::tag[_level], __FUNCTION__, __LINE__, ##__VA_ARGS__)
#define LOGE(fmt, ...) _LOG(LOG_ERR, fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) _LOG(LOG_WARNING, fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) _LOG(LOG_INFO, fmt, ##__VA_ARGS__)
#define LOGD(fmt, ...) _LOG(LOG_DEBUG, fmt, ##__VA_ARGS__)
#define LOGV(fmt, ...) _LOG(LOG_VERBOSE, fmt, ##__VA_ARGS__)

#endif // __LOGGER_H__
