/*
 * Copyright (C) 2026 The DavClient Authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) version 3.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301  USA
 */

#ifndef INCL_DAV_LOGGING
#define INCL_DAV_LOGGING

#include <stdarg.h>
#include <time.h>
#include <string>

#include <boost/function.hpp>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * Abstract interface for logging in DavClient. Can be implemented by
 * other classes to add information (like a certain prefix) before
 * passing the message on to a global instance for the actual
 * processing.
 */
class Logger
{
 public:
    /**
     * How the levels are meant to be used:
     * - error: a request failed and the caller will see an exception
     * - warning: a problem that was handled, for example a fallback
     *            path in version resolution
     * - show: plain output of the example program, no tag
     * - info: one line per high-level operation
     * - developer: authentication retries, session setup
     * - debug: every HTTP exchange, response bodies, neon debug output
     */
    typedef enum {
        ERROR,
        WARNING,
        SHOW,
        INFO,
        DEV,
        DEBUG
    } Level;
    static const char *levelToStr(Level level);

    /** always returns a valid level, also for NULL, by falling back to DEBUG */
    static Level strToLevel(const char *str);

    virtual ~Logger() {}

    /**
     * output a single message
     *
     * @param level     level for current message
     * @param prefix    inserted at beginning of each line, if non-NULL
     * @param file      source file where message comes from, if non-NULL
     * @param line      source line number, if file is non-NULL
     * @param function  surrounding function name, if non-NULL
     * @param format    sprintf format
     * @param args      parameters for sprintf: consumed by this function,
     *                  make copy with va_copy() if necessary!
     */
    virtual void messagev(Level level,
                          const char *prefix,
                          const char *file,
                          int line,
                          const char *function,
                          const char *format,
                          va_list args) = 0;

    /** default: redirect into messagev() */
    virtual void message(Level level,
                         const char *prefix,
                         const char *file,
                         int line,
                         const char *function,
                         const char *format,
                         ...)
#ifdef __GNUC__
        __attribute__((format(printf, 7, 8)))
#endif
        ;
};

/**
 * Global logging, implemented as a stack of loggers with a default
 * LoggerStdout at the bottom.
 */
class LoggerBase : public Logger
{
 public:
    LoggerBase() : m_level(INFO), m_startTime(0) {}

    /**
     * The currently active logger: the one pushed last, or a
     * LoggerStdout writing to stdout if none was pushed.
     */
    static LoggerBase &instance();

    /**
     * Overrides the default logger. The logger itself is never
     * deleted by this class.
     */
    static void pushLogger(LoggerBase *logger);

    /**
     * Remove the current logger and restore previous one.
     * Must match a pushLogger() call.
     */
    static void popLogger();

    virtual void setLevel(Level level) { m_level = level; }
    virtual Level getLevel() { return m_level; }

 protected:
    /**
     * Prepares the output. Each line gets a "[LEVEL hh:mm:ss] prefix: "
     * tag, except for SHOW messages which are passed through
     * unmodified. The time is relative to the first message and only
     * added when the output level is DEBUG.
     *
     * The result is passed back line-by-line (expectedTotal > 0) or
     * as full chunk (expectedTotal = 0).
     */
    void formatLines(Level msglevel,
                     Level outputlevel,
                     const char *prefix,
                     const char *format,
                     va_list args,
                     boost::function<void (std::string &chunk, size_t expectedTotal)> print);

 private:
    Level m_level;
    time_t m_startTime;
};

/**
 * Vararg macro which passes the message through a specific
 * Logger class instance (if non-NULL) and otherwise calls
 * the global logger directly. Adds source file and line.
 */
#define DAV_LOG(_level, _instance, _prefix, _format, _args...) \
    do { \
        if (_instance) { \
            static_cast<DavClient::Logger *>(_instance)->message(_level, \
                                                                 _prefix, \
                                                                 __FILE__, \
                                                                 __LINE__, \
                                                                 0, \
                                                                 _format, \
                                                                 ##_args); \
        } else { \
            DavClient::LoggerBase::instance().message(_level, \
                                                      _prefix, \
                                                      __FILE__, \
                                                      __LINE__, \
                                                      0, \
                                                      _format, \
                                                      ##_args); \
        } \
    } while(false)

#define DAV_LOG_SHOW(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::SHOW, _instance, _prefix, _format, ##_args)
#define DAV_LOG_ERROR(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::ERROR, _instance, _prefix, _format, ##_args)
#define DAV_LOG_WARNING(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::WARNING, _instance, _prefix, _format, ##_args)
#define DAV_LOG_INFO(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::INFO, _instance, _prefix, _format, ##_args)
#define DAV_LOG_DEV(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::DEV, _instance, _prefix, _format, ##_args)
#define DAV_LOG_DEBUG(_instance, _prefix, _format, _args...) DAV_LOG(DavClient::Logger::DEBUG, _instance, _prefix, _format, ##_args)

DAV_END_CXX
#endif // INCL_DAV_LOGGING
