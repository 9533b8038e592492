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

#include <davclient/Logging.h>
#include <davclient/LogStdout.h>
#include <davclient/util.h>

#include <vector>
#include <string.h>

#include <boost/algorithm/string/predicate.hpp>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

static std::vector<LoggerBase *> &loggers()
{
    // never freed, logging may be needed till the very end
    static std::vector<LoggerBase *> *loggers = new std::vector<LoggerBase *>;
    return *loggers;
}

LoggerBase &LoggerBase::instance()
{
    static LoggerStdout *DefaultLogger = new LoggerStdout;
    if (!loggers().empty()) {
        return *loggers()[loggers().size() - 1];
    } else {
        return *DefaultLogger;
    }
}

void LoggerBase::pushLogger(LoggerBase *logger)
{
    loggers().push_back(logger);
}

void LoggerBase::popLogger()
{
    if (loggers().empty()) {
        DAV_THROW("too many popLogger() calls");
    }
    loggers().pop_back();
}

void LoggerBase::formatLines(Level msglevel,
                             Level outputlevel,
                             const char *prefix,
                             const char *format,
                             va_list args,
                             boost::function<void (std::string &buffer, size_t expectedTotal)> print)
{
    std::string tag;

    // in case of 'SHOW' level, don't print level and prefix information
    if (msglevel != SHOW) {
        std::string reltime;

        if (outputlevel >= DEBUG) {
            time_t now = time(NULL);
            if (!m_startTime) {
                // first message, start counting time
                m_startTime = now;
                struct tm tm_gm;
                char buffer[80];
                gmtime_r(&now, &tm_gm);
                strftime(buffer, sizeof(buffer),
                         "%a %Y-%m-%d %H:%M:%S",
                         &tm_gm);
                reltime = " 00:00:00";
                std::string line =
                    StringPrintf("[DEBUG%s] %s UTC\n",
                                 reltime.c_str(),
                                 buffer);
                print(line, 1);
            } else if (now >= m_startTime) {
                long delta = (long)(now - m_startTime);
                reltime = StringPrintf(" %02ld:%02ld:%02ld",
                                       delta / (60 * 60),
                                       (delta % (60 * 60)) / 60,
                                       delta % 60);
            } else {
                reltime = " ??:??:??";
            }
        }
        tag = StringPrintf("[%s%s] %s%s",
                           levelToStr(msglevel),
                           reltime.c_str(),
                           prefix ? prefix : "",
                           prefix ? ": " : "");
    }

    std::string output = StringPrintfV(format, args);

    if (!tag.empty()) {
        // Total size is guessed by assuming an average line length of
        // around 40 characters.
        size_t expectedTotal = (output.size() / 40 + 1) * tag.size() + output.size();
        size_t pos = 0;
        while (true) {
            size_t next = output.find('\n', pos);
            if (next == output.npos) {
                break;
            }
            std::string line;
            line.reserve(tag.size() + next + 1 - pos);
            line.append(tag);
            line.append(output, pos, next + 1 - pos);
            print(line, expectedTotal);
            pos = next + 1;
        }
        if (pos < output.size() || output.empty()) {
            // dangling last line or empty message: print at least the tag
            std::string line;
            line.reserve(tag.size() + output.size() - pos + 1);
            line.append(tag);
            line.append(output, pos, output.size() - pos);
            line += '\n';
            print(line, expectedTotal);
        }
    } else {
        if (!boost::ends_with(output, "\n")) {
            output += '\n';
        }
        print(output, 0);
    }
}

void Logger::message(Level level,
                     const char *prefix,
                     const char *file,
                     int line,
                     const char *function,
                     const char *format,
                     ...)
{
    va_list args;
    va_start(args, format);
    messagev(level, prefix, file, line, function, format, args);
    va_end(args);
}

const char *Logger::levelToStr(Level level)
{
    switch (level) {
    case SHOW: return "SHOW";
    case ERROR: return "ERROR";
    case WARNING: return "WARNING";
    case INFO: return "INFO";
    case DEV: return "DEVELOPER";
    case DEBUG: return "DEBUG";
    default: return "???";
    }
}

Logger::Level Logger::strToLevel(const char *str)
{
    if (!str || !strcasecmp(str, "DEBUG")) {
        return DEBUG;
    } else if (!strcasecmp(str, "INFO")) {
        return INFO;
    } else if (!strcasecmp(str, "SHOW")) {
        return SHOW;
    } else if (!strcasecmp(str, "ERROR")) {
        return ERROR;
    } else if (!strcasecmp(str, "WARNING")) {
        return WARNING;
    } else if (!strcasecmp(str, "DEV") || !strcasecmp(str, "DEVELOPER")) {
        return DEV;
    } else {
        return DEBUG;
    }
}

DAV_END_CXX
