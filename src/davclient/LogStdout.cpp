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

#include <davclient/LogStdout.h>
#include <davclient/util.h>
#include <string.h>
#include <errno.h>

#include <boost/bind.hpp>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

LoggerStdout::LoggerStdout(FILE *file) :
    m_file(file),
    m_closeFile(false)
{}

LoggerStdout::LoggerStdout(const std::string &filename) :
    m_file(fopen(filename.c_str(), "a")),
    m_closeFile(true)
{
    if (!m_file) {
        DAV_THROW(filename + ": " + strerror(errno));
    }
}

LoggerStdout::~LoggerStdout()
{
    if (m_closeFile) {
        fclose(m_file);
    }
}

static void appendOutput(std::string &output, std::string &chunk, size_t expectedTotal)
{
    if (expectedTotal) {
        output.reserve(expectedTotal);
    }
    output.append(chunk);
}

void LoggerStdout::messagev(Level level,
                            const char *prefix,
                            const char *file,
                            int line,
                            const char *function,
                            const char *format,
                            va_list args)
{
    if (m_file &&
        level <= getLevel()) {
        std::string output;
        formatLines(level, getLevel(),
                    prefix,
                    format, args,
                    boost::bind(appendOutput, boost::ref(output), _1, _2));
        fwrite(output.c_str(), 1, output.size(), m_file);
        fflush(m_file);
    }
}

#ifdef ENABLE_UNIT_TESTS

#include "test.h"

class LoggingTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(LoggingTest);
    CPPUNIT_TEST(levels);
    CPPUNIT_TEST(tagging);
    CPPUNIT_TEST(filtering);
    CPPUNIT_TEST_SUITE_END();

    static std::string readBack(FILE *file) {
        std::string res;
        char buffer[256];
        size_t len;
        rewind(file);
        while ((len = fread(buffer, 1, sizeof(buffer), file)) > 0) {
            res.append(buffer, len);
        }
        return res;
    }

    void levels() {
        CPPUNIT_ASSERT_EQUAL(Logger::DEV, Logger::strToLevel("developer"));
        CPPUNIT_ASSERT_EQUAL(Logger::ERROR, Logger::strToLevel("ERROR"));
        CPPUNIT_ASSERT_EQUAL(Logger::DEBUG, Logger::strToLevel(NULL));
        CPPUNIT_ASSERT_EQUAL(Logger::DEBUG, Logger::strToLevel("no such level"));
        CPPUNIT_ASSERT_EQUAL(std::string("WARNING"), std::string(Logger::levelToStr(Logger::WARNING)));
    }

    void tagging() {
        FILE *file = tmpfile();
        CPPUNIT_ASSERT(file);
        {
            LoggerStdout logger(file);
            logger.setLevel(Logger::INFO);
            DAV_LOG_INFO(&logger, "PROPFIND", "first\nsecond");
            DAV_LOG_SHOW(&logger, NULL, "plain");
        }
        std::string out = readBack(file);
        fclose(file);
        CPPUNIT_ASSERT_EQUAL(std::string("[INFO] PROPFIND: first\n"
                                         "[INFO] PROPFIND: second\n"
                                         "plain\n"),
                             out);
    }

    void filtering() {
        FILE *file = tmpfile();
        CPPUNIT_ASSERT(file);
        {
            LoggerStdout logger(file);
            logger.setLevel(Logger::WARNING);
            LoggerBase::pushLogger(&logger);
            DAV_LOG_DEBUG(NULL, NULL, "hidden");
            DAV_LOG_ERROR(NULL, NULL, "failed %d", 42);
            LoggerBase::popLogger();
        }
        std::string out = readBack(file);
        fclose(file);
        CPPUNIT_ASSERT_EQUAL(std::string("[ERROR] failed 42\n"), out);
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(LoggingTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
