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

#include <davclient/util.h>

#include <fstream>
#include <sstream>
#include <ctype.h>
#include <stdlib.h>
#include <stdio.h>

#include <boost/algorithm/string/join.hpp>

#ifdef ENABLE_UNIT_TESTS
#include "test.h"
CPPUNIT_REGISTRY_ADD_TO_DEFAULT("DavClient");
#endif

#include <davclient/declarations.h>
using namespace std;
DAV_BEGIN_CXX

string normalizePath(const string &path)
{
    string res;

    res.reserve(path.size());
    size_t index = 0;
    while (index < path.size()) {
        char curr = path[index];
        res += curr;
        index++;
        if (curr == '/') {
            while (index < path.size() &&
                   (path[index] == '/' ||
                    (path[index] == '.' &&
                     index + 1 < path.size() &&
                     path[index + 1] == '/'))) {
                index++;
            }
        }
    }
    if (!res.empty() && res[res.size() - 1] == '/') {
        res.resize(res.size() - 1);
    }
    return res;
}

string getBasename(const string &path)
{
    string dir;
    string file;
    splitPath(path, dir, file);
    return file;
}

string getDirname(const string &path)
{
    string dir;
    string file;
    splitPath(path, dir, file);
    return dir;
}

void splitPath(const string &path, string &dir, string &file)
{
    string normal = normalizePath(path);
    size_t offset = normal.rfind('/');
    if (offset != normal.npos) {
        dir = normal.substr(0, offset);
        file = normal.substr(offset + 1);
    } else {
        dir = "";
        file = normal;
    }
}

string joinPaths(const string &base, const string &path)
{
    if (base.empty()) {
        return path;
    }
    if (path.empty()) {
        return base;
    }
    bool baseSlash = base[base.size() - 1] == '/';
    bool pathSlash = path[0] == '/';
    if (baseSlash && pathSlash) {
        return base + path.substr(1);
    } else if (baseSlash || pathSlash) {
        return base + path;
    } else {
        return base + "/" + path;
    }
}

bool ReadFile(const string &filename, string &content)
{
    ifstream in;
    in.open(filename.c_str(), ios::in | ios::binary);
    ostringstream out;
    char buf[8192];
    do {
        in.read(buf, sizeof(buf));
        out.write(buf, in.gcount());
    } while(in);

    content = out.str();
    return in.eof();
}

string StripSpace(const string &str)
{
    size_t start = 0;
    while (start < str.size() && isspace((unsigned char)str[start])) {
        start++;
    }
    size_t end = str.size();
    while (end > start && isspace((unsigned char)str[end - 1])) {
        end--;
    }
    return str.substr(start, end - start);
}

string StringPrintf(const char *format, ...)
{
    va_list ap;
    va_start(ap, format);
    string res = StringPrintfV(format, ap);
    va_end(ap);
    return res;
}

string StringPrintfV(const char *format, va_list ap)
{
    va_list aq;

    char *buffer = NULL, *nbuffer = NULL;
    ssize_t size = 0;
    ssize_t realsize = 255;
    do {
        // vsnprintf() destroys ap, so make a copy first
        va_copy(aq, ap);

        if (size < realsize) {
            nbuffer = (char *)realloc(buffer, realsize + 1);
            if (!nbuffer) {
                if (buffer) {
                    free(buffer);
                }
                return "";
            }
            size = realsize;
            buffer = nbuffer;
        }

        realsize = vsnprintf(buffer, size + 1, format, aq);
        if (realsize == -1) {
            // old-style vnsprintf: exact len unknown, try again with doubled size
            realsize = size * 2;
        }
        va_end(aq);
    } while(realsize > size);

    string res = buffer;
    free(buffer);
    return res;
}

void Exception::handle(Logger *logger, std::string *explanation, Logger::Level level)
{
    std::string error;

    try {
        throw;
    } catch (const ProtocolException &ex) {
        DAV_LOG_DEBUG(logger, NULL, "protocol error thrown at %s:%d",
                      ex.m_file.c_str(), ex.m_line);
        error = StringPrintf("%s %s: %s",
                             ex.getMethod().c_str(), ex.getURL().c_str(), ex.what());
        if (!ex.getConditions().empty()) {
            error += " (";
            error += boost::join(ex.getConditions(), ", ");
            error += ")";
        }
    } catch (const DavException &ex) {
        DAV_LOG_DEBUG(logger, NULL, "exception thrown at %s:%d",
                      ex.m_file.c_str(), ex.m_line);
        if (ex.getMethod().empty()) {
            error = ex.what();
        } else {
            error = StringPrintf("%s %s: %s",
                                 ex.getMethod().c_str(), ex.getURL().c_str(), ex.what());
        }
    } catch (const Exception &ex) {
        DAV_LOG_DEBUG(logger, NULL, "exception thrown at %s:%d",
                      ex.m_file.c_str(), ex.m_line);
        error = ex.what();
    } catch (const std::exception &ex) {
        error = ex.what();
    } catch (...) {
        error = "unknown error";
    }
    DAV_LOG(level, logger, NULL, "%s", error.c_str());

    if (explanation) {
        *explanation = error;
    }
}

string Flags2String(int flags, const Flag *descr, const string &sep)
{
    list<string> tmp;

    while (descr->m_flag) {
        if (flags & descr->m_flag) {
            tmp.push_back(descr->m_description);
        }
        ++descr;
    }
    return boost::join(tmp, sep);
}

#ifdef ENABLE_UNIT_TESTS

class PathTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(PathTest);
    CPPUNIT_TEST(normalize);
    CPPUNIT_TEST(join);
    CPPUNIT_TEST(split);
    CPPUNIT_TEST(strip);
    CPPUNIT_TEST_SUITE_END();

    void normalize() {
        CPPUNIT_ASSERT_EQUAL(string("/a/b"), normalizePath("//a/./b/"));
        CPPUNIT_ASSERT_EQUAL(string(""), normalizePath(""));
    }

    void join() {
        CPPUNIT_ASSERT_EQUAL(string("/a/b"), joinPaths("/a", "b"));
        CPPUNIT_ASSERT_EQUAL(string("/a/b"), joinPaths("/a/", "b"));
        CPPUNIT_ASSERT_EQUAL(string("/a/b"), joinPaths("/a", "/b"));
        CPPUNIT_ASSERT_EQUAL(string("/a/b"), joinPaths("/a/", "/b"));
        CPPUNIT_ASSERT_EQUAL(string("/a"), joinPaths("/a", ""));
        CPPUNIT_ASSERT_EQUAL(string("b"), joinPaths("", "b"));
    }

    void split() {
        CPPUNIT_ASSERT_EQUAL(string("file.txt"), getBasename("/dav/dir/file.txt"));
        CPPUNIT_ASSERT_EQUAL(string("dir"), getBasename("/dav/dir/"));
        CPPUNIT_ASSERT_EQUAL(string("/dav"), getDirname("/dav/dir/"));
    }

    void strip() {
        CPPUNIT_ASSERT_EQUAL(string("a b"), StripSpace(" \n\ta b \r\n"));
        CPPUNIT_ASSERT_EQUAL(string(""), StripSpace("  "));
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(PathTest);

class ExceptionTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ExceptionTest);
    CPPUNIT_TEST(explanation);
    CPPUNIT_TEST(classification);
    CPPUNIT_TEST_SUITE_END();

    void explanation() {
        string error;
        try {
            ProtocolException ex(__FILE__, __LINE__, "Locked", "PUT", "http://host/a", 423);
            std::list<string> conditions;
            conditions.push_back("lock-token-submitted");
            ex.setConditions(conditions, "");
            throw ex;
        } catch (...) {
            Exception::handle(NULL, &error, Logger::DEBUG);
        }
        CPPUNIT_ASSERT_EQUAL(string("PUT http://host/a: Locked (lock-token-submitted)"), error);
    }

    void classification() {
        ProtocolException notFound(__FILE__, __LINE__, "Not Found", "GET", "/x", 404);
        CPPUNIT_ASSERT(notFound.isClientError());
        CPPUNIT_ASSERT(notFound.isNotFound());
        CPPUNIT_ASSERT(!notFound.isServerError());
        CPPUNIT_ASSERT_EQUAL(string(""), notFound.firstCondition());

        ProtocolException failed(__FILE__, __LINE__, "Bad Gateway", "GET", "/x", 502);
        CPPUNIT_ASSERT(failed.isServerError());
        CPPUNIT_ASSERT(!failed.isClientError());
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(ExceptionTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
