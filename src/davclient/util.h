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

#ifndef INCL_DAV_UTIL
#define INCL_DAV_UTIL

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <stdarg.h>

#include <map>
#include <list>
#include <vector>
#include <string>
#include <stdexcept>
#include <functional>

#include <davclient/Logging.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/** case-insensitive less than for associative containers */
template <class T> class Nocase : public std::binary_function<T, T, bool> {
public:
    bool operator()(const T &x, const T &y) const { return boost::ilexicographical_compare(x, y); }
};

/** case-insensitive equals */
template <class T> class Iequals : public std::binary_function<T, T, bool> {
public:
    bool operator()(const T &x, const T &y) const { return boost::iequals(x, y); }
};

/** shorthand, primarily useful for BOOST_FOREACH macro */
typedef std::pair<std::string, std::string> StringPair;
typedef std::map<std::string, std::string> StringMap;

/**
 * remove multiple slashes in a row and dots directly after a slash if not followed by filename,
 * remove trailing /
 */
std::string normalizePath(const std::string &path);

/**
 * Returns last component of path. Trailing slash is ignored.
 * Empty if path is empty.
 */
std::string getBasename(const std::string &path);

/**
 * Returns path without the last component. Empty if nothing left.
 */
std::string getDirname(const std::string &path);

/**
 * Splits path into directory and file part. Trailing slashes
 * are stripped first.
 */
void splitPath(const std::string &path, std::string &dir, std::string &file);

/**
 * Concatenates two path fragments with exactly one slash between
 * them. An empty fragment contributes nothing.
 */
std::string joinPaths(const std::string &base, const std::string &path);

/**
 * Read complete file into string.
 *
 * @return true for success, false otherwise
 */
bool ReadFile(const std::string &filename, std::string &content);

/**
 * Removes leading and trailing white space.
 */
std::string StripSpace(const std::string &str);

/**
 * This macro has to be used instead of CPPUNIT_TEST_SUITE_REGISTRATION:
 * it registers the suite in the "DavClient" registry and creates
 * a symbol that TestMain.cpp can check to see that the object file
 * was linked in.
 *
 * Use it like this:
 * @verbatim
   #ifdef ENABLE_UNIT_TESTS
   # include "test.h"
   class Foo : public CppUnit::TestFixture {
       CPPUNIT_TEST_SUITE(Foo);
       CPPUNIT_TEST(testBar);
       CPPUNIT_TEST_SUITE_END();

     public:
       void testBar();
   };
   DAVCLIENT_TEST_SUITE_REGISTRATION(Foo);
   #endif
   @endverbatim
 */
#define DAVCLIENT_TEST_SUITE_REGISTRATION( ATestFixtureType ) \
    CPPUNIT_TEST_SUITE_NAMED_REGISTRATION( ATestFixtureType, "DavClient" ); \
    extern "C" { int davclientAutoRegisterRegistry ## ATestFixtureType = 12345; }

std::string StringPrintf(const char *format, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 1, 2)))
#endif
;
std::string StringPrintfV(const char *format, va_list ap);

/**
 * an exception which records the source file and line
 * where it was thrown
 */
class Exception : public std::runtime_error
{
 public:
    Exception(const std::string &file,
              int line,
              const std::string &what) :
    std::runtime_error(what),
        m_file(file),
        m_line(line)
        {}
    ~Exception() throw() {}
    const std::string m_file;
    const int m_line;

    /**
     * Convenience function, to be called inside a catch(..) block.
     *
     * Rethrows the exception to determine what it is, then logs it
     * at the chosen level (error by default).
     *
     * @param logger    the class which does the logging
     * @retval explanation   set to explanation for problem, if non-NULL
     * @param level     level to be used for logging
     */
    static void handle(Logger *logger = NULL, std::string *explanation = NULL, Logger::Level level = Logger::ERROR);
    static void handle(std::string &explanation) { handle(NULL, &explanation); }
    static void log() { handle(NULL, NULL, Logger::DEBUG); }
};

/**
 * Base class of everything that went wrong while talking to the
 * WebDAV server. Remembers which request failed.
 */
class DavException : public Exception
{
 public:
    DavException(const std::string &file,
                 int line,
                 const std::string &what,
                 const std::string &method,
                 const std::string &url) :
    Exception(file, line, what),
        m_method(method),
        m_url(url)
        {}
    ~DavException() throw() {}

    const std::string &getMethod() const { return m_method; }
    const std::string &getURL() const { return m_url; }

 private:
    std::string m_method;
    std::string m_url;
};

/**
 * The server could not be reached or the connection broke down:
 * DNS lookup, connect, timeout, reset. The caller may retry.
 */
class NetworkException : public DavException
{
 public:
    NetworkException(const std::string &file,
                     int line,
                     const std::string &what,
                     const std::string &method,
                     const std::string &url) :
    DavException(file, line, what, method, url)
    {}
    ~NetworkException() throw() {}
};

/**
 * The server answered with a status other than 2xx or 207.
 * Holds the raw body and the condition names found in a
 * DAV:error body, if there was one.
 */
class ProtocolException : public DavException
{
 public:
    ProtocolException(const std::string &file,
                      int line,
                      const std::string &what,
                      const std::string &method,
                      const std::string &url,
                      int status,
                      const std::string &body = "") :
    DavException(file, line, what, method, url),
        m_status(status),
        m_body(body)
        {}
    ~ProtocolException() throw() {}

    int getStatus() const { return m_status; }
    const std::string &getBody() const { return m_body; }
    const std::list<std::string> &getConditions() const { return m_conditions; }
    const std::string &getDescription() const { return m_description; }

    void setConditions(const std::list<std::string> &conditions,
                       const std::string &description) {
        m_conditions = conditions;
        m_description = description;
    }

    bool isClientError() const { return m_status >= 400 && m_status < 500; }
    bool isServerError() const { return m_status >= 500; }
    bool isNotFound() const { return m_status == 404; }

    /** first condition, empty if none */
    std::string firstCondition() const { return m_conditions.empty() ? "" : m_conditions.front(); }

 private:
    int m_status;
    std::string m_body;
    std::list<std::string> m_conditions;
    std::string m_description;
};

/**
 * 3xx status: not followed automatically, the caller decides
 * whether the new location is acceptable.
 */
class RedirectException : public ProtocolException
{
 public:
    RedirectException(const std::string &file,
                      int line,
                      const std::string &what,
                      const std::string &method,
                      const std::string &url,
                      int status,
                      const std::string &location) :
    ProtocolException(file, line, what, method, url, status),
        m_location(location)
        {}
    ~RedirectException() throw() {}

    /** the new URL, from the Location header */
    const std::string &getLocation() const { return m_location; }

 private:
    std::string m_location;
};

/**
 * 401 after the single retry, or a challenge that cannot be
 * answered because the request body cannot be sent again.
 */
class AuthenticationException : public DavException
{
 public:
    AuthenticationException(const std::string &file,
                            int line,
                            const std::string &what,
                            const std::string &method,
                            const std::string &url) :
    DavException(file, line, what, method, url)
    {}
    ~AuthenticationException() throw() {}
};

/**
 * The response body is not well-formed XML or lacks an element
 * that has to be there.
 */
class MalformedResponseException : public DavException
{
 public:
    MalformedResponseException(const std::string &file,
                               int line,
                               const std::string &what,
                               const std::string &method = "",
                               const std::string &url = "") :
    DavException(file, line, what, method, url)
    {}
    ~MalformedResponseException() throw() {}
};

/**
 * mapping from int flag to explanation
 */
struct Flag {
    int m_flag;
    const char *m_description;
};

/**
 * turn flags into comma separated list of explanations
 *
 * @param flags     bit mask
 * @param descr     array with zero m_flag as end marker
 * @param sep       used to join m_description strings
 */
std::string Flags2String(int flags, const Flag *descr, const std::string &sep = ", ");

/** throw a normal DavClient Exception, including source information */
#define DAV_THROW(_what) \
    DAV_THROW_EXCEPTION(DavClient::Exception, _what)

/** throw a class which accepts file, line, what parameters */
#define DAV_THROW_EXCEPTION(_class,  _what) \
    throw _class(__FILE__, __LINE__, _what)

/** throw a class which accepts file, line, what plus 1 additional parameter */
#define DAV_THROW_EXCEPTION_1(_class,  _what, _x1)   \
    throw _class(__FILE__, __LINE__, (_what), (_x1))

/** throw a class which accepts file, line, what plus 2 additional parameters */
#define DAV_THROW_EXCEPTION_2(_class,  _what, _x1, _x2) \
    throw _class(__FILE__, __LINE__, (_what), (_x1), (_x2))

/** throw a class which accepts file, line, what plus 3 additional parameters */
#define DAV_THROW_EXCEPTION_3(_class,  _what, _x1, _x2, _x3) \
    throw _class(__FILE__, __LINE__, (_what), (_x1), (_x2), (_x3))

/** throw a class which accepts file, line, what plus 4 additional parameters */
#define DAV_THROW_EXCEPTION_4(_class,  _what, _x1, _x2, _x3, _x4) \
    throw _class(__FILE__, __LINE__, (_what), (_x1), (_x2), (_x3), (_x4))

DAV_END_CXX
#endif // INCL_DAV_UTIL
