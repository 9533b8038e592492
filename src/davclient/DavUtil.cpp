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

#include <davclient/DavUtil.h>
#include <davclient/SmartPtr.h>
#include <davclient/util.h>

#include <ne_dates.h>
#include <ne_string.h>

#include <boost/algorithm/string/case_conv.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

std::string depthToString(int depth)
{
    switch (depth) {
    case 0:
        return "0";
    case DEPTH_INFINITY:
        return "infinity";
    default:
        // 1 and everything unknown
        return "1";
    }
}

int parseDepth(const std::string &depth)
{
    std::string lower = boost::to_lower_copy(depth);
    if (lower == "0") {
        return 0;
    } else if (lower == "infinity") {
        return DEPTH_INFINITY;
    } else {
        return 1;
    }
}

std::string getMimeType(const std::string &filename)
{
    static const struct {
        const char *m_suffix;
        const char *m_type;
    } types[] = {
        { "txt", "text/plain" },
        { "html", "text/html" },
        { "htm", "text/html" },
        { "css", "text/css" },
        { "js", "application/javascript" },
        { "json", "application/json" },
        { "xml", "application/xml" },
        { "pdf", "application/pdf" },
        { "zip", "application/zip" },
        { "jpg", "image/jpeg" },
        { "jpeg", "image/jpeg" },
        { "png", "image/png" },
        { "gif", "image/gif" },
        { "svg", "image/svg+xml" },
        { "mp3", "audio/mpeg" },
        { "mp4", "video/mp4" },
        { "avi", "video/x-msvideo" },
        { NULL, NULL }
    };

    size_t dot = filename.rfind('.');
    std::string suffix = boost::to_lower_copy(dot == filename.npos ? filename : filename.substr(dot + 1));
    for (int i = 0; types[i].m_suffix; i++) {
        if (suffix == types[i].m_suffix) {
            return types[i].m_type;
        }
    }
    return "application/octet-stream";
}

std::string basicAuthValue(const std::string &username, const std::string &password)
{
    std::string credentials = username + ":" + password;
    SmartPtr<char *> blob(ne_base64((const unsigned char *)credentials.c_str(), credentials.size()));
    return std::string("Basic ") + blob.get();
}

std::string formatHttpDate(time_t date)
{
    SmartPtr<char *> str(ne_rfc1123_date(date), "date");
    return str.get();
}

time_t parseHttpDate(const std::string &date)
{
    if (date.empty()) {
        return (time_t)-1;
    }
    time_t res = ne_iso8601_parse(date.c_str());
    if (res == (time_t)-1) {
        res = ne_httpdate_parse(date.c_str());
    }
    return res;
}

#ifdef ENABLE_UNIT_TESTS

class DavUtilTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DavUtilTest);
    CPPUNIT_TEST(depth);
    CPPUNIT_TEST(mime);
    CPPUNIT_TEST(basic);
    CPPUNIT_TEST(dates);
    CPPUNIT_TEST_SUITE_END();

    void depth() {
        CPPUNIT_ASSERT_EQUAL(std::string("0"), depthToString(0));
        CPPUNIT_ASSERT_EQUAL(std::string("1"), depthToString(1));
        CPPUNIT_ASSERT_EQUAL(std::string("infinity"), depthToString(DEPTH_INFINITY));
        CPPUNIT_ASSERT_EQUAL(std::string("1"), depthToString(2));
        CPPUNIT_ASSERT_EQUAL(std::string("1"), depthToString(-5));

        CPPUNIT_ASSERT_EQUAL(0, parseDepth(depthToString(0)));
        CPPUNIT_ASSERT_EQUAL(1, parseDepth(depthToString(1)));
        CPPUNIT_ASSERT_EQUAL(DEPTH_INFINITY, parseDepth(depthToString(DEPTH_INFINITY)));
        CPPUNIT_ASSERT_EQUAL(DEPTH_INFINITY, parseDepth("Infinity"));
        CPPUNIT_ASSERT_EQUAL(1, parseDepth("bogus"));
    }

    void mime() {
        CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), getMimeType("notes.TXT"));
        CPPUNIT_ASSERT_EQUAL(std::string("image/jpeg"), getMimeType("/a/b/photo.jpeg"));
        CPPUNIT_ASSERT_EQUAL(std::string("application/octet-stream"), getMimeType("archive.tar.xz"));
        CPPUNIT_ASSERT_EQUAL(std::string("application/octet-stream"), getMimeType("README"));
    }

    void basic() {
        CPPUNIT_ASSERT_EQUAL(std::string("Basic dXNlcjpwYXNz"), basicAuthValue("user", "pass"));
    }

    void dates() {
        time_t date = parseHttpDate("Tue, 15 Nov 1994 08:12:31 GMT");
        CPPUNIT_ASSERT_EQUAL((time_t)784887151, date);
        CPPUNIT_ASSERT_EQUAL(std::string("Tue, 15 Nov 1994 08:12:31 GMT"), formatHttpDate(date));
        CPPUNIT_ASSERT_EQUAL((time_t)784887151, parseHttpDate("1994-11-15T08:12:31Z"));
        CPPUNIT_ASSERT_EQUAL((time_t)-1, parseHttpDate("yesterday"));
        CPPUNIT_ASSERT_EQUAL((time_t)-1, parseHttpDate(""));
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(DavUtilTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
