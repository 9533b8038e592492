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

#include <davclient/Config.h>
#include <davclient/Logging.h>

#include <fstream>
#include <errno.h>
#include <string.h>
#include <strings.h>
#include <stdio.h>
#include <ctype.h>
#include <sys/stat.h>

#include <boost/foreach.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
using namespace std;
DAV_BEGIN_CXX

boost::shared_ptr<ConfigNode> ConfigNode::createFileNode(const string &filename)
{
    string dir, file;
    splitPath(filename, dir, file);
    return boost::shared_ptr<ConfigNode>(new IniFileConfigNode(dir.empty() ? "." : dir, file, false));
}

IniFileConfigNode::IniFileConfigNode(const string &path, const string &fileName, bool readonly) :
    m_path(path),
    m_fileName(fileName),
    m_readonly(readonly),
    m_exists(false),
    m_modified(false)
{
    read();
}

void IniFileConfigNode::read()
{
    string filename = m_path + "/" + m_fileName;
    ifstream file(filename.c_str());

    m_lines.clear();
    m_exists = file.good();
    string line;
    while (getline(file, line)) {
        m_lines.push_back(line);
    }
    m_modified = false;
}

void IniFileConfigNode::flush()
{
    if (!m_modified) {
        return;
    }

    if (m_readonly) {
        DAV_THROW(getName() + ": internal error: flushing read-only config node not allowed");
    }

    string filename = m_path + "/" + m_fileName;
    string tmpFilename = m_path + "/.#" + m_fileName;

    FILE *file = fopen(tmpFilename.c_str(), "w");
    if (file) {
        BOOST_FOREACH(const string &line, m_lines) {
            fprintf(file, "%s\n", line.c_str());
        }
        fflush(file);
        bool failed = ferror(file);
        if (fclose(file)) {
            failed = true;
        }
        if (failed ||
            rename(tmpFilename.c_str(), filename.c_str())) {
            DAV_THROW(tmpFilename + ": " + strerror(errno));
        }
    } else {
        DAV_THROW(tmpFilename + ": " + strerror(errno));
    }

    m_modified = false;
    m_exists = true;
}

/**
 * get property and value from line, if any present
 */
static bool getContent(const string &line,
                       string &property,
                       string &value,
                       bool &isComment,
                       bool fuzzyComments)
{
    size_t start = 0;
    while (start < line.size() &&
           isspace(line[start])) {
        start++;
    }

    // empty line?
    if (start == line.size()) {
        return false;
    }

    // Comment? Potentially keep reading, might be commented out assignment.
    isComment = false;
    if (line[start] == '#') {
        if (!fuzzyComments) {
            return false;
        }
        isComment = true;
    }

    // recognize # <word> = <value> as commented out (= default) value
    if (isComment) {
        start++;
        while (start < line.size() &&
               isspace(line[start])) {
            start++;
        }
    }

    // extract property
    size_t end = start;
    while (end < line.size() &&
           !isspace(line[end]) &&
           line[end] != '=') {
        end++;
    }
    property = line.substr(start, end - start);

    // skip assignment
    start = end;
    while (start < line.size() &&
           isspace(line[start])) {
        start++;
    }
    if (start == line.size() ||
        line[start] != '=') {
        // invalid syntax or we tried to read a comment as assignment
        return false;
    }

    // extract value, without the white space users tend to add
    value = StripSpace(line.substr(start + 1));
    return !property.empty();
}

/**
 * check whether the line contains the property and if so, extract its value
 */
static bool getValue(const string &line,
                     const string &property,
                     string &value,
                     bool &isComment,
                     bool fuzzyComments)
{
    string curProp;
    return getContent(line, curProp, value, isComment, fuzzyComments) &&
        !strcasecmp(curProp.c_str(), property.c_str());
}

bool IniFileConfigNode::readProperty(const string &property, string &value) const
{
    BOOST_FOREACH(const string &line, m_lines) {
        bool isComment;
        string curValue;
        if (getValue(line, property, curValue, isComment, false)) {
            value = curValue;
            return true;
        }
    }
    return false;
}

void IniFileConfigNode::readProperties(StringMap &props) const
{
    string value, property;

    BOOST_FOREACH(const string &line, m_lines) {
        bool isComment;
        if (getContent(line, property, value, isComment, false)) {
            // only the first instance of the property counts
            props.insert(StringPair(property, value));
        }
    }
}

void IniFileConfigNode::removeProperty(const string &property)
{
    string value;

    list<string>::iterator it = m_lines.begin();
    while (it != m_lines.end()) {
        bool isComment;
        if (getValue(*it, property, value, isComment, false)) {
            it = m_lines.erase(it);
            m_modified = true;
        } else {
            ++it;
        }
    }
}

void IniFileConfigNode::writeProperty(const string &property,
                                      const string &newvalue,
                                      const string &comment)
{
    string newstr = property + " = " + newvalue;
    string oldvalue;

    BOOST_FOREACH(string &line, m_lines) {
        bool isComment;

        if (getValue(line, property, oldvalue, isComment, true)) {
            if (newvalue != oldvalue || isComment) {
                line = newstr;
                m_modified = true;
            }
            return;
        }
    }

    // add each line of the comment as separate line in .ini file
    if (comment.size()) {
        list<string> commentLines;
        boost::split(commentLines, comment, boost::is_any_of("\n"));
        if (m_lines.size()) {
            m_lines.push_back("");
        }
        BOOST_FOREACH(const string &commentLine, commentLines) {
            m_lines.push_back(string("# ") + commentLine);
        }
    }

    m_lines.push_back(newstr);
    m_modified = true;
}

ClientConfig::ClientConfig() :
    m_preemptive(false),
    m_compression(false),
    m_ignoreCookies(false),
    m_timeoutSeconds(300),
    m_verifySSLHost(true),
    m_verifySSLCertificate(true),
    m_logLevel(0)
{
    m_headers["User-Agent"] = "DavClient/1.0";
    m_headers["Accept"] = "*/*";
}

ClientConfig ClientConfig::fromNode(const ConfigNode &node)
{
    ClientConfig config;

    node.getProperty("url", config.m_baseUrl);
    while (config.m_baseUrl.size() > 1 &&
           config.m_baseUrl[config.m_baseUrl.size() - 1] == '/') {
        config.m_baseUrl.resize(config.m_baseUrl.size() - 1);
    }
    node.getProperty("username", config.m_username);
    node.getProperty("password", config.m_password);
    node.getProperty("domain", config.m_domain);
    node.getProperty("workstation", config.m_workstation);
    node.getProperty("preemptive", config.m_preemptive);
    node.getProperty("compression", config.m_compression);
    node.getProperty("ignoreCookies", config.m_ignoreCookies);
    node.getProperty("timeout", config.m_timeoutSeconds);
    bool verify;
    if (node.getProperty("verifySSL", verify)) {
        config.m_verifySSLHost =
            config.m_verifySSLCertificate = verify;
    }
    node.getProperty("proxy", config.m_proxy);
    node.getProperty("loglevel", config.m_logLevel);
    string userAgent;
    if (node.getProperty("userAgent", userAgent) &&
        !userAgent.empty()) {
        config.m_headers["User-Agent"] = userAgent;
    }
    if (config.m_compression) {
        config.m_headers["Accept-Encoding"] = "gzip, deflate";
    }

    DAV_LOG_DEBUG(NULL, NULL, "%s: url '%s', user '%s', compression %s, timeout %ds",
                  node.getName().c_str(),
                  config.m_baseUrl.c_str(),
                  config.m_username.c_str(),
                  config.m_compression ? "on" : "off",
                  config.m_timeoutSeconds);
    return config;
}

#ifdef ENABLE_UNIT_TESTS

class ConfigTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ConfigTest);
    CPPUNIT_TEST(parse);
    CPPUNIT_TEST(writeBack);
    CPPUNIT_TEST(clientConfig);
    CPPUNIT_TEST_SUITE_END();

    string m_dir;

public:
    void setUp() {
        m_dir = "ConfigTest.dir";
        mkdir(m_dir.c_str(), S_IRWXU);
        unlink((m_dir + "/client.ini").c_str());
    }

    void tearDown() {
        unlink((m_dir + "/client.ini").c_str());
        rmdir(m_dir.c_str());
    }

private:
    void writeFile(const string &content) {
        ofstream out((m_dir + "/client.ini").c_str());
        out << content;
    }

    void parse() {
        writeFile("# connection\n"
                  "url = http://example.com/dav/  \n"
                  "  Username=alice\n"
                  "# password = secret\n"
                  "timeout = 30\n"
                  "broken line\n"
                  "url = http://other.com/\n");
        IniFileConfigNode node(m_dir, "client.ini", true);
        CPPUNIT_ASSERT(node.exists());

        string value;
        CPPUNIT_ASSERT(node.getProperty("url", value));
        CPPUNIT_ASSERT_EQUAL(string("http://example.com/dav/"), value);
        CPPUNIT_ASSERT(node.getProperty("username", value));
        CPPUNIT_ASSERT_EQUAL(string("alice"), value);
        CPPUNIT_ASSERT(!node.getProperty("password", value));

        int timeout = 0;
        CPPUNIT_ASSERT(node.getProperty("timeout", timeout));
        CPPUNIT_ASSERT_EQUAL(30, timeout);
        CPPUNIT_ASSERT(!node.getProperty("username", timeout));

        StringMap props;
        node.readProperties(props);
        CPPUNIT_ASSERT_EQUAL((size_t)3, props.size());
        CPPUNIT_ASSERT_EQUAL(string("http://example.com/dav/"), props["url"]);

        IniFileConfigNode missing(m_dir, "none.ini", true);
        CPPUNIT_ASSERT(!missing.exists());
        CPPUNIT_ASSERT(!missing.getProperty("url", value));
    }

    void writeBack() {
        writeFile("# connection\n"
                  "url = http://example.com/dav\n"
                  "# password = secret\n");
        {
            IniFileConfigNode node(m_dir, "client.ini", false);
            node.setProperty("password", "hidden");
            node.setProperty("preemptive", true);
            node.setProperty("timeout", 60, "request timeout\nin seconds");
            node.removeProperty("url");
            node.flush();
        }
        string content;
        CPPUNIT_ASSERT(ReadFile(m_dir + "/client.ini", content));
        CPPUNIT_ASSERT_EQUAL(string("# connection\n"
                                    "password = hidden\n"
                                    "preemptive = true\n"
                                    "\n"
                                    "# request timeout\n"
                                    "# in seconds\n"
                                    "timeout = 60\n"),
                             content);

        IniFileConfigNode readonly(m_dir, "client.ini", true);
        readonly.setProperty("timeout", 61);
        CPPUNIT_ASSERT_THROW(readonly.flush(), Exception);
    }

    void clientConfig() {
        writeFile("url = https://example.com/dav/\n"
                  "username = bob\n"
                  "preemptive = yes\n"
                  "compression = 1\n"
                  "verifySSL = off\n"
                  "userAgent = test/2\n");
        ClientConfig config = ClientConfig::fromNode(IniFileConfigNode(m_dir, "client.ini", true));
        CPPUNIT_ASSERT_EQUAL(string("https://example.com/dav"), config.m_baseUrl);
        CPPUNIT_ASSERT_EQUAL(string("bob"), config.m_username);
        CPPUNIT_ASSERT(config.m_preemptive);
        CPPUNIT_ASSERT(config.m_compression);
        CPPUNIT_ASSERT(!config.m_verifySSLHost);
        CPPUNIT_ASSERT(!config.m_verifySSLCertificate);
        CPPUNIT_ASSERT_EQUAL(300, config.m_timeoutSeconds);
        CPPUNIT_ASSERT_EQUAL(string("test/2"), config.m_headers["user-agent"]);
        CPPUNIT_ASSERT_EQUAL(string("*/*"), config.m_headers["Accept"]);
        CPPUNIT_ASSERT_EQUAL(string("gzip, deflate"), config.m_headers["Accept-Encoding"]);

        ClientConfig defaults;
        CPPUNIT_ASSERT_EQUAL(string("DavClient/1.0"), defaults.m_headers["User-Agent"]);
        CPPUNIT_ASSERT(!defaults.m_compression);
        CPPUNIT_ASSERT_EQUAL((size_t)2, defaults.m_headers.size());
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(ConfigTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
