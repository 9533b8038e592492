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

#include <davclient/Locks.h>
#include <davclient/Codec.h>
#include <davclient/DavUtil.h>
#include <davclient/Logging.h>

#include <boost/foreach.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include "ScriptedTransport.h"
# include <boost/scoped_ptr.hpp>
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

const int LockManager::DEFAULT_TIMEOUT;

std::string LockManager::extractToken(const HTTPResponse &response)
{
    std::string token = decodeLockToken(response.m_body);
    if (token.empty()) {
        token = StripSpace(response.getHeader("Lock-Token"));
        if (token.size() >= 2 &&
            token[0] == '<' &&
            token[token.size() - 1] == '>') {
            token = token.substr(1, token.size() - 2);
        }
    }
    return token;
}

std::string LockManager::acquireLock(const std::string &url,
                                     int timeoutSeconds,
                                     const std::string &owner,
                                     bool exclusive)
{
    HTTPRequest request("LOCK", url);
    request.m_headers["Content-Type"] = "application/xml; charset=utf-8";
    request.m_headers["Timeout"] = StringPrintf("Second-%d", timeoutSeconds);
    request.m_body = encodeLockInfo(owner.empty() ? "davclient" : owner, exclusive);
    HTTPResponse response;
    m_dispatcher.execute(request, response);

    std::string token;
    try {
        token = extractToken(response);
    } catch (const MalformedResponseException &ex) {
        throw MalformedResponseException(ex.m_file, ex.m_line, ex.what(),
                                         request.m_method, request.m_url);
    }
    if (token.empty()) {
        DAV_THROW_EXCEPTION_2(MalformedResponseException,
                              "lock token not found in response",
                              request.m_method, request.m_url);
    }
    DAV_LOG_DEBUG(NULL, NULL, "locked %s: %s", request.m_url.c_str(), token.c_str());
    return token;
}

std::string LockManager::refreshLock(const std::string &url,
                                     const std::string &token,
                                     int timeoutSeconds)
{
    HTTPRequest request("LOCK", url);
    request.m_headers["If"] = ifHeader(token);
    request.m_headers["Timeout"] = StringPrintf("Second-%d", timeoutSeconds);
    HTTPResponse response;
    m_dispatcher.execute(request, response);

    std::string newToken;
    try {
        newToken = extractToken(response);
    } catch (const MalformedResponseException &ex) {
        DAV_LOG_DEBUG(NULL, NULL, "%s %s: no lock token in response: %s",
                      request.m_method.c_str(), request.m_url.c_str(), ex.what());
    }
    if (newToken.empty()) {
        DAV_LOG_DEBUG(NULL, NULL, "refreshed %s, keeping token %s", request.m_url.c_str(), token.c_str());
        return token;
    }
    return newToken;
}

void LockManager::releaseLock(const std::string &url, const std::string &token)
{
    Headers headers;
    headers["Lock-Token"] = lockTokenHeader(token);
    m_dispatcher.execute("UNLOCK", url, headers);
}

std::list<ActiveLock> LockManager::discoverLocks(const std::string &url)
{
    std::list<std::string> props;
    props.push_back("lockdiscovery");
    Headers headers;
    headers["Depth"] = "0";
    Multistatus ms = m_dispatcher.executeMultistatus("PROPFIND", url, headers, encodePropfind(props));

    std::list<ActiveLock> locks;
    BOOST_FOREACH(const Response &response, ms.m_responses) {
        const XMLElement *lockdiscovery = response.findProperty("lockdiscovery");
        if (lockdiscovery) {
            std::list<ActiveLock> found = decodeActiveLocks(*lockdiscovery);
            locks.splice(locks.end(), found);
        }
    }
    return locks;
}

std::string LockManager::getVersionHistory(const std::string &url)
{
    std::list<std::string> props;
    props.push_back("version-history");
    Headers headers;
    headers["Depth"] = "0";
    Multistatus ms = m_dispatcher.executeMultistatus("PROPFIND", url, headers, encodePropfind(props));
    if (ms.m_responses.empty()) {
        return "";
    }
    const XMLElement *history = ms.m_responses.front().findProperty("version-history");
    if (!history) {
        return "";
    }
    std::string href = history->getDescendantText("href");
    return href.empty() ? history->getText() : href;
}

std::string LockManager::resolveVersion(const std::string &url, const std::string &version)
{
    try {
        std::string history = getVersionHistory(url);
        if (!history.empty()) {
            return m_dispatcher.execute("GET", m_dispatcher.resolveHref(joinPaths(history, version))).m_body;
        }
        DAV_LOG_DEBUG(NULL, NULL, "%s: no version history", url.c_str());
    } catch (const DavException &ex) {
        DAV_LOG_WARNING(NULL, NULL, "%s: version %s not found in history, trying Label header: %s",
                        url.c_str(), version.c_str(), ex.what());
    }

    Headers headers;
    headers["Label"] = version;
    return m_dispatcher.execute("GET", url, headers).m_body;
}

#ifdef ENABLE_UNIT_TESTS

class LocksTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(LocksTest);
    CPPUNIT_TEST(acquire);
    CPPUNIT_TEST(acquireWithoutToken);
    CPPUNIT_TEST(refresh);
    CPPUNIT_TEST(release);
    CPPUNIT_TEST(discover);
    CPPUNIT_TEST(version);
    CPPUNIT_TEST(versionFallback);
    CPPUNIT_TEST_SUITE_END();

    boost::shared_ptr<ScriptedTransport> m_transport;
    boost::scoped_ptr<Dispatcher> m_dispatcher;
    boost::scoped_ptr<LockManager> m_locks;

public:
    void setUp() {
        m_transport.reset(new ScriptedTransport);
        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav";
        m_dispatcher.reset(new Dispatcher(config, m_transport,
                                          boost::shared_ptr<Negotiator>(new Negotiator)));
        m_locks.reset(new LockManager(*m_dispatcher));
    }

    void tearDown() {
        m_locks.reset();
        m_dispatcher.reset();
        m_transport.reset();
    }

private:
    static std::string lockBody(const std::string &token) {
        return
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<prop xmlns=\"DAV:\"><lockdiscovery><activelock>"
            "<locktype><write/></locktype><lockscope><exclusive/></lockscope>"
            "<depth>0</depth><timeout>Second-600</timeout>"
            "<locktoken><href>" + token + "</href></locktoken>"
            "</activelock></lockdiscovery></prop>";
    }

    void acquire() {
        m_transport->reply(200, lockBody("opaquelocktoken:1"));
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:1"),
                             m_locks->acquireLock("/file.txt", 600, "alice"));
        const HTTPRequest &request = m_transport->m_requests.back();
        CPPUNIT_ASSERT_EQUAL(std::string("LOCK"), request.m_method);
        Headers headers = request.m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("Second-600"), headers["Timeout"]);
        XMLElement::Ptr body = XMLElement::parse(request.m_body);
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), body->getDescendantText("owner"));
        CPPUNIT_ASSERT(body->findDescendant("exclusive"));

        // token only in the header
        Headers lockToken;
        lockToken["Lock-Token"] = "<opaquelocktoken:2>";
        m_transport->reply(201, "", lockToken);
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:2"), m_locks->acquireLock("/new.txt"));
        headers = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("Second-3600"), headers["Timeout"]);
    }

    void acquireWithoutToken() {
        m_transport->reply(200, "<D:prop xmlns:D=\"DAV:\"/>");
        CPPUNIT_ASSERT_THROW(m_locks->acquireLock("/file.txt"), MalformedResponseException);
        m_transport->reply(423);
        CPPUNIT_ASSERT_THROW(m_locks->acquireLock("/file.txt"), ProtocolException);
    }

    void refresh() {
        m_transport->reply(200);
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:old"),
                             m_locks->refreshLock("/file.txt", "opaquelocktoken:old"));
        const HTTPRequest &request = m_transport->m_requests.back();
        CPPUNIT_ASSERT(request.m_body.empty());
        Headers headers = request.m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("(<opaquelocktoken:old>)"), headers["If"]);

        m_transport->reply(200, lockBody("opaquelocktoken:new"));
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:new"),
                             m_locks->refreshLock("/file.txt", "opaquelocktoken:old"));

        // plain text instead of XML
        Headers text;
        text["Content-Type"] = "text/plain";
        m_transport->reply(200, "Lock refreshed", text);
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:old"),
                             m_locks->refreshLock("/file.txt", "opaquelocktoken:old"));
    }

    void release() {
        m_transport->reply(204);
        m_locks->releaseLock("/file.txt", "opaquelocktoken:1");
        Headers headers = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("<opaquelocktoken:1>"), headers["Lock-Token"]);
        CPPUNIT_ASSERT_EQUAL(std::string("UNLOCK"), m_transport->m_requests.back().m_method);

        m_transport->reply(409);
        CPPUNIT_ASSERT_THROW(m_locks->releaseLock("/file.txt", "opaquelocktoken:1"), ProtocolException);
    }

    void discover() {
        m_transport->reply(207,
                           "<d:multistatus xmlns:d=\"DAV:\"><d:response><d:href>/dav/file.txt</d:href>"
                           "<d:propstat><d:prop><d:lockdiscovery>"
                           "<d:activelock><d:lockscope><d:shared/></d:lockscope>"
                           "<d:locktoken><d:href>opaquelocktoken:a</d:href></d:locktoken></d:activelock>"
                           "<d:activelock><d:lockscope><d:shared/></d:lockscope>"
                           "<d:locktoken><d:href>opaquelocktoken:b</d:href></d:locktoken></d:activelock>"
                           "</d:lockdiscovery></d:prop><d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                           "</d:response></d:multistatus>");
        std::list<ActiveLock> locks = m_locks->discoverLocks("/file.txt");
        CPPUNIT_ASSERT_EQUAL((size_t)2, locks.size());
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:b"), locks.back().m_token);
        Headers headers = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("0"), headers["Depth"]);
    }

    void version() {
        m_transport->reply(207,
                           "<D:multistatus xmlns:D=\"DAV:\"><D:response><D:href>/dav/doc.txt</D:href>"
                           "<D:propstat><D:prop><D:version-history><D:href>/dav/his/17/</D:href></D:version-history></D:prop>"
                           "<D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
                           "</D:response></D:multistatus>");
        m_transport->reply(200, "version two");
        CPPUNIT_ASSERT_EQUAL(std::string("version two"), m_locks->resolveVersion("/doc.txt", "2"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/his/17/2"), m_transport->m_requests.back().m_url);
    }

    void versionFallback() {
        // PROPFIND not supported
        m_transport->reply(405);
        m_transport->reply(200, "labelled");
        CPPUNIT_ASSERT_EQUAL(std::string("labelled"), m_locks->resolveVersion("/doc.txt", "V1"));
        Headers headers = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("V1"), headers["Label"]);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/doc.txt"), m_transport->m_requests.back().m_url);

        // property missing
        m_transport->reply(207,
                           "<D:multistatus xmlns:D=\"DAV:\"><D:response><D:href>/dav/doc.txt</D:href>"
                           "<D:propstat><D:prop><D:version-history/></D:prop>"
                           "<D:status>HTTP/1.1 404 Not Found</D:status></D:propstat>"
                           "</D:response></D:multistatus>");
        m_transport->reply(200, "labelled again");
        CPPUNIT_ASSERT_EQUAL(std::string("labelled again"), m_locks->resolveVersion("/doc.txt", "V1"));

        // version missing in the history, then also by label
        m_transport->reply(207,
                           "<D:multistatus xmlns:D=\"DAV:\"><D:response><D:href>/dav/doc.txt</D:href>"
                           "<D:propstat><D:prop><D:version-history><D:href>/dav/his/17</D:href></D:version-history></D:prop>"
                           "<D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
                           "</D:response></D:multistatus>");
        m_transport->reply(404);
        m_transport->reply(404);
        try {
            m_locks->resolveVersion("/doc.txt", "V9");
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT(ex.isNotFound());
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/doc.txt"), ex.getURL());
        }
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(LocksTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
