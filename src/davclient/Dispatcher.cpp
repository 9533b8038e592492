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

#include <davclient/Dispatcher.h>
#include <davclient/Transfer.h>
#include <davclient/Codec.h>
#include <davclient/Logging.h>

#include <stdlib.h>

#include <boost/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/algorithm/string/predicate.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include "ScriptedTransport.h"
# include <string.h>
# include <algorithm>
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * Receives the raw body from the transport: counts it for
 * progress, decodes the Content-Encoding and routes it either
 * to the caller or into the response.
 */
class BodySink
{
 public:
    BodySink(HTTPResponse &response,
             const ResponseReader_t &reader,
             const Progress_t &progress) :
        m_response(response),
        m_reader(reader),
        m_progress(progress),
        m_started(false),
        m_forward(false),
        m_received(0),
        m_total(-1)
    {}

    void receive(const char *data, size_t len)
    {
        if (!m_started) {
            start();
        }
        m_received += len;
        if (m_decompressor) {
            m_decompressor->feed(data, len, boost::bind(&BodySink::deliver, this, _1, _2));
        } else {
            deliver(data, len);
        }
        if (m_progress) {
            m_progress(m_received, m_total);
        }
    }

    void finish()
    {
        if (m_decompressor) {
            m_decompressor->finish();
        }
    }

 private:
    HTTPResponse &m_response;
    const ResponseReader_t &m_reader;
    const Progress_t &m_progress;
    boost::scoped_ptr<Decompressor> m_decompressor;
    bool m_started;
    bool m_forward;
    long long m_received;
    long long m_total;

    void start()
    {
        m_started = true;
        Decompressor::Encoding encoding =
            Decompressor::fromHeader(m_response.getHeader("Content-Encoding"));
        if (encoding != Decompressor::IDENTITY) {
            m_decompressor.reset(new Decompressor(encoding));
        }
        std::string length = m_response.getHeader("Content-Length");
        if (!length.empty()) {
            m_total = strtoll(length.c_str(), NULL, 10);
        }
        m_forward = m_reader &&
            m_response.m_status >= 200 && m_response.m_status < 300;
    }

    void deliver(const char *data, size_t len)
    {
        if (m_forward) {
            m_reader(data, len);
        } else {
            m_response.m_body.append(data, len);
        }
    }
};

Dispatcher::Dispatcher(const ClientConfig &config,
                       const boost::shared_ptr<HTTPTransport> &transport,
                       const boost::shared_ptr<Negotiator> &negotiator) :
    m_config(config),
    m_transport(transport),
    m_negotiator(negotiator)
{
}

std::string Dispatcher::resolveUrl(const std::string &url) const
{
    if (url.find("://") != url.npos) {
        return url;
    }
    return joinPaths(m_config.m_baseUrl, url);
}

std::string Dispatcher::resolveHref(const std::string &href) const
{
    if (href.empty() || href[0] != '/') {
        return resolveUrl(href);
    }
    const std::string &base = m_config.m_baseUrl;
    size_t scheme = base.find("://");
    if (scheme == base.npos) {
        return href;
    }
    size_t path = base.find('/', scheme + 3);
    return base.substr(0, path) + href;
}

void Dispatcher::send(const HTTPRequest &request,
                      HTTPResponse &response,
                      const ResponseReader_t &reader,
                      const Progress_t &progress) const
{
    DAV_LOG_DEBUG(NULL, NULL, "%s %s", request.m_method.c_str(), request.m_url.c_str());
    BodySink sink(response, reader, progress);
    try {
        m_transport->send(request, response, boost::bind(&BodySink::receive, &sink, _1, _2));
        sink.finish();
    } catch (const MalformedResponseException &ex) {
        if (!ex.getURL().empty()) {
            throw;
        }
        throw MalformedResponseException(ex.m_file, ex.m_line, ex.what(),
                                         request.m_method, request.m_url);
    }
    DAV_LOG_DEBUG(NULL, NULL, "%s %s: %d %s",
                  request.m_method.c_str(), request.m_url.c_str(),
                  response.m_status, response.m_reason.c_str());
}

void Dispatcher::execute(HTTPRequest &request,
                         HTTPResponse &response,
                         const ResponseReader_t &reader,
                         const Progress_t &progress) const
{
    request.m_url = resolveUrl(request.m_url);

    Headers headers = m_config.m_headers;
    if (m_config.m_compression) {
        headers["Accept-Encoding"] = "gzip, deflate";
    }
    BOOST_FOREACH(const Headers::value_type &header, m_negotiator->headersForRequest(request.m_url)) {
        headers[header.first] = header.second;
    }
    BOOST_FOREACH(const Headers::value_type &header, request.m_headers) {
        headers[header.first] = header.second;
    }
    if (m_config.m_ignoreCookies) {
        headers.erase("Cookie");
    }
    request.m_headers = headers;

    send(request, response, reader, progress);

    if (response.m_status == 401) {
        if (!request.isReplayable()) {
            DAV_THROW_EXCEPTION_2(AuthenticationException,
                                  "Authentication required. Use preemptive authentication for streaming uploads.",
                                  request.m_method, request.m_url);
        }
        std::string authorization;
        if (!m_negotiator->respondToChallenge(request.m_url, response.m_headers, authorization)) {
            DAV_THROW_EXCEPTION_2(AuthenticationException,
                                  "authentication required, no credentials available",
                                  request.m_method, request.m_url);
        }
        DAV_LOG_DEV(NULL, NULL, "%s %s: retrying with new credentials",
                    request.m_method.c_str(), request.m_url.c_str());
        request.m_headers["Authorization"] = authorization;
        if (request.m_source) {
            request.m_source->rewind();
        }
        response = HTTPResponse();
        send(request, response, reader, progress);
        if (response.m_status == 401) {
            DAV_THROW_EXCEPTION_2(AuthenticationException,
                                  "authentication failed, credentials rejected",
                                  request.m_method, request.m_url);
        }
    }

    checkStatus(request, response);
}

void Dispatcher::checkStatus(const HTTPRequest &request, const HTTPResponse &response) const
{
    int status = response.m_status;
    if (status >= 200 && status < 300) {
        return;
    }

    std::string what = response.m_reason.empty() ?
        StringPrintf("HTTP status %d", status) :
        StringPrintf("%d %s", status, response.m_reason.c_str());
    DAV_LOG_DEBUG(NULL, NULL, "%s %s failed: %s",
                  request.m_method.c_str(), request.m_url.c_str(), what.c_str());

    if (status >= 300 && status < 400) {
        DAV_THROW_EXCEPTION_4(RedirectException, what,
                              request.m_method, request.m_url,
                              status, response.getHeader("Location"));
    }

    ProtocolException ex(__FILE__, __LINE__, what,
                         request.m_method, request.m_url,
                         status, response.m_body);
    std::list<std::string> conditions;
    std::string description;
    if (decodeError(response.m_body, conditions, description)) {
        ex.setConditions(conditions, description);
    }
    throw ex;
}

HTTPResponse Dispatcher::execute(const std::string &method,
                                 const std::string &url,
                                 const Headers &headers,
                                 const std::string &body) const
{
    HTTPRequest request(method, url);
    request.m_headers = headers;
    request.m_body = body;
    HTTPResponse response;
    execute(request, response);
    return response;
}

Multistatus Dispatcher::executeMultistatus(const std::string &method,
                                           const std::string &url,
                                           const Headers &headers,
                                           const std::string &body) const
{
    HTTPRequest request(method, url);
    request.m_headers = headers;
    if (!body.empty() &&
        request.m_headers.find("Content-Type") == request.m_headers.end()) {
        request.m_headers["Content-Type"] = "application/xml; charset=utf-8";
    }
    request.m_body = body;
    HTTPResponse response;
    execute(request, response);

    if (response.m_status != 207 &&
        StripSpace(response.m_body).empty()) {
        return Multistatus();
    }
    try {
        return decodeMultistatus(response.m_body);
    } catch (const MalformedResponseException &ex) {
        throw MalformedResponseException(ex.m_file, ex.m_line, ex.what(),
                                         request.m_method, request.m_url);
    }
}

#ifdef ENABLE_UNIT_TESTS

class DispatcherTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DispatcherTest);
    CPPUNIT_TEST(resolve);
    CPPUNIT_TEST(headers);
    CPPUNIT_TEST(replay);
    CPPUNIT_TEST(replayStream);
    CPPUNIT_TEST(authFailure);
    CPPUNIT_TEST(classify);
    CPPUNIT_TEST(network);
    CPPUNIT_TEST(multistatus);
    CPPUNIT_TEST(compressed);
    CPPUNIT_TEST_SUITE_END();

    boost::shared_ptr<ScriptedTransport> m_transport;
    boost::shared_ptr<Negotiator> m_negotiator;
    boost::scoped_ptr<Dispatcher> m_dispatcher;

public:
    void setUp() {
        m_transport.reset(new ScriptedTransport);
        m_negotiator.reset(new Negotiator);
        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav";
        m_dispatcher.reset(new Dispatcher(config, m_transport, m_negotiator));
    }

    void tearDown() {
        m_dispatcher.reset();
        m_transport.reset();
        m_negotiator.reset();
    }

private:
    static size_t readOnce(std::string &data, char *buffer, size_t len) {
        size_t chunk = std::min(len, data.size());
        memcpy(buffer, data.data(), chunk);
        data.erase(0, chunk);
        return chunk;
    }

    void resolve() {
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a/b.txt"), m_dispatcher->resolveUrl("/a/b.txt"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a/b.txt"), m_dispatcher->resolveUrl("a/b.txt"));
        CPPUNIT_ASSERT_EQUAL(std::string("https://other.org/x"), m_dispatcher->resolveUrl("https://other.org/x"));

        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav/";
        Dispatcher slash(config, m_transport, m_negotiator);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a"), slash.resolveUrl("/a"));

        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a"), m_dispatcher->resolveHref("/dav/a"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a"), m_dispatcher->resolveHref("a"));
        CPPUNIT_ASSERT_EQUAL(std::string("https://other.org/x"), m_dispatcher->resolveHref("https://other.org/x"));
        config.m_baseUrl = "http://example.com:8080";
        Dispatcher root(config, m_transport, m_negotiator);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com:8080/x/y"), root.resolveHref("/x/y"));
    }

    void headers() {
        m_negotiator->setCredentialsWithDomain("u", "p", "DOM", "WS", true);
        m_transport->reply(204);
        Headers headers;
        headers["Depth"] = "1";
        headers["User-Agent"] = "custom";
        headers["Cookie"] = "session=1";
        m_dispatcher->execute("DELETE", "/file", headers);

        const HTTPRequest &request = m_transport->m_requests.front();
        CPPUNIT_ASSERT_EQUAL(std::string("DELETE"), request.m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/file"), request.m_url);
        Headers sent = request.m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("1"), sent["Depth"]);
        CPPUNIT_ASSERT_EQUAL(std::string("custom"), sent["User-Agent"]);
        CPPUNIT_ASSERT_EQUAL(std::string("*/*"), sent["Accept"]);
        CPPUNIT_ASSERT_EQUAL(std::string("Basic RE9NXHU6cA=="), sent["Authorization"]);
        CPPUNIT_ASSERT_EQUAL(std::string("WS"), sent["X-Workstation"]);
        CPPUNIT_ASSERT_EQUAL(std::string("session=1"), sent["Cookie"]);
        CPPUNIT_ASSERT(sent.find("Accept-Encoding") == sent.end());

        ClientConfig config;
        config.m_ignoreCookies = true;
        config.m_compression = true;
        Dispatcher dispatcher(config, m_transport, m_negotiator);
        m_transport->reply(204);
        dispatcher.execute("DELETE", "http://example.com/file", headers);
        sent = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT(sent.find("Cookie") == sent.end());
        CPPUNIT_ASSERT_EQUAL(std::string("gzip, deflate"), sent["Accept-Encoding"]);
    }

    void replay() {
        m_negotiator->setCredentials("u", "p");
        Headers challenge;
        challenge["WWW-Authenticate"] = "Basic realm=\"dav\"";
        m_transport->reply(401, "denied", challenge);
        m_transport->reply(201);

        HTTPRequest request("PUT", "/file.txt");
        request.m_source.reset(new StringBodySource("hello world"));
        HTTPResponse response;
        m_dispatcher->execute(request, response);

        CPPUNIT_ASSERT_EQUAL(201, response.m_status);
        CPPUNIT_ASSERT_EQUAL((size_t)2, m_transport->m_requests.size());
        CPPUNIT_ASSERT(m_transport->m_requests.front().m_headers.find("Authorization") ==
                       m_transport->m_requests.front().m_headers.end());
        Headers retried = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("Basic dTpw"), retried["Authorization"]);
        CPPUNIT_ASSERT_EQUAL(std::string("hello world"), m_transport->m_bodies.back());
    }

    void replayStream() {
        m_negotiator->setCredentials("u", "p");
        m_transport->reply(401);
        m_transport->reply(201);

        std::string data("streamed");
        HTTPRequest request("PUT", "/file.txt");
        request.m_source.reset(new CallbackBodySource(boost::bind(&DispatcherTest::readOnce, boost::ref(data), _1, _2)));
        HTTPResponse response;
        try {
            m_dispatcher->execute(request, response);
            CPPUNIT_FAIL("expected AuthenticationException");
        } catch (const AuthenticationException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("Authentication required. Use preemptive authentication for streaming uploads."),
                                 std::string(ex.what()));
            CPPUNIT_ASSERT_EQUAL(std::string("PUT"), ex.getMethod());
        }
        // no second attempt with an empty body
        CPPUNIT_ASSERT_EQUAL((size_t)1, m_transport->m_requests.size());
    }

    void authFailure() {
        // nothing to answer with
        m_transport->reply(401);
        CPPUNIT_ASSERT_THROW(m_dispatcher->execute("GET", "/a"), AuthenticationException);

        // exactly one retry
        m_negotiator->setCredentials("u", "wrong");
        m_transport->m_requests.clear();
        m_transport->reply(401);
        m_transport->reply(401);
        m_transport->reply(200);
        CPPUNIT_ASSERT_THROW(m_dispatcher->execute("GET", "/a"), AuthenticationException);
        CPPUNIT_ASSERT_EQUAL((size_t)2, m_transport->m_requests.size());
    }

    void classify() {
        m_transport->reply(423,
                           "<?xml version=\"1.0\"?>"
                           "<D:error xmlns:D=\"DAV:\"><D:lock-token-submitted>"
                           "<D:href>/dav/file</D:href></D:lock-token-submitted></D:error>");
        try {
            m_dispatcher->execute("PUT", "/file", Headers(), "data");
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT_EQUAL(423, ex.getStatus());
            CPPUNIT_ASSERT(ex.isClientError());
            CPPUNIT_ASSERT_EQUAL(std::string("lock-token-submitted"), ex.firstCondition());
            CPPUNIT_ASSERT_EQUAL(std::string("/dav/file"), ex.getDescription());
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/file"), ex.getURL());
            CPPUNIT_ASSERT_EQUAL(std::string("423 Locked"), std::string(ex.what()));
        }

        m_transport->reply(500, "<html>oops</html>");
        try {
            m_dispatcher->execute("GET", "/file");
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT(ex.isServerError());
            CPPUNIT_ASSERT(ex.getConditions().empty());
            CPPUNIT_ASSERT_EQUAL(std::string("<html>oops</html>"), ex.getBody());
        }

        Headers location;
        location["Location"] = "http://example.com/new";
        m_transport->reply(301, "", location);
        try {
            m_dispatcher->execute("GET", "/old");
            CPPUNIT_FAIL("expected RedirectException");
        } catch (const RedirectException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/new"), ex.getLocation());
            CPPUNIT_ASSERT_EQUAL(301, ex.getStatus());
        }

        m_transport->reply(404);
        try {
            m_dispatcher->execute("GET", "/missing");
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT(ex.isNotFound());
        }
    }

    void network() {
        // no reply queued: connection refused
        CPPUNIT_ASSERT_THROW(m_dispatcher->execute("GET", "/a"), NetworkException);
        try {
            m_dispatcher->execute("GET", "/a");
        } catch (const DavException &ex) {
            CPPUNIT_ASSERT(!dynamic_cast<const ProtocolException *>(&ex));
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a"), ex.getURL());
        }
    }

    void multistatus() {
        m_transport->reply(207,
                           "<d:multistatus xmlns:d=\"DAV:\">"
                           "<d:response><d:href>/dav/a</d:href><d:status>HTTP/1.1 200 OK</d:status></d:response>"
                           "<d:response><d:href>/dav/b</d:href><d:status>HTTP/1.1 423 Locked</d:status></d:response>"
                           "</d:multistatus>");
        Multistatus ms = m_dispatcher->executeMultistatus("PROPPATCH", "/a", Headers(), "<x/>");
        CPPUNIT_ASSERT_EQUAL((size_t)2, ms.m_responses.size());
        CPPUNIT_ASSERT_EQUAL(423, ms.m_responses.back().getStatusCode());
        Headers sent = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("application/xml; charset=utf-8"), sent["Content-Type"]);

        m_transport->reply(200);
        CPPUNIT_ASSERT(m_dispatcher->executeMultistatus("PROPPATCH", "/a", Headers(), "<x/>").m_responses.empty());

        m_transport->reply(207, "<html>not a multistatus</html>");
        try {
            m_dispatcher->executeMultistatus("PROPFIND", "/a", Headers(), "");
            CPPUNIT_FAIL("expected MalformedResponseException");
        } catch (const MalformedResponseException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("PROPFIND"), ex.getMethod());
        }
    }

    static std::string gzip(const std::string &data) {
        z_stream stream;
        memset(&stream, 0, sizeof(stream));
        deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
        std::string out(deflateBound(&stream, data.size()) + 32, '\0');
        stream.next_in = (Bytef *)data.data();
        stream.avail_in = data.size();
        stream.next_out = (Bytef *)&out[0];
        stream.avail_out = out.size();
        deflate(&stream, Z_FINISH);
        out.resize(out.size() - stream.avail_out);
        deflateEnd(&stream);
        return out;
    }

    void compressed() {
        std::string xml("<D:multistatus xmlns:D=\"DAV:\">"
                        "<D:response><D:href>/dav/zipped</D:href><D:status>HTTP/1.1 200 OK</D:status></D:response>"
                        "</D:multistatus>");
        Headers headers;
        headers["Content-Encoding"] = "gzip";
        m_transport->reply(207, gzip(xml), headers);
        Multistatus ms = m_dispatcher->executeMultistatus("PROPFIND", "/", Headers(), "");
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/zipped"), ms.m_responses.front().m_href);

        // corrupt data names the request
        m_transport->reply(200, "not gzip", headers);
        try {
            m_dispatcher->execute("GET", "/file.txt");
            CPPUNIT_FAIL("expected MalformedResponseException");
        } catch (const MalformedResponseException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("GET"), ex.getMethod());
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/file.txt"), ex.getURL());
        }

        // truncated stream
        std::string zipped = gzip("0123456789");
        m_transport->reply(200, zipped.substr(0, zipped.size() - 6), headers);
        try {
            m_dispatcher->execute("GET", "/file.txt");
            CPPUNIT_FAIL("expected MalformedResponseException");
        } catch (const MalformedResponseException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/file.txt"), ex.getURL());
        }
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(DispatcherTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
