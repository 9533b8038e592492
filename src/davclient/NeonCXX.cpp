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

#include <davclient/NeonCXX.h>
#include <ne_socket.h>
#include <ne_string.h>

#include <list>
#include <sstream>
#include <string.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/foreach.hpp>

#include <davclient/Logging.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

namespace Neon {
#if 0
}
#endif

std::string features()
{
    std::list<std::string> res;

    if (ne_has_support(NE_FEATURE_SSL)) { res.push_back("SSL"); }
    if (ne_has_support(NE_FEATURE_ZLIB)) { res.push_back("ZLIB"); }
    if (ne_has_support(NE_FEATURE_IPV6)) { res.push_back("IPV6"); }
    if (ne_has_support(NE_FEATURE_LFS)) { res.push_back("LFS"); }
    if (ne_has_support(NE_FEATURE_SOCKS)) { res.push_back("SOCKS"); }
    if (ne_has_support(NE_FEATURE_TS_SSL)) { res.push_back("TS_SSL"); }
    if (ne_has_support(NE_FEATURE_I18N)) { res.push_back("I18N"); }
    return boost::join(res, ", ");
}

URI URI::parse(const std::string &url)
{
    ne_uri uri;
    int error = ne_uri_parse(url.c_str(), &uri);
    URI res = fromNeon(uri);
    if (!res.m_port) {
        res.m_port = ne_uri_defaultport(res.m_scheme.c_str());
    }
    ne_uri_free(&uri);
    if (error || res.m_scheme.empty() || res.m_host.empty()) {
        DAV_THROW_EXCEPTION_2(NetworkException,
                              StringPrintf("invalid URL '%s' (parsed as '%s')",
                                           url.c_str(),
                                           res.toURL().c_str()),
                              "",
                              url);
    }
    if (res.m_path.empty()) {
        res.m_path = "/";
    }
    return res;
}

URI URI::fromNeon(const ne_uri &uri)
{
    URI res;

    if (uri.scheme) { res.m_scheme = uri.scheme; }
    if (uri.host) { res.m_host = uri.host; }
    if (uri.userinfo) { res.m_userinfo = uri.userinfo; }
    if (uri.path) { res.m_path = uri.path; }
    if (uri.query) { res.m_query = uri.query; }
    if (uri.fragment) { res.m_fragment = uri.fragment; }
    res.m_port = uri.port;

    return res;
}

URI URI::resolve(const std::string &path) const
{
    ne_uri tmp[2];
    ne_uri full;
    memset(tmp, 0, sizeof(tmp));
    tmp[0].path = const_cast<char *>(m_path.c_str());
    tmp[1].path = const_cast<char *>(path.c_str());
    ne_uri_resolve(tmp + 0, tmp + 1, &full);
    URI res(*this);
    res.m_path = full.path;
    ne_uri_free(&full);
    return res;
}

std::string URI::toURL() const
{
    std::ostringstream buffer;

    buffer << m_scheme << "://";
    if (!m_userinfo.empty()) {
        buffer << m_userinfo << "@";
    }
    buffer << m_host;
    if (m_port) {
        buffer << ":" << m_port;
    }
    buffer << requestTarget();
    if (!m_fragment.empty()) {
        buffer << "#" << m_fragment;
    }
    return buffer.str();
}

std::string URI::requestTarget() const
{
    std::string res = m_path.empty() ? "/" : m_path;
    if (!m_query.empty()) {
        res += "?";
        res += m_query;
    }
    return res;
}

std::string URI::serverKey() const
{
    return StringPrintf("%s://%s:%u", m_scheme.c_str(), m_host.c_str(), m_port);
}

std::string URI::escape(const std::string &text)
{
    SmartPtr<char *> tmp(ne_path_escape(text.c_str()));
    // if escaping fails, the string is returned as it is
    return tmp ? tmp.get() : text;
}

std::string URI::unescape(const std::string &text)
{
    SmartPtr<char *> tmp(ne_path_unescape(text.c_str()));
    return tmp ? tmp.get() : text;
}

std::string Status2String(const ne_status *status)
{
    if (!status) {
        return "<NULL status>";
    }
    return StringPrintf("<status %d.%d, code %d, class %d, %s>",
                        status->major_version,
                        status->minor_version,
                        status->code,
                        status->klass,
                        status->reason_phrase ? status->reason_phrase : "\"\"");
}

Session::Session(const boost::shared_ptr<const Settings> &settings,
                 const URI &uri) :
    m_settings(settings),
    m_session(NULL),
    m_uri(uri)
{
    int logLevel = m_settings->logLevel();
    if (logLevel >= 3) {
        ne_debug_init(stderr,
                      NE_DBG_FLUSH|NE_DBG_HTTP|
                      (logLevel >= 4 ? NE_DBG_HTTPBODY : 0) |
                      (logLevel >= 5 ? (NE_DBG_SSL) : 0)|
                      (logLevel >= 6 ? (NE_DBG_XML|NE_DBG_XMLPARSE) : 0)|
                      (logLevel >= 11 ? (NE_DBG_HTTPPLAIN) : 0));
    } else {
        ne_debug_init(NULL, 0);
    }

    ne_sock_init();
    m_session = ne_session_create(m_uri.m_scheme.c_str(),
                                  m_uri.m_host.c_str(),
                                  m_uri.m_port);
    if (m_uri.m_scheme == "https") {
        // neon only has an SSL context for https sessions
        ne_ssl_set_verify(m_session, sslVerify, this);
        ne_ssl_trust_default_ca(m_session);
    }

    std::string proxyURL = settings->proxy();
    if (proxyURL.empty()) {
#ifdef HAVE_LIBNEON_SYSTEM_PROXY
        ne_session_system_proxy(m_session, 0);
#endif
    } else {
        URI proxyuri = URI::parse(proxyURL);
        ne_session_proxy(m_session, proxyuri.m_host.c_str(), proxyuri.m_port);
    }

    int seconds = settings->timeoutSeconds();
    if (seconds <= 0) {
        seconds = 5 * 60;
    }
    ne_set_read_timeout(m_session, seconds);
    ne_set_connect_timeout(m_session, seconds);

    DAV_LOG_DEV(NULL, NULL, "new session for %s, proxy %s, timeout %ds",
                m_uri.serverKey().c_str(),
                proxyURL.empty() ? "system default" : proxyURL.c_str(),
                seconds);
}

Session::~Session()
{
    if (m_session) {
        ne_session_destroy(m_session);
    }
    ne_sock_exit();
}

int Session::sslVerify(void *userdata, int failures, const ne_ssl_certificate *cert) throw()
{
    try {
        Session *session = static_cast<Session *>(userdata);

        static const Flag descr[] = {
            { NE_SSL_NOTYETVALID, "certificate not yet valid" },
            { NE_SSL_EXPIRED, "certificate has expired" },
            { NE_SSL_IDMISMATCH, "hostname mismatch" },
            { NE_SSL_UNTRUSTED, "untrusted certificate" },
            { 0, NULL }
        };

        DAV_LOG_DEBUG(NULL, NULL,
                      "%s: SSL verification problem: %s",
                      session->m_uri.serverKey().c_str(),
                      Flags2String(failures, descr).c_str());
        if (!session->m_settings->verifySSLCertificate()) {
            DAV_LOG_DEBUG(NULL, NULL, "ignoring bad certificate");
            return 0;
        }
        if (failures == NE_SSL_IDMISMATCH &&
            !session->m_settings->verifySSLHost()) {
            DAV_LOG_DEBUG(NULL, NULL, "ignoring hostname mismatch");
            return 0;
        }
        return 1;
    } catch (...) {
        Exception::handle();
        return 1;
    }
}

void Session::throwError(int error, const std::string &method, const std::string &url)
{
    const char *kind;
    switch (error) {
    case NE_LOOKUP: kind = "host lookup failed"; break;
    case NE_CONNECT: kind = "could not connect"; break;
    case NE_TIMEOUT: kind = "timeout"; break;
    case NE_AUTH: kind = "server authentication failed"; break;
    case NE_PROXYAUTH: kind = "proxy authentication failed"; break;
    default: kind = "request failed"; break;
    }
    std::string descr = StringPrintf("%s: Neon error code %d: %s",
                                     kind,
                                     error,
                                     ne_get_error(m_session));
    DAV_LOG_DEBUG(NULL, NULL, "%s %s: %s", method.c_str(), url.c_str(), descr.c_str());
    DAV_THROW_EXCEPTION_2(NetworkException, descr, method, url);
}

XMLParser::XMLParser() :
    m_parser(ne_xml_create(), "XML parser")
{
}

XMLParser &XMLParser::pushHandler(const StartCB_t &start,
                                  const DataCB_t &data,
                                  const EndCB_t &end)
{
    m_stack.push_back(Callbacks(start, data, end));
    Callbacks &cb = m_stack.back();
    ne_xml_push_handler(m_parser.get(),
                        startCB, dataCB, endCB,
                        &cb);
    return *this;
}

void XMLParser::parse(const char *data, size_t len)
{
    if (len) {
        ne_xml_parse(m_parser.get(), data, len);
        checkError();
    }
}

void XMLParser::finish()
{
    // zero length signals the end of the document
    ne_xml_parse(m_parser.get(), "", 0);
    checkError();
}

void XMLParser::checkError()
{
    if (ne_xml_failed(m_parser.get())) {
        DAV_THROW_EXCEPTION(MalformedResponseException,
                            StringPrintf("invalid XML: %s", ne_xml_get_error(m_parser.get())));
    }
}

int XMLParser::startCB(void *userdata, int parent,
                       const char *nspace, const char *name,
                       const char **atts) throw()
{
    Callbacks *cb = static_cast<Callbacks *>(userdata);
    try {
        return cb->m_start(parent, nspace, name, atts);
    } catch (...) {
        Exception::handle();
        DAV_LOG_ERROR(NULL, NULL, "startCB %s %s failed", nspace, name);
        return -1;
    }
}

int XMLParser::dataCB(void *userdata, int state,
                      const char *cdata, size_t len) throw()
{
    Callbacks *cb = static_cast<Callbacks *>(userdata);
    try {
        return cb->m_data ?
            cb->m_data(state, cdata, len) :
            0;
    } catch (...) {
        Exception::handle();
        DAV_LOG_ERROR(NULL, NULL, "dataCB failed");
        return -1;
    }
}

int XMLParser::endCB(void *userdata, int state,
                     const char *nspace, const char *name) throw()
{
    Callbacks *cb = static_cast<Callbacks *>(userdata);
    try {
        return cb->m_end ?
            cb->m_end(state, nspace, name) :
            0;
    } catch (...) {
        Exception::handle();
        DAV_LOG_ERROR(NULL, NULL, "endCB %s %s failed", nspace, name);
        return -1;
    }
}

int XMLParser::append(std::string &buffer,
                      const char *data,
                      size_t len)
{
    buffer.append(data, len);
    return 0;
}

Request::Request(Session &session,
                 const std::string &method,
                 const std::string &url) :
    m_session(session),
    m_method(method),
    m_url(url),
    m_bodyStarted(false)
{
    URI uri = URI::parse(url);
    m_req.set(ne_request_create(session.getSession(), m_method.c_str(), uri.requestTarget().c_str()),
              "neon request");
}

void Request::setBody(const std::string &body)
{
    ne_set_request_body_buffer(m_req.get(), body.c_str(), body.size());
}

void Request::setBody(const boost::shared_ptr<BodySource> &source)
{
    m_source = source;
    m_bodyStarted = false;
    // a negative length makes neon use chunked encoding
    ne_set_request_body_provider(m_req.get(),
                                 (ne_off_t)source->getLength(),
                                 bodyProvider, this);
}

ssize_t Request::bodyProvider(void *userdata, char *buffer, size_t buflen) throw()
{
    Request *me = static_cast<Request *>(userdata);
    try {
        if (!buflen) {
            // neon asks for a rewind before each attempt, including the first one
            if (me->m_bodyStarted) {
                DAV_LOG_DEBUG(NULL, NULL, "%s %s: resending body",
                              me->m_method.c_str(), me->m_url.c_str());
                me->m_source->rewind();
            }
            me->m_bodyStarted = true;
            return 0;
        }
        return (ssize_t)me->m_source->read(buffer, buflen);
    } catch (...) {
        std::string explanation;
        Exception::handle(explanation);
        ne_set_error(me->m_session.getSession(), "reading request body: %s", explanation.c_str());
        return -1;
    }
}

void Request::readHeaders(HTTPResponse &response)
{
    const ne_status *status = getStatus();
    response.m_status = status->code;
    response.m_reason = status->reason_phrase ? status->reason_phrase : "";
    response.m_headers.clear();

    void *cursor = NULL;
    const char *name, *value;
    while ((cursor = ne_response_header_iterate(m_req.get(), cursor, &name, &value)) != NULL) {
        std::string &entry = response.m_headers[name];
        if (!entry.empty()) {
            // repeated header, combine as allowed by RFC 2616 4.2
            entry += ", ";
        }
        entry += value;
    }
}

void Request::run(HTTPResponse &response, const ResponseReader_t &reader)
{
    int error;

    try {
        do {
            response.m_body.clear();
            error = ne_begin_request(m_req.get());
            if (error != NE_OK) {
                break;
            }
            readHeaders(response);

            char buffer[16 * 1024];
            ssize_t len;
            while ((len = ne_read_response_block(m_req.get(), buffer, sizeof(buffer))) > 0) {
                if (reader) {
                    reader(buffer, len);
                } else {
                    response.m_body.append(buffer, len);
                }
            }
            if (len < 0) {
                error = NE_ERROR;
                break;
            }
            error = ne_end_request(m_req.get());
        } while (error == NE_RETRY);
    } catch (...) {
        // the response was not read completely, connection cannot be reused
        ne_close_connection(m_session.getSession());
        throw;
    }

    if (error != NE_OK) {
        ne_close_connection(m_session.getSession());
        m_session.throwError(error, m_method, m_url);
    }
    DAV_LOG_DEBUG(NULL, NULL, "%s %s: %s",
                  m_method.c_str(), m_url.c_str(),
                  Status2String(getStatus()).c_str());
}

NeonTransport::NeonTransport(const boost::shared_ptr<const Settings> &settings) :
    m_settings(settings)
{
}

Session &NeonTransport::getSession(const URI &uri)
{
    std::string key = uri.serverKey();
    boost::shared_ptr<Session> &session = m_sessions[key];
    if (!session) {
        session.reset(new Session(m_settings, uri));
    }
    return *session;
}

void NeonTransport::send(const HTTPRequest &request,
                         HTTPResponse &response,
                         const ResponseReader_t &reader)
{
    URI uri = URI::parse(request.m_url);
    Request req(getSession(uri), request.m_method, request.m_url);
    BOOST_FOREACH(const StringPair &header, request.m_headers) {
        req.addHeader(header.first, header.second);
    }
    if (request.m_source) {
        req.setBody(request.m_source);
    } else if (!request.m_body.empty()) {
        req.setBody(request.m_body);
    }
    req.run(response, reader);
}

#ifdef ENABLE_UNIT_TESTS

class URITest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(URITest);
    CPPUNIT_TEST(parse);
    CPPUNIT_TEST(serverKey);
    CPPUNIT_TEST(resolve);
    CPPUNIT_TEST(invalid);
    CPPUNIT_TEST_SUITE_END();

    void parse() {
        URI uri = URI::parse("https://user@dav.example.com/remote.php/webdav/a%20b?x=1");
        CPPUNIT_ASSERT_EQUAL(std::string("https"), uri.m_scheme);
        CPPUNIT_ASSERT_EQUAL(std::string("dav.example.com"), uri.m_host);
        CPPUNIT_ASSERT_EQUAL(std::string("user"), uri.m_userinfo);
        CPPUNIT_ASSERT_EQUAL(443u, uri.m_port);
        CPPUNIT_ASSERT_EQUAL(std::string("/remote.php/webdav/a%20b?x=1"), uri.requestTarget());
    }

    void serverKey() {
        CPPUNIT_ASSERT_EQUAL(std::string("http://localhost:8080"),
                             URI::parse("http://localhost:8080/dav").serverKey());
        CPPUNIT_ASSERT_EQUAL(URI::parse("http://localhost/a").serverKey(),
                             URI::parse("http://localhost:80/b").serverKey());
        CPPUNIT_ASSERT_EQUAL(std::string("/"), URI::parse("http://localhost").requestTarget());
    }

    void resolve() {
        URI base = URI::parse("http://localhost/dav/dir/");
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/dir/file"), base.resolve("file").m_path);
        CPPUNIT_ASSERT_EQUAL(std::string("/other"), base.resolve("/other").m_path);
    }

    void invalid() {
        CPPUNIT_ASSERT_THROW(URI::parse("not a url"), NetworkException);
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(URITest);

#endif // ENABLE_UNIT_TESTS

}

DAV_END_CXX
