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

#include <davclient/Client.h>
#include <davclient/Codec.h>
#include <davclient/DavUtil.h>
#include <davclient/Transfer.h>
#include <davclient/Logging.h>

#include <stdlib.h>
#include <errno.h>
#include <vector>
#include <algorithm>

#include <boost/foreach.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include "ScriptedTransport.h"
# include <boost/bind.hpp>
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * "a/b/c/" -> "a/b/" and "c"; "c" -> "" and "c"
 */
static void splitSegment(const std::string &path, std::string &parent, std::string &segment)
{
    std::string stripped = path;
    while (stripped.size() > 1 && stripped[stripped.size() - 1] == '/') {
        stripped.resize(stripped.size() - 1);
    }
    size_t slash = stripped.rfind('/');
    if (slash == stripped.npos) {
        parent = "";
        segment = stripped;
    } else {
        parent = stripped.substr(0, slash + 1);
        segment = stripped.substr(slash + 1);
    }
}

/** decimal property value, -1 if missing or not a number */
static long long parseBytes(const std::string &value)
{
    std::string text = StripSpace(value);
    if (text.empty()) {
        return -1;
    }
    char *end;
    errno = 0;
    long long bytes = strtoll(text.c_str(), &end, 10);
    if (errno || *end) {
        DAV_LOG_DEBUG(NULL, NULL, "ignoring invalid byte count '%s'", text.c_str());
        return -1;
    }
    return bytes;
}

Client::Client(const ClientConfig &config,
               const boost::shared_ptr<HTTPTransport> &transport) :
    m_config(config),
    m_transport(transport),
    m_negotiator(new Negotiator)
{
    if (!m_config.m_username.empty()) {
        if (m_config.m_domain.empty() && m_config.m_workstation.empty()) {
            m_negotiator->setCredentials(m_config.m_username,
                                         m_config.m_password,
                                         m_config.m_preemptive);
        } else {
            m_negotiator->setCredentialsWithDomain(m_config.m_username,
                                                   m_config.m_password,
                                                   m_config.m_domain,
                                                   m_config.m_workstation,
                                                   m_config.m_preemptive);
        }
    }
    reconfigure();
}

void Client::reconfigure()
{
    m_dispatcher.reset(new Dispatcher(m_config, m_transport, m_negotiator));
}

void Client::setBaseUrl(const std::string &url)
{
    m_config.m_baseUrl = url;
    while (m_config.m_baseUrl.size() > 1 &&
           m_config.m_baseUrl[m_config.m_baseUrl.size() - 1] == '/') {
        m_config.m_baseUrl.resize(m_config.m_baseUrl.size() - 1);
    }
    reconfigure();
}

void Client::enableCompression()
{
    m_config.m_compression = true;
    m_config.m_headers["Accept-Encoding"] = "gzip, deflate";
    reconfigure();
}

void Client::disableCompression()
{
    m_config.m_compression = false;
    m_config.m_headers.erase("Accept-Encoding");
    reconfigure();
}

void Client::setIgnoreCookies(bool ignore)
{
    m_config.m_ignoreCookies = ignore;
    reconfigure();
}

void Client::setHeader(const std::string &name, const std::string &value)
{
    m_config.m_headers[name] = value;
    reconfigure();
}

void Client::removeHeader(const std::string &name)
{
    m_config.m_headers.erase(name);
    reconfigure();
}

void Client::setCredentials(const std::string &username,
                            const std::string &password,
                            bool preemptive)
{
    m_negotiator->setCredentials(username, password, preemptive);
}

void Client::setCredentialsWithDomain(const std::string &username,
                                      const std::string &password,
                                      const std::string &domain,
                                      const std::string &workstation,
                                      bool preemptive)
{
    m_negotiator->setCredentialsWithDomain(username, password, domain, workstation, preemptive);
}

void Client::setAuthenticationHandler(const boost::shared_ptr<AuthHandler> &handler,
                                      bool preemptive)
{
    m_negotiator->setHandler(handler, preemptive);
}

void Client::clearAuthentication()
{
    m_negotiator->clearAuthentication();
}

HTTPResponse Client::xmlRequest(const std::string &method,
                                const std::string &path,
                                const std::string &body,
                                const Headers &headers)
{
    Headers all = headers;
    all["Content-Type"] = "application/xml; charset=utf-8";
    return m_dispatcher->execute(method, path, all, body);
}

Multistatus Client::propfind(const std::string &path, int depth, const std::string &body)
{
    Headers headers;
    headers["Depth"] = depthToString(depth);
    return m_dispatcher->executeMultistatus("PROPFIND", path, headers, body);
}

const XMLElement *Client::findProperty(const std::string &path,
                                       const std::string &name,
                                       Multistatus &multistatus)
{
    std::list<std::string> names;
    names.push_back(name);
    multistatus = propfind(path, 0, encodePropfind(names));
    BOOST_FOREACH(const Response &response, multistatus.m_responses) {
        const XMLElement *prop = response.findProperty(name);
        if (prop) {
            return prop;
        }
    }
    return NULL;
}

std::string Client::newResourceUrl(const std::string &path, const HTTPResponse &response)
{
    std::string location = response.getHeader("Location");
    if (!location.empty()) {
        return location;
    }
    std::string href = decodeFirstHref(response.m_body);
    return href.empty() ? path : href;
}

std::list<DavResource> Client::list(const std::string &path, int depth)
{
    return decodeResources(propfind(path, depth, encodePropfindAllprop()));
}

std::list<DavResource> Client::listWithAllProp(const std::string &path, int depth, bool includeAll)
{
    if (includeAll) {
        return list(path, depth);
    }
    return decodeResources(propfind(path, depth, encodePropfind(standardProps())));
}

std::list<DavResource> Client::listWithProps(const std::string &path,
                                             const std::list<std::string> &names,
                                             int depth)
{
    std::list<std::string> props = names;
    if (std::find(props.begin(), props.end(), "resourcetype") == props.end()) {
        props.push_back("resourcetype");
    }
    return decodeResources(propfind(path, depth, encodePropfind(props)));
}

std::list<DavResource> Client::propfindNames(const std::string &path, int depth)
{
    return decodeResources(propfind(path, depth, encodePropfindPropname()));
}

Multistatus Client::propfindRaw(const std::string &path, int depth,
                                const std::list<std::string> &names)
{
    return propfind(path, depth,
                    names.empty() ? encodePropfindAllprop() : encodePropfind(names));
}

std::string Client::get(const std::string &path, const Headers &headers)
{
    return m_dispatcher->execute("GET", path, headers).m_body;
}

void Client::getStream(const std::string &path, const ResponseReader_t &sink)
{
    TransferManager(*m_dispatcher).download(path, sink);
}

void Client::downloadToFile(const std::string &path, const std::string &filename,
                            const Progress_t &progress)
{
    TransferManager(*m_dispatcher).downloadToFile(path, filename, progress);
}

void Client::put(const std::string &path,
                 const std::string &data,
                 const std::string &contentType,
                 const std::string &lockToken,
                 bool expectContinue)
{
    Headers headers;
    headers["Content-Type"] = contentType;
    if (!lockToken.empty()) {
        headers["If"] = LockManager::ifHeader(lockToken);
    }
    if (expectContinue) {
        headers["Expect"] = "100-continue";
    }
    m_dispatcher->execute("PUT", path, headers, data);
}

void Client::putStream(const std::string &path,
                       const boost::shared_ptr<BodySource> &source,
                       const std::string &contentType,
                       const Progress_t &progress)
{
    TransferManager(*m_dispatcher).upload(path, source, contentType, Headers(), progress);
}

void Client::putFile(const std::string &path,
                     const std::string &filename,
                     const std::string &contentType,
                     const Progress_t &progress)
{
    boost::shared_ptr<BodySource> source(new FileBodySource(filename));
    TransferManager(*m_dispatcher).upload(path, source,
                                          contentType.empty() ? getMimeType(filename) : contentType,
                                          Headers(), progress);
}

void Client::remove(const std::string &path, const std::string &lockToken)
{
    Headers headers;
    if (!lockToken.empty()) {
        headers["If"] = LockManager::ifHeader(lockToken);
    }
    m_dispatcher->execute("DELETE", path, headers);
}

void Client::createDirectory(const std::string &path)
{
    m_dispatcher->execute("MKCOL", path);
}

void Client::createDirectoryRecursive(const std::string &path)
{
    std::string current;
    std::string rest = path;
    size_t scheme = path.find("://");
    if (scheme != path.npos) {
        size_t slash = path.find('/', scheme + 3);
        current = path.substr(0, slash);
        rest = slash == path.npos ? "" : path.substr(slash);
    }

    std::vector<std::string> segments;
    boost::split(segments, rest, boost::is_any_of("/"));
    BOOST_FOREACH(const std::string &segment, segments) {
        if (segment.empty()) {
            continue;
        }
        current += "/" + segment;
        try {
            createDirectory(current);
        } catch (const ProtocolException &ex) {
            // 405 = the collection is already there
            if (ex.getStatus() != 405) {
                throw;
            }
            DAV_LOG_DEBUG(NULL, NULL, "%s exists already", current.c_str());
        }
    }
}

void Client::move(const std::string &source, const std::string &destination,
                  bool overwrite, const std::string &lockToken)
{
    Headers headers;
    headers["Destination"] = m_dispatcher->resolveUrl(destination);
    headers["Overwrite"] = overwrite ? "T" : "F";
    if (!lockToken.empty()) {
        headers["If"] = LockManager::ifHeader(lockToken);
    }
    m_dispatcher->execute("MOVE", source, headers);
}

void Client::copy(const std::string &source, const std::string &destination,
                  bool overwrite)
{
    Headers headers;
    headers["Destination"] = m_dispatcher->resolveUrl(destination);
    headers["Overwrite"] = overwrite ? "T" : "F";
    m_dispatcher->execute("COPY", source, headers);
}

bool Client::exists(const std::string &path)
{
    try {
        m_dispatcher->execute("HEAD", path);
        return true;
    } catch (const std::exception &ex) {
        DAV_LOG_DEBUG(NULL, NULL, "HEAD %s: %s", path.c_str(), ex.what());
        return false;
    }
}

Multistatus Client::patch(const std::string &path,
                          const StringMap &setProps,
                          const std::list<std::string> &removeProps)
{
    return m_dispatcher->executeMultistatus("PROPPATCH", path, Headers(),
                                            encodePropertyUpdate(setProps, removeProps));
}

std::string Client::lock(const std::string &path, int timeoutSeconds)
{
    return LockManager(*m_dispatcher).acquireLock(path, timeoutSeconds, m_config.m_username);
}

std::string Client::refreshLock(const std::string &path, const std::string &token,
                                int timeoutSeconds)
{
    return LockManager(*m_dispatcher).refreshLock(path, token, timeoutSeconds);
}

void Client::unlock(const std::string &path, const std::string &token)
{
    LockManager(*m_dispatcher).releaseLock(path, token);
}

std::list<ActiveLock> Client::discoverLocks(const std::string &path)
{
    return LockManager(*m_dispatcher).discoverLocks(path);
}

bool Client::isLocked(const std::string &path)
{
    return !discoverLocks(path).empty();
}

std::string Client::getLockToken(const std::string &path)
{
    std::list<ActiveLock> locks = discoverLocks(path);
    return locks.empty() ? "" : locks.front().m_token;
}

DavAcl Client::getAcl(const std::string &path)
{
    Multistatus ms;
    const XMLElement *prop = findProperty(path, "acl", ms);
    DavAcl acl;
    if (prop) {
        acl = decodeAcl(*prop);
    }
    acl.m_url = m_dispatcher->resolveUrl(path);
    return acl;
}

void Client::setAcl(const std::string &path, const DavAcl &acl)
{
    xmlRequest("ACL", path, encodeAcl(acl));
}

std::set<std::string> Client::getCurrentUserPrivileges(const std::string &path)
{
    Multistatus ms;
    const XMLElement *prop = findProperty(path, "current-user-privilege-set", ms);
    return prop ? decodePrivileges(*prop) : std::set<std::string>();
}

bool Client::hasPrivilege(const std::string &path, const std::string &privilege)
{
    std::set<std::string> privileges = getCurrentUserPrivileges(path);
    return privileges.count(privilege) || privileges.count("all");
}

std::map<std::string, bool> Client::validatePrivileges(const std::string &path,
                                                       const std::list<std::string> &privileges)
{
    std::set<std::string> granted = getCurrentUserPrivileges(path);
    std::map<std::string, bool> result;
    BOOST_FOREACH(const std::string &privilege, privileges) {
        result[privilege] = granted.count(privilege) || granted.count("all");
    }
    return result;
}

std::list<DavPrincipal> Client::getPrincipals(const std::string &path)
{
    std::list<std::string> names;
    names.push_back("displayname");
    names.push_back("resourcetype");
    names.push_back("principal-URL");
    std::list<DavPrincipal> principals;
    BOOST_FOREACH(const DavResource &resource,
                  decodeResources(propfind(path, 1, encodePropfind(names)))) {
        if (resource.m_resourceTypes.count("principal")) {
            DavPrincipal principal;
            principal.m_url = resource.m_href;
            principal.m_displayName = resource.m_displayName;
            principal.m_props = resource.m_props;
            principals.push_back(principal);
        }
    }
    return principals;
}

std::list<std::string> Client::getPrincipalCollectionSet(const std::string &path)
{
    Multistatus ms;
    const XMLElement *prop = findProperty(path, "principal-collection-set", ms);
    return prop ? decodeHrefs(*prop) : std::list<std::string>();
}

std::list<std::string> Client::getSupportedReports(const std::string &path)
{
    Multistatus ms;
    const XMLElement *prop = findProperty(path, "supported-report-set", ms);
    return prop ? decodeSupportedReports(*prop) : std::list<std::string>();
}

DavQuota Client::getQuota(const std::string &path)
{
    std::list<std::string> names;
    names.push_back("quota-available-bytes");
    names.push_back("quota-used-bytes");
    Multistatus ms = propfind(path, 0, encodePropfind(names));

    DavQuota quota;
    quota.m_url = m_dispatcher->resolveUrl(path);
    if (!ms.m_responses.empty()) {
        DavResource resource = decodeResource(ms.m_responses.front());
        quota.m_availableBytes = parseBytes(resource.getProperty("quota-available-bytes"));
        quota.m_usedBytes = parseBytes(resource.getProperty("quota-used-bytes"));
    }
    return quota;
}

std::list<DavResource> Client::search(const std::string &path,
                                      const std::string &query,
                                      const std::string &language)
{
    return decodeResources(m_dispatcher->executeMultistatus("SEARCH", path, Headers(),
                                                            encodeSearch(query, language,
                                                                         m_dispatcher->resolveUrl(path))));
}

SyncResult Client::syncCollection(const std::string &path,
                                  const std::string &syncToken,
                                  int depth,
                                  int limit,
                                  const std::list<std::string> &props)
{
    Headers headers;
    headers["Depth"] = "0";
    Multistatus ms = m_dispatcher->executeMultistatus("REPORT", path, headers,
                                                      encodeSyncCollection(syncToken, depth, limit, props));
    SyncResult result;
    result.m_syncToken = ms.m_syncToken;
    BOOST_FOREACH(const Response &response, ms.m_responses) {
        if (response.getStatusCode() == 404) {
            result.m_removed.push_back(response.m_href);
        } else {
            result.m_changed.push_back(decodeResource(response));
        }
    }
    DAV_LOG_DEBUG(NULL, NULL, "sync %s: %lu changed, %lu removed, new token %s",
                  path.c_str(),
                  (unsigned long)result.m_changed.size(),
                  (unsigned long)result.m_removed.size(),
                  result.m_syncToken.c_str());
    return result;
}

void Client::bind(const std::string &source, const std::string &target, bool overwrite)
{
    std::string parent, segment;
    splitSegment(target, parent, segment);
    Headers headers;
    headers["Overwrite"] = overwrite ? "T" : "F";
    xmlRequest("BIND", parent, encodeBind(segment, m_dispatcher->resolveUrl(source)), headers);
}

void Client::unbind(const std::string &path)
{
    std::string parent, segment;
    splitSegment(path, parent, segment);
    xmlRequest("UNBIND", parent, encodeUnbind(segment));
}

void Client::versionControl(const std::string &path, const std::string &version)
{
    xmlRequest("VERSION-CONTROL", path, encodeVersionControl(version));
}

std::string Client::checkout(const std::string &path, const std::string &activitySet)
{
    return newResourceUrl(path, xmlRequest("CHECKOUT", path, encodeCheckout(activitySet)));
}

std::string Client::checkin(const std::string &path, bool keepCheckedOut)
{
    return newResourceUrl(path, xmlRequest("CHECKIN", path, encodeCheckin(keepCheckedOut)));
}

void Client::uncheckout(const std::string &path)
{
    xmlRequest("UNCHECKOUT", path, encodeUncheckout());
}

void Client::baselineControl(const std::string &path, const std::string &baseline)
{
    xmlRequest("BASELINE-CONTROL", path, encodeBaselineControl(baseline));
}

std::string Client::makeBaseline(const std::string &path)
{
    return newResourceUrl(path, xmlRequest("MKBASELINE", path, encodeMkBaseline()));
}

std::list<DavResource> Client::versionTreeReport(const std::string &path)
{
    return decodeResources(report(path, encodeVersionTreeReport(), 0));
}

std::list<std::string> Client::getVersionHistory(const std::string &path)
{
    Multistatus ms;
    const XMLElement *prop = findProperty(path, "version-history", ms);
    return prop ? decodeHrefs(*prop) : std::list<std::string>();
}

std::string Client::getVersion(const std::string &path, const std::string &version)
{
    return LockManager(*m_dispatcher).resolveVersion(path, version);
}

Multistatus Client::report(const std::string &path, const std::string &body, int depth)
{
    Headers headers;
    headers["Depth"] = depthToString(depth);
    return m_dispatcher->executeMultistatus("REPORT", path, headers, body);
}

#ifdef ENABLE_UNIT_TESTS

class ClientTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ClientTest);
    CPPUNIT_TEST(configuration);
    CPPUNIT_TEST(compression);
    CPPUNIT_TEST(credentials);
    CPPUNIT_TEST(listing);
    CPPUNIT_TEST(exists);
    CPPUNIT_TEST(content);
    CPPUNIT_TEST(directories);
    CPPUNIT_TEST(moveCopy);
    CPPUNIT_TEST(quota);
    CPPUNIT_TEST(acl);
    CPPUNIT_TEST(privileges);
    CPPUNIT_TEST(sync);
    CPPUNIT_TEST(binding);
    CPPUNIT_TEST(versioning);
    CPPUNIT_TEST_SUITE_END();

    boost::shared_ptr<ScriptedTransport> m_transport;
    boost::scoped_ptr<Client> m_client;

public:
    void setUp() {
        m_transport.reset(new ScriptedTransport);
        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav";
        m_client.reset(new Client(config, m_transport));
    }

    void tearDown() {
        m_client.reset();
        m_transport.reset();
    }

private:
    static void append(std::string &buffer, const char *data, size_t len) {
        buffer.append(data, len);
    }

    const HTTPRequest &last() { return m_transport->m_requests.back(); }
    std::string lastHeader(const std::string &name) {
        Headers headers = last().m_headers;
        Headers::const_iterator it = headers.find(name);
        return it == headers.end() ? "<unset>" : it->second;
    }

    static std::string multistatus(const std::string &responses) {
        return
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<D:multistatus xmlns:D=\"DAV:\">" + responses + "</D:multistatus>";
    }

    static std::string response(const std::string &href, const std::string &props,
                                const std::string &status = "HTTP/1.1 200 OK") {
        return
            "<D:response><D:href>" + href + "</D:href>"
            "<D:propstat><D:prop>" + props + "</D:prop>"
            "<D:status>" + status + "</D:status></D:propstat></D:response>";
    }

    void configuration() {
        m_client->setBaseUrl("http://example.com/other//");
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/other"), m_client->getBaseUrl());

        m_client->setHeader("X-Custom", "1");
        m_client->setIgnoreCookies(true);
        m_transport->reply(200, "hello");
        Headers headers;
        headers["Cookie"] = "session=1";
        CPPUNIT_ASSERT_EQUAL(std::string("hello"), m_client->get("file.txt", headers));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/other/file.txt"), last().m_url);
        CPPUNIT_ASSERT_EQUAL(std::string("1"), lastHeader("X-Custom"));
        CPPUNIT_ASSERT_EQUAL(std::string("DavClient/1.0"), lastHeader("User-Agent"));
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("Cookie"));

        m_client->removeHeader("X-Custom");
        m_transport->reply(200);
        m_client->get("file.txt");
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("X-Custom"));
    }

    void compression() {
        m_client->enableCompression();
        m_client->enableCompression();
        CPPUNIT_ASSERT(m_client->isCompressionEnabled());
        m_transport->reply(200);
        m_client->get("a");
        CPPUNIT_ASSERT_EQUAL(std::string("gzip, deflate"), lastHeader("Accept-Encoding"));

        m_client->disableCompression();
        m_client->disableCompression();
        CPPUNIT_ASSERT(!m_client->isCompressionEnabled());
        CPPUNIT_ASSERT(m_client->getConfig().m_headers.find("Accept-Encoding") ==
                       m_client->getConfig().m_headers.end());
        m_transport->reply(200);
        m_client->get("a");
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("Accept-Encoding"));
    }

    void credentials() {
        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav";
        config.m_username = "u";
        config.m_password = "p";
        config.m_domain = "DOM";
        config.m_workstation = "WS";
        config.m_preemptive = true;
        Client client(config, m_transport);
        m_transport->reply(200);
        client.get("a");
        CPPUNIT_ASSERT_EQUAL(std::string("Basic RE9NXHU6cA=="), lastHeader("Authorization"));
        CPPUNIT_ASSERT_EQUAL(std::string("WS"), lastHeader("X-Workstation"));

        client.clearAuthentication();
        client.clearAuthentication();
        CPPUNIT_ASSERT(!client.getNegotiator().hasCredentials());
        m_transport->reply(200);
        client.get("a");
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("Authorization"));
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("X-Workstation"));
    }

    void listing() {
        m_transport->reply(207,
                           "<multistatus xmlns=\"DAV:\">"
                           "<response><href>/dav/</href><propstat><prop>"
                           "<resourcetype><collection/></resourcetype>"
                           "</prop><status>HTTP/1.1 200 OK</status></propstat></response>"
                           "<response><href>/dav/a.txt</href><propstat><prop>"
                           "<resourcetype/><getcontentlength>12</getcontentlength>"
                           "<getcontenttype>text/plain</getcontenttype>"
                           "</prop><status>HTTP/1.1 200 OK</status></propstat></response>"
                           "</multistatus>");
        std::list<DavResource> resources = m_client->list("/");
        CPPUNIT_ASSERT_EQUAL(std::string("1"), lastHeader("Depth"));
        CPPUNIT_ASSERT_EQUAL(std::string("PROPFIND"), last().m_method);
        CPPUNIT_ASSERT(XMLElement::parse(last().m_body)->findChild("allprop"));
        CPPUNIT_ASSERT_EQUAL((size_t)2, resources.size());
        CPPUNIT_ASSERT(resources.front().isDirectory());
        CPPUNIT_ASSERT(!resources.back().isDirectory());
        CPPUNIT_ASSERT_EQUAL(12ll, resources.back().m_contentLength);
        CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), resources.back().getName());

        m_transport->reply(207, multistatus(""));
        std::list<std::string> names;
        names.push_back("getetag");
        CPPUNIT_ASSERT(m_client->listWithProps("/", names, -1).empty());
        CPPUNIT_ASSERT_EQUAL(std::string("infinity"), lastHeader("Depth"));
        XMLElement::Ptr body = XMLElement::parse(last().m_body);
        CPPUNIT_ASSERT(body->findDescendant("getetag"));
        CPPUNIT_ASSERT(body->findDescendant("resourcetype"));

        m_transport->reply(207, multistatus(""));
        m_client->listWithAllProp("/", 0, false);
        body = XMLElement::parse(last().m_body);
        CPPUNIT_ASSERT_EQUAL((size_t)1, body->findDescendants("lockdiscovery").size());
        CPPUNIT_ASSERT(body->findDescendant("getlastmodified"));
        CPPUNIT_ASSERT(!body->findDescendant("allprop"));

        m_transport->reply(207, multistatus(response("/dav/a.txt", "<D:getetag/><X:color xmlns:X=\"urn:x\"/>")));
        resources = m_client->propfindNames("a.txt");
        CPPUNIT_ASSERT(XMLElement::parse(last().m_body)->findChild("propname"));
        CPPUNIT_ASSERT(resources.front().hasProperty("color"));
        CPPUNIT_ASSERT_EQUAL(std::string("0"), lastHeader("Depth"));
    }

    void exists() {
        m_transport->reply(200);
        CPPUNIT_ASSERT(m_client->exists("a.txt"));
        CPPUNIT_ASSERT_EQUAL(std::string("HEAD"), last().m_method);
        m_transport->reply(404);
        CPPUNIT_ASSERT(!m_client->exists("a.txt"));
        m_transport->reply(401);
        CPPUNIT_ASSERT(!m_client->exists("a.txt"));
        // no reply queued: connection refused
        CPPUNIT_ASSERT(!m_client->exists("a.txt"));
    }

    void content() {
        m_transport->reply(201);
        m_client->put("a.txt", "hello", "text/plain", "opaquelocktoken:1", true);
        CPPUNIT_ASSERT_EQUAL(std::string("PUT"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("hello"), m_transport->m_bodies.back());
        CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), lastHeader("Content-Type"));
        CPPUNIT_ASSERT_EQUAL(std::string("(<opaquelocktoken:1>)"), lastHeader("If"));
        CPPUNIT_ASSERT_EQUAL(std::string("100-continue"), lastHeader("Expect"));

        m_transport->reply(204);
        m_client->put("b.txt", "");
        CPPUNIT_ASSERT_EQUAL(std::string("application/octet-stream"), lastHeader("Content-Type"));
        CPPUNIT_ASSERT_EQUAL(std::string("<unset>"), lastHeader("If"));

        m_transport->reply(200, "0123456789abcdef");
        std::string received;
        m_client->getStream("a.txt", boost::bind(append, boost::ref(received), _1, _2));
        CPPUNIT_ASSERT_EQUAL(std::string("0123456789abcdef"), received);

        m_transport->reply(204);
        m_client->remove("a.txt", "opaquelocktoken:1");
        CPPUNIT_ASSERT_EQUAL(std::string("DELETE"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("(<opaquelocktoken:1>)"), lastHeader("If"));

        m_transport->reply(423);
        CPPUNIT_ASSERT_THROW(m_client->remove("a.txt"), ProtocolException);
    }

    void directories() {
        m_transport->reply(201);
        m_client->createDirectory("new");
        CPPUNIT_ASSERT_EQUAL(std::string("MKCOL"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/new"), last().m_url);

        m_transport->reply(405);
        m_transport->reply(201);
        m_transport->reply(201);
        m_client->createDirectoryRecursive("a/b/c/");
        CPPUNIT_ASSERT_EQUAL((size_t)4, m_transport->m_requests.size());
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/a/b/c"), last().m_url);

        m_transport->reply(403);
        CPPUNIT_ASSERT_THROW(m_client->createDirectoryRecursive("x/y"), ProtocolException);
        CPPUNIT_ASSERT_EQUAL((size_t)5, m_transport->m_requests.size());
    }

    void moveCopy() {
        m_transport->reply(201);
        m_client->move("a.txt", "b.txt", false, "opaquelocktoken:1");
        CPPUNIT_ASSERT_EQUAL(std::string("MOVE"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/b.txt"), lastHeader("Destination"));
        CPPUNIT_ASSERT_EQUAL(std::string("F"), lastHeader("Overwrite"));
        CPPUNIT_ASSERT_EQUAL(std::string("(<opaquelocktoken:1>)"), lastHeader("If"));

        m_transport->reply(204);
        m_client->copy("a.txt", "https://other.org/b.txt");
        CPPUNIT_ASSERT_EQUAL(std::string("COPY"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("https://other.org/b.txt"), lastHeader("Destination"));
        CPPUNIT_ASSERT_EQUAL(std::string("T"), lastHeader("Overwrite"));

        m_transport->reply(412);
        try {
            m_client->copy("a.txt", "b.txt", false);
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT_EQUAL(412, ex.getStatus());
            CPPUNIT_ASSERT_EQUAL(std::string("COPY"), ex.getMethod());
        }
    }

    void quota() {
        m_transport->reply(207, multistatus(response("/dav/",
                                                     "<D:quota-available-bytes>3000</D:quota-available-bytes>"
                                                     "<D:quota-used-bytes>1000</D:quota-used-bytes>")));
        DavQuota quota = m_client->getQuota("/");
        CPPUNIT_ASSERT_EQUAL(3000ll, quota.m_availableBytes);
        CPPUNIT_ASSERT_EQUAL(1000ll, quota.m_usedBytes);
        CPPUNIT_ASSERT_EQUAL(4000ll, quota.getTotal());
        CPPUNIT_ASSERT_EQUAL(std::string("0"), lastHeader("Depth"));

        m_transport->reply(207, multistatus(response("/dav/",
                                                     "<D:quota-available-bytes/><D:quota-used-bytes/>",
                                                     "HTTP/1.1 404 Not Found")));
        quota = m_client->getQuota("/");
        CPPUNIT_ASSERT_EQUAL(-1ll, quota.m_availableBytes);
        CPPUNIT_ASSERT_EQUAL(-1ll, quota.m_usedBytes);
        CPPUNIT_ASSERT_EQUAL(-1ll, quota.getTotal());
    }

    void acl() {
        m_transport->reply(207, multistatus(response("/dav/doc",
                                                     "<D:acl>"
                                                     "<D:ace><D:principal><D:href>/principals/alice</D:href></D:principal>"
                                                     "<D:grant><D:privilege><D:read/></D:privilege><D:privilege><D:write/></D:privilege></D:grant></D:ace>"
                                                     "<D:ace><D:principal><D:all/></D:principal>"
                                                     "<D:deny><D:privilege><D:write/></D:privilege></D:deny></D:ace>"
                                                     "<D:ace><D:principal><D:authenticated/></D:principal>"
                                                     "<D:grant><D:privilege><D:read/></D:privilege></D:grant><D:protected/></D:ace>"
                                                     "</D:acl>")));
        DavAcl acl = m_client->getAcl("doc");
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/doc"), acl.m_url);
        CPPUNIT_ASSERT_EQUAL((size_t)3, acl.m_aces.size());
        CPPUNIT_ASSERT(acl.hasPrivilege("/principals/alice", "read"));
        CPPUNIT_ASSERT(!acl.hasPrivilege("DAV:all", "write"));

        m_transport->reply(200);
        m_client->setAcl("doc", acl);
        CPPUNIT_ASSERT_EQUAL(std::string("ACL"), last().m_method);
        DavAcl sent = decodeAcl(*XMLElement::parse(last().m_body));
        // the protected entry belongs to the server
        CPPUNIT_ASSERT_EQUAL((size_t)2, sent.m_aces.size());
        CPPUNIT_ASSERT(sent.m_aces.front() == acl.m_aces.front());
        CPPUNIT_ASSERT_EQUAL(std::string("DAV:all"), sent.m_aces.back().m_principal);
        CPPUNIT_ASSERT(!sent.m_aces.back().m_grant);

        m_transport->reply(207, multistatus(response("/dav/doc", "<D:acl/>", "HTTP/1.1 403 Forbidden")));
        CPPUNIT_ASSERT(m_client->getAcl("doc").m_aces.empty());
    }

    void privileges() {
        std::string privileges =
            multistatus(response("/dav/doc",
                                 "<D:current-user-privilege-set>"
                                 "<D:privilege><D:read/></D:privilege>"
                                 "<D:privilege><D:write-content/></D:privilege>"
                                 "</D:current-user-privilege-set>"));
        m_transport->reply(207, privileges);
        CPPUNIT_ASSERT(m_client->hasPrivilege("doc", "read"));
        m_transport->reply(207, privileges);
        CPPUNIT_ASSERT(!m_client->hasPrivilege("doc", "write-acl"));

        m_transport->reply(207, privileges);
        std::list<std::string> required;
        required.push_back("read");
        required.push_back("unlock");
        std::map<std::string, bool> result = m_client->validatePrivileges("doc", required);
        CPPUNIT_ASSERT(result["read"]);
        CPPUNIT_ASSERT(!result["unlock"]);

        m_transport->reply(207, multistatus(response("/dav/doc",
                                                     "<D:current-user-privilege-set>"
                                                     "<D:privilege><D:all/></D:privilege>"
                                                     "</D:current-user-privilege-set>")));
        CPPUNIT_ASSERT(m_client->hasPrivilege("doc", "write-acl"));

        m_transport->reply(207,
                           multistatus(response("/principals/", "<D:resourcetype><D:collection/></D:resourcetype>") +
                                       response("/principals/alice",
                                                "<D:displayname>Alice</D:displayname>"
                                                "<D:resourcetype><D:principal/></D:resourcetype>")));
        std::list<DavPrincipal> principals = m_client->getPrincipals("/principals/");
        CPPUNIT_ASSERT_EQUAL((size_t)1, principals.size());
        CPPUNIT_ASSERT_EQUAL(std::string("Alice"), principals.front().m_displayName);
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), principals.front().getName());
        CPPUNIT_ASSERT_EQUAL(std::string("1"), lastHeader("Depth"));

        m_transport->reply(207, multistatus(response("/dav/",
                                                     "<D:principal-collection-set>"
                                                     "<D:href>/principals/users/</D:href>"
                                                     "<D:href>/principals/groups/</D:href>"
                                                     "</D:principal-collection-set>")));
        std::list<std::string> collections = m_client->getPrincipalCollectionSet("/");
        CPPUNIT_ASSERT_EQUAL((size_t)2, collections.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/principals/groups/"), collections.back());

        m_transport->reply(207, multistatus(response("/dav/",
                                                     "<D:supported-report-set>"
                                                     "<D:supported-report><D:report><D:sync-collection/></D:report></D:supported-report>"
                                                     "<D:supported-report><D:report><D:version-tree/></D:report></D:supported-report>"
                                                     "</D:supported-report-set>")));
        std::list<std::string> reports = m_client->getSupportedReports("/");
        CPPUNIT_ASSERT_EQUAL((size_t)2, reports.size());
        CPPUNIT_ASSERT_EQUAL(std::string("sync-collection"), reports.front());
    }

    void sync() {
        m_transport->reply(207,
                           "<d:multistatus xmlns:d=\"DAV:\">"
                           "<d:response><d:href>/dav/cal/new.ics</d:href>"
                           "<d:propstat><d:prop><d:getetag>\"1\"</d:getetag></d:prop>"
                           "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>"
                           "<d:response><d:href>/dav/cal/gone.ics</d:href>"
                           "<d:status>HTTP/1.1 404 Not Found</d:status></d:response>"
                           "<d:sync-token>http://example.com/sync/5</d:sync-token>"
                           "</d:multistatus>");
        SyncResult result = m_client->syncCollection("cal/", "http://example.com/sync/4", 1, 10);
        CPPUNIT_ASSERT_EQUAL(std::string("REPORT"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("0"), lastHeader("Depth"));
        XMLElement::Ptr body = XMLElement::parse(last().m_body);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/sync/4"), body->getDescendantText("sync-token"));
        CPPUNIT_ASSERT_EQUAL(std::string("1"), body->getDescendantText("sync-level"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/sync/5"), result.m_syncToken);
        CPPUNIT_ASSERT_EQUAL((size_t)1, result.m_changed.size());
        CPPUNIT_ASSERT_EQUAL(std::string("\"1\""), result.m_changed.front().m_etag);
        CPPUNIT_ASSERT_EQUAL((size_t)1, result.m_removed.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/cal/gone.ics"), result.m_removed.front());

        m_transport->reply(403,
                           "<D:error xmlns:D=\"DAV:\"><D:valid-sync-token/></D:error>");
        try {
            m_client->syncCollection("cal/", "stale");
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("valid-sync-token"), ex.firstCondition());
        }
    }

    void binding() {
        m_transport->reply(201);
        m_client->bind("docs/a.txt", "links/b.txt", true);
        CPPUNIT_ASSERT_EQUAL(std::string("BIND"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/links/"), last().m_url);
        CPPUNIT_ASSERT_EQUAL(std::string("T"), lastHeader("Overwrite"));
        XMLElement::Ptr body = XMLElement::parse(last().m_body);
        CPPUNIT_ASSERT_EQUAL(std::string("b.txt"), body->getDescendantText("segment"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/docs/a.txt"), body->getDescendantText("href"));

        m_transport->reply(200);
        m_client->unbind("links/b.txt");
        CPPUNIT_ASSERT_EQUAL(std::string("UNBIND"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/links/"), last().m_url);
        CPPUNIT_ASSERT_EQUAL(std::string("b.txt"), XMLElement::parse(last().m_body)->getDescendantText("segment"));
    }

    void versioning() {
        Headers location;
        location["Location"] = "http://example.com/dav/wr/1";
        m_transport->reply(201, "", location);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/wr/1"), m_client->checkout("doc"));
        CPPUNIT_ASSERT_EQUAL(std::string("CHECKOUT"), last().m_method);

        m_transport->reply(201, "<D:checkin-response xmlns:D=\"DAV:\"><D:href>/dav/his/1/2</D:href></D:checkin-response>");
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/his/1/2"), m_client->checkin("doc", true));
        CPPUNIT_ASSERT(XMLElement::parse(last().m_body)->findChild("keep-checked-out"));

        m_transport->reply(201);
        CPPUNIT_ASSERT_EQUAL(std::string("coll"), m_client->makeBaseline("coll"));
        CPPUNIT_ASSERT_EQUAL(std::string("MKBASELINE"), last().m_method);

        m_transport->reply(200);
        m_client->versionControl("doc");
        CPPUNIT_ASSERT_EQUAL(std::string("VERSION-CONTROL"), last().m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("application/xml; charset=utf-8"), lastHeader("Content-Type"));

        m_transport->reply(200);
        m_client->uncheckout("doc");
        CPPUNIT_ASSERT_EQUAL(std::string("UNCHECKOUT"), last().m_method);

        m_transport->reply(200);
        m_client->baselineControl("coll", "/dav/bl/1");
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/bl/1"), XMLElement::parse(last().m_body)->getDescendantText("href"));

        m_transport->reply(207, multistatus(response("/dav/his/1/1", "<D:version-name>V1</D:version-name>") +
                                            response("/dav/his/1/2", "<D:version-name>V2</D:version-name>")));
        std::list<DavResource> versions = m_client->versionTreeReport("doc");
        CPPUNIT_ASSERT_EQUAL(std::string("REPORT"), last().m_method);
        CPPUNIT_ASSERT_EQUAL((size_t)2, versions.size());
        CPPUNIT_ASSERT_EQUAL(std::string("V2"), versions.back().getProperty("version-name"));

        m_transport->reply(207, multistatus(response("/dav/doc",
                                                     "<D:version-history><D:href>/dav/his/1/</D:href></D:version-history>")));
        std::list<std::string> history = m_client->getVersionHistory("doc");
        CPPUNIT_ASSERT_EQUAL((size_t)1, history.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/his/1/"), history.front());

        m_transport->reply(207, multistatus(response("/dav/doc",
                                                     "<D:version-history><D:href>/dav/his/1/</D:href></D:version-history>")));
        m_transport->reply(200, "first");
        CPPUNIT_ASSERT_EQUAL(std::string("first"), m_client->getVersion("doc", "1"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/his/1/1"), last().m_url);
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(ClientTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
