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

#include <davclient/Codec.h>
#include <davclient/DavUtil.h>

#include <sstream>
#include <stdlib.h>

#include <boost/foreach.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <boost/algorithm/string/replace.hpp>
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

static const char XML_HEADER[] = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";

PropName::PropName(const std::string &name, const std::string &defaultNamespace)
{
    size_t end;
    if (!name.empty() && name[0] == '{' &&
        (end = name.find('}')) != name.npos) {
        m_namespace = name.substr(1, end - 1);
        m_name = name.substr(end + 1);
    } else {
        m_namespace = defaultNamespace;
        m_name = name;
    }
}

std::string PropName::toXML(const std::string &value) const
{
    std::string tag;
    std::string decl;
    if (m_namespace == "DAV:") {
        tag = "D:" + m_name;
    } else if (m_namespace == CUSTOM_NAMESPACE) {
        tag = "S:" + m_name;
        decl = StringPrintf(" xmlns:S=\"%s\"", CUSTOM_NAMESPACE);
    } else if (m_namespace.empty()) {
        tag = m_name;
        decl = " xmlns=\"\"";
    } else {
        tag = "X:" + m_name;
        decl = " xmlns:X=\"" + XMLEscape(m_namespace) + "\"";
    }
    if (value.empty()) {
        return "<" + tag + decl + "/>";
    } else {
        return "<" + tag + decl + ">" + XMLEscape(value) + "</" + tag + ">";
    }
}

std::list<std::string> standardProps()
{
    static const char *names[] = {
        "getcontentlength",
        "getlastmodified",
        "creationdate",
        "displayname",
        "getcontenttype",
        "resourcetype",
        "getetag",
        "lockdiscovery",
        NULL
    };
    std::list<std::string> res;
    for (int i = 0; names[i]; i++) {
        res.push_back(names[i]);
    }
    return res;
}

std::string encodePropfindAllprop()
{
    return std::string(XML_HEADER) +
        "<D:propfind xmlns:D=\"DAV:\">\n"
        "  <D:allprop/>\n"
        "</D:propfind>";
}

std::string encodePropfindPropname()
{
    return std::string(XML_HEADER) +
        "<D:propfind xmlns:D=\"DAV:\">\n"
        "  <D:propname/>\n"
        "</D:propfind>";
}

std::string encodePropfind(const std::list<std::string> &names)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:propfind xmlns:D=\"DAV:\">\n"
        << "  <D:prop>\n";
    BOOST_FOREACH(const std::string &name, names) {
        out << "    " << PropName(name).toXML() << "\n";
    }
    out << "  </D:prop>\n"
        << "</D:propfind>";
    return out.str();
}

std::string encodePropertyUpdate(const StringMap &setProps,
                                 const std::list<std::string> &removeProps)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:propertyupdate xmlns:D=\"DAV:\">\n";
    if (!setProps.empty()) {
        out << "  <D:set>\n"
            << "    <D:prop>\n";
        BOOST_FOREACH(const StringPair &prop, setProps) {
            out << "      " << PropName(prop.first, CUSTOM_NAMESPACE).toXML(prop.second) << "\n";
        }
        out << "    </D:prop>\n"
            << "  </D:set>\n";
    }
    if (!removeProps.empty()) {
        out << "  <D:remove>\n"
            << "    <D:prop>\n";
        BOOST_FOREACH(const std::string &name, removeProps) {
            out << "      " << PropName(name, CUSTOM_NAMESPACE).toXML() << "\n";
        }
        out << "    </D:prop>\n"
            << "  </D:remove>\n";
    }
    out << "</D:propertyupdate>";
    return out.str();
}

std::string encodeLockInfo(const std::string &owner, bool exclusive)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:lockinfo xmlns:D=\"DAV:\">\n"
        << "  <D:lockscope><D:" << (exclusive ? "exclusive" : "shared") << "/></D:lockscope>\n"
        << "  <D:locktype><D:write/></D:locktype>\n"
        << "  <D:owner>" << XMLEscape(owner) << "</D:owner>\n"
        << "</D:lockinfo>";
    return out.str();
}

/** "DAV:all" -> <D:all/>, everything else is an href */
static std::string encodePrincipal(const std::string &principal)
{
    static const char *special[] = { "all", "authenticated", "unauthenticated", "self", NULL };
    for (int i = 0; special[i]; i++) {
        if (principal == std::string("DAV:") + special[i]) {
            return std::string("<D:") + special[i] + "/>";
        }
    }
    return "<D:href>" + XMLEscape(principal) + "</D:href>";
}

std::string encodeAcl(const DavAcl &acl)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:acl xmlns:D=\"DAV:\">\n";
    BOOST_FOREACH(const DavAce &ace, acl.m_aces) {
        if (ace.m_inherited || ace.m_protected) {
            continue;
        }
        const char *kind = ace.m_grant ? "grant" : "deny";
        out << "  <D:ace>\n"
            << "    <D:principal>" << encodePrincipal(ace.m_principal) << "</D:principal>\n"
            << "    <D:" << kind << ">\n";
        BOOST_FOREACH(const std::string &privilege, ace.m_privileges) {
            out << "      <D:privilege><D:" << privilege << "/></D:privilege>\n";
        }
        out << "    </D:" << kind << ">\n"
            << "  </D:ace>\n";
    }
    out << "</D:acl>";
    return out.str();
}

std::string encodeSearch(const std::string &query,
                         const std::string &language,
                         const std::string &scope)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:searchrequest xmlns:D=\"DAV:\">\n";
    if (language == "davbasic") {
        out << "  <D:basicsearch>\n"
            << "    <D:select><D:allprop/></D:select>\n"
            << "    <D:from>\n"
            << "      <D:scope>\n"
            << "        <D:href>" << XMLEscape(scope) << "</D:href>\n"
            << "        <D:depth>infinity</D:depth>\n"
            << "      </D:scope>\n"
            << "    </D:from>\n"
            << "    <D:where>\n"
            << "      <D:contains>" << XMLEscape(query) << "</D:contains>\n"
            << "    </D:where>\n"
            << "  </D:basicsearch>\n";
    } else {
        out << "  <D:sql>" << XMLEscape(query) << "</D:sql>\n";
    }
    out << "</D:searchrequest>";
    return out.str();
}

std::string encodeSyncCollection(const std::string &syncToken,
                                 int depth,
                                 int limit,
                                 const std::list<std::string> &props)
{
    std::ostringstream out;
    out << XML_HEADER
        << "<D:sync-collection xmlns:D=\"DAV:\">\n"
        << "  <D:sync-token>" << XMLEscape(syncToken) << "</D:sync-token>\n"
        << "  <D:sync-level>" << (depth == DEPTH_INFINITY ? "infinite" : "1") << "</D:sync-level>\n";
    if (limit > 0) {
        out << "  <D:limit><D:nresults>" << limit << "</D:nresults></D:limit>\n";
    }
    out << "  <D:prop>\n";
    if (props.empty()) {
        out << "    <D:getetag/>\n"
            << "    <D:getcontentlength/>\n"
            << "    <D:getlastmodified/>\n";
    } else {
        BOOST_FOREACH(const std::string &name, props) {
            out << "    " << PropName(name).toXML() << "\n";
        }
    }
    out << "  </D:prop>\n"
        << "</D:sync-collection>";
    return out.str();
}

std::string encodeBind(const std::string &segment, const std::string &href)
{
    return std::string(XML_HEADER) +
        "<D:bind xmlns:D=\"DAV:\">\n"
        "  <D:segment>" + XMLEscape(segment) + "</D:segment>\n"
        "  <D:href>" + XMLEscape(href) + "</D:href>\n"
        "</D:bind>";
}

std::string encodeUnbind(const std::string &segment)
{
    return std::string(XML_HEADER) +
        "<D:unbind xmlns:D=\"DAV:\">\n"
        "  <D:segment>" + XMLEscape(segment) + "</D:segment>\n"
        "</D:unbind>";
}

/** <D:element> with an optional <D:wrapper><D:href>...</D:href></D:wrapper> */
static std::string encodeHrefElement(const std::string &element,
                                     const std::string &wrapper,
                                     const std::string &href)
{
    if (href.empty()) {
        return std::string(XML_HEADER) +
            "<D:" + element + " xmlns:D=\"DAV:\"/>";
    }
    return std::string(XML_HEADER) +
        "<D:" + element + " xmlns:D=\"DAV:\">\n"
        "  <D:" + wrapper + "><D:href>" + XMLEscape(href) + "</D:href></D:" + wrapper + ">\n"
        "</D:" + element + ">";
}

std::string encodeVersionControl(const std::string &version)
{
    return encodeHrefElement("version-control", "version", version);
}

std::string encodeCheckout(const std::string &activitySet)
{
    return encodeHrefElement("checkout", "activity-set", activitySet);
}

std::string encodeCheckin(bool keepCheckedOut)
{
    if (!keepCheckedOut) {
        return std::string(XML_HEADER) + "<D:checkin xmlns:D=\"DAV:\"/>";
    }
    return std::string(XML_HEADER) +
        "<D:checkin xmlns:D=\"DAV:\">\n"
        "  <D:keep-checked-out/>\n"
        "</D:checkin>";
}

std::string encodeUncheckout()
{
    return std::string(XML_HEADER) + "<D:uncheckout xmlns:D=\"DAV:\"/>";
}

std::string encodeBaselineControl(const std::string &baseline)
{
    return encodeHrefElement("baseline-control", "baseline", baseline);
}

std::string encodeMkBaseline()
{
    return std::string(XML_HEADER) + "<D:mkbaseline xmlns:D=\"DAV:\"/>";
}

std::string encodeVersionTreeReport()
{
    return std::string(XML_HEADER) +
        "<D:version-tree xmlns:D=\"DAV:\">\n"
        "  <D:prop>\n"
        "    <D:version-name/>\n"
        "    <D:creator-displayname/>\n"
        "    <D:creationdate/>\n"
        "    <D:successor-set/>\n"
        "    <D:predecessor-set/>\n"
        "  </D:prop>\n"
        "</D:version-tree>";
}

void decodeProp(const XMLElement &prop, Propstat &propstat)
{
    BOOST_FOREACH(const XMLElement::Ptr &child, prop.getChildren()) {
        const std::string &name = child->getName();
        std::string value;
        if (name == "resourcetype") {
            // extension elements may wrap the marker
            if (child->findDescendant("collection")) {
                value = "collection";
            }
        } else {
            value = child->getText();
        }
        propstat.m_props[name] = value;
        propstat.m_elements[name] = child;
    }
}

static void decodeResponse(const XMLElement &elem, Response &response)
{
    const XMLElement *href = elem.findChild("href");
    if (!href) {
        DAV_THROW_EXCEPTION(MalformedResponseException, "<response> without <href>");
    }
    response.m_href = href->getText();

    BOOST_FOREACH(const XMLElement *propstatElem, elem.findChildren("propstat")) {
        const XMLElement *prop = propstatElem->findChild("prop");
        const XMLElement *status = propstatElem->findChild("status");
        if (!prop || !status) {
            DAV_THROW_EXCEPTION(MalformedResponseException,
                                StringPrintf("<propstat> of %s without <%s>",
                                             response.m_href.c_str(),
                                             prop ? "status" : "prop"));
        }
        Propstat propstat;
        propstat.m_status = status->getText();
        const XMLElement *descr = propstatElem->findChild("responsedescription");
        if (descr) {
            propstat.m_description = descr->getText();
        }
        decodeProp(*prop, propstat);
        response.m_propstats.push_back(propstat);
    }

    const XMLElement *status = elem.findChild("status");
    if (status) {
        response.m_status = status->getText();
    }
    const XMLElement *error = elem.findChild("error");
    if (error) {
        BOOST_FOREACH(const XMLElement::Ptr &condition, error->getChildren()) {
            response.m_errors.push_back(condition->getName());
        }
    }
    const XMLElement *descr = elem.findChild("responsedescription");
    if (descr) {
        response.m_description = descr->getText();
    }
    const XMLElement *location = elem.findChild("location");
    if (location) {
        response.m_location = location->getDescendantText("href");
    }
}

Multistatus decodeMultistatus(const std::string &body)
{
    XMLElement::Ptr root = XMLElement::parse(body);
    if (root->getName() != "multistatus") {
        DAV_THROW_EXCEPTION(MalformedResponseException,
                            StringPrintf("expected <multistatus>, got <%s>", root->getName().c_str()));
    }

    Multistatus multistatus;
    BOOST_FOREACH(const XMLElement *elem, root->findChildren("response")) {
        multistatus.m_responses.push_back(Response());
        decodeResponse(*elem, multistatus.m_responses.back());
    }
    const XMLElement *descr = root->findChild("responsedescription");
    if (descr) {
        multistatus.m_description = descr->getText();
    }
    const XMLElement *token = root->findChild("sync-token");
    if (token) {
        multistatus.m_syncToken = token->getText();
    }
    return multistatus;
}

DavResource decodeResource(const Response &response)
{
    DavResource res;
    res.m_href = response.m_href;
    res.m_status = response.getStatusCode();

    BOOST_FOREACH(const Propstat &propstat, response.m_propstats) {
        if (!propstat.isOkay()) {
            continue;
        }
        if (!res.m_status) {
            res.m_status = propstat.getStatusCode();
        }
        BOOST_FOREACH(const StringPair &prop, propstat.m_props) {
            res.m_props[prop.first] = prop.second;
        }
        const XMLElement *type = propstat.getElement("resourcetype");
        if (type) {
            BOOST_FOREACH(const XMLElement::Ptr &child, type->getChildren()) {
                res.m_resourceTypes.insert(child->getName());
            }
            if (type->findDescendant("collection")) {
                res.m_resourceTypes.insert("collection");
            }
        }
    }
    if (!res.m_status && !response.m_propstats.empty()) {
        res.m_status = response.m_propstats.front().getStatusCode();
    }

    res.m_contentType = res.getProperty("getcontenttype");
    if (res.m_contentType.empty()) {
        res.m_contentType = "application/octet-stream";
    }
    std::string length = res.getProperty("getcontentlength");
    res.m_contentLength = length.empty() ? 0 : strtoll(length.c_str(), NULL, 10);
    res.m_etag = res.getProperty("getetag");
    res.m_displayName = res.getProperty("displayname");
    res.m_lastModified = res.getProperty("getlastmodified");
    res.m_creationDate = res.getProperty("creationdate");
    return res;
}

std::list<DavResource> decodeResources(const Multistatus &multistatus)
{
    std::list<DavResource> res;
    BOOST_FOREACH(const Response &response, multistatus.m_responses) {
        res.push_back(decodeResource(response));
    }
    return res;
}

std::string decodeLockToken(const std::string &body)
{
    if (StripSpace(body).empty()) {
        return "";
    }
    XMLElement::Ptr root = XMLElement::parse(body);
    const XMLElement *locktoken = root->getName() == "locktoken" ?
        root.get() :
        root->findDescendant("locktoken");
    return locktoken ? locktoken->getDescendantText("href") : "";
}

std::list<ActiveLock> decodeActiveLocks(const XMLElement &lockdiscovery)
{
    std::list<ActiveLock> locks;
    BOOST_FOREACH(const XMLElement *elem, lockdiscovery.findDescendants("activelock")) {
        ActiveLock lock;
        lock.m_scope = elem->findDescendant("shared") ? "shared" : "exclusive";
        lock.m_type = "write";
        lock.m_depth = elem->getDescendantText("depth");
        if (lock.m_depth.empty()) {
            lock.m_depth = "0";
        }
        lock.m_owner = elem->getDescendantText("owner");
        lock.m_timeout = elem->getDescendantText("timeout");
        const XMLElement *token = elem->findDescendant("locktoken");
        lock.m_token = token ?
            token->getDescendantText("href") :
            elem->getDescendantText("href");
        const XMLElement *root = elem->findDescendant("lockroot");
        if (root) {
            lock.m_root = root->getDescendantText("href");
        }
        locks.push_back(lock);
    }
    return locks;
}

static std::string decodePrincipal(const XMLElement *principal)
{
    static const char *special[] = { "all", "authenticated", "unauthenticated", "self", NULL };

    if (principal) {
        const XMLElement *href = principal->findChild("href");
        if (href) {
            return href->getText();
        }
        for (int i = 0; special[i]; i++) {
            if (principal->findChild(special[i])) {
                return std::string("DAV:") + special[i];
            }
        }
    }
    return "unknown";
}

DavAcl decodeAcl(const XMLElement &acl)
{
    DavAcl res;
    BOOST_FOREACH(const XMLElement *elem, acl.findChildren("ace")) {
        DavAce ace(decodePrincipal(elem->findChild("principal")));
        const XMLElement *grant = elem->findChild("grant");
        const XMLElement *deny = elem->findChild("deny");
        ace.m_grant = grant && !deny;
        const XMLElement *privileges = deny ? deny : grant;
        if (privileges) {
            BOOST_FOREACH(const XMLElement *privilege, privileges->findChildren("privilege")) {
                if (!privilege->getChildren().empty()) {
                    ace.m_privileges.insert(privilege->getChildren().front()->getName());
                }
            }
        }
        ace.m_protected = elem->findChild("protected") != NULL;
        ace.m_inherited = elem->findChild("inherited") != NULL;
        res.m_aces.push_back(ace);
    }
    return res;
}

std::set<std::string> decodePrivileges(const XMLElement &privilegeSet)
{
    std::set<std::string> res;
    BOOST_FOREACH(const XMLElement *privilege, privilegeSet.findDescendants("privilege")) {
        BOOST_FOREACH(const XMLElement::Ptr &child, privilege->getChildren()) {
            res.insert(child->getName());
        }
    }
    return res;
}

std::list<std::string> decodeSupportedReports(const XMLElement &reportSet)
{
    std::list<std::string> res;
    BOOST_FOREACH(const XMLElement *report, reportSet.findDescendants("report")) {
        if (!report->getChildren().empty()) {
            res.push_back(report->getChildren().front()->getName());
        }
    }
    return res;
}

std::list<std::string> decodeHrefs(const XMLElement &elem)
{
    std::list<std::string> res;
    BOOST_FOREACH(const XMLElement *href, elem.findDescendants("href")) {
        res.push_back(href->getText());
    }
    return res;
}

std::string decodeFirstHref(const std::string &body)
{
    if (StripSpace(body).empty()) {
        return "";
    }
    try {
        XMLElement::Ptr root = XMLElement::parse(body);
        return root->getName() == "href" ? root->getText() : root->getDescendantText("href");
    } catch (const MalformedResponseException &ex) {
        DAV_LOG_DEBUG(NULL, NULL, "no href in body: %s", ex.what());
        return "";
    }
}

bool decodeError(const std::string &body,
                 std::list<std::string> &conditions,
                 std::string &description)
{
    conditions.clear();
    description.clear();
    if (StripSpace(body).empty() || StripSpace(body)[0] != '<') {
        return false;
    }

    XMLElement::Ptr root;
    try {
        root = XMLElement::parse(body);
    } catch (const MalformedResponseException &ex) {
        DAV_LOG_DEBUG(NULL, NULL, "error body is not XML: %s", ex.what());
        return false;
    }
    const XMLElement *error = root->getName() == "error" ?
        root.get() :
        root->findDescendant("error");
    if (!error) {
        return false;
    }
    BOOST_FOREACH(const XMLElement::Ptr &child, error->getChildren()) {
        conditions.push_back(child->getName());
        if (description.empty()) {
            description = child->getText();
        }
    }
    return true;
}

#ifdef ENABLE_UNIT_TESTS

class CodecTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(CodecTest);
    CPPUNIT_TEST(prefixVariants);
    CPPUNIT_TEST(propRoundTrip);
    CPPUNIT_TEST(mixedPropstat);
    CPPUNIT_TEST(statusOnly);
    CPPUNIT_TEST(malformed);
    CPPUNIT_TEST(propertyUpdate);
    CPPUNIT_TEST(lockToken);
    CPPUNIT_TEST(activeLocks);
    CPPUNIT_TEST(acl);
    CPPUNIT_TEST(reports);
    CPPUNIT_TEST(bodies);
    CPPUNIT_TEST(error);
    CPPUNIT_TEST_SUITE_END();

    /** the same listing with "P:" replaced by the given prefix */
    static std::string multistatus(const std::string &prefix, const std::string &decl) {
        std::string doc =
            "<?xml version=\"1.0\"?>"
            "<P:multistatus DECL>"
            "<P:response>"
            "<P:href>/dav/dir/file%20one.txt</P:href>"
            "<P:propstat><P:prop>"
            "<P:getcontentlength>1234</P:getcontentlength>"
            "<P:getcontenttype>text/plain</P:getcontenttype>"
            "<P:getetag>\"abc\"</P:getetag>"
            "<P:resourcetype/>"
            "</P:prop><P:status>HTTP/1.1 200 OK</P:status></P:propstat>"
            "</P:response>"
            "<P:response>"
            "<P:href>/dav/dir/</P:href>"
            "<P:propstat><P:prop>"
            "<P:resourcetype><P:collection/></P:resourcetype>"
            "</P:prop><P:status>HTTP/1.1 200 OK</P:status></P:propstat>"
            "</P:response>"
            "</P:multistatus>";
        boost::replace_all(doc, "P:", prefix.empty() ? "" : prefix + ":");
        boost::replace_all(doc, "DECL", decl);
        return doc;
    }

    void prefixVariants() {
        std::list<std::string> docs;
        docs.push_back(multistatus("D", "xmlns:D=\"DAV:\""));
        docs.push_back(multistatus("d", "xmlns:d=\"DAV:\""));
        docs.push_back(multistatus("", "xmlns=\"DAV:\""));

        std::list<std::string> dumps;
        BOOST_FOREACH(const std::string &doc, docs) {
            std::list<DavResource> resources = decodeResources(decodeMultistatus(doc));
            CPPUNIT_ASSERT_EQUAL((size_t)2, resources.size());

            const DavResource &file = resources.front();
            CPPUNIT_ASSERT_EQUAL(std::string("file one.txt"), file.getName());
            CPPUNIT_ASSERT_EQUAL(1234LL, file.m_contentLength);
            CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), file.m_contentType);
            CPPUNIT_ASSERT_EQUAL(std::string("\"abc\""), file.m_etag);
            CPPUNIT_ASSERT_EQUAL(200, file.m_status);
            CPPUNIT_ASSERT(!file.isDirectory());

            const DavResource &dir = resources.back();
            CPPUNIT_ASSERT(dir.isDirectory());
            CPPUNIT_ASSERT_EQUAL(std::string("dir"), dir.getName());
            CPPUNIT_ASSERT_EQUAL(0LL, dir.m_contentLength);
            CPPUNIT_ASSERT_EQUAL(std::string("collection"), dir.getProperty("resourcetype"));

            std::string dump;
            BOOST_FOREACH(const DavResource &res, resources) {
                dump += res.toString() + "\n";
                BOOST_FOREACH(const StringPair &prop, res.m_props) {
                    dump += prop.first + "=" + prop.second + "\n";
                }
            }
            dumps.push_back(dump);
        }
        CPPUNIT_ASSERT_EQUAL(dumps.front(), *(++dumps.begin()));
        CPPUNIT_ASSERT_EQUAL(dumps.front(), dumps.back());
    }

    void propRoundTrip() {
        std::list<std::string> names;
        names.push_back("getetag");
        names.push_back("displayname");
        names.push_back("{http://example.com/ns}color");

        // the request names exactly the requested properties
        XMLElement::Ptr request = XMLElement::parse(encodePropfind(names));
        CPPUNIT_ASSERT_EQUAL(std::string("propfind"), request->getName());
        const XMLElement *prop = request->findChild("prop");
        CPPUNIT_ASSERT(prop);
        std::set<std::string> requested;
        std::string customNamespace;
        BOOST_FOREACH(const XMLElement::Ptr &child, prop->getChildren()) {
            requested.insert(child->getName());
            if (child->getName() == "color") {
                customNamespace = child->getNamespace();
            }
        }
        CPPUNIT_ASSERT_EQUAL((size_t)3, requested.size());
        CPPUNIT_ASSERT(requested.count("getetag"));
        CPPUNIT_ASSERT(requested.count("displayname"));
        CPPUNIT_ASSERT(requested.count("color"));
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/ns"), customNamespace);

        Multistatus ms = decodeMultistatus(
            "<D:multistatus xmlns:D=\"DAV:\" xmlns:X=\"http://example.com/ns\">"
            "<D:response><D:href>/a</D:href>"
            "<D:propstat><D:prop>"
            "<D:getetag>\"1\"</D:getetag>"
            "<D:displayname>A</D:displayname>"
            "<X:color>red</X:color>"
            "</D:prop><D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
            "</D:response></D:multistatus>");
        DavResource res = decodeResource(ms.m_responses.front());
        std::set<std::string> decoded;
        BOOST_FOREACH(const StringPair &entry, res.m_props) {
            decoded.insert(entry.first);
        }
        CPPUNIT_ASSERT(requested == decoded);
        CPPUNIT_ASSERT_EQUAL(std::string("red"), res.getProperty("color"));
        CPPUNIT_ASSERT_EQUAL(std::string("A"), res.m_displayName);
    }

    void mixedPropstat() {
        Multistatus ms = decodeMultistatus(
            "<D:multistatus xmlns:D=\"DAV:\">"
            "<D:response><D:href>/a</D:href>"
            "<D:propstat><D:prop><D:getetag>\"1\"</D:getetag></D:prop>"
            "<D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
            "<D:propstat><D:prop><D:quota-used-bytes/></D:prop>"
            "<D:status>HTTP/1.1 403 Forbidden</D:status>"
            "<D:responsedescription>not allowed</D:responsedescription></D:propstat>"
            "</D:response></D:multistatus>");
        CPPUNIT_ASSERT_EQUAL((size_t)1, ms.m_responses.size());
        const Response &response = ms.m_responses.front();
        CPPUNIT_ASSERT_EQUAL((size_t)2, response.m_propstats.size());
        CPPUNIT_ASSERT_EQUAL(403, response.m_propstats.back().getStatusCode());
        CPPUNIT_ASSERT_EQUAL(std::string("not allowed"), response.m_propstats.back().m_description);
        CPPUNIT_ASSERT(response.findProperty("getetag"));
        CPPUNIT_ASSERT(!response.findProperty("quota-used-bytes"));

        DavResource res = decodeResource(response);
        CPPUNIT_ASSERT_EQUAL(200, res.m_status);
        CPPUNIT_ASSERT(res.hasProperty("getetag"));
        CPPUNIT_ASSERT(!res.hasProperty("quota-used-bytes"));
    }

    void statusOnly() {
        Multistatus ms = decodeMultistatus(
            "<multistatus xmlns=\"DAV:\">"
            "<response><href>/gone</href><status>HTTP/1.1 404 Not Found</status></response>"
            "<response><href>/locked</href><status>HTTP/1.1 423 Locked</status>"
            "<error><lock-token-submitted><href>/locked</href></lock-token-submitted></error>"
            "</response>"
            "<sync-token>http://example.com/sync/2</sync-token>"
            "</multistatus>");
        CPPUNIT_ASSERT_EQUAL((size_t)2, ms.m_responses.size());
        CPPUNIT_ASSERT_EQUAL(404, ms.m_responses.front().getStatusCode());
        CPPUNIT_ASSERT(ms.m_responses.front().m_propstats.empty());
        CPPUNIT_ASSERT_EQUAL(404, decodeResource(ms.m_responses.front()).m_status);
        CPPUNIT_ASSERT_EQUAL((size_t)1, ms.m_responses.back().m_errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("lock-token-submitted"), ms.m_responses.back().m_errors.front());
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/sync/2"), ms.m_syncToken);
    }

    void malformed() {
        // not XML
        CPPUNIT_ASSERT_THROW(decodeMultistatus("<html><body>oops"), MalformedResponseException);
        CPPUNIT_ASSERT_THROW(decodeMultistatus(""), MalformedResponseException);
        // wrong root
        CPPUNIT_ASSERT_THROW(decodeMultistatus("<D:prop xmlns:D=\"DAV:\"/>"), MalformedResponseException);
        // response without href
        CPPUNIT_ASSERT_THROW(decodeMultistatus("<D:multistatus xmlns:D=\"DAV:\">"
                                               "<D:response><D:status>HTTP/1.1 200 OK</D:status></D:response>"
                                               "</D:multistatus>"),
                             MalformedResponseException);
        // propstat without status
        CPPUNIT_ASSERT_THROW(decodeMultistatus("<D:multistatus xmlns:D=\"DAV:\">"
                                               "<D:response><D:href>/a</D:href>"
                                               "<D:propstat><D:prop/></D:propstat>"
                                               "</D:response></D:multistatus>"),
                             MalformedResponseException);
        // an empty multistatus is fine
        CPPUNIT_ASSERT(decodeMultistatus("<D:multistatus xmlns:D=\"DAV:\"/>").m_responses.empty());
    }

    void propertyUpdate() {
        StringMap setProps;
        setProps["author"] = "Jane <jd>";
        setProps["{DAV:}displayname"] = "Report";
        std::list<std::string> removeProps;
        removeProps.push_back("obsolete");

        std::string body = encodePropertyUpdate(setProps, removeProps);
        XMLElement::Ptr root = XMLElement::parse(body);
        CPPUNIT_ASSERT_EQUAL(std::string("propertyupdate"), root->getName());

        const XMLElement *set = root->findChild("set");
        CPPUNIT_ASSERT(set);
        const XMLElement *author = set->findDescendant("author");
        CPPUNIT_ASSERT(author);
        CPPUNIT_ASSERT_EQUAL(std::string(CUSTOM_NAMESPACE), author->getNamespace());
        CPPUNIT_ASSERT_EQUAL(std::string("Jane <jd>"), author->getText());
        const XMLElement *displayname = set->findDescendant("displayname");
        CPPUNIT_ASSERT(displayname);
        CPPUNIT_ASSERT(displayname->isDAV());

        const XMLElement *remove = root->findChild("remove");
        CPPUNIT_ASSERT(remove);
        const XMLElement *obsolete = remove->findDescendant("obsolete");
        CPPUNIT_ASSERT(obsolete);
        CPPUNIT_ASSERT_EQUAL(std::string(CUSTOM_NAMESPACE), obsolete->getNamespace());
        CPPUNIT_ASSERT_EQUAL(std::string(""), obsolete->getText());

        // nothing to remove: no <remove> section
        root = XMLElement::parse(encodePropertyUpdate(setProps, std::list<std::string>()));
        CPPUNIT_ASSERT(!root->findChild("remove"));
    }

    void lockToken() {
        static const char *docs[] = {
            "<D:prop xmlns:D=\"DAV:\"><D:lockdiscovery><D:activelock>"
            "<D:locktoken><D:href>urn:uuid:1234</D:href></D:locktoken>"
            "</D:activelock></D:lockdiscovery></D:prop>",
            "<d:prop xmlns:d=\"DAV:\"><d:lockdiscovery><d:activelock>"
            "<d:locktoken><d:href>urn:uuid:1234</d:href></d:locktoken>"
            "</d:activelock></d:lockdiscovery></d:prop>",
            "<prop xmlns=\"DAV:\"><lockdiscovery><activelock>"
            "<locktoken>\n  <href> urn:uuid:1234 </href>\n</locktoken>"
            "</activelock></lockdiscovery></prop>",
            NULL
        };
        for (int i = 0; docs[i]; i++) {
            CPPUNIT_ASSERT_EQUAL(std::string("urn:uuid:1234"), decodeLockToken(docs[i]));
        }
        CPPUNIT_ASSERT_EQUAL(std::string(""), decodeLockToken(""));
        CPPUNIT_ASSERT_EQUAL(std::string(""), decodeLockToken("<D:prop xmlns:D=\"DAV:\"/>"));
        CPPUNIT_ASSERT_THROW(decodeLockToken("not xml <"), MalformedResponseException);
    }

    void activeLocks() {
        XMLElement::Ptr root = XMLElement::parse(
            "<D:lockdiscovery xmlns:D=\"DAV:\">"
            "<D:activelock>"
            "<D:locktype><D:write/></D:locktype>"
            "<D:lockscope><D:shared/></D:lockscope>"
            "<D:depth>infinity</D:depth>"
            "<D:owner>alice</D:owner>"
            "<D:timeout>Second-3600</D:timeout>"
            "<D:locktoken><D:href>opaquelocktoken:abc</D:href></D:locktoken>"
            "<D:lockroot><D:href>/dav/dir</D:href></D:lockroot>"
            "</D:activelock>"
            "<D:activelock>"
            "<D:lockscope><D:exclusive/></D:lockscope>"
            "<D:href>opaquelocktoken:def</D:href>"
            "</D:activelock>"
            "</D:lockdiscovery>");
        std::list<ActiveLock> locks = decodeActiveLocks(*root);
        CPPUNIT_ASSERT_EQUAL((size_t)2, locks.size());
        const ActiveLock &shared = locks.front();
        CPPUNIT_ASSERT(!shared.isExclusive());
        CPPUNIT_ASSERT_EQUAL(std::string("infinity"), shared.m_depth);
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), shared.m_owner);
        CPPUNIT_ASSERT_EQUAL(std::string("Second-3600"), shared.m_timeout);
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:abc"), shared.m_token);
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/dir"), shared.m_root);
        const ActiveLock &exclusive = locks.back();
        CPPUNIT_ASSERT(exclusive.isExclusive());
        CPPUNIT_ASSERT_EQUAL(std::string("0"), exclusive.m_depth);
        CPPUNIT_ASSERT_EQUAL(std::string("opaquelocktoken:def"), exclusive.m_token);
    }

    void acl() {
        DavAcl acl;
        DavAce alice("/principals/alice", true);
        alice.m_privileges.insert("read");
        alice.m_privileges.insert("write");
        DavAce everybody("DAV:all", false);
        everybody.m_privileges.insert("write");
        DavAce inherited("/principals/bob", true);
        inherited.m_privileges.insert("read");
        inherited.m_inherited = true;
        acl.m_aces.push_back(alice);
        acl.m_aces.push_back(everybody);
        acl.m_aces.push_back(inherited);

        XMLElement::Ptr root = XMLElement::parse(encodeAcl(acl));
        CPPUNIT_ASSERT_EQUAL(std::string("acl"), root->getName());
        DavAcl decoded = decodeAcl(*root);
        CPPUNIT_ASSERT_EQUAL((size_t)2, decoded.m_aces.size());
        CPPUNIT_ASSERT(decoded.m_aces.front() == alice);
        CPPUNIT_ASSERT(decoded.m_aces.back() == everybody);

        root = XMLElement::parse(
            "<D:acl xmlns:D=\"DAV:\">"
            "<D:ace><D:principal><D:authenticated/></D:principal>"
            "<D:grant><D:privilege><D:read/></D:privilege></D:grant>"
            "<D:protected/></D:ace>"
            "<D:ace><D:principal><D:property><D:owner/></D:property></D:principal>"
            "<D:grant><D:privilege><D:all/></D:privilege></D:grant>"
            "<D:inherited><D:href>/dav/</D:href></D:inherited></D:ace>"
            "</D:acl>");
        decoded = decodeAcl(*root);
        CPPUNIT_ASSERT_EQUAL((size_t)2, decoded.m_aces.size());
        CPPUNIT_ASSERT_EQUAL(std::string("DAV:authenticated"), decoded.m_aces.front().m_principal);
        CPPUNIT_ASSERT(decoded.m_aces.front().m_protected);
        CPPUNIT_ASSERT_EQUAL(std::string("unknown"), decoded.m_aces.back().m_principal);
        CPPUNIT_ASSERT(decoded.m_aces.back().m_inherited);
        CPPUNIT_ASSERT(decoded.m_aces.back().hasPrivilege("all"));
    }

    void reports() {
        XMLElement::Ptr root = XMLElement::parse(
            "<D:current-user-privilege-set xmlns:D=\"DAV:\">"
            "<D:privilege><D:read/></D:privilege>"
            "<D:privilege><D:write-content/></D:privilege>"
            "</D:current-user-privilege-set>");
        std::set<std::string> privileges = decodePrivileges(*root);
        CPPUNIT_ASSERT_EQUAL((size_t)2, privileges.size());
        CPPUNIT_ASSERT(privileges.count("write-content"));

        root = XMLElement::parse(
            "<D:supported-report-set xmlns:D=\"DAV:\">"
            "<D:supported-report><D:report><D:version-tree/></D:report></D:supported-report>"
            "<D:supported-report><D:report><D:sync-collection/></D:report></D:supported-report>"
            "</D:supported-report-set>");
        std::list<std::string> reports = decodeSupportedReports(*root);
        CPPUNIT_ASSERT_EQUAL((size_t)2, reports.size());
        CPPUNIT_ASSERT_EQUAL(std::string("version-tree"), reports.front());
        CPPUNIT_ASSERT_EQUAL(std::string("sync-collection"), reports.back());

        root = XMLElement::parse(
            "<D:version-history xmlns:D=\"DAV:\"><D:href>/his/1</D:href><D:href>/his/2</D:href></D:version-history>");
        CPPUNIT_ASSERT_EQUAL((size_t)2, decodeHrefs(*root).size());
        CPPUNIT_ASSERT_EQUAL(std::string("/his/1"), decodeFirstHref(
            "<D:checkout-response xmlns:D=\"DAV:\"><D:href>/his/1</D:href></D:checkout-response>"));
        CPPUNIT_ASSERT_EQUAL(std::string(""), decodeFirstHref("plain text"));
    }

    void bodies() {
        XMLElement::Ptr root = XMLElement::parse(encodePropfindAllprop());
        CPPUNIT_ASSERT(root->findChild("allprop"));
        root = XMLElement::parse(encodePropfindPropname());
        CPPUNIT_ASSERT(root->findChild("propname"));

        root = XMLElement::parse(encodeLockInfo("me & you", false));
        CPPUNIT_ASSERT_EQUAL(std::string("lockinfo"), root->getName());
        CPPUNIT_ASSERT(root->findDescendant("shared"));
        CPPUNIT_ASSERT(root->findDescendant("write"));
        CPPUNIT_ASSERT_EQUAL(std::string("me & you"), root->getDescendantText("owner"));

        root = XMLElement::parse(encodeSearch("budget", "davbasic", "/docs"));
        CPPUNIT_ASSERT(root->findDescendant("basicsearch"));
        CPPUNIT_ASSERT_EQUAL(std::string("/docs"), root->getDescendantText("href"));
        CPPUNIT_ASSERT_EQUAL(std::string("infinity"), root->getDescendantText("depth"));
        CPPUNIT_ASSERT_EQUAL(std::string("budget"), root->getDescendantText("contains"));
        root = XMLElement::parse(encodeSearch("SELECT * WHERE a < 3", "sql"));
        CPPUNIT_ASSERT_EQUAL(std::string("SELECT * WHERE a < 3"), root->getDescendantText("sql"));

        root = XMLElement::parse(encodeSyncCollection("", DEPTH_INFINITY, 10, std::list<std::string>()));
        CPPUNIT_ASSERT_EQUAL(std::string("sync-collection"), root->getName());
        CPPUNIT_ASSERT(root->findChild("sync-token"));
        CPPUNIT_ASSERT_EQUAL(std::string("infinite"), root->getDescendantText("sync-level"));
        CPPUNIT_ASSERT_EQUAL(std::string("10"), root->getDescendantText("nresults"));
        CPPUNIT_ASSERT(root->findDescendant("getetag"));
        root = XMLElement::parse(encodeSyncCollection("tok", 1, 0, std::list<std::string>()));
        CPPUNIT_ASSERT_EQUAL(std::string("1"), root->getDescendantText("sync-level"));
        CPPUNIT_ASSERT(!root->findChild("limit"));

        root = XMLElement::parse(encodeBind("link", "/dav/target"));
        CPPUNIT_ASSERT_EQUAL(std::string("link"), root->getDescendantText("segment"));
        CPPUNIT_ASSERT_EQUAL(std::string("/dav/target"), root->getDescendantText("href"));
        root = XMLElement::parse(encodeUnbind("link"));
        CPPUNIT_ASSERT_EQUAL(std::string("unbind"), root->getName());

        root = XMLElement::parse(encodeVersionControl(""));
        CPPUNIT_ASSERT_EQUAL(std::string("version-control"), root->getName());
        CPPUNIT_ASSERT(root->getChildren().empty());
        root = XMLElement::parse(encodeVersionControl("/his/3"));
        CPPUNIT_ASSERT_EQUAL(std::string("/his/3"), root->findChild("version")->getDescendantText("href"));
        root = XMLElement::parse(encodeCheckout("/act/1"));
        CPPUNIT_ASSERT(root->findChild("activity-set"));
        root = XMLElement::parse(encodeCheckin(true));
        CPPUNIT_ASSERT(root->findChild("keep-checked-out"));
        root = XMLElement::parse(encodeCheckin(false));
        CPPUNIT_ASSERT(root->getChildren().empty());
        CPPUNIT_ASSERT_EQUAL(std::string("uncheckout"), XMLElement::parse(encodeUncheckout())->getName());
        CPPUNIT_ASSERT_EQUAL(std::string("mkbaseline"), XMLElement::parse(encodeMkBaseline())->getName());
        root = XMLElement::parse(encodeBaselineControl("/bl/1"));
        CPPUNIT_ASSERT(root->findChild("baseline"));
        root = XMLElement::parse(encodeVersionTreeReport());
        CPPUNIT_ASSERT(root->findDescendant("version-name"));
        CPPUNIT_ASSERT(root->findDescendant("successor-set"));
    }

    void error() {
        std::list<std::string> conditions;
        std::string description;
        CPPUNIT_ASSERT(decodeError("<D:error xmlns:D=\"DAV:\">"
                                   "<D:lock-token-submitted><D:href>/locked</D:href></D:lock-token-submitted>"
                                   "</D:error>",
                                   conditions, description));
        CPPUNIT_ASSERT_EQUAL((size_t)1, conditions.size());
        CPPUNIT_ASSERT_EQUAL(std::string("lock-token-submitted"), conditions.front());
        CPPUNIT_ASSERT_EQUAL(std::string("/locked"), description);

        CPPUNIT_ASSERT(decodeError("<error xmlns=\"DAV:\"><need-privileges/><cannot-modify-protected-property/></error>",
                                   conditions, description));
        CPPUNIT_ASSERT_EQUAL((size_t)2, conditions.size());
        CPPUNIT_ASSERT_EQUAL(std::string(""), description);

        CPPUNIT_ASSERT(!decodeError("", conditions, description));
        CPPUNIT_ASSERT(!decodeError("<html><body>Internal error</body></html>", conditions, description));
        CPPUNIT_ASSERT(!decodeError("<html><body>broken", conditions, description));
        CPPUNIT_ASSERT(!decodeError("Forbidden", conditions, description));
        CPPUNIT_ASSERT(conditions.empty());
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(CodecTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
