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

#include <davclient/Resource.h>
#include <davclient/NeonCXX.h>

#include <stdlib.h>
#include <sstream>

#include <boost/foreach.hpp>
#include <boost/algorithm/string/join.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/** "HTTP/1.1 404 Not Found" -> 404 */
static int statusLineCode(const std::string &status)
{
    size_t start = status.find(' ');
    if (start == status.npos) {
        return 0;
    }
    return atoi(status.c_str() + start + 1);
}

int Propstat::getStatusCode() const
{
    return statusLineCode(m_status);
}

const XMLElement *Propstat::getElement(const std::string &name) const
{
    std::map<std::string, XMLElement::Ptr>::const_iterator it = m_elements.find(name);
    return it == m_elements.end() ? NULL : it->second.get();
}

int Response::getStatusCode() const
{
    return statusLineCode(m_status);
}

const XMLElement *Response::findProperty(const std::string &name) const
{
    BOOST_FOREACH(const Propstat &propstat, m_propstats) {
        if (propstat.isOkay()) {
            const XMLElement *elem = propstat.getElement(name);
            if (elem) {
                return elem;
            }
        }
    }
    return NULL;
}

bool DavResource::isDirectory() const
{
    return m_resourceTypes.count("collection") ||
        m_contentType == "httpd/unix-directory";
}

std::string DavResource::getName() const
{
    std::string path = m_href;
    size_t scheme = path.find("://");
    if (scheme != path.npos) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == path.npos ? "/" : path.substr(slash);
    }
    return Neon::URI::unescape(getBasename(path));
}

std::string DavResource::getProperty(const std::string &name) const
{
    StringMap::const_iterator it = m_props.find(name);
    return it == m_props.end() ? "" : it->second;
}

std::string DavResource::toString() const
{
    std::ostringstream out;
    out << (isDirectory() ? "d " : "- ")
        << m_contentLength << " "
        << (m_lastModified.empty() ? "-" : m_lastModified) << " "
        << m_href;
    return out.str();
}

bool DavAce::operator == (const DavAce &other) const
{
    return m_principal == other.m_principal &&
        m_grant == other.m_grant &&
        m_privileges == other.m_privileges &&
        m_inherited == other.m_inherited &&
        m_protected == other.m_protected;
}

std::string DavAce::toString() const
{
    std::list<std::string> privileges(m_privileges.begin(), m_privileges.end());
    return StringPrintf("%s %s: %s%s%s",
                        m_grant ? "grant" : "deny",
                        m_principal.c_str(),
                        boost::join(privileges, ", ").c_str(),
                        m_inherited ? " (inherited)" : "",
                        m_protected ? " (protected)" : "");
}

bool DavAcl::hasPrivilege(const std::string &principal, const std::string &privilege) const
{
    bool granted = false;
    BOOST_FOREACH(const DavAce &ace, m_aces) {
        if (ace.m_principal == principal &&
            ace.hasPrivilege(privilege)) {
            if (!ace.m_grant) {
                return false;
            }
            granted = true;
        }
    }
    return granted;
}

std::list<DavAce> DavAcl::getAcesForPrincipal(const std::string &principal) const
{
    std::list<DavAce> res;
    BOOST_FOREACH(const DavAce &ace, m_aces) {
        if (ace.m_principal == principal) {
            res.push_back(ace);
        }
    }
    return res;
}

std::set<std::string> DavAcl::getPrincipals() const
{
    std::set<std::string> res;
    BOOST_FOREACH(const DavAce &ace, m_aces) {
        res.insert(ace.m_principal);
    }
    return res;
}

std::string DavPrincipal::getName() const
{
    std::string path = m_url;
    size_t scheme = path.find("://");
    if (scheme != path.npos) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == path.npos ? "" : path.substr(slash);
    }
    return getBasename(path);
}

long long DavQuota::getTotal() const
{
    if (m_availableBytes < 0 || m_usedBytes < 0) {
        return -1;
    }
    return m_availableBytes + m_usedBytes;
}

double DavQuota::getUsage() const
{
    long long total = getTotal();
    if (total <= 0) {
        return -1;
    }
    return (double)m_usedBytes / total;
}

std::string DavQuota::getDescription() const
{
    long long total = getTotal();
    if (m_usedBytes >= 0 && total >= 0) {
        return FormatBytes(m_usedBytes) + " of " + FormatBytes(total) + " used";
    } else if (m_usedBytes >= 0) {
        return FormatBytes(m_usedBytes) + " used";
    } else if (m_availableBytes >= 0) {
        return FormatBytes(m_availableBytes) + " available";
    } else {
        return "no quota information available";
    }
}

std::string FormatBytes(long long bytes)
{
    static const struct {
        long long m_size;
        const char *m_unit;
    } units[] = {
        { 1024LL * 1024 * 1024 * 1024, "TB" },
        { 1024LL * 1024 * 1024, "GB" },
        { 1024LL * 1024, "MB" },
        { 1024LL, "KB" },
        { 0, NULL }
    };
    for (int i = 0; units[i].m_unit; i++) {
        if (bytes >= units[i].m_size) {
            return StringPrintf("%.1f %s", (double)bytes / units[i].m_size, units[i].m_unit);
        }
    }
    return StringPrintf("%lld bytes", bytes);
}

#ifdef ENABLE_UNIT_TESTS

class ResourceTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ResourceTest);
    CPPUNIT_TEST(directory);
    CPPUNIT_TEST(name);
    CPPUNIT_TEST(acl);
    CPPUNIT_TEST(quota);
    CPPUNIT_TEST(propstatStatus);
    CPPUNIT_TEST_SUITE_END();

    void propstatStatus() {
        Propstat propstat;
        propstat.m_status = "HTTP/1.1 200 OK";
        CPPUNIT_ASSERT(propstat.isOkay());
        propstat.m_status = "HTTP/1.1 500 Error 200";
        CPPUNIT_ASSERT_EQUAL(500, propstat.getStatusCode());
        CPPUNIT_ASSERT(!propstat.isOkay());
        propstat.m_status = "HTTP/1.1 404 Not Found";
        CPPUNIT_ASSERT(!propstat.isOkay());
        propstat.m_status = "garbage";
        CPPUNIT_ASSERT(!propstat.isOkay());
    }

    void directory() {
        DavResource res;
        CPPUNIT_ASSERT(!res.isDirectory());
        res.m_contentType = "httpd/unix-directory";
        CPPUNIT_ASSERT(res.isDirectory());
        res.m_contentType = "text/plain";
        res.m_resourceTypes.insert("collection");
        CPPUNIT_ASSERT(res.isDirectory());
    }

    void name() {
        DavResource res;
        res.m_href = "/dav/dir/my%20file.txt";
        CPPUNIT_ASSERT_EQUAL(std::string("my file.txt"), res.getName());
        res.m_href = "http://example.com/dav/dir/";
        CPPUNIT_ASSERT_EQUAL(std::string("dir"), res.getName());

        DavPrincipal principal;
        principal.m_url = "/principals/users/alice/";
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), principal.getName());
    }

    void acl() {
        DavAcl acl;
        DavAce grant("/principals/alice", true);
        grant.m_privileges.insert("read");
        grant.m_privileges.insert("write");
        DavAce deny("/principals/alice", false);
        deny.m_privileges.insert("write");
        acl.m_aces.push_back(grant);
        acl.m_aces.push_back(deny);

        CPPUNIT_ASSERT(acl.hasPrivilege("/principals/alice", "read"));
        CPPUNIT_ASSERT(!acl.hasPrivilege("/principals/alice", "write"));
        CPPUNIT_ASSERT(!acl.hasPrivilege("/principals/bob", "read"));
        CPPUNIT_ASSERT_EQUAL((size_t)2, acl.getAcesForPrincipal("/principals/alice").size());
        CPPUNIT_ASSERT_EQUAL((size_t)1, acl.getPrincipals().size());
    }

    void quota() {
        DavQuota quota;
        CPPUNIT_ASSERT_EQUAL(-1LL, quota.getTotal());
        CPPUNIT_ASSERT(!quota.isNearlyFull());
        CPPUNIT_ASSERT_EQUAL(std::string("no quota information available"), quota.getDescription());

        quota.m_usedBytes = 950;
        quota.m_availableBytes = 50;
        CPPUNIT_ASSERT_EQUAL(1000LL, quota.getTotal());
        CPPUNIT_ASSERT(quota.isNearlyFull());
        CPPUNIT_ASSERT(!quota.isFull());
        CPPUNIT_ASSERT_EQUAL(std::string("950 bytes of 1000 bytes used"), quota.getDescription());

        quota.m_availableBytes = 0;
        CPPUNIT_ASSERT(quota.isFull());
        CPPUNIT_ASSERT_EQUAL(std::string("1.5 MB"), FormatBytes(1536 * 1024));
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(ResourceTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
