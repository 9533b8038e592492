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

/**
 * Plain value objects produced by the codec: the multistatus
 * envelope as it came over the wire, and the resource, lock,
 * ACL, principal and quota views derived from it.
 */

#ifndef INCL_DAV_RESOURCE
#define INCL_DAV_RESOURCE

#include <string>
#include <list>
#include <map>
#include <set>

#include <davclient/XMLTree.h>
#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * One <propstat>: a group of properties sharing the same status.
 */
struct Propstat
{
    /** status line, for example "HTTP/1.1 200 OK" */
    std::string m_status;
    /** local property name to value, "" for properties without text */
    StringMap m_props;
    /** the property elements themselves, for structured values */
    std::map<std::string, XMLElement::Ptr> m_elements;
    std::string m_description;

    /** numeric code from m_status, 0 if it cannot be parsed */
    int getStatusCode() const;
    bool isOkay() const { return getStatusCode() == 200; }
    const XMLElement *getElement(const std::string &name) const;
};

/**
 * One <response>. Either m_status is set (whole resource) or
 * m_propstats has entries (per property group).
 */
struct Response
{
    std::string m_href;
    std::string m_status;
    std::list<Propstat> m_propstats;
    /** precondition/postcondition names from <error> */
    std::list<std::string> m_errors;
    std::string m_description;
    std::string m_location;

    int getStatusCode() const;

    /**
     * property element from the first successful propstat which
     * has it, NULL if none
     */
    const XMLElement *findProperty(const std::string &name) const;
};

struct Multistatus
{
    std::list<Response> m_responses;
    std::string m_description;
    /** only set in sync-collection reports */
    std::string m_syncToken;
};

struct DavResource
{
    std::string m_href;
    int m_status;
    std::string m_contentType;
    long long m_contentLength;
    std::string m_etag;
    std::string m_displayName;
    /** raw values, see parseHttpDate() */
    std::string m_lastModified;
    std::string m_creationDate;
    /** local names of the <resourcetype> children */
    std::set<std::string> m_resourceTypes;
    /** every property from successful propstats, by local name */
    StringMap m_props;

    DavResource() :
        m_status(0),
        m_contentLength(0)
    {}

    /** collection marker in the resource type or the Apache directory type */
    bool isDirectory() const;

    /** last path segment of m_href, unescaped */
    std::string getName() const;

    bool hasProperty(const std::string &name) const { return m_props.find(name) != m_props.end(); }
    std::string getProperty(const std::string &name) const;

    std::string toString() const;
};

/**
 * Access control entry. The principal is either an href or one of
 * "DAV:all", "DAV:authenticated", "DAV:unauthenticated", "DAV:self".
 */
struct DavAce
{
    std::string m_principal;
    bool m_grant;
    std::set<std::string> m_privileges;
    bool m_inherited;
    bool m_protected;

    DavAce(const std::string &principal = "",
           bool grant = true) :
        m_principal(principal),
        m_grant(grant),
        m_inherited(false),
        m_protected(false)
    {}

    bool hasPrivilege(const std::string &privilege) const { return m_privileges.count(privilege) > 0; }
    bool operator == (const DavAce &other) const;
    std::string toString() const;
};

struct DavAcl
{
    std::string m_url;
    std::list<DavAce> m_aces;

    /** deny entries take precedence over grant entries */
    bool hasPrivilege(const std::string &principal, const std::string &privilege) const;
    std::list<DavAce> getAcesForPrincipal(const std::string &principal) const;
    std::set<std::string> getPrincipals() const;
};

struct DavPrincipal
{
    std::string m_url;
    std::string m_displayName;
    StringMap m_props;

    /** last path segment of the URL */
    std::string getName() const;
};

struct DavQuota
{
    std::string m_url;
    long long m_availableBytes;
    long long m_usedBytes;

    DavQuota() :
        m_availableBytes(-1),
        m_usedBytes(-1)
    {}

    /** used + available, -1 if either is unknown */
    long long getTotal() const;
    /** 0.0 - 1.0, negative if unknown */
    double getUsage() const;
    bool isNearlyFull() const { return getUsage() > 0.9; }
    bool isFull() const { return m_availableBytes == 0 || getUsage() >= 1.0; }
    /** "1.5 MB of 2.0 GB used" */
    std::string getDescription() const;
};

struct ActiveLock
{
    /** "exclusive" or "shared" */
    std::string m_scope;
    /** always "write" in RFC 4918 */
    std::string m_type;
    /** "0" or "infinity" */
    std::string m_depth;
    std::string m_owner;
    /** "Second-3600" or "Infinite" */
    std::string m_timeout;
    std::string m_token;
    std::string m_root;

    bool isExclusive() const { return m_scope == "exclusive"; }
};

struct SyncResult
{
    std::list<DavResource> m_changed;
    /** hrefs reported with a 404 status */
    std::list<std::string> m_removed;
    std::string m_syncToken;
};

/** format size with the largest fitting unit, like "1.5 MB" */
std::string FormatBytes(long long bytes);

DAV_END_CXX
#endif // INCL_DAV_RESOURCE
