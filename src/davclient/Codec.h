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
 * Request bodies for all XML-bearing WebDAV methods and the
 * parsers for what servers send back. Everything on the response
 * side goes through XMLElement and therefore matches local names
 * only: D:href, d:href and href in a default namespace are the same.
 */

#ifndef INCL_DAV_CODEC
#define INCL_DAV_CODEC

#include <string>
#include <list>
#include <set>

#include <davclient/Resource.h>
#include <davclient/XMLTree.h>
#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/** namespace used for PROPPATCH properties given without namespace */
static const char CUSTOM_NAMESPACE[] = "SAR:";

/**
 * A property name. Accepts Clark notation ("{urn:x}color") or a
 * plain local name, which then belongs to the default namespace.
 */
struct PropName
{
    std::string m_namespace;
    std::string m_name;

    PropName(const std::string &name, const std::string &defaultNamespace = "DAV:");

    /** "<D:name/>" or "<X:name xmlns:X="..."/>", with value if not empty */
    std::string toXML(const std::string &value = "") const;
};

/** the properties requested by a "lean" listing */
std::list<std::string> standardProps();

std::string encodePropfindAllprop();
std::string encodePropfindPropname();
std::string encodePropfind(const std::list<std::string> &names);

/**
 * All entries of setProps go into one <set><prop> block, the names
 * in removeProps into one <remove><prop> block. Plain names belong
 * to CUSTOM_NAMESPACE.
 */
std::string encodePropertyUpdate(const StringMap &setProps,
                                 const std::list<std::string> &removeProps);

std::string encodeLockInfo(const std::string &owner, bool exclusive = true);

/** inherited and protected entries are skipped, the server owns them */
std::string encodeAcl(const DavAcl &acl);

/** "davbasic" turns query into a basicsearch for "contains", anything else is sent as <sql> */
std::string encodeSearch(const std::string &query,
                         const std::string &language,
                         const std::string &scope = "/");

/** limit <= 0: no limit; empty props: getetag, getcontentlength, getlastmodified */
std::string encodeSyncCollection(const std::string &syncToken,
                                 int depth,
                                 int limit,
                                 const std::list<std::string> &props);

std::string encodeBind(const std::string &segment, const std::string &href);
std::string encodeUnbind(const std::string &segment);

std::string encodeVersionControl(const std::string &version);
std::string encodeCheckout(const std::string &activitySet);
std::string encodeCheckin(bool keepCheckedOut);
std::string encodeUncheckout();
std::string encodeBaselineControl(const std::string &baseline);
std::string encodeMkBaseline();
std::string encodeVersionTreeReport();

/**
 * parse a 207 body
 *
 * @throw MalformedResponseException   root is not <multistatus>, a
 *        <response> without <href>, a <propstat> without <prop> or <status>
 */
Multistatus decodeMultistatus(const std::string &body);

/** fill propstat.m_props and m_elements from the children of <prop> */
void decodeProp(const XMLElement &prop, Propstat &propstat);

/** merges the properties of all successful propstats */
DavResource decodeResource(const Response &response);
std::list<DavResource> decodeResources(const Multistatus &multistatus);

/** locktoken/href anywhere in the body, empty if none */
std::string decodeLockToken(const std::string &body);

std::list<ActiveLock> decodeActiveLocks(const XMLElement &lockdiscovery);

/** <acl> property: one DavAce per <ace> */
DavAcl decodeAcl(const XMLElement &acl);

/** local names of the privileges in current-user-privilege-set */
std::set<std::string> decodePrivileges(const XMLElement &privilegeSet);

/** local names of the reports in supported-report-set */
std::list<std::string> decodeSupportedReports(const XMLElement &reportSet);

/** texts of all <href> elements below elem */
std::list<std::string> decodeHrefs(const XMLElement &elem);

/** first <href> text in body, empty if none or not XML */
std::string decodeFirstHref(const std::string &body);

/**
 * Extract conditions and description from a <error> body.
 *
 * @return false if the body contains no <error> element
 */
bool decodeError(const std::string &body,
                 std::list<std::string> &conditions,
                 std::string &description);

DAV_END_CXX
#endif // INCL_DAV_CODEC
