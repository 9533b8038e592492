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

#ifndef INCL_DAV_XMLTREE
#define INCL_DAV_XMLTREE

#include <string>
#include <list>

#include <boost/shared_ptr.hpp>

#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * One element of a parsed response body. Servers disagree about
 * namespace prefixes, so all lookups compare local names only;
 * the namespace is kept for encoding custom properties.
 */
class XMLElement
{
 public:
    typedef boost::shared_ptr<XMLElement> Ptr;
    typedef std::list<const XMLElement *> ConstList;

    XMLElement(const std::string &nspace, const std::string &name) :
        m_namespace(nspace),
        m_name(name)
    {}

    const std::string &getNamespace() const { return m_namespace; }
    /** local name, without prefix */
    const std::string &getName() const { return m_name; }
    bool isDAV() const { return m_namespace == "DAV:"; }
    const std::list<Ptr> &getChildren() const { return m_children; }

    /** first direct child with that local name, NULL if none */
    const XMLElement *findChild(const std::string &name) const;

    /** all direct children with that local name */
    ConstList findChildren(const std::string &name) const;

    /** first element below this one with that local name, in document order */
    const XMLElement *findDescendant(const std::string &name) const;

    /** all elements below this one with that local name, in document order */
    ConstList findDescendants(const std::string &name) const;

    /** text of this element and all its descendants, white space stripped */
    std::string getText() const;

    /** text of the first descendant with that name, empty if none */
    std::string getDescendantText(const std::string &name) const;

    void addChild(const Ptr &child) { m_children.push_back(child); }
    void appendText(const char *data, size_t len) { m_text.append(data, len); }

    /** parses the document, throws MalformedResponseException */
    static Ptr parse(const std::string &document);

 private:
    std::string m_namespace;
    std::string m_name;
    /** character data directly inside this element */
    std::string m_text;
    std::list<Ptr> m_children;

    void collectText(std::string &text) const;
    void collectDescendants(const std::string &name, ConstList &result, bool firstOnly) const;
};

/** escape &, <, > and quotes for use in element content and attributes */
std::string XMLEscape(const std::string &text);

DAV_END_CXX
#endif // INCL_DAV_XMLTREE
