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

#include <davclient/XMLTree.h>
#include <davclient/NeonCXX.h>

#include <vector>

#include <boost/bind.hpp>
#include <boost/foreach.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

const XMLElement *XMLElement::findChild(const std::string &name) const
{
    BOOST_FOREACH(const Ptr &child, m_children) {
        if (child->m_name == name) {
            return child.get();
        }
    }
    return NULL;
}

XMLElement::ConstList XMLElement::findChildren(const std::string &name) const
{
    ConstList res;
    BOOST_FOREACH(const Ptr &child, m_children) {
        if (child->m_name == name) {
            res.push_back(child.get());
        }
    }
    return res;
}

void XMLElement::collectDescendants(const std::string &name, ConstList &result, bool firstOnly) const
{
    BOOST_FOREACH(const Ptr &child, m_children) {
        if (child->m_name == name) {
            result.push_back(child.get());
            if (firstOnly) {
                return;
            }
        }
        child->collectDescendants(name, result, firstOnly);
        if (firstOnly && !result.empty()) {
            return;
        }
    }
}

const XMLElement *XMLElement::findDescendant(const std::string &name) const
{
    ConstList res;
    collectDescendants(name, res, true);
    return res.empty() ? NULL : res.front();
}

XMLElement::ConstList XMLElement::findDescendants(const std::string &name) const
{
    ConstList res;
    collectDescendants(name, res, false);
    return res;
}

void XMLElement::collectText(std::string &text) const
{
    text += m_text;
    BOOST_FOREACH(const Ptr &child, m_children) {
        child->collectText(text);
    }
}

std::string XMLElement::getText() const
{
    std::string text;
    collectText(text);
    return StripSpace(text);
}

std::string XMLElement::getDescendantText(const std::string &name) const
{
    const XMLElement *elem = findDescendant(name);
    return elem ? elem->getText() : "";
}

/**
 * Keeps track of the currently open elements while neon
 * walks the document.
 */
class XMLTreeBuilder
{
 public:
    XMLElement::Ptr m_root;
    std::vector<XMLElement *> m_open;

    int start(const char *nspace, const char *name) {
        XMLElement::Ptr elem(new XMLElement(nspace ? nspace : "", name ? name : ""));
        if (m_open.empty()) {
            if (m_root) {
                // second root element, cannot happen in well-formed XML
                return -1;
            }
            m_root = elem;
        } else {
            m_open.back()->addChild(elem);
        }
        m_open.push_back(elem.get());
        return 1;
    }

    int data(const char *cdata, size_t len) {
        if (!m_open.empty()) {
            m_open.back()->appendText(cdata, len);
        }
        return 0;
    }

    int end() {
        if (!m_open.empty()) {
            m_open.pop_back();
        }
        return 0;
    }
};

XMLElement::Ptr XMLElement::parse(const std::string &document)
{
    XMLTreeBuilder builder;
    Neon::XMLParser parser;
    parser.pushHandler(boost::bind(&XMLTreeBuilder::start, &builder, _2, _3),
                       boost::bind(&XMLTreeBuilder::data, &builder, _2, _3),
                       boost::bind(&XMLTreeBuilder::end, &builder));
    parser.parse(document.c_str(), document.size());
    parser.finish();
    if (!builder.m_root) {
        DAV_THROW_EXCEPTION(MalformedResponseException, "empty XML document");
    }
    return builder.m_root;
}

std::string XMLEscape(const std::string &text)
{
    std::string res;
    res.reserve(text.size());
    BOOST_FOREACH(char c, text) {
        switch (c) {
        case '&': res += "&amp;"; break;
        case '<': res += "&lt;"; break;
        case '>': res += "&gt;"; break;
        case '"': res += "&quot;"; break;
        case '\'': res += "&apos;"; break;
        default: res += c; break;
        }
    }
    return res;
}

#ifdef ENABLE_UNIT_TESTS

class XMLTreeTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(XMLTreeTest);
    CPPUNIT_TEST(localNames);
    CPPUNIT_TEST(descendants);
    CPPUNIT_TEST(text);
    CPPUNIT_TEST(malformed);
    CPPUNIT_TEST(escape);
    CPPUNIT_TEST_SUITE_END();

    void localNames() {
        XMLElement::Ptr root =
            XMLElement::parse("<?xml version=\"1.0\"?>"
                              "<x:a xmlns:x=\"DAV:\" xmlns:y=\"urn:other\"><x:b/><y:b/><c xmlns=\"DAV:\"/></x:a>");
        CPPUNIT_ASSERT_EQUAL(std::string("a"), root->getName());
        CPPUNIT_ASSERT(root->isDAV());
        CPPUNIT_ASSERT_EQUAL((size_t)2, root->findChildren("b").size());
        const XMLElement *b = root->findChild("b");
        CPPUNIT_ASSERT(b);
        CPPUNIT_ASSERT_EQUAL(std::string("DAV:"), b->getNamespace());
        CPPUNIT_ASSERT(root->findChild("c"));
        CPPUNIT_ASSERT(!root->findChild("d"));
    }

    void descendants() {
        XMLElement::Ptr root =
            XMLElement::parse("<D:resourcetype xmlns:D=\"DAV:\" xmlns:E=\"urn:ext\">"
                              "<E:wrapper><D:collection/></E:wrapper>"
                              "<D:collection/>"
                              "</D:resourcetype>");
        CPPUNIT_ASSERT(!root->findChild("wrapper")->findChild("missing"));
        CPPUNIT_ASSERT(root->findDescendant("collection"));
        CPPUNIT_ASSERT_EQUAL((size_t)2, root->findDescendants("collection").size());
    }

    void text() {
        XMLElement::Ptr root =
            XMLElement::parse("<p xmlns=\"DAV:\">\n  <href> /a/b </href>\n  <status>HTTP/1.1 200 OK</status></p>");
        CPPUNIT_ASSERT_EQUAL(std::string("/a/b"), root->getDescendantText("href"));
        CPPUNIT_ASSERT_EQUAL(std::string(""), root->getDescendantText("missing"));
        CPPUNIT_ASSERT_EQUAL(std::string("HTTP/1.1 200 OK"), root->findChild("status")->getText());
    }

    void malformed() {
        CPPUNIT_ASSERT_THROW(XMLElement::parse("<a><b></a>"), MalformedResponseException);
        CPPUNIT_ASSERT_THROW(XMLElement::parse(""), MalformedResponseException);
    }

    void escape() {
        CPPUNIT_ASSERT_EQUAL(std::string("a &lt;b&gt; &amp; &quot;c&quot;"), XMLEscape("a <b> & \"c\""));
    }
};
DAVCLIENT_TEST_SUITE_REGISTRATION(XMLTreeTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
