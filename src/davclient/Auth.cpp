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

#include <davclient/Auth.h>
#include <davclient/DavUtil.h>
#include <davclient/Logging.h>

#include <boost/algorithm/string/predicate.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

BasicAuthHandler::BasicAuthHandler(const std::string &username,
                                   const std::string &password,
                                   const std::string &domain,
                                   const std::string &workstation) :
    m_username(username),
    m_password(password),
    m_domain(domain),
    m_workstation(workstation)
{
}

bool BasicAuthHandler::canHandle(const std::string &scheme) const
{
    return boost::iequals(StripSpace(scheme), "basic");
}

std::string BasicAuthHandler::getQualifiedUsername() const
{
    return m_domain.empty() ?
        m_username :
        m_domain + "\\" + m_username;
}

std::string BasicAuthHandler::preemptiveValue(const std::string &url)
{
    return basicAuthValue(getQualifiedUsername(), m_password);
}

std::string BasicAuthHandler::handleChallenge(const std::string &url,
                                              const Headers &challenge)
{
    Headers::const_iterator it = challenge.find("WWW-Authenticate");
    if (it != challenge.end() &&
        !boost::icontains(it->second, "basic")) {
        // server wants something else
        return "";
    }
    return preemptiveValue(url);
}

void Negotiator::setCredentials(const std::string &username,
                                const std::string &password,
                                bool preemptive)
{
    setCredentialsWithDomain(username, password, "", "", preemptive);
}

void Negotiator::setCredentialsWithDomain(const std::string &username,
                                          const std::string &password,
                                          const std::string &domain,
                                          const std::string &workstation,
                                          bool preemptive)
{
    m_handler.reset();
    m_username = username;
    m_password = password;
    m_domain = domain;
    m_workstation = workstation;
    m_preemptive = preemptive;
}

void Negotiator::setHandler(const boost::shared_ptr<AuthHandler> &handler,
                            bool preemptive)
{
    m_username.clear();
    m_password.clear();
    m_domain.clear();
    m_workstation.clear();
    m_handler = handler;
    m_preemptive = preemptive;
}

void Negotiator::clearAuthentication()
{
    m_username.clear();
    m_password.clear();
    m_domain.clear();
    m_workstation.clear();
    m_handler.reset();
    m_preemptive = false;
}

std::string Negotiator::basicValue() const
{
    return BasicAuthHandler(m_username, m_password, m_domain).preemptiveValue("");
}

Headers Negotiator::headersForRequest(const std::string &url) const
{
    Headers headers;
    if (m_preemptive) {
        std::string value;
        if (m_handler) {
            value = m_handler->preemptiveValue(url);
        } else if (hasCredentials()) {
            value = basicValue();
        }
        if (!value.empty()) {
            headers["Authorization"] = value;
        }
    }
    if (!m_workstation.empty()) {
        headers["X-Workstation"] = m_workstation;
    }
    return headers;
}

bool Negotiator::respondToChallenge(const std::string &url,
                                    const Headers &challenge,
                                    std::string &authorization) const
{
    if (m_handler) {
        try {
            authorization = m_handler->handleChallenge(url, challenge);
            if (!authorization.empty()) {
                DAV_LOG_DEV(NULL, NULL, "%s handler answered challenge for %s",
                            m_handler->schemeName().c_str(), url.c_str());
                return true;
            }
        } catch (const std::exception &ex) {
            DAV_LOG_DEV(NULL, NULL, "%s handler failed for %s: %s",
                        m_handler->schemeName().c_str(), url.c_str(), ex.what());
        }
    }

    if (hasCredentials() && !m_preemptive) {
        authorization = basicValue();
        return true;
    }

    authorization.clear();
    return false;
}

#ifdef ENABLE_UNIT_TESTS

class AuthTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(AuthTest);
    CPPUNIT_TEST(basic);
    CPPUNIT_TEST(authSwitch);
    CPPUNIT_TEST(clear);
    CPPUNIT_TEST(challenge);
    CPPUNIT_TEST(handler);
    CPPUNIT_TEST_SUITE_END();

    /** answers with a fixed value or throws */
    class TokenHandler : public AuthHandler {
    public:
        TokenHandler(const std::string &token, bool fail = false) :
            m_token(token),
            m_fail(fail),
            m_calls(0)
        {}

        virtual std::string schemeName() const { return "Token"; }
        virtual bool canHandle(const std::string &scheme) const { return boost::iequals(scheme, "token"); }
        virtual std::string preemptiveValue(const std::string &url) { return "Token " + m_token; }
        virtual std::string handleChallenge(const std::string &url,
                                            const Headers &challenge) {
            m_calls++;
            m_url = url;
            if (m_fail) {
                DAV_THROW("token expired");
            }
            return m_token.empty() ? "" : "Token " + m_token + "-2";
        }

        std::string m_token;
        bool m_fail;
        int m_calls;
        std::string m_url;
    };

    void basic() {
        BasicAuthHandler handler("u", "p", "DOM");
        CPPUNIT_ASSERT(handler.canHandle("Basic"));
        CPPUNIT_ASSERT(handler.canHandle("BASIC"));
        CPPUNIT_ASSERT(!handler.canHandle("NTLM"));
        CPPUNIT_ASSERT_EQUAL(std::string("DOM\\u"), handler.getQualifiedUsername());

        Headers challenge;
        challenge["WWW-Authenticate"] = "NTLM";
        CPPUNIT_ASSERT_EQUAL(std::string(""), handler.handleChallenge("http://host/", challenge));
        challenge["WWW-Authenticate"] = "Negotiate, Basic realm=\"dav\"";
        CPPUNIT_ASSERT_EQUAL(std::string("Basic RE9NXHU6cA=="), handler.handleChallenge("http://host/", challenge));
    }

    void authSwitch() {
        Negotiator negotiator;
        negotiator.setCredentialsWithDomain("u", "p", "DOM", "WS", true);
        Headers headers = negotiator.headersForRequest("http://host/dav/");
        CPPUNIT_ASSERT_EQUAL(std::string("Basic RE9NXHU6cA=="), headers["Authorization"]);
        CPPUNIT_ASSERT_EQUAL(std::string("WS"), headers["x-workstation"]);

        boost::shared_ptr<TokenHandler> handler(new TokenHandler("abc"));
        negotiator.setHandler(handler, true);
        CPPUNIT_ASSERT(!negotiator.hasCredentials());
        headers = negotiator.headersForRequest("http://host/dav/");
        CPPUNIT_ASSERT_EQUAL((size_t)1, headers.size());
        CPPUNIT_ASSERT_EQUAL(std::string("Token abc"), headers["Authorization"]);

        negotiator.setCredentials("u", "p");
        CPPUNIT_ASSERT(!negotiator.hasHandler());
        CPPUNIT_ASSERT(!negotiator.isPreemptive());
        CPPUNIT_ASSERT(negotiator.headersForRequest("http://host/dav/").empty());
    }

    void clear() {
        Negotiator negotiator;
        negotiator.setCredentialsWithDomain("u", "p", "DOM", "WS", true);
        negotiator.clearAuthentication();
        CPPUNIT_ASSERT(!negotiator.hasCredentials());
        CPPUNIT_ASSERT(!negotiator.isPreemptive());
        CPPUNIT_ASSERT(negotiator.getWorkstation().empty());
        CPPUNIT_ASSERT(negotiator.headersForRequest("http://host/").empty());
        negotiator.clearAuthentication();
        CPPUNIT_ASSERT(!negotiator.hasCredentials());
        CPPUNIT_ASSERT(!negotiator.hasHandler());
        CPPUNIT_ASSERT(!negotiator.isPreemptive());
        CPPUNIT_ASSERT(negotiator.headersForRequest("http://host/").empty());
    }

    void challenge() {
        Negotiator negotiator;
        std::string authorization;
        Headers challenge;

        // nothing configured
        CPPUNIT_ASSERT(!negotiator.respondToChallenge("http://host/", challenge, authorization));

        negotiator.setCredentials("u", "p");
        CPPUNIT_ASSERT(negotiator.respondToChallenge("http://host/", challenge, authorization));
        CPPUNIT_ASSERT_EQUAL(std::string("Basic dTpw"), authorization);

        // the same credentials were already sent
        negotiator.setCredentials("u", "p", true);
        CPPUNIT_ASSERT(!negotiator.respondToChallenge("http://host/", challenge, authorization));
        CPPUNIT_ASSERT(authorization.empty());
    }

    void handler() {
        Negotiator negotiator;
        std::string authorization;
        Headers challenge;
        challenge["WWW-Authenticate"] = "Token";

        boost::shared_ptr<TokenHandler> good(new TokenHandler("abc"));
        negotiator.setHandler(good);
        CPPUNIT_ASSERT(negotiator.headersForRequest("http://host/a").empty());
        CPPUNIT_ASSERT(negotiator.respondToChallenge("http://host/a", challenge, authorization));
        CPPUNIT_ASSERT_EQUAL(std::string("Token abc-2"), authorization);
        CPPUNIT_ASSERT_EQUAL(std::string("http://host/a"), good->m_url);

        boost::shared_ptr<TokenHandler> failing(new TokenHandler("abc", true));
        negotiator.setHandler(failing);
        CPPUNIT_ASSERT(!negotiator.respondToChallenge("http://host/a", challenge, authorization));
        CPPUNIT_ASSERT_EQUAL(1, failing->m_calls);

        boost::shared_ptr<TokenHandler> clueless(new TokenHandler(""));
        negotiator.setHandler(clueless);
        CPPUNIT_ASSERT(!negotiator.respondToChallenge("http://host/a", challenge, authorization));
        CPPUNIT_ASSERT_EQUAL(1, clueless->m_calls);
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(AuthTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
