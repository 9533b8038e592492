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

#ifndef INCL_DAV_AUTH
#define INCL_DAV_AUTH

#include <string>

#include <boost/shared_ptr.hpp>

#include <davclient/HTTPTransport.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * An authentication scheme. Implementations beyond Basic (NTLM,
 * Negotiate, ...) are provided by the application and installed
 * with Negotiator::setHandler().
 */
class AuthHandler
{
 public:
    virtual ~AuthHandler() {}

    /** name as used in WWW-Authenticate, for example "Basic" */
    virtual std::string schemeName() const = 0;

    /** true if the handler understands the given scheme token (case-insensitive) */
    virtual bool canHandle(const std::string &scheme) const = 0;

    /**
     * Authorization value to send before the server asked for it,
     * empty if the scheme cannot do that
     */
    virtual std::string preemptiveValue(const std::string &url) = 0;

    /**
     * Computes the answer to a 401 response.
     *
     * @param url         the URL of the request which was rejected
     * @param challenge   headers of the 401 response
     * @return Authorization value, empty if the handler has no better answer
     */
    virtual std::string handleChallenge(const std::string &url,
                                        const Headers &challenge) = 0;
};

/**
 * Basic authentication, with "domain\user" as user name
 * if a domain is set.
 */
class BasicAuthHandler : public AuthHandler
{
 public:
    BasicAuthHandler(const std::string &username,
                     const std::string &password,
                     const std::string &domain = "",
                     const std::string &workstation = "");

    virtual std::string schemeName() const { return "Basic"; }
    virtual bool canHandle(const std::string &scheme) const;
    virtual std::string preemptiveValue(const std::string &url);
    virtual std::string handleChallenge(const std::string &url,
                                        const Headers &challenge);

    /** user name as sent to the server */
    std::string getQualifiedUsername() const;
    const std::string &getWorkstation() const { return m_workstation; }

 private:
    std::string m_username;
    std::string m_password;
    std::string m_domain;
    std::string m_workstation;
};

/**
 * Holds the credentials of a client. Either plain credentials
 * (user, password, optional domain and workstation) or an
 * AuthHandler are active, never both.
 *
 * Not thread-safe: changing the credentials while requests are
 * in flight must be serialized by the caller.
 */
class Negotiator
{
 public:
    Negotiator() : m_preemptive(false) {}

    void setCredentials(const std::string &username,
                        const std::string &password,
                        bool preemptive = false);
    void setCredentialsWithDomain(const std::string &username,
                                  const std::string &password,
                                  const std::string &domain,
                                  const std::string &workstation,
                                  bool preemptive = false);
    void setHandler(const boost::shared_ptr<AuthHandler> &handler,
                    bool preemptive = false);
    void clearAuthentication();

    bool isPreemptive() const { return m_preemptive; }
    bool hasCredentials() const { return !m_username.empty(); }
    bool hasHandler() const { return m_handler.get() != NULL; }
    const std::string &getWorkstation() const { return m_workstation; }

    /**
     * headers added to every request: Authorization in preemptive
     * mode, X-Workstation whenever a workstation is set
     */
    Headers headersForRequest(const std::string &url) const;

    /**
     * Computes the Authorization value for retrying a request which
     * was rejected with 401. The installed handler is asked first;
     * if it fails or has no answer, Basic with the stored credentials
     * is used unless those were already sent preemptively.
     *
     * @return false if there is nothing else to try
     */
    bool respondToChallenge(const std::string &url,
                            const Headers &challenge,
                            std::string &authorization) const;

 private:
    std::string m_username;
    std::string m_password;
    std::string m_domain;
    std::string m_workstation;
    boost::shared_ptr<AuthHandler> m_handler;
    bool m_preemptive;

    std::string basicValue() const;
};

DAV_END_CXX
#endif // INCL_DAV_AUTH
