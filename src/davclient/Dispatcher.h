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

#ifndef INCL_DAV_DISPATCHER
#define INCL_DAV_DISPATCHER

#include <string>

#include <boost/shared_ptr.hpp>

#include <davclient/HTTPTransport.h>
#include <davclient/Auth.h>
#include <davclient/Config.h>
#include <davclient/Resource.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * Every request goes through here. The dispatcher resolves the URL,
 * adds the default, authentication and caller headers, answers one
 * 401 challenge, decodes compressed bodies and turns the status into
 * either a normal return or an exception:
 * - 2xx (including 207): returned
 * - 3xx: RedirectException
 * - 401 after the retry: AuthenticationException
 * - everything else: ProtocolException with the conditions of a
 *   DAV:error body
 *
 * The dispatcher has no state of its own besides the configuration,
 * so it can be used concurrently as long as the Negotiator is not
 * modified at the same time.
 */
class Dispatcher
{
 public:
    Dispatcher(const ClientConfig &config,
               const boost::shared_ptr<HTTPTransport> &transport,
               const boost::shared_ptr<Negotiator> &negotiator);

    const ClientConfig &getConfig() const { return m_config; }

    /**
     * absolute URLs are used as they are, everything else is
     * appended to the base URL with exactly one slash in between
     */
    std::string resolveUrl(const std::string &url) const;

    /**
     * hrefs in server responses are absolute paths on the server,
     * not relative to the base URL: "/dav/a" becomes
     * "http://host/dav/a". Relative hrefs are handled like
     * resolveUrl().
     */
    std::string resolveHref(const std::string &href) const;

    /**
     * Sends the request. request.m_url may be relative, it is
     * replaced with the resolved URL and request.m_headers with
     * the headers that were sent.
     *
     * @param reader     receives the decoded body of a successful
     *                   response; error bodies always end up in
     *                   response.m_body
     * @param progress   invoked with the number of bytes received
     *                   so far, before decoding
     */
    void execute(HTTPRequest &request,
                 HTTPResponse &response,
                 const ResponseReader_t &reader = ResponseReader_t(),
                 const Progress_t &progress = Progress_t()) const;

    /** buffered request and response */
    HTTPResponse execute(const std::string &method,
                         const std::string &url,
                         const Headers &headers = Headers(),
                         const std::string &body = "") const;

    /**
     * For PROPFIND, PROPPATCH, REPORT and SEARCH: the body of a
     * successful response is parsed as multistatus. A 207 is
     * success even if the responses inside it report failures.
     * An empty 2xx body yields an empty result.
     *
     * @throw MalformedResponseException
     */
    Multistatus executeMultistatus(const std::string &method,
                                   const std::string &url,
                                   const Headers &headers,
                                   const std::string &body) const;

 private:
    const ClientConfig m_config;
    boost::shared_ptr<HTTPTransport> m_transport;
    boost::shared_ptr<Negotiator> m_negotiator;

    /** one exchange with the server, without status checks */
    void send(const HTTPRequest &request,
              HTTPResponse &response,
              const ResponseReader_t &reader,
              const Progress_t &progress) const;

    /** throws for everything that is not a success */
    void checkStatus(const HTTPRequest &request, const HTTPResponse &response) const;
};

DAV_END_CXX
#endif // INCL_DAV_DISPATCHER
