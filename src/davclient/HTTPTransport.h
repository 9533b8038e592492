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
 * The boundary between the WebDAV logic and the HTTP implementation.
 * Everything above this interface only deals with methods, URLs,
 * headers and bodies; NeonCXX.h provides the implementation used in
 * production, the tests plug in scripted transports.
 */

#ifndef INCL_DAV_HTTPTRANSPORT
#define INCL_DAV_HTTPTRANSPORT

#include <string>
#include <map>

#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>

#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/** HTTP header names are case-insensitive */
typedef std::map<std::string, std::string, Nocase<std::string> > Headers;

/**
 * A request body which is produced piece by piece.
 */
class BodySource
{
 public:
    virtual ~BodySource() {}

    /**
     * copy up to len bytes into buffer
     *
     * @return number of bytes copied, 0 at the end of the body
     */
    virtual size_t read(char *buffer, size_t len) = 0;

    /**
     * start again from the beginning; only possible
     * if isReplayable() is true, throws otherwise
     */
    virtual void rewind() = 0;

    /** true if the body can be sent more than once */
    virtual bool isReplayable() const = 0;

    /** total number of bytes, -1 if unknown */
    virtual long long getLength() const = 0;
};

struct HTTPRequest
{
    std::string m_method;
    /** absolute URL */
    std::string m_url;
    Headers m_headers;
    /** used if m_source is empty */
    std::string m_body;
    boost::shared_ptr<BodySource> m_source;

    HTTPRequest() {}
    HTTPRequest(const std::string &method, const std::string &url) :
        m_method(method),
        m_url(url)
    {}

    bool isReplayable() const { return !m_source || m_source->isReplayable(); }
};

struct HTTPResponse
{
    int m_status;
    std::string m_reason;
    Headers m_headers;
    /** complete body, unless a reader was given to HTTPTransport::send() */
    std::string m_body;

    HTTPResponse() : m_status(0) {}

    /** value of the header, empty if not present */
    std::string getHeader(const std::string &name) const {
        Headers::const_iterator it = m_headers.find(name);
        return it == m_headers.end() ? "" : it->second;
    }
    bool hasHeader(const std::string &name) const { return m_headers.find(name) != m_headers.end(); }
};

/**
 * Invoked for each chunk of the response body. Status and headers
 * in the HTTPResponse are already set when it gets called.
 */
typedef boost::function<void (const char *data, size_t len)> ResponseReader_t;

/**
 * Invoked after each chunk that went over the wire. total is -1
 * if the size is not known in advance.
 */
typedef boost::function<void (long long transferred, long long total)> Progress_t;

class HTTPTransport
{
 public:
    virtual ~HTTPTransport() {}

    /**
     * Sends the request and waits for the complete response.
     *
     * The status is not interpreted: 4xx and 5xx responses are
     * returned like any other.
     *
     * @param reader   if set, receives the body instead of response.m_body
     * @throw NetworkException   if no complete response was received
     */
    virtual void send(const HTTPRequest &request,
                      HTTPResponse &response,
                      const ResponseReader_t &reader = ResponseReader_t()) = 0;
};

DAV_END_CXX
#endif // INCL_DAV_HTTPTRANSPORT
