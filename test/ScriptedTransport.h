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

#ifndef INCL_DAV_SCRIPTEDTRANSPORT
#define INCL_DAV_SCRIPTEDTRANSPORT

#ifdef ENABLE_UNIT_TESTS

#include <davclient/HTTPTransport.h>
#include <davclient/util.h>

#include <list>
#include <algorithm>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * Replays canned responses and records the requests,
 * including bodies read from a BodySource.
 */
class ScriptedTransport : public HTTPTransport
{
 public:
    struct Reply {
        int m_status;
        Headers m_headers;
        std::string m_body;
        /** throw NetworkException after this many body bytes, -1 never */
        long long m_failAfter;
    };

    ScriptedTransport() : m_chunkSize(7) {}

    /** queue the next response */
    Reply &reply(int status,
                 const std::string &body = "",
                 const Headers &headers = Headers()) {
        Reply reply;
        reply.m_status = status;
        reply.m_headers = headers;
        reply.m_body = body;
        reply.m_failAfter = -1;
        m_replies.push_back(reply);
        return m_replies.back();
    }

    virtual void send(const HTTPRequest &request,
                      HTTPResponse &response,
                      const ResponseReader_t &reader) {
        m_requests.push_back(request);
        std::string body = request.m_body;
        if (request.m_source) {
            request.m_source->rewind();
            char buffer[5];
            size_t len;
            while ((len = request.m_source->read(buffer, sizeof(buffer))) > 0) {
                body.append(buffer, len);
            }
        }
        m_bodies.push_back(body);

        if (m_replies.empty()) {
            DAV_THROW_EXCEPTION_2(NetworkException, "connection refused",
                                  request.m_method, request.m_url);
        }
        Reply reply = m_replies.front();
        m_replies.pop_front();

        response.m_status = reply.m_status;
        response.m_reason = reason(reply.m_status);
        response.m_headers = reply.m_headers;
        response.m_body.clear();
        size_t end = reply.m_failAfter >= 0 ?
            std::min((size_t)reply.m_failAfter, reply.m_body.size()) :
            reply.m_body.size();
        for (size_t offset = 0; offset < end; offset += m_chunkSize) {
            size_t len = std::min(m_chunkSize, end - offset);
            if (reader) {
                reader(reply.m_body.data() + offset, len);
            } else {
                response.m_body.append(reply.m_body, offset, len);
            }
        }
        if (reply.m_failAfter >= 0) {
            DAV_THROW_EXCEPTION_2(NetworkException, "connection reset by peer",
                                  request.m_method, request.m_url);
        }
    }

    static std::string reason(int status) {
        switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 207: return "Multi-Status";
        case 301: return "Moved Permanently";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 423: return "Locked";
        case 500: return "Internal Server Error";
        case 507: return "Insufficient Storage";
        default: return "";
        }
    }

    std::list<Reply> m_replies;
    std::list<HTTPRequest> m_requests;
    std::list<std::string> m_bodies;
    size_t m_chunkSize;
};

DAV_END_CXX

#endif // ENABLE_UNIT_TESTS
#endif // INCL_DAV_SCRIPTEDTRANSPORT
