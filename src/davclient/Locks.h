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

#ifndef INCL_DAV_LOCKS
#define INCL_DAV_LOCKS

#include <string>
#include <list>

#include <davclient/Dispatcher.h>
#include <davclient/Resource.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * LOCK/UNLOCK and the tokens that come with them, plus
 * access to old versions of a resource.
 */
class LockManager
{
 public:
    /** seconds */
    static const int DEFAULT_TIMEOUT = 3600;

    LockManager(const Dispatcher &dispatcher) : m_dispatcher(dispatcher) {}

    /**
     * @return the lock token
     * @throw MalformedResponseException   the server did not return a token
     */
    std::string acquireLock(const std::string &url,
                            int timeoutSeconds = DEFAULT_TIMEOUT,
                            const std::string &owner = "",
                            bool exclusive = true);

    /**
     * LOCK without body, identifying the lock with an If header
     *
     * @return the new token if the server sent one, token otherwise
     */
    std::string refreshLock(const std::string &url,
                            const std::string &token,
                            int timeoutSeconds = DEFAULT_TIMEOUT);

    void releaseLock(const std::string &url, const std::string &token);

    /** active locks, from a depth 0 PROPFIND for lockdiscovery */
    std::list<ActiveLock> discoverLocks(const std::string &url);

    /** value of an If header for a token-guarded request */
    static std::string ifHeader(const std::string &token) { return "(<" + token + ">)"; }

    /** value of a Lock-Token header */
    static std::string lockTokenHeader(const std::string &token) { return "<" + token + ">"; }

    /**
     * href of the DAV:version-history property,
     * empty if the server does not report it
     */
    std::string getVersionHistory(const std::string &url);

    /**
     * Content of a specific version. Looks for the version inside
     * the version history collection first; if that does not work
     * for whatever reason, asks for the version with a Label header
     * on the resource itself. Only the error of that second request
     * reaches the caller.
     */
    std::string resolveVersion(const std::string &url, const std::string &version);

 private:
    const Dispatcher &m_dispatcher;

    /** token from the response body, else from the Lock-Token header */
    static std::string extractToken(const HTTPResponse &response);
};

DAV_END_CXX
#endif // INCL_DAV_LOCKS
