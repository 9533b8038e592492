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

#ifndef INCL_DAV_CLIENT
#define INCL_DAV_CLIENT

#include <string>
#include <list>
#include <map>
#include <set>

#include <boost/shared_ptr.hpp>
#include <boost/scoped_ptr.hpp>

#include <davclient/HTTPTransport.h>
#include <davclient/Dispatcher.h>
#include <davclient/Auth.h>
#include <davclient/Config.h>
#include <davclient/Resource.h>
#include <davclient/Locks.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * The WebDAV operations, one method per protocol request. Paths
 * are relative to the base URL unless they contain a scheme.
 *
 * All methods throw the DavException subclasses described in
 * Dispatcher. exists() is the only method which never throws.
 *
 * Configuration and authentication changes must not happen while
 * another thread uses the same instance.
 */
class Client
{
 public:
    Client(const ClientConfig &config,
           const boost::shared_ptr<HTTPTransport> &transport);

    /** @name configuration */
    /**@{*/
    const ClientConfig &getConfig() const { return m_config; }
    void setBaseUrl(const std::string &url);
    const std::string &getBaseUrl() const { return m_config.m_baseUrl; }
    void enableCompression();
    void disableCompression();
    bool isCompressionEnabled() const { return m_config.m_compression; }
    void setIgnoreCookies(bool ignore);
    void setHeader(const std::string &name, const std::string &value);
    void removeHeader(const std::string &name);
    /**@}*/

    /** @name authentication, see Negotiator */
    /**@{*/
    void setCredentials(const std::string &username,
                        const std::string &password,
                        bool preemptive = false);
    void setCredentialsWithDomain(const std::string &username,
                                  const std::string &password,
                                  const std::string &domain,
                                  const std::string &workstation,
                                  bool preemptive = false);
    void setAuthenticationHandler(const boost::shared_ptr<AuthHandler> &handler,
                                  bool preemptive = false);
    void clearAuthentication();
    const Negotiator &getNegotiator() const { return *m_negotiator; }
    /**@}*/

    /** @name listing */
    /**@{*/
    /** PROPFIND allprop */
    std::list<DavResource> list(const std::string &path, int depth = 1);

    /**
     * @param includeAll    allprop if true, otherwise the standard
     *                      properties plus lockdiscovery
     */
    std::list<DavResource> listWithAllProp(const std::string &path, int depth, bool includeAll);

    /** the given properties plus resourcetype */
    std::list<DavResource> listWithProps(const std::string &path,
                                         const std::list<std::string> &names,
                                         int depth = 1);

    /** PROPFIND propname: the property names are the keys of DavResource::m_props */
    std::list<DavResource> propfindNames(const std::string &path, int depth = 0);

    /** empty names: allprop */
    Multistatus propfindRaw(const std::string &path, int depth,
                            const std::list<std::string> &names = std::list<std::string>());
    /**@}*/

    /** @name content */
    /**@{*/
    std::string get(const std::string &path, const Headers &headers = Headers());
    void getStream(const std::string &path, const ResponseReader_t &sink);
    void downloadToFile(const std::string &path, const std::string &filename,
                        const Progress_t &progress = Progress_t());

    void put(const std::string &path,
             const std::string &data,
             const std::string &contentType = "application/octet-stream",
             const std::string &lockToken = "",
             bool expectContinue = false);
    /** source must not be read by anyone else during the upload */
    void putStream(const std::string &path,
                   const boost::shared_ptr<BodySource> &source,
                   const std::string &contentType = "application/octet-stream",
                   const Progress_t &progress = Progress_t());
    /** empty contentType: derived from the file name */
    void putFile(const std::string &path,
                 const std::string &filename,
                 const std::string &contentType = "",
                 const Progress_t &progress = Progress_t());

    /** DELETE */
    void remove(const std::string &path, const std::string &lockToken = "");
    /** MKCOL */
    void createDirectory(const std::string &path);
    /** MKCOL for every missing parent, then for path itself */
    void createDirectoryRecursive(const std::string &path);
    void move(const std::string &source, const std::string &destination,
              bool overwrite = true, const std::string &lockToken = "");
    void copy(const std::string &source, const std::string &destination,
              bool overwrite = true);

    /**
     * HEAD request. Every failure counts as "does not exist",
     * including network errors and authentication failures, so a
     * false result does not prove that the resource is absent.
     */
    bool exists(const std::string &path);
    /**@}*/

    /** PROPPATCH; the result reports success per property */
    Multistatus patch(const std::string &path,
                      const StringMap &setProps,
                      const std::list<std::string> &removeProps = std::list<std::string>());

    /** @name locking */
    /**@{*/
    std::string lock(const std::string &path, int timeoutSeconds = LockManager::DEFAULT_TIMEOUT);
    std::string refreshLock(const std::string &path, const std::string &token,
                            int timeoutSeconds = LockManager::DEFAULT_TIMEOUT);
    void unlock(const std::string &path, const std::string &token);
    std::list<ActiveLock> discoverLocks(const std::string &path);
    bool isLocked(const std::string &path);
    /** token of the first active lock, empty if none */
    std::string getLockToken(const std::string &path);
    /**@}*/

    /** @name access control (RFC 3744) */
    /**@{*/
    DavAcl getAcl(const std::string &path);
    void setAcl(const std::string &path, const DavAcl &acl);
    std::set<std::string> getCurrentUserPrivileges(const std::string &path);
    /** true if the privilege or "all" is granted */
    bool hasPrivilege(const std::string &path, const std::string &privilege);
    std::map<std::string, bool> validatePrivileges(const std::string &path,
                                                   const std::list<std::string> &privileges);
    /** members of the collection whose resource type is principal */
    std::list<DavPrincipal> getPrincipals(const std::string &path);
    std::list<std::string> getPrincipalCollectionSet(const std::string &path);
    std::list<std::string> getSupportedReports(const std::string &path);
    /**@}*/

    DavQuota getQuota(const std::string &path);

    /** SEARCH with "davbasic" (a basicsearch for contains) or any other grammar */
    std::list<DavResource> search(const std::string &path,
                                  const std::string &query,
                                  const std::string &language = "davbasic");

    /**
     * sync-collection REPORT
     *
     * @param syncToken    empty for the initial synchronization
     * @param limit        <= 0: no limit
     * @param props        empty: getetag, getcontentlength, getlastmodified
     */
    SyncResult syncCollection(const std::string &path,
                              const std::string &syncToken,
                              int depth = 1,
                              int limit = 0,
                              const std::list<std::string> &props = std::list<std::string>());

    /** @name binding (RFC 5842) */
    /**@{*/
    /** make the resource at source also available as target */
    void bind(const std::string &source, const std::string &target, bool overwrite = false);
    /** remove the binding at path */
    void unbind(const std::string &path);
    /**@}*/

    /** @name versioning (RFC 3253) */
    /**@{*/
    void versionControl(const std::string &path, const std::string &version = "");
    /** @return URL of the working resource */
    std::string checkout(const std::string &path, const std::string &activitySet = "");
    /** @return URL of the new version */
    std::string checkin(const std::string &path, bool keepCheckedOut = false);
    void uncheckout(const std::string &path);
    void baselineControl(const std::string &path, const std::string &baseline = "");
    /** @return URL of the new baseline */
    std::string makeBaseline(const std::string &path);
    std::list<DavResource> versionTreeReport(const std::string &path);
    /** hrefs in the version-history property */
    std::list<std::string> getVersionHistory(const std::string &path);
    /** content of a specific version, see LockManager::resolveVersion() */
    std::string getVersion(const std::string &path, const std::string &version);
    /**@}*/

    /** REPORT with a caller supplied body */
    Multistatus report(const std::string &path, const std::string &body, int depth = 0);

 private:
    ClientConfig m_config;
    boost::shared_ptr<HTTPTransport> m_transport;
    boost::shared_ptr<Negotiator> m_negotiator;
    boost::scoped_ptr<Dispatcher> m_dispatcher;

    /** after each change of m_config */
    void reconfigure();

    HTTPResponse xmlRequest(const std::string &method,
                            const std::string &path,
                            const std::string &body,
                            const Headers &headers = Headers());
    Multistatus propfind(const std::string &path, int depth, const std::string &body);
    /** depth 0 PROPFIND for one property, NULL if not in a successful propstat */
    const XMLElement *findProperty(const std::string &path,
                                   const std::string &name,
                                   Multistatus &multistatus);
    /** Location header, first href in the body, path */
    std::string newResourceUrl(const std::string &path, const HTTPResponse &response);

    // not copyable
    Client(const Client &other);
    Client &operator = (const Client &other);
};

DAV_END_CXX
#endif // INCL_DAV_CLIENT
