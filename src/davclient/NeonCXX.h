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
 * Simplifies usage of neon in C++ by wrapping some calls in C++
 * classes. Includes all neon header files relevant for the client.
 */

#ifndef INCL_DAV_NEONCXX
#define INCL_DAV_NEONCXX

#include <ne_session.h>
#include <ne_utils.h>
#include <ne_basic.h>
#include <ne_request.h>
#include <ne_uri.h>
#include <ne_xml.h>

#include <string>
#include <list>
#include <map>

#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>

#include <davclient/HTTPTransport.h>
#include <davclient/SmartPtr.h>
#include <davclient/util.h>
#include <davclient/declarations.h>
DAV_BEGIN_CXX

namespace Neon {
#if 0
}
#endif

/** comma separated list of features supported by libneon in use */
std::string features();

class Settings {
 public:
    virtual ~Settings() {}

    /**
     * host name must match for SSL?
     */
    virtual bool verifySSLHost() const = 0;

    /**
     * SSL certificate must be valid?
     */
    virtual bool verifySSLCertificate() const = 0;

    /**
     * proxy URL, empty for system default
     */
    virtual std::string proxy() const = 0;

    /**
     * DavClient log level, see Session::Session() how that is
     * mapped to neon debugging
     */
    virtual int logLevel() const = 0;

    /**
     * duration in seconds after which communication with a server
     * fails with a timeout error; <= 0 picks a large default value
     */
    virtual int timeoutSeconds() const = 0;

    /**
     * use this to create a boost_shared pointer for a
     * Settings instance which needs to be freed differently
     */
    struct NullDeleter {
        void operator()(const Settings *) const {}
    };
};

struct URI {
    std::string m_scheme;
    std::string m_host;
    std::string m_userinfo;
    unsigned int m_port;
    std::string m_path;
    std::string m_query;
    std::string m_fragment;

    URI() : m_port(0) {}

    /**
     * Split URL into parts. Throws NetworkException if parsing
     * fails. Port is set to the default for the scheme if not
     * explicitly specified.
     */
    static URI parse(const std::string &url);

    static URI fromNeon(const ne_uri &other);

    /**
     * produce new URI from current path and new one (may be absolute
     * and relative)
     */
    URI resolve(const std::string &path) const;

    /** compose URL from parts */
    std::string toURL() const;

    /** path plus query, as sent in the request line */
    std::string requestTarget() const;

    /** scheme, host and port: identifies the server connection */
    std::string serverKey() const;

    /**
     * URL-escape string
     */
    static std::string escape(const std::string &text);
    static std::string unescape(const std::string &text);

    int compare(const URI &other) const {
        int res;
        (res = m_scheme.compare(other.m_scheme)) == 0 &&
            (res = m_host.compare(other.m_host)) == 0 &&
            (res = m_userinfo.compare(other.m_userinfo)) == 0 &&
            (res = (int)m_port - (int)other.m_port) == 0 &&
            (res = m_path.compare(other.m_path)) == 0 &&
            (res = m_query.compare(other.m_query)) == 0 &&
            (res = m_fragment.compare(other.m_fragment)) == 0;
        return res;
    }

    bool operator == (const URI &other) const { return compare(other) == 0; }

    bool empty() const {
        return m_scheme.empty() &&
            m_host.empty() &&
            m_userinfo.empty() &&
            m_port == 0 &&
            m_path.empty() &&
            m_query.empty() &&
            m_fragment.empty();
    }
};

/** produce debug string for status, which may be NULL */
std::string Status2String(const ne_status *status);

/**
 * Wraps one ne_session, which is bound to exactly one server.
 * Authentication is not configured here: the Authorization header
 * comes from the caller of HTTPTransport::send().
 */
class Session {
 public:
    Session(const boost::shared_ptr<const Settings> &settings,
            const URI &uri);
    ~Session();

    /** ne_session_create() + ne_sock_init() */
    ne_session *getSession() const { return m_session; }
    const URI &getURI() const { return m_uri; }

    /**
     * throws NetworkException describing the neon error,
     * with the request method and URL
     */
    void throwError(int error, const std::string &method, const std::string &url);

 private:
    boost::shared_ptr<const Settings> m_settings;
    ne_session *m_session;
    URI m_uri;

    /** ne_ssl_set_verify() callback */
    static int sslVerify(void *userdata, int failures, const ne_ssl_certificate *cert) throw();
};

/**
 * encapsulates a ne_xml_parser instance
 */
class XMLParser
{
 public:
    XMLParser();

    ne_xml_parser *get() const { return m_parser.get(); }

    /**
     * See ne_xml_startelm_cb:
     * arguments are parent state, namespace, name, attributes (NULL terminated)
     * @return < 0 abort, 0 decline, > 0 accept
     */
    typedef boost::function<int (int, const char *, const char *, const char **)> StartCB_t;

    /**
     * See ne_xml_cdata_cb:
     * arguments are state of element, data and data len
     * May be NULL.
     * @return != 0 to abort
     */
    typedef boost::function<int (int, const char *, size_t)> DataCB_t;

    /**
     * See ne_xml_endelm_cb:
     * arguments are state of element, namespace, name
     * May be NULL.
     * @return != 0 to abort
     */
    typedef boost::function<int (int, const char *, const char *)> EndCB_t;

    /**
     * add new handler, see ne_xml_push_handler()
     */
    XMLParser &pushHandler(const StartCB_t &start,
                           const DataCB_t &data = DataCB_t(),
                           const EndCB_t &end = EndCB_t());

    /**
     * feed data into the parser
     *
     * @throw MalformedResponseException
     */
    void parse(const char *data, size_t len);

    /**
     * signal end of input; throws MalformedResponseException
     * if the document was incomplete or a callback failed
     */
    void finish();

    /**
     * StartCB_t: accepts every element
     */
    static int acceptAll(int parent, const char *nspace, const char *name) { return 1; }

    /**
     * DataCB_t: append to std::string
     */
    static int append(std::string &buffer,
                      const char *data,
                      size_t len);

 private:
    SmartPtr<ne_xml_parser *> m_parser;
    struct Callbacks {
        Callbacks(const StartCB_t &start,
                  const DataCB_t &data = DataCB_t(),
                  const EndCB_t &end = EndCB_t()) :
            m_start(start),
            m_data(data),
            m_end(end)
        {}
        StartCB_t m_start;
        DataCB_t m_data;
        EndCB_t m_end;
    };
    std::list<Callbacks> m_stack;

    void checkError();

    /** trampoline functions, must not throw */
    static int startCB(void *userdata, int parent,
                       const char *nspace, const char *name,
                       const char **atts) throw();
    static int dataCB(void *userdata, int state,
                      const char *cdata, size_t len) throw();
    static int endCB(void *userdata, int state,
                     const char *nspace, const char *name) throw();
};

/**
 * encapsulates a ne_request, with C++ error handling
 */
class Request
{
 public:
    Request(Session &session,
            const std::string &method,
            const std::string &url);

    void addHeader(const std::string &name, const std::string &value) {
        ne_add_request_header(m_req.get(), name.c_str(), value.c_str());
    }

    /** body must remain valid while the request exists */
    void setBody(const std::string &body);

    /** streams the body from the source, rewinding it for resends */
    void setBody(const boost::shared_ptr<BodySource> &source);

    /**
     * send the request and read the response;
     * the body goes to reader if set, else into response.m_body
     *
     * @throw NetworkException
     */
    void run(HTTPResponse &response, const ResponseReader_t &reader);

    const ne_status *getStatus() { return ne_get_status(m_req.get()); }

 private:
    Session &m_session;
    std::string m_method;
    std::string m_url;
    SmartPtr<ne_request *> m_req;
    boost::shared_ptr<BodySource> m_source;
    bool m_bodyStarted;

    void readHeaders(HTTPResponse &response);

    /** ne_set_request_body_provider() callback */
    static ssize_t bodyProvider(void *userdata, char *buffer, size_t buflen) throw();
};

/**
 * HTTPTransport on top of neon. Keeps one Session per server,
 * so requests to different hosts can be mixed freely. Not
 * thread-safe: use one instance per thread.
 */
class NeonTransport : public HTTPTransport
{
 public:
    NeonTransport(const boost::shared_ptr<const Settings> &settings);

    virtual void send(const HTTPRequest &request,
                      HTTPResponse &response,
                      const ResponseReader_t &reader = ResponseReader_t());

 private:
    boost::shared_ptr<const Settings> m_settings;
    std::map<std::string, boost::shared_ptr<Session> > m_sessions;

    Session &getSession(const URI &uri);
};

}

DAV_END_CXX

#endif // INCL_DAV_NEONCXX
