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

#ifndef INCL_DAV_CONFIG
#define INCL_DAV_CONFIG

#include <string>
#include <list>
#include <sstream>

#include <boost/shared_ptr.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <davclient/HTTPTransport.h>
#include <davclient/NeonCXX.h>
#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/**
 * A key/value store. Keys are case-insensitive.
 */
class ConfigNode {
 public:
    /** free resources without saving */
    virtual ~ConfigNode() {}

    /** creates a file-backed config node which accepts arbitrary key/value pairs */
    static boost::shared_ptr<ConfigNode> createFileNode(const std::string &filename);

    /** a name for the node that the user can understand */
    virtual std::string getName() const = 0;

    /**
     * save all changes persistently
     */
    virtual void flush() = 0;

    /**
     * Returns the value of the given property
     *
     * @retval value   the value, unchanged if not set
     * @return true if the property was set
     */
    virtual bool readProperty(const std::string &property, std::string &value) const = 0;

    /**
     * Actual implementation of setProperty().
     *
     * @param comment    a comment explaining what the property is about, with
     *                   \n separating lines; added in front of a new property
     */
    virtual void writeProperty(const std::string &property,
                               const std::string &value,
                               const std::string &comment = std::string("")) = 0;

    /**
     * @retval props    filled with all key/value pairs; the first
     *                  assignment of a key wins
     */
    virtual void readProperties(StringMap &props) const = 0;

    virtual void removeProperty(const std::string &property) = 0;

    /**
     * Node exists in backend storage.
     */
    virtual bool exists() const = 0;

    void setProperty(const std::string &property,
                     const std::string &value,
                     const std::string &comment = std::string("")) {
        writeProperty(property, value, comment);
    }
    void setProperty(const std::string &property,
                     const char *value) {
        writeProperty(property, value);
    }

    /**
     * Sets a boolean property, using "true/false".
     */
    void setProperty(const std::string &property, bool value) {
        writeProperty(property, value ? "true" : "false");
    }

    template <class T> void setProperty(const std::string &property,
                                        const T &value,
                                        const std::string &comment = std::string("")) {
        std::stringstream strval;
        strval << value;
        writeProperty(property, strval.str(), comment);
    }

    bool getProperty(const std::string &property,
                     std::string &value) const {
        return readProperty(property, value);
    }

    bool getProperty(const std::string &property,
                     bool &value) const {
        std::string str;
        if (!readProperty(property, str) ||
            str.empty()) {
            return false;
        }

        /* accept keywords */
        if (boost::iequals(str, "true") ||
            boost::iequals(str, "yes") ||
            boost::iequals(str, "on")) {
            value = true;
            return true;
        }
        if (boost::iequals(str, "false") ||
            boost::iequals(str, "no") ||
            boost::iequals(str, "off")) {
            value = false;
            return true;
        }

        /* zero means false */
        double number;
        if (getProperty(property, number)) {
            value = number != 0;
            return true;
        }

        return false;
    }

    template <class T> bool getProperty(const std::string &property,
                                        T &value) const {
        std::string str;
        if (!readProperty(property, str) ||
            str.empty()) {
            return false;
        } else {
            std::stringstream strval(str);
            T tmp;
            strval >> tmp;
            if (strval.fail()) {
                return false;
            }
            value = tmp;
            return true;
        }
    }
};

/**
 * A .ini style file: "key = value" lines, "#" starts a comment.
 * Writing a property keeps all other lines, including comments,
 * and replaces a commented out "# key = value" default in place.
 */
class IniFileConfigNode : public ConfigNode {
 public:
    IniFileConfigNode(const std::string &path, const std::string &fileName, bool readonly);

    virtual std::string getName() const { return m_path + "/" + m_fileName; }
    virtual void flush();
    virtual bool readProperty(const std::string &property, std::string &value) const;
    virtual void writeProperty(const std::string &property,
                               const std::string &value,
                               const std::string &comment = "");
    virtual void readProperties(StringMap &props) const;
    virtual void removeProperty(const std::string &property);
    virtual bool exists() const { return m_exists; }

 private:
    std::string m_path;
    std::string m_fileName;
    bool m_readonly;
    bool m_exists;
    bool m_modified;
    std::list<std::string> m_lines;

    void read();
};

/**
 * Everything the dispatcher needs to know about a client, fixed
 * once the dispatcher is created.
 */
struct ClientConfig
{
    /** requests with relative paths are resolved against this URL */
    std::string m_baseUrl;
    /** sent with every request, unless the request overrides them */
    Headers m_headers;

    std::string m_username;
    std::string m_password;
    std::string m_domain;
    std::string m_workstation;
    bool m_preemptive;

    /** ask for gzip/deflate encoded responses */
    bool m_compression;
    /** never send a Cookie header */
    bool m_ignoreCookies;
    int m_timeoutSeconds;
    bool m_verifySSLHost;
    bool m_verifySSLCertificate;
    /** empty: system proxy settings */
    std::string m_proxy;
    /** neon debugging: 0 off, 3 headers, 4 bodies, 5 SSL, 6 XML */
    int m_logLevel;

    ClientConfig();

    /**
     * reads url, username, password, domain, workstation, preemptive,
     * compression, ignoreCookies, timeout, verifySSL, proxy, loglevel,
     * userAgent; unset keys keep their defaults
     */
    static ClientConfig fromNode(const ConfigNode &node);
};

/**
 * The transport settings of a ClientConfig.
 */
class ClientSettings : public Neon::Settings
{
 public:
    ClientSettings(const ClientConfig &config) : m_config(config) {}

    virtual bool verifySSLHost() const { return m_config.m_verifySSLHost; }
    virtual bool verifySSLCertificate() const { return m_config.m_verifySSLCertificate; }
    virtual std::string proxy() const { return m_config.m_proxy; }
    virtual int logLevel() const { return m_config.m_logLevel; }
    virtual int timeoutSeconds() const { return m_config.m_timeoutSeconds; }

 private:
    const ClientConfig m_config;
};

DAV_END_CXX
#endif // INCL_DAV_CONFIG
