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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>
#include <iostream>

#include <boost/shared_ptr.hpp>
#include <boost/bind.hpp>
#include <boost/foreach.hpp>

#include <davclient/Client.h>
#include <davclient/Config.h>
#include <davclient/NeonCXX.h>
#include <davclient/Logging.h>
#include <davclient/LogStdout.h>
#include <davclient/util.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

static void usage()
{
    DAV_LOG_SHOW(NULL, NULL,
                 "usage: davclient-cmd [options] <command> [arguments]\n"
                 "\n"
                 "options:\n"
                 "  --config <file>      read url, username, password, ... from <file>\n"
                 "  --url <url>          base URL of the WebDAV server\n"
                 "  --user <name>        user name\n"
                 "  --password <secret>  password\n"
                 "  --preemptive         send credentials without waiting for a challenge\n"
                 "  --compression        ask for gzip/deflate encoded responses\n"
                 "  --debug              enable debug output\n"
                 "\n"
                 "commands:\n"
                 "  ls [path] [depth]\n"
                 "  get <path> <local file>\n"
                 "  put <local file> <path>\n"
                 "  mkdir <path>\n"
                 "  rm <path>\n"
                 "  mv <from> <to>\n"
                 "  cp <from> <to>\n"
                 "  lock <path> [seconds]\n"
                 "  unlock <path> <token>\n"
                 "  quota [path]");
}

static void showProgress(const std::string &what, long long transferred, long long total)
{
    if (total > 0) {
        DAV_LOG_INFO(NULL, NULL, "%s: %lld of %lld bytes", what.c_str(), transferred, total);
    } else {
        DAV_LOG_INFO(NULL, NULL, "%s: %lld bytes", what.c_str(), transferred);
    }
}

/** @return true if the command was known and had enough arguments */
static bool run(Client &client, const std::vector<std::string> &args)
{
    const std::string &cmd = args[0];
    size_t argc = args.size() - 1;

    if (cmd == "ls" && argc <= 2) {
        std::string path = argc >= 1 ? args[1] : "/";
        int depth = argc >= 2 ? parseDepth(args[2]) : 1;
        BOOST_FOREACH(const DavResource &resource, client.list(path, depth)) {
            DAV_LOG_SHOW(NULL, NULL, "%s", resource.toString().c_str());
        }
    } else if (cmd == "get" && argc == 2) {
        client.downloadToFile(args[1], args[2],
                              boost::bind(showProgress, args[1], _1, _2));
    } else if (cmd == "put" && argc == 2) {
        client.putFile(args[2], args[1], "",
                       boost::bind(showProgress, args[1], _1, _2));
    } else if (cmd == "mkdir" && argc == 1) {
        client.createDirectoryRecursive(args[1]);
    } else if (cmd == "rm" && argc == 1) {
        client.remove(args[1]);
    } else if (cmd == "mv" && argc == 2) {
        client.move(args[1], args[2]);
    } else if (cmd == "cp" && argc == 2) {
        client.copy(args[1], args[2]);
    } else if (cmd == "lock" && (argc == 1 || argc == 2)) {
        int timeout = argc == 2 ? atoi(args[2].c_str()) : LockManager::DEFAULT_TIMEOUT;
        DAV_LOG_SHOW(NULL, NULL, "%s", client.lock(args[1], timeout).c_str());
    } else if (cmd == "unlock" && argc == 2) {
        client.unlock(args[1], args[2]);
    } else if (cmd == "quota" && argc <= 1) {
        DavQuota quota = client.getQuota(argc == 1 ? args[1] : "/");
        DAV_LOG_SHOW(NULL, NULL, "%s", quota.getDescription().c_str());
    } else {
        return false;
    }
    return true;
}

DAV_END_CXX

using namespace DavClient;

int main(int argc, char **argv)
{
    LoggerStdout logger;
    LoggerBase::pushLogger(&logger);
    logger.setLevel(Logger::SHOW);

    int result = 1;
    try {
        ClientConfig config;
        std::vector<std::string> args;
        bool debug = false;
        std::string user, password;
        bool preemptive = false, compression = false;
        std::string url;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if ((arg == "--config" || arg == "--url" ||
                 arg == "--user" || arg == "--password") &&
                i + 1 >= argc) {
                DAV_LOG_ERROR(NULL, NULL, "%s: parameter missing", arg.c_str());
                usage();
                LoggerBase::popLogger();
                return 1;
            } else if (arg == "--config") {
                boost::shared_ptr<ConfigNode> node = ConfigNode::createFileNode(argv[++i]);
                if (!node->exists()) {
                    DAV_THROW(node->getName() + ": no such file");
                }
                config = ClientConfig::fromNode(*node);
            } else if (arg == "--url") {
                url = argv[++i];
            } else if (arg == "--user") {
                user = argv[++i];
            } else if (arg == "--password") {
                password = argv[++i];
            } else if (arg == "--preemptive") {
                preemptive = true;
            } else if (arg == "--compression") {
                compression = true;
            } else if (arg == "--debug") {
                debug = true;
            } else if (arg == "--help" || arg == "-h") {
                usage();
                LoggerBase::popLogger();
                return 0;
            } else {
                args.push_back(arg);
            }
        }

        if (getenv("DAVCLIENT_DEBUG")) {
            debug = true;
        }
        if (debug) {
            logger.setLevel(Logger::DEBUG);
            if (config.m_logLevel < 3) {
                config.m_logLevel = 3;
            }
        }
        if (!url.empty()) {
            config.m_baseUrl = url;
        }
        if (!user.empty()) {
            config.m_username = user;
            config.m_password = password;
        }
        if (preemptive) {
            config.m_preemptive = true;
        }
        if (compression) {
            config.m_compression = true;
        }

        if (args.empty() || config.m_baseUrl.empty()) {
            usage();
        } else {
            boost::shared_ptr<Neon::Settings> settings(new ClientSettings(config));
            boost::shared_ptr<HTTPTransport> transport(new Neon::NeonTransport(settings));
            Client client(config, transport);
            if (run(client, args)) {
                result = 0;
            } else {
                DAV_LOG_ERROR(NULL, NULL, "%s: unknown command or wrong number of arguments", args[0].c_str());
                usage();
            }
        }
    } catch (...) {
        Exception::handle();
        result = 1;
    }

    LoggerBase::popLogger();
    return result;
}
