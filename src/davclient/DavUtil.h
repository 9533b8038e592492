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

#ifndef INCL_DAV_DAVUTIL
#define INCL_DAV_DAVUTIL

#include <string>
#include <time.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

/** depth value for the "infinity" token */
static const int DEPTH_INFINITY = -1;

/**
 * 0 -> "0", 1 -> "1", DEPTH_INFINITY -> "infinity";
 * every other value is sent as "1"
 */
std::string depthToString(int depth);

/** inverse of depthToString(), case-insensitive; unknown tokens map to 1 */
int parseDepth(const std::string &depth);

/** content type derived from the file name suffix */
std::string getMimeType(const std::string &filename);

/** value for an Authorization header: "Basic " + base64(user:password) */
std::string basicAuthValue(const std::string &username, const std::string &password);

/** RFC 1123 date, as used in HTTP headers */
std::string formatHttpDate(time_t date);

/**
 * accepts ISO 8601 (creationdate) as well as the HTTP date
 * formats (getlastmodified)
 *
 * @return (time_t)-1 if the value cannot be parsed
 */
time_t parseHttpDate(const std::string &date);

DAV_END_CXX
#endif // INCL_DAV_DAVUTIL
