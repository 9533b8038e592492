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
 * Header file that is included by all DavClient files.
 * Sets up the "DavClient" namespace.
 */

#ifndef INCL_DAV_DECLARATIONS
#define INCL_DAV_DECLARATIONS

#define DAV_BEGIN_CXX namespace DavClient {
#define DAV_END_CXX }

DAV_BEGIN_CXX
/*
 * Library code never writes to standard IO directly. Either use the
 * logging facilities or let the caller pass in the output channel,
 * so that the example program and the tests can redirect it.
 *
 * These dummy declarations trip up code inside the DavClient namespace
 * which uses plain "cout << something" after a "using namespace std".
 */
struct DontUseStandardIO;
extern DontUseStandardIO *cout;
extern DontUseStandardIO *cerr;
DAV_END_CXX

#endif /** INCL_DAV_DECLARATIONS */
