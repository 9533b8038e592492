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

#ifndef INCL_DAV_SMART_POINTER
#define INCL_DAV_SMART_POINTER

#include <stdlib.h>
#include <stdio.h>
#include <stdexcept>
#include <string>

#include <ne_request.h>
#include <ne_xml.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

class Unref {
 public:
    /** C character string allocated by neon (ne_base64, ne_path_escape) */
    static void unref(char *pointer) { free(pointer); }
    static void unref(ne_request *pointer) { ne_request_destroy(pointer); }
    static void unref(ne_xml_parser *pointer) { ne_xml_destroy(pointer); }
    /** error checking is up to the caller, see SmartPtr::release() */
    static void unref(FILE *pointer) { fclose(pointer); }
};

/**
 * a smart pointer implementation for objects for which
 * a unref() function exists inside R;
 * trying to store a NULL object raises an exception,
 * unreferencing valid objects is done automatically
 */
template<class T, class base = T, class R = Unref>
class SmartPtr
{
 protected:
    T m_pointer;

  public:
    /**
     * create a smart pointer that owns the given object;
     * passing a NULL pointer and a name for the object raises an error
     */
    SmartPtr(T pointer = 0, const char *objectName = NULL) :
        m_pointer( pointer )
    {
        if (!pointer && objectName ) {
            throw std::runtime_error(std::string("Error allocating ") + objectName);
        }
    };
    ~SmartPtr()
    {
        set(0);
    }

    /**
     * store another object in this pointer, replacing any which was
     * referenced there before;
     * passing a NULL pointer and a name for the object raises an error
     */
    void set( T pointer, const char *objectName = NULL )
    {
        if (m_pointer) {
            R::unref((base)m_pointer);
        }
        if (!pointer && objectName) {
            throw std::runtime_error(std::string("Error allocating ") + objectName);
        }
        m_pointer = pointer;
    }

    /**
     * transfer ownership over the pointer to caller and stop tracking it
     */
    T release() { T res = m_pointer; m_pointer = 0; return res; }

    SmartPtr<T, base, R> &operator = ( T pointer ) { set( pointer ); return *this; }
    T get() const { return m_pointer; }
    T operator-> () { return m_pointer; }
    operator bool () const { return m_pointer != 0; }

 private:
    // ownership is never shared
    SmartPtr(const SmartPtr &other);
    SmartPtr & operator = (const SmartPtr &other);
};

DAV_END_CXX
#endif // INCL_DAV_SMART_POINTER
