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

#ifndef INCL_DAV_TRANSFER
#define INCL_DAV_TRANSFER

#include <string>
#include <stdio.h>

#include <zlib.h>

#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>

#include <davclient/HTTPTransport.h>
#include <davclient/SmartPtr.h>

#include <davclient/declarations.h>
DAV_BEGIN_CXX

class Dispatcher;

/**
 * Incremental Content-Encoding decoder.
 */
class Decompressor
{
 public:
    enum Encoding {
        IDENTITY,
        /** gzip or x-gzip */
        GZIP,
        /** raw deflate, or deflate with zlib header */
        DEFLATE
    };

    /** unknown encodings map to IDENTITY */
    static Encoding fromHeader(const std::string &contentEncoding);

    Decompressor(Encoding encoding);
    ~Decompressor();

    /**
     * decode the next chunk, passing all output produced so far
     * to output
     *
     * @throw MalformedResponseException   corrupt data
     */
    void feed(const char *data, size_t len, const ResponseReader_t &output);

    /**
     * @throw MalformedResponseException   the compressed stream is incomplete
     */
    void finish();

 private:
    Encoding m_encoding;
    z_stream m_stream;
    bool m_initialized;
    bool m_done;
    /** start of a deflate stream, kept until the header can be checked */
    std::string m_pending;

    void init(const std::string &start);
    void inflateChunk(const char *data, size_t len, const ResponseReader_t &output);

    // not copyable
    Decompressor(const Decompressor &other);
    Decompressor &operator = (const Decompressor &other);
};

/** a complete body in memory */
class StringBodySource : public BodySource
{
 public:
    StringBodySource(const std::string &data) : m_data(data), m_offset(0) {}

    virtual size_t read(char *buffer, size_t len);
    virtual void rewind() { m_offset = 0; }
    virtual bool isReplayable() const { return true; }
    virtual long long getLength() const { return m_data.size(); }

 private:
    std::string m_data;
    size_t m_offset;
};

/** reads a local file on demand */
class FileBodySource : public BodySource
{
 public:
    /** @throw Exception  file cannot be opened */
    FileBodySource(const std::string &filename);

    virtual size_t read(char *buffer, size_t len);
    virtual void rewind();
    virtual bool isReplayable() const { return true; }
    virtual long long getLength() const { return m_length; }

 private:
    std::string m_filename;
    SmartPtr<FILE *> m_file;
    long long m_length;
};

/**
 * Pulls data from a function. Can be sent only once:
 * a 401 challenge for such a body needs preemptive
 * authentication.
 */
class CallbackBodySource : public BodySource
{
 public:
    /** same semantic as BodySource::read() */
    typedef boost::function<size_t (char *buffer, size_t len)> Reader_t;

    CallbackBodySource(const Reader_t &reader, long long length = -1) :
        m_reader(reader),
        m_length(length),
        m_consumed(false)
    {}

    virtual size_t read(char *buffer, size_t len);
    /** only possible as long as nothing was read */
    virtual void rewind();
    virtual bool isReplayable() const { return false; }
    virtual long long getLength() const { return m_length; }

 private:
    Reader_t m_reader;
    long long m_length;
    bool m_consumed;
};

/** reports the number of bytes read from another source */
class ProgressBodySource : public BodySource
{
 public:
    ProgressBodySource(const boost::shared_ptr<BodySource> &source,
                       const Progress_t &progress) :
        m_source(source),
        m_progress(progress),
        m_sent(0)
    {}

    virtual size_t read(char *buffer, size_t len);
    virtual void rewind() { m_source->rewind(); m_sent = 0; }
    virtual bool isReplayable() const { return m_source->isReplayable(); }
    virtual long long getLength() const { return m_source->getLength(); }

 private:
    boost::shared_ptr<BodySource> m_source;
    Progress_t m_progress;
    long long m_sent;
};

/**
 * Uploads and downloads without keeping the whole body in memory.
 */
class TransferManager
{
 public:
    TransferManager(const Dispatcher &dispatcher) : m_dispatcher(dispatcher) {}

    /**
     * PUT the content of source. The Content-Length comes from
     * the source if it knows it, otherwise the body is chunked.
     */
    void upload(const std::string &url,
                const boost::shared_ptr<BodySource> &source,
                const std::string &contentType,
                const Headers &headers = Headers(),
                const Progress_t &progress = Progress_t());

    /**
     * GET url, decoded data goes to sink. Progress counts received
     * bytes against the Content-Length, -1 if the server did not
     * send one.
     */
    void download(const std::string &url,
                  const ResponseReader_t &sink,
                  const Progress_t &progress = Progress_t(),
                  const Headers &headers = Headers());

    /**
     * GET url into a local file. The file is closed in all cases;
     * after a failure it contains the part that was received and
     * removing it is left to the caller.
     */
    void downloadToFile(const std::string &url,
                        const std::string &path,
                        const Progress_t &progress = Progress_t());

 private:
    const Dispatcher &m_dispatcher;
};

DAV_END_CXX
#endif // INCL_DAV_TRANSFER
