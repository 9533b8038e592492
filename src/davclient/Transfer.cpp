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

#include <davclient/Transfer.h>
#include <davclient/Dispatcher.h>
#include <davclient/Logging.h>

#include <string.h>
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>

#include <algorithm>

#include <boost/bind.hpp>
#include <boost/algorithm/string/predicate.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include "ScriptedTransport.h"
# include <fstream>
# include <unistd.h>
# include <boost/scoped_ptr.hpp>
#endif

#include <davclient/declarations.h>
DAV_BEGIN_CXX

Decompressor::Encoding Decompressor::fromHeader(const std::string &contentEncoding)
{
    std::string encoding = StripSpace(contentEncoding);
    if (boost::iequals(encoding, "gzip") ||
        boost::iequals(encoding, "x-gzip")) {
        return GZIP;
    } else if (boost::iequals(encoding, "deflate")) {
        return DEFLATE;
    } else {
        return IDENTITY;
    }
}

Decompressor::Decompressor(Encoding encoding) :
    m_encoding(encoding),
    m_initialized(false),
    m_done(false)
{
    memset(&m_stream, 0, sizeof(m_stream));
}

Decompressor::~Decompressor()
{
    if (m_initialized) {
        inflateEnd(&m_stream);
    }
}

void Decompressor::init(const std::string &start)
{
    int windowBits;
    if (m_encoding == GZIP) {
        windowBits = 16 + MAX_WBITS;
    } else {
        // "deflate" is supposed to have a zlib header, but many
        // servers send raw deflate data
        unsigned char cmf = start.size() > 0 ? start[0] : 0;
        unsigned char flg = start.size() > 1 ? start[1] : 0;
        bool zlibHeader = (cmf & 0x0f) == Z_DEFLATED &&
            ((cmf << 8) | flg) % 31 == 0;
        windowBits = zlibHeader ? MAX_WBITS : -MAX_WBITS;
    }
    if (inflateInit2(&m_stream, windowBits) != Z_OK) {
        DAV_THROW(StringPrintf("inflateInit2 failed: %s", m_stream.msg ? m_stream.msg : "out of memory"));
    }
    m_initialized = true;
}

void Decompressor::feed(const char *data, size_t len, const ResponseReader_t &output)
{
    if (m_encoding == IDENTITY) {
        output(data, len);
        return;
    }
    if (m_done) {
        // data after the end of the compressed stream
        return;
    }
    if (!m_initialized) {
        if (m_encoding == DEFLATE) {
            m_pending.append(data, len);
            if (m_pending.size() < 2) {
                return;
            }
            init(m_pending);
            std::string pending;
            pending.swap(m_pending);
            inflateChunk(pending.data(), pending.size(), output);
            return;
        }
        init("");
    }
    inflateChunk(data, len, output);
}

void Decompressor::inflateChunk(const char *data, size_t len, const ResponseReader_t &output)
{
    char buffer[16 * 1024];

    m_stream.next_in = (Bytef *)data;
    m_stream.avail_in = len;
    while (!m_done) {
        m_stream.next_out = (Bytef *)buffer;
        m_stream.avail_out = sizeof(buffer);
        int res = inflate(&m_stream, Z_NO_FLUSH);
        size_t produced = sizeof(buffer) - m_stream.avail_out;
        if (produced) {
            output(buffer, produced);
        }
        if (res == Z_STREAM_END) {
            m_done = true;
        } else if (res == Z_BUF_ERROR) {
            // needs more input
            break;
        } else if (res != Z_OK) {
            DAV_THROW_EXCEPTION(MalformedResponseException,
                                StringPrintf("decoding %s body failed: %s",
                                             m_encoding == GZIP ? "gzip" : "deflate",
                                             m_stream.msg ? m_stream.msg : "corrupt data"));
        } else if (m_stream.avail_in == 0 && m_stream.avail_out != 0) {
            break;
        }
    }
}

void Decompressor::finish()
{
    if (m_encoding == IDENTITY) {
        return;
    }
    if (!m_pending.empty() ||
        (m_initialized && !m_done)) {
        DAV_THROW_EXCEPTION(MalformedResponseException, "compressed body is truncated");
    }
}

size_t StringBodySource::read(char *buffer, size_t len)
{
    size_t chunk = std::min(len, m_data.size() - m_offset);
    memcpy(buffer, m_data.data() + m_offset, chunk);
    m_offset += chunk;
    return chunk;
}

FileBodySource::FileBodySource(const std::string &filename) :
    m_filename(filename),
    m_length(-1)
{
    FILE *file = fopen(filename.c_str(), "rb");
    if (!file) {
        DAV_THROW(filename + ": " + strerror(errno));
    }
    m_file.set(file);
    struct stat buf;
    if (!fstat(fileno(file), &buf)) {
        m_length = buf.st_size;
    }
}

size_t FileBodySource::read(char *buffer, size_t len)
{
    size_t res = fread(buffer, 1, len, m_file.get());
    if (res < len && ferror(m_file.get())) {
        DAV_THROW(m_filename + ": reading failed: " + strerror(errno));
    }
    return res;
}

void FileBodySource::rewind()
{
    if (fseek(m_file.get(), 0, SEEK_SET)) {
        DAV_THROW(m_filename + ": " + strerror(errno));
    }
}

size_t CallbackBodySource::read(char *buffer, size_t len)
{
    m_consumed = true;
    return m_reader(buffer, len);
}

void CallbackBodySource::rewind()
{
    if (m_consumed) {
        DAV_THROW("streamed body cannot be sent again");
    }
}

size_t ProgressBodySource::read(char *buffer, size_t len)
{
    size_t res = m_source->read(buffer, len);
    if (res) {
        m_sent += res;
        if (m_progress) {
            m_progress(m_sent, m_source->getLength());
        }
    }
    return res;
}

void TransferManager::upload(const std::string &url,
                             const boost::shared_ptr<BodySource> &source,
                             const std::string &contentType,
                             const Headers &headers,
                             const Progress_t &progress)
{
    HTTPRequest request("PUT", url);
    request.m_headers = headers;
    request.m_headers["Content-Type"] = contentType.empty() ?
        "application/octet-stream" :
        contentType;
    if (progress) {
        request.m_source.reset(new ProgressBodySource(source, progress));
    } else {
        request.m_source = source;
    }
    HTTPResponse response;
    m_dispatcher.execute(request, response);
    DAV_LOG_DEBUG(NULL, NULL, "uploaded %s, %lld bytes",
                  request.m_url.c_str(), source->getLength());
}

void TransferManager::download(const std::string &url,
                               const ResponseReader_t &sink,
                               const Progress_t &progress,
                               const Headers &headers)
{
    HTTPRequest request("GET", url);
    request.m_headers = headers;
    HTTPResponse response;
    m_dispatcher.execute(request, response, sink, progress);
}

static void writeToFile(FILE *file, const std::string &path, const char *data, size_t len)
{
    if (fwrite(data, 1, len, file) != len) {
        DAV_THROW(path + ": writing failed: " + strerror(errno));
    }
}

void TransferManager::downloadToFile(const std::string &url,
                                     const std::string &path,
                                     const Progress_t &progress)
{
    FILE *out = fopen(path.c_str(), "wb");
    if (!out) {
        DAV_THROW(path + ": " + strerror(errno));
    }
    // closes the file also when the download fails
    SmartPtr<FILE *> file(out);
    download(url, boost::bind(writeToFile, out, boost::cref(path), _1, _2), progress);
    if (fclose(file.release())) {
        DAV_THROW(path + ": " + strerror(errno));
    }
    DAV_LOG_DEBUG(NULL, NULL, "downloaded %s into %s", url.c_str(), path.c_str());
}

#ifdef ENABLE_UNIT_TESTS

class TransferTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(TransferTest);
    CPPUNIT_TEST(gzip);
    CPPUNIT_TEST(deflate);
    CPPUNIT_TEST(corrupt);
    CPPUNIT_TEST(identity);
    CPPUNIT_TEST(upload);
    CPPUNIT_TEST(uploadStream);
    CPPUNIT_TEST(fileSource);
    CPPUNIT_TEST(download);
    CPPUNIT_TEST(downloadError);
    CPPUNIT_TEST(downloadToFile);
    CPPUNIT_TEST(downloadToFileFails);
    CPPUNIT_TEST_SUITE_END();

    boost::shared_ptr<ScriptedTransport> m_transport;
    boost::scoped_ptr<Dispatcher> m_dispatcher;
    std::list< std::pair<long long, long long> > m_progress;

public:
    void setUp() {
        m_transport.reset(new ScriptedTransport);
        ClientConfig config;
        config.m_baseUrl = "http://example.com/dav";
        m_dispatcher.reset(new Dispatcher(config, m_transport,
                                          boost::shared_ptr<Negotiator>(new Negotiator)));
        m_progress.clear();
        unlink("TransferTest.out");
        unlink("TransferTest.in");
    }

    void tearDown() {
        m_dispatcher.reset();
        m_transport.reset();
        unlink("TransferTest.out");
        unlink("TransferTest.in");
    }

private:
    static std::string compress(const std::string &data, int windowBits) {
        z_stream stream;
        memset(&stream, 0, sizeof(stream));
        deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY);
        std::string out(deflateBound(&stream, data.size()) + 32, '\0');
        stream.next_in = (Bytef *)data.data();
        stream.avail_in = data.size();
        stream.next_out = (Bytef *)&out[0];
        stream.avail_out = out.size();
        deflate(&stream, Z_FINISH);
        out.resize(out.size() - stream.avail_out);
        deflateEnd(&stream);
        return out;
    }

    static std::string text() {
        std::string data;
        for (int i = 0; i < 2000; i++) {
            data += StringPrintf("line %d of a highly compressible WebDAV body\n", i);
        }
        return data;
    }

    static void append(std::string &buffer, const char *data, size_t len) {
        buffer.append(data, len);
    }

    void progress(long long transferred, long long total) {
        m_progress.push_back(std::make_pair(transferred, total));
    }

    /** feed the compressed data in small pieces */
    static std::string decode(Decompressor::Encoding encoding, const std::string &data, size_t chunk) {
        std::string result;
        Decompressor decompressor(encoding);
        for (size_t offset = 0; offset < data.size(); offset += chunk) {
            decompressor.feed(data.data() + offset, std::min(chunk, data.size() - offset),
                              boost::bind(append, boost::ref(result), _1, _2));
        }
        decompressor.finish();
        return result;
    }

    void gzip() {
        CPPUNIT_ASSERT_EQUAL(Decompressor::GZIP, Decompressor::fromHeader("gzip"));
        CPPUNIT_ASSERT_EQUAL(Decompressor::GZIP, Decompressor::fromHeader(" X-GZIP"));
        std::string data = text();
        std::string compressed = compress(data, 16 + MAX_WBITS);
        CPPUNIT_ASSERT(compressed.size() < data.size() / 4);
        CPPUNIT_ASSERT_EQUAL(data, decode(Decompressor::GZIP, compressed, 1));
        CPPUNIT_ASSERT_EQUAL(data, decode(Decompressor::GZIP, compressed, 100000));
    }

    void deflate() {
        CPPUNIT_ASSERT_EQUAL(Decompressor::DEFLATE, Decompressor::fromHeader("Deflate"));
        std::string data = text();
        CPPUNIT_ASSERT_EQUAL(data, decode(Decompressor::DEFLATE, compress(data, -MAX_WBITS), 1));
        CPPUNIT_ASSERT_EQUAL(data, decode(Decompressor::DEFLATE, compress(data, -MAX_WBITS), 333));
        // with zlib header
        CPPUNIT_ASSERT_EQUAL(data, decode(Decompressor::DEFLATE, compress(data, MAX_WBITS), 333));
    }

    void corrupt() {
        CPPUNIT_ASSERT_THROW(decode(Decompressor::GZIP, "this is not gzip data", 5), MalformedResponseException);
        std::string compressed = compress(text(), 16 + MAX_WBITS);
        CPPUNIT_ASSERT_THROW(decode(Decompressor::GZIP, compressed.substr(0, compressed.size() / 2), 10),
                             MalformedResponseException);
    }

    void identity() {
        CPPUNIT_ASSERT_EQUAL(Decompressor::IDENTITY, Decompressor::fromHeader(""));
        CPPUNIT_ASSERT_EQUAL(Decompressor::IDENTITY, Decompressor::fromHeader("br"));
        CPPUNIT_ASSERT_EQUAL(std::string("plain"), decode(Decompressor::IDENTITY, "plain", 2));
    }

    void upload() {
        TransferManager transfer(*m_dispatcher);
        m_transport->reply(201);
        boost::shared_ptr<BodySource> source(new StringBodySource("0123456789abc"));
        transfer.upload("/up.txt", source, "text/plain", Headers(),
                        boost::bind(&TransferTest::progress, this, _1, _2));

        const HTTPRequest &request = m_transport->m_requests.back();
        CPPUNIT_ASSERT_EQUAL(std::string("PUT"), request.m_method);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/dav/up.txt"), request.m_url);
        Headers headers = request.m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), headers["Content-Type"]);
        CPPUNIT_ASSERT_EQUAL(13LL, request.m_source->getLength());
        CPPUNIT_ASSERT_EQUAL(std::string("0123456789abc"), m_transport->m_bodies.back());

        // ScriptedTransport reads 5 bytes at a time
        CPPUNIT_ASSERT_EQUAL((size_t)3, m_progress.size());
        CPPUNIT_ASSERT_EQUAL(5LL, m_progress.front().first);
        CPPUNIT_ASSERT_EQUAL(13LL, m_progress.back().first);
        CPPUNIT_ASSERT_EQUAL(13LL, m_progress.back().second);
    }

    static size_t generate(int &remaining, char *buffer, size_t len) {
        size_t res = std::min(len, (size_t)remaining);
        memset(buffer, 'x', res);
        remaining -= res;
        return res;
    }

    void uploadStream() {
        TransferManager transfer(*m_dispatcher);
        m_transport->reply(204);
        int remaining = 12;
        boost::shared_ptr<BodySource> source(new CallbackBodySource(boost::bind(generate, boost::ref(remaining), _1, _2)));
        transfer.upload("/stream.bin", source, "");
        CPPUNIT_ASSERT_EQUAL(std::string("xxxxxxxxxxxx"), m_transport->m_bodies.back());
        Headers headers = m_transport->m_requests.back().m_headers;
        CPPUNIT_ASSERT_EQUAL(std::string("application/octet-stream"), headers["Content-Type"]);
        CPPUNIT_ASSERT_EQUAL(-1LL, source->getLength());
        CPPUNIT_ASSERT(!source->isReplayable());
        char buffer[1];
        CPPUNIT_ASSERT_THROW(source->rewind(), Exception);
        CPPUNIT_ASSERT_EQUAL((size_t)0, source->read(buffer, sizeof(buffer)));
    }

    void fileSource() {
        {
            std::ofstream out("TransferTest.in");
            out << "file content";
        }
        FileBodySource source("TransferTest.in");
        CPPUNIT_ASSERT_EQUAL(12LL, source.getLength());
        char buffer[100];
        CPPUNIT_ASSERT_EQUAL((size_t)12, source.read(buffer, sizeof(buffer)));
        CPPUNIT_ASSERT_EQUAL((size_t)0, source.read(buffer, sizeof(buffer)));
        source.rewind();
        CPPUNIT_ASSERT_EQUAL((size_t)4, source.read(buffer, 4));
        CPPUNIT_ASSERT_EQUAL(std::string("file"), std::string(buffer, 4));

        CPPUNIT_ASSERT_THROW(FileBodySource("TransferTest.missing"), Exception);
    }

    void download() {
        TransferManager transfer(*m_dispatcher);
        std::string data = text();
        std::string compressed = compress(data, 16 + MAX_WBITS);
        Headers headers;
        headers["Content-Encoding"] = "gzip";
        headers["Content-Length"] = StringPrintf("%lu", (unsigned long)compressed.size());
        m_transport->reply(200, compressed, headers);
        m_transport->m_chunkSize = 100;

        std::string result;
        transfer.download("/big.txt", boost::bind(append, boost::ref(result), _1, _2),
                          boost::bind(&TransferTest::progress, this, _1, _2));
        CPPUNIT_ASSERT_EQUAL(data, result);
        CPPUNIT_ASSERT(!m_progress.empty());
        CPPUNIT_ASSERT_EQUAL((long long)compressed.size(), m_progress.back().first);
        CPPUNIT_ASSERT_EQUAL((long long)compressed.size(), m_progress.back().second);

        // no Content-Length
        m_progress.clear();
        m_transport->reply(200, "abc");
        result.clear();
        transfer.download("/small.txt", boost::bind(append, boost::ref(result), _1, _2),
                          boost::bind(&TransferTest::progress, this, _1, _2));
        CPPUNIT_ASSERT_EQUAL(std::string("abc"), result);
        CPPUNIT_ASSERT_EQUAL(3LL, m_progress.back().first);
        CPPUNIT_ASSERT_EQUAL(-1LL, m_progress.back().second);
    }

    void downloadError() {
        TransferManager transfer(*m_dispatcher);
        m_transport->reply(404, "no such file");
        std::string result;
        try {
            transfer.download("/missing", boost::bind(append, boost::ref(result), _1, _2));
            CPPUNIT_FAIL("expected ProtocolException");
        } catch (const ProtocolException &ex) {
            CPPUNIT_ASSERT_EQUAL(std::string("no such file"), ex.getBody());
        }
        CPPUNIT_ASSERT(result.empty());
    }

    void downloadToFile() {
        TransferManager transfer(*m_dispatcher);
        m_transport->reply(200, "remote content");
        transfer.downloadToFile("/remote.txt", "TransferTest.out");
        std::string content;
        CPPUNIT_ASSERT(ReadFile("TransferTest.out", content));
        CPPUNIT_ASSERT_EQUAL(std::string("remote content"), content);
    }

    void downloadToFileFails() {
        TransferManager transfer(*m_dispatcher);
        m_transport->reply(200, "0123456789012345678901234567890123456789").m_failAfter = 21;
        CPPUNIT_ASSERT_THROW(transfer.downloadToFile("/remote.txt", "TransferTest.out"), NetworkException);
        // the partial file is closed and complete up to the failure
        std::string content;
        CPPUNIT_ASSERT(ReadFile("TransferTest.out", content));
        CPPUNIT_ASSERT_EQUAL(std::string("012345678901234567890"), content);
    }
};

DAVCLIENT_TEST_SUITE_REGISTRATION(TransferTest);

#endif // ENABLE_UNIT_TESTS

DAV_END_CXX
