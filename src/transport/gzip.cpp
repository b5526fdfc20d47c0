#include "gzip.hpp"
#include <zlib.h>

namespace gzip {

bool compress(const std::string& in, std::string& out) {
    out.clear();
    z_stream strm{};

    // 16 + MAX_WBITS writes a gzip header and trailer instead of zlib framing
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    char buf[4096];
    int ret;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(buf);
        strm.avail_out = sizeof(buf);
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buf) - strm.avail_out;
        out.append(buf, have);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return true;
}

bool decompress(const std::string& in, std::string& out) {
    out.clear();
    if (in.empty()) {
        return true;
    }
    z_stream strm{};
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    // 32 + MAX_WBITS detects gzip or zlib headers automatically
    if (inflateInit2(&strm, 32 + MAX_WBITS) != Z_OK) {
        return false;
    }

    char buf[4096];
    int ret;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(buf);
        strm.avail_out = sizeof(buf);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buf) - strm.avail_out;
        out.append(buf, have);
        if (ret == Z_OK && strm.avail_in == 0 && have == 0) {
            // truncated stream
            inflateEnd(&strm);
            return false;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

} // namespace gzip
