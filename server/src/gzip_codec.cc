#include "gzip_codec.h"

#include <cstring>

#include <zlib.h>

namespace plshare {

// windowBits 15 + 16 selects the gzip wrapper in zlib.
static constexpr int kGzipWindowBits = 15 + 16;
static constexpr int kMemLevel = 8;

// 1f 8b | CM=8 | FLG=0 | MTIME=0 | XFL=2 (level 9) | OS=255
static const unsigned char kExpectedHeader[10] = {
    0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0xff,
};

bool gzip_compress(const std::string& in, std::string* out, std::string* err) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        if (err) *err = "deflateInit2 failed";
        return false;
    }

    gz_header head;
    std::memset(&head, 0, sizeof(head));
    head.os = 255;
    if (deflateSetHeader(&zs, &head) != Z_OK) {
        deflateEnd(&zs);
        if (err) *err = "deflateSetHeader failed";
        return false;
    }

    std::string buf;
    buf.resize(deflateBound(&zs, (uLong)in.size()) + sizeof(kExpectedHeader) + 8);

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = (uInt)in.size();
    zs.next_out = reinterpret_cast<Bytef*>(&buf[0]);
    zs.avail_out = (uInt)buf.size();

    int rc = deflate(&zs, Z_FINISH);
    if (rc != Z_STREAM_END) {
        deflateEnd(&zs);
        if (err) *err = std::string("deflate failed: ") + (zs.msg ? zs.msg : "rc=" + std::to_string(rc));
        return false;
    }
    buf.resize(zs.total_out);
    deflateEnd(&zs);

    if (out) *out = std::move(buf);
    return true;
}

bool gzip_decompress(const std::string& in, std::string* out, std::string* err, size_t max_out) {
    if (in.size() < sizeof(kExpectedHeader) + 8 ||
        std::memcmp(in.data(), kExpectedHeader, sizeof(kExpectedHeader)) != 0) {
        if (err) *err = "unexpected gzip header";
        return false;
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
        if (err) *err = "inflateInit2 failed";
        return false;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = (uInt)in.size();

    std::string result;
    char chunk[32768];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : ("rc=" + std::to_string(rc));
            inflateEnd(&zs);
            if (err) *err = "inflate failed: " + msg;
            return false;
        }
        const size_t produced = sizeof(chunk) - zs.avail_out;
        if (result.size() + produced > max_out) {
            inflateEnd(&zs);
            if (err) *err = "inflated size exceeds limit";
            return false;
        }
        result.append(chunk, produced);
        if (rc == Z_OK && produced == 0 && zs.avail_in == 0) {
            inflateEnd(&zs);
            if (err) *err = "truncated gzip stream";
            return false;
        }
    }

    const bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);
    if (trailing) {
        if (err) *err = "trailing bytes after gzip member";
        return false;
    }

    if (out) *out = std::move(result);
    return true;
}

} // namespace plshare
