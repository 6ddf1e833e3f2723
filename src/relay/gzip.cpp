#include "gzip.hpp"

#include <format>
#include <zlib.h>

namespace gzip {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper instead of raw zlib.
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kChunk = 16384;

} // namespace

std::expected<std::vector<uint8_t>, std::string> compress(std::span<const uint8_t> data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::unexpected("deflateInit2 failed");
    }

    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    uint8_t buf[kChunk];
    int rc;
    do {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        rc = deflate(&zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            return std::unexpected("deflate stream error");
        }
        out.insert(out.end(), buf, buf + (sizeof(buf) - zs.avail_out));
    } while (rc != Z_STREAM_END);

    deflateEnd(&zs);
    return out;
}

std::expected<std::vector<uint8_t>, std::string> decompress(std::span<const uint8_t> data) {
    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
        return std::unexpected("inflateInit2 failed");
    }

    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    uint8_t buf[kChunk];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : std::format("inflate returned {}", rc);
            inflateEnd(&zs);
            return std::unexpected("gzip decompression failed: " + msg);
        }
        out.insert(out.end(), buf, buf + (sizeof(buf) - zs.avail_out));
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            return std::unexpected("gzip decompression failed: truncated input");
        }
    }

    inflateEnd(&zs);
    return out;
}

} // namespace gzip
