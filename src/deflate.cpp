#include "pngfiles/deflate.hpp"

#include "pngfiles/constants.hpp"
#include "pngfiles/errors.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

#include <zlib.h>

namespace pngfiles::deflate {

namespace {

constexpr int kRawWindowBits = -15;
constexpr int kMemLevel = 8;

// Feeds at most uInt-max bytes per call so inputs above 4 GiB still work.
void Refill(z_stream& zs, const std::uint8_t*& cursor, std::size_t& remaining) {
    if (zs.avail_in != 0 || remaining == 0) {
        return;
    }
    std::size_t step = std::min<std::size_t>(remaining, std::numeric_limits<uInt>::max());
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(cursor));
    zs.avail_in = static_cast<uInt>(step);
    cursor += step;
    remaining -= step;
}

std::string ZlibMessage(const z_stream& zs, int rc) {
    if (zs.msg) {
        return zs.msg;
    }
    return "zlib error " + std::to_string(rc);
}

}  // namespace

Bytes Compress(ByteView input) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, kRawWindowBits, kMemLevel,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CompressionError("Failed to initialise deflate stream");
    }
    Bytes out;
    if (input.size() <= std::numeric_limits<uLong>::max()) {
        out.reserve(static_cast<std::size_t>(deflateBound(&zs, static_cast<uLong>(input.size()))));
    }
    std::array<std::uint8_t, constants::kDeflateBufferSize> buffer{};
    const std::uint8_t* cursor = input.data();
    std::size_t remaining = input.size();
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        Refill(zs, cursor, remaining);
        int flush = (remaining == 0) ? Z_FINISH : Z_NO_FLUSH;
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = ::deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) {
            std::string message = ZlibMessage(zs, rc);
            deflateEnd(&zs);
            throw CompressionError("Deflate failed: " + message);
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    deflateEnd(&zs);
    return out;
}

Bytes Decompress(ByteView input) {
    z_stream zs{};
    if (inflateInit2(&zs, kRawWindowBits) != Z_OK) {
        throw CompressionError("Failed to initialise inflate stream");
    }
    Bytes out;
    std::array<std::uint8_t, constants::kInflateBufferSize> buffer{};
    const std::uint8_t* cursor = input.data();
    std::size_t remaining = input.size();
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        Refill(zs, cursor, remaining);
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR && zs.avail_in == 0 && remaining == 0) {
            inflateEnd(&zs);
            throw CompressionError("Inflate failed: truncated deflate stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            std::string message = ZlibMessage(zs, rc);
            inflateEnd(&zs);
            throw CompressionError("Inflate failed: " + message);
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    bool trailing = zs.avail_in != 0 || remaining != 0;
    inflateEnd(&zs);
    if (trailing) {
        throw CompressionError("Inflate failed: trailing bytes after deflate stream");
    }
    return out;
}

}  // namespace pngfiles::deflate
