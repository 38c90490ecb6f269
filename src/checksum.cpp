#include "pngfiles/checksum.hpp"

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngfiles::checksum {

std::uint32_t Crc32(ByteView bytes, std::uint32_t seed) {
    uLong crc = seed;
    const std::uint8_t* cursor = bytes.data();
    std::size_t remaining = bytes.size();
    while (remaining > 0) {
        std::size_t step = std::min<std::size_t>(remaining, std::numeric_limits<uInt>::max());
        crc = crc32(crc, cursor, static_cast<uInt>(step));
        cursor += step;
        remaining -= step;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t ChunkCrc(std::string_view tag, ByteView payload) {
    ByteView tag_bytes(reinterpret_cast<const std::uint8_t*>(tag.data()), tag.size());
    return Crc32(payload, Crc32(tag_bytes));
}

}  // namespace pngfiles::checksum
