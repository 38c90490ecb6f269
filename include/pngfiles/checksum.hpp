#pragma once

#include "pngfiles/format.hpp"

#include <cstdint>
#include <string_view>

namespace pngfiles::checksum {

// CRC-32 (zlib polynomial) over tag ++ payload, as stored after every chunk.
std::uint32_t ChunkCrc(std::string_view tag, ByteView payload);

std::uint32_t Crc32(ByteView bytes, std::uint32_t seed = 0);

}  // namespace pngfiles::checksum
