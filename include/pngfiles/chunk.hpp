#pragma once

#include "pngfiles/constants.hpp"
#include "pngfiles/data_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pngfiles {

namespace chunk_type {

// Property bits are bit 5 of each tag byte: lowercase means set.
bool IsAncillary(std::string_view tag) noexcept;
bool IsPrivate(std::string_view tag) noexcept;
bool IsReservedBitSet(std::string_view tag) noexcept;
bool IsSafeToCopy(std::string_view tag) noexcept;

inline bool IsFileTag(std::string_view tag) noexcept {
    return tag == constants::kFileChunkTag;
}

}  // namespace chunk_type

struct Chunk {
    std::string tag;
    // Decoded record key; present only for fiLe chunks.
    std::optional<std::string> key;
    DataSource data;
    std::uint32_t length = 0;
    std::uint32_t crc = 0;

    bool IsFile() const noexcept { return key.has_value(); }
    ByteView Payload() const noexcept { return data.View(); }
    bool Matches(std::string_view wanted) const noexcept { return key && *key == wanted; }
};

}  // namespace pngfiles
