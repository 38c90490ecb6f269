#include "pngfiles/chunk.hpp"

namespace pngfiles::chunk_type {

namespace {

constexpr unsigned char kPropertyBit = 0x20u;

bool PropertyBit(std::string_view tag, std::size_t index) noexcept {
    if (index >= tag.size()) {
        return false;
    }
    return (static_cast<unsigned char>(tag[index]) & kPropertyBit) != 0;
}

}  // namespace

bool IsAncillary(std::string_view tag) noexcept {
    return PropertyBit(tag, 0);
}

bool IsPrivate(std::string_view tag) noexcept {
    return PropertyBit(tag, 1);
}

bool IsReservedBitSet(std::string_view tag) noexcept {
    return PropertyBit(tag, 2);
}

bool IsSafeToCopy(std::string_view tag) noexcept {
    return PropertyBit(tag, 3);
}

}  // namespace pngfiles::chunk_type
