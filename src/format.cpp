#include "pngfiles/format.hpp"

#include "pngfiles/errors.hpp"

#include <algorithm>
#include <limits>

namespace pngfiles {

bool operator==(ByteView lhs, ByteView rhs) noexcept {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin());
}

namespace format {

namespace {

bool IsContinuation(unsigned char ch) {
    return (ch & 0xC0u) == 0x80u;
}

}  // namespace

std::uint32_t ReadU32BE(const std::uint8_t* data) noexcept {
    return (static_cast<std::uint32_t>(data[0]) << 24)
           | (static_cast<std::uint32_t>(data[1]) << 16)
           | (static_cast<std::uint32_t>(data[2]) << 8)
           | static_cast<std::uint32_t>(data[3]);
}

void AppendU32BE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void Append(Bytes& out, ByteView bytes) {
    if (!bytes.empty()) {
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
}

bool HasRoom(std::size_t total, std::size_t offset, std::size_t count) noexcept {
    return offset <= total && count <= total - offset;
}

bool IsValidUtf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80u) {
            ++i;
            continue;
        }
        std::size_t extra = 0;
        std::uint32_t code = 0;
        std::uint32_t min_code = 0;
        if ((lead & 0xE0u) == 0xC0u) {
            extra = 1;
            code = lead & 0x1Fu;
            min_code = 0x80u;
        } else if ((lead & 0xF0u) == 0xE0u) {
            extra = 2;
            code = lead & 0x0Fu;
            min_code = 0x800u;
        } else if ((lead & 0xF8u) == 0xF0u) {
            extra = 3;
            code = lead & 0x07u;
            min_code = 0x10000u;
        } else {
            return false;
        }
        if (extra > text.size() - i - 1) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char ch = static_cast<unsigned char>(text[i + k]);
            if (!IsContinuation(ch)) {
                return false;
            }
            code = (code << 6) | (ch & 0x3Fu);
        }
        if (code < min_code || code > 0x10FFFFu || (code >= 0xD800u && code <= 0xDFFFu)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

Bytes PackLengthPrefixed(const std::vector<ByteView>& parts) {
    std::size_t total = 4 * parts.size();
    for (const auto& part : parts) {
        if (part.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw SizeLimitError("Length-prefixed part cannot be bigger than u32::MAX bytes");
        }
        total += part.size();
    }
    Bytes out;
    out.reserve(total);
    for (const auto& part : parts) {
        AppendU32BE(out, static_cast<std::uint32_t>(part.size()));
        Append(out, part);
    }
    return out;
}

}  // namespace format

}  // namespace pngfiles
