#include "pngfiles/container.hpp"

#include "pngfiles/checksum.hpp"
#include "pngfiles/errors.hpp"
#include "pngfiles/file_record.hpp"
#include "pngfiles/log.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string>

// http://www.libpng.org/pub/png/spec/1.2/PNG-Structure.html

namespace pngfiles {

namespace {

std::uint32_t ReadField(const Bytes& data, std::size_t& offset, const char* what) {
    if (!format::HasRoom(data.size(), offset, 4)) {
        throw OutOfBoundsError(std::string("Truncated chunk (missing ") + what + ") at offset "
                               + std::to_string(offset));
    }
    std::uint32_t value = format::ReadU32BE(data.data() + offset);
    offset += 4;
    return value;
}

void ValidateTag(const std::string& tag, std::size_t offset) {
    if (!format::IsValidUtf8(tag)) {
        throw FormatError("Invalid chunk type at offset " + std::to_string(offset));
    }
}

}  // namespace

Container Container::Parse(Bytes data, ContainerOptions options) {
    const std::size_t file_len = data.size();
    auto backing = std::make_shared<const Bytes>(std::move(data));
    const Bytes& bytes = *backing;

    const auto& signature = constants::kPngSignature;
    if (file_len < signature.size() || !std::equal(signature.begin(), signature.end(), bytes.begin())) {
        throw FormatError("Input file is not PNG format");
    }

    std::vector<Chunk> chunks;
    std::set<std::string> seen_keys;
    std::size_t offset = signature.size();
    while (offset < file_len) {
        const std::size_t chunk_start = offset;
        std::uint32_t len = ReadField(bytes, offset, "length");
        const std::size_t tag_start = offset;
        if (!format::HasRoom(file_len, tag_start, constants::kTagSize)) {
            throw OutOfBoundsError("Truncated chunk (missing chunk type) at offset " + std::to_string(tag_start));
        }
        const std::size_t payload_start = tag_start + constants::kTagSize;
        if (!format::HasRoom(file_len, payload_start, len)) {
            throw OutOfBoundsError("Invalid chunk at offset " + std::to_string(chunk_start)
                                   + " (data runs past end of buffer)");
        }
        offset = payload_start + len;
        std::uint32_t crc = ReadField(bytes, offset, "crc");

        // CRC covers tag ++ payload; verify before interpreting the tag.
        ByteView payload(bytes.data() + payload_start, len);
        std::string tag(reinterpret_cast<const char*>(bytes.data() + tag_start), constants::kTagSize);
        if (checksum::ChunkCrc(tag, payload) != crc) {
            throw IntegrityError("Crc check failed for chunk at offset " + std::to_string(chunk_start)
                                 + "; PNG file is corrupted");
        }
        ValidateTag(tag, tag_start);

        std::optional<std::string> key;
        if (chunk_type::IsFileTag(tag)) {
            key = std::string(file_record::DecodeHeader(payload).key);
            if (!seen_keys.insert(*key).second) {
                log::Debug("Duplicate fiLe key in input: " + *key);
            }
        }

        chunks.push_back(Chunk{std::move(tag), std::move(key),
                               DataSource::Borrow(backing, payload_start, payload_start + len), len, crc});
    }

    log::Debug("Parsed " + std::to_string(chunks.size()) + " chunks (" + std::to_string(seen_keys.size())
               + " embedded keys) from " + std::to_string(file_len) + " bytes");
    return Container(std::move(chunks), file_len, options);
}

}  // namespace pngfiles
