#include "pngfiles/file_record.hpp"

#include "pngfiles/deflate.hpp"
#include "pngfiles/errors.hpp"

#include <string>

namespace pngfiles::file_record {

namespace {

ByteView ReadPart(ByteView payload, std::size_t& offset, const char* what) {
    if (!format::HasRoom(payload.size(), offset, 4)) {
        throw EncodingError(std::string("Malformed file record (missing ") + what + " length)");
    }
    std::uint32_t len = format::ReadU32BE(payload.data() + offset);
    offset += 4;
    if (!format::HasRoom(payload.size(), offset, len)) {
        throw EncodingError(std::string("Malformed file record (truncated ") + what + ")");
    }
    ByteView part = payload.Subview(offset, len);
    offset += len;
    return part;
}

}  // namespace

Bytes Encode(std::string_view key, ByteView raw) {
    if (!format::IsValidUtf8(key)) {
        throw EncodingError("File key is not valid UTF-8");
    }
    Bytes compressed = deflate::Compress(raw);
    ByteView key_bytes(reinterpret_cast<const std::uint8_t*>(key.data()), key.size());
    return format::PackLengthPrefixed({key_bytes, ByteView(compressed)});
}

RecordHeader DecodeHeader(ByteView payload) {
    std::size_t offset = 0;
    ByteView key_bytes = ReadPart(payload, offset, "key");
    ByteView data = ReadPart(payload, offset, "data");
    if (offset != payload.size()) {
        throw EncodingError("Malformed file record (extra bytes)");
    }
    std::string_view key(reinterpret_cast<const char*>(key_bytes.data()), key_bytes.size());
    if (!format::IsValidUtf8(key)) {
        throw EncodingError("Malformed file record (key is not valid UTF-8)");
    }
    return RecordHeader{key, data};
}

Bytes Extract(ByteView payload) {
    RecordHeader header = DecodeHeader(payload);
    return deflate::Decompress(header.compressed);
}

}  // namespace pngfiles::file_record
