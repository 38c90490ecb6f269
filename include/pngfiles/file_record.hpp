#pragma once

#include "pngfiles/format.hpp"

#include <string>
#include <string_view>

namespace pngfiles::file_record {

// Views into a fiLe chunk payload. Valid as long as the payload is.
struct RecordHeader {
    std::string_view key;
    ByteView compressed;
};

// key_len:u32 | key | data_len:u32 | raw_deflate(raw)
Bytes Encode(std::string_view key, ByteView raw);

// Splits a payload into key and compressed data without inflating.
// Throws EncodingError on truncated lengths, trailing bytes or a key that is
// not valid UTF-8.
RecordHeader DecodeHeader(ByteView payload);

// DecodeHeader followed by inflate; throws CompressionError on a bad stream.
Bytes Extract(ByteView payload);

}  // namespace pngfiles::file_record
