#pragma once

#include "pngfiles/format.hpp"

namespace pngfiles::deflate {

// Raw deflate stream (no zlib or gzip wrapper) at Z_BEST_COMPRESSION.
Bytes Compress(ByteView input);

// Inflates a raw deflate stream. Throws CompressionError when the stream is
// malformed, truncated, or followed by trailing bytes.
Bytes Decompress(ByteView input);

}  // namespace pngfiles::deflate
