#include "pngfiles/container.hpp"

namespace pngfiles {

Bytes Container::Serialize() const {
    Bytes out;
    out.reserve(capacity_);
    out.insert(out.end(), constants::kPngSignature.begin(), constants::kPngSignature.end());
    for (const auto& chunk : chunks_) {
        format::AppendU32BE(out, chunk.length);
        out.insert(out.end(), chunk.tag.begin(), chunk.tag.end());
        format::Append(out, chunk.Payload());
        format::AppendU32BE(out, chunk.crc);
    }
    return out;
}

}  // namespace pngfiles
