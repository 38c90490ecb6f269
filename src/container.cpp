#include "pngfiles/container.hpp"

#include "pngfiles/checksum.hpp"
#include "pngfiles/errors.hpp"
#include "pngfiles/file_record.hpp"
#include "pngfiles/log.hpp"

#include <algorithm>

namespace pngfiles {

std::vector<Chunk>::iterator Container::Find(std::string_view key) {
    return std::find_if(chunks_.begin(), chunks_.end(),
                        [key](const Chunk& chunk) { return chunk.Matches(key); });
}

std::vector<Chunk>::const_iterator Container::Find(std::string_view key) const {
    return std::find_if(chunks_.begin(), chunks_.end(),
                        [key](const Chunk& chunk) { return chunk.Matches(key); });
}

std::optional<Bytes> Container::Get(std::string_view key) const {
    auto it = Find(key);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    try {
        return file_record::Extract(it->Payload());
    } catch (const EncodingError& exc) {
        log::Warn("Embedded file " + std::string(key) + " could not be decoded: " + exc.what());
    } catch (const CompressionError& exc) {
        log::Warn("Embedded file " + std::string(key) + " could not be decompressed: " + exc.what());
    }
    return std::nullopt;
}

bool Container::Remove(std::string_view key) {
    auto it = Find(key);
    if (it == chunks_.end()) {
        return false;
    }
    chunks_.erase(it);
    return true;
}

void Container::Insert(std::string_view key, ByteView data, bool replace_existing) {
    auto it = Find(key);
    if (it != chunks_.end() && !replace_existing) {
        throw DuplicateKeyError(std::string(key));
    }

    Bytes payload = file_record::Encode(key, data);
    if (payload.size() > options_.max_chunk_length) {
        throw SizeLimitError("Data cannot be bigger than " + std::to_string(options_.max_chunk_length)
                             + " bytes once encoded (got " + std::to_string(payload.size()) + ")");
    }
    std::uint32_t crc = checksum::ChunkCrc(constants::kFileChunkTag, payload);
    auto len = static_cast<std::uint32_t>(payload.size());

    Chunk chunk{std::string(constants::kFileChunkTag), std::string(key), DataSource::Own(std::move(payload)),
                len, crc};
    if (it == chunks_.end()) {
        chunks_.push_back(std::move(chunk));
    } else {
        *it = std::move(chunk);
    }
}

bool Container::Contains(std::string_view key) const {
    return Find(key) != chunks_.end();
}

std::vector<std::string> Container::Keys() const {
    std::vector<std::string> keys;
    for (const auto& chunk : chunks_) {
        if (chunk.key) {
            keys.push_back(*chunk.key);
        }
    }
    return keys;
}

}  // namespace pngfiles
