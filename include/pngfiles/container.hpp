#pragma once

#include "pngfiles/chunk.hpp"
#include "pngfiles/constants.hpp"
#include "pngfiles/format.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pngfiles {

struct ContainerOptions {
    // Largest encoded fiLe payload Insert accepts.
    std::uint32_t max_chunk_length = constants::kMaxChunkLength;
};

// In-memory chunk sequence of one PNG. Parsed chunks borrow from a shared,
// never-mutated copy of the input; inserted chunks own their payload.
// Not thread-safe.
class Container {
public:
    // Throws FormatError, OutOfBoundsError, IntegrityError or EncodingError;
    // nothing is returned on failure.
    static Container Parse(Bytes data, ContainerOptions options = {});

    // Signature followed by every chunk in sequence order.
    Bytes Serialize() const;

    // Decompressed bytes of the first fiLe chunk with key. Empty when no
    // chunk matches or its record fails to decode.
    std::optional<Bytes> Get(std::string_view key) const;

    // Removes the first fiLe chunk with key.
    bool Remove(std::string_view key);

    // Appends a new fiLe chunk, or replaces the matching one in place when
    // replace_existing is set. Throws DuplicateKeyError, SizeLimitError or
    // EncodingError and leaves the container untouched on failure.
    void Insert(std::string_view key, ByteView data, bool replace_existing);

    bool Contains(std::string_view key) const;
    std::vector<std::string> Keys() const;

    const std::vector<Chunk>& Chunks() const noexcept { return chunks_; }
    std::size_t size() const noexcept { return chunks_.size(); }
    std::size_t SizeHint() const noexcept { return capacity_; }
    const ContainerOptions& Options() const noexcept { return options_; }

private:
    Container(std::vector<Chunk> chunks, std::size_t capacity, ContainerOptions options)
        : chunks_(std::move(chunks)), capacity_(capacity), options_(options) {}

    std::vector<Chunk>::iterator Find(std::string_view key);
    std::vector<Chunk>::const_iterator Find(std::string_view key) const;

    std::vector<Chunk> chunks_;
    std::size_t capacity_ = 0;
    ContainerOptions options_;
};

}  // namespace pngfiles
