#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pngfiles {

using Bytes = std::vector<std::uint8_t>;

// Non-owning read-only view over contiguous bytes.
class ByteView {
public:
    ByteView() = default;
    ByteView(const std::uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}
    ByteView(const Bytes& bytes) noexcept : data_(bytes.data()), size_(bytes.size()) {}

    const std::uint8_t* data() const noexcept { return data_; }
    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    const std::uint8_t* begin() const noexcept { return data_; }
    const std::uint8_t* end() const noexcept { return data_ + size_; }
    std::uint8_t operator[](std::size_t index) const noexcept { return data_[index]; }

    // Caller guarantees offset + count <= size().
    ByteView Subview(std::size_t offset, std::size_t count) const noexcept {
        return ByteView(data_ + offset, count);
    }

    Bytes ToBytes() const { return Bytes(begin(), end()); }

private:
    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
};

bool operator==(ByteView lhs, ByteView rhs) noexcept;
inline bool operator!=(ByteView lhs, ByteView rhs) noexcept { return !(lhs == rhs); }

namespace format {

// Unchecked; the caller has verified that four bytes are available.
std::uint32_t ReadU32BE(const std::uint8_t* data) noexcept;
void AppendU32BE(Bytes& out, std::uint32_t value);
void Append(Bytes& out, ByteView bytes);

bool HasRoom(std::size_t total, std::size_t offset, std::size_t count) noexcept;
bool IsValidUtf8(std::string_view text) noexcept;

// Each part becomes len:u32 | bytes. Throws SizeLimitError for parts that do
// not fit a u32 length.
Bytes PackLengthPrefixed(const std::vector<ByteView>& parts);

}  // namespace format

}  // namespace pngfiles
