#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace pngfiles::constants {

inline constexpr std::array<std::uint8_t, 8> kPngSignature = {
    0x89u, 0x50u, 0x4Eu, 0x47u, 0x0Du, 0x0Au, 0x1Au, 0x0Au
};

inline constexpr std::size_t kTagSize = 4;
inline constexpr std::size_t kLengthSize = 4;
inline constexpr std::size_t kCrcSize = 4;
inline constexpr std::size_t kChunkOverhead = kLengthSize + kTagSize + kCrcSize;

// fiLe
// |||+- safe-to-copy (lowercase)
// ||+-- reserved bit clear (uppercase)
// |+--- private (lowercase)
// +---- ancillary (lowercase)
inline constexpr std::string_view kFileChunkTag = "fiLe";

inline constexpr std::uint32_t kMaxChunkLength = std::numeric_limits<std::uint32_t>::max();

inline constexpr std::size_t kInflateBufferSize = 16384;
inline constexpr std::size_t kDeflateBufferSize = 16384;

inline constexpr std::string_view kEnvDebug = "PNGFILES_DEBUG";
inline constexpr std::string_view kEnvNoColor = "PNGFILES_NO_COLOR";
inline constexpr std::string_view kEnvMaxChunkLength = "PNGFILES_MAX_CHUNK_LENGTH";

}  // namespace pngfiles::constants
