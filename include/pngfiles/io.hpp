#pragma once

#include "pngfiles/format.hpp"

#include <filesystem>
#include <string>

namespace pngfiles::io {

Bytes ReadFile(const std::filesystem::path& path);

// Writes to a sibling temporary file and renames it over path, so a failed
// write never leaves a truncated target behind.
void WriteFile(const std::filesystem::path& path, ByteView data);

// Embedding key for a file: its base name including extension.
std::string KeyFromPath(const std::filesystem::path& path);

}  // namespace pngfiles::io
