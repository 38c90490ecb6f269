#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pngfiles::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Unset, empty, zero or unparsable values yield default_value; values above
// max_value are clamped.
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value, std::uint64_t max_value);

bool DebugRequested();
bool ColorsDisabled();
std::uint32_t MaxChunkLength();

}  // namespace pngfiles::env
