#include "pngfiles/env.hpp"

#include "pngfiles/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace pngfiles::env {

namespace {

std::string Normalize(std::string value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Normalize(Get(name));
    if (value.empty()) {
        return default_value;
    }
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value, std::uint64_t max_value) {
    std::string raw = Normalize(Get(name));
    if (raw.empty() || raw.front() == '-') {
        return default_value;
    }
    try {
        std::uint64_t parsed = static_cast<std::uint64_t>(std::stoull(raw));
        if (parsed == 0) {
            return default_value;
        }
        return std::min(parsed, max_value);
    } catch (const std::exception&) {
        return default_value;
    }
}

bool DebugRequested() {
    return IsEnabled(constants::kEnvDebug);
}

bool ColorsDisabled() {
    return IsEnabled(constants::kEnvNoColor);
}

std::uint32_t MaxChunkLength() {
    return static_cast<std::uint32_t>(
        GetUnsigned(constants::kEnvMaxChunkLength, constants::kMaxChunkLength, constants::kMaxChunkLength));
}

}  // namespace pngfiles::env
