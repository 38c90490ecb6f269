#pragma once

#include <string>

namespace pngfiles::log {

// Debug output defaults to PNGFILES_DEBUG; the CLI overrides it with --verbose.
bool DebugEnabled();
void SetDebugEnabled(bool enabled);

void Debug(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace pngfiles::log
