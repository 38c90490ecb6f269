#pragma once

#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pngfiles::cli {

struct EncodeMode {
    std::vector<std::filesystem::path> files;
};

struct DecodeMode {
    std::vector<std::string> keys;
};

struct RemoveMode {
    std::vector<std::string> keys;
};

struct ListMode {
    bool all_chunks = false;
};

using Mode = std::variant<EncodeMode, DecodeMode, RemoveMode, ListMode>;

struct Invocation {
    std::filesystem::path input;
    // Encode: target image (defaults to input). Decode: target directory.
    std::filesystem::path output;
    Mode mode;
    bool verbose = false;
    bool no_color = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage(std::ostream& os);

// Throws UsageError on unknown commands, flags or missing operands.
Invocation ParseArgs(int argc, char** argv);

// Performs the single operation selected by invocation.mode. Every read and
// every lookup happens before the first write.
void Run(const Invocation& invocation, std::ostream& out);

}  // namespace pngfiles::cli
