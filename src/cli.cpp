#include "pngfiles/cli.hpp"

#include "pngfiles/cli_colors.hpp"
#include "pngfiles/container.hpp"
#include "pngfiles/env.hpp"
#include "pngfiles/errors.hpp"
#include "pngfiles/io.hpp"
#include "pngfiles/log.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace pngfiles::cli {

namespace {

ContainerOptions OptionsFromEnv() {
    ContainerOptions options;
    options.max_chunk_length = env::MaxChunkLength();
    return options;
}

Container Load(const std::filesystem::path& input) {
    return Container::Parse(io::ReadFile(input), OptionsFromEnv());
}

void RunEncode(const Invocation& invocation, const EncodeMode& mode, std::ostream& out) {
    Container png = Load(invocation.input);
    for (const auto& file : mode.files) {
        std::string key = io::KeyFromPath(file);
        Bytes data = io::ReadFile(file);
        png.Insert(key, data, true);
        log::Debug("Embedded " + key + " (" + std::to_string(data.size()) + " bytes)");
    }
    std::filesystem::path target = invocation.output.empty() ? invocation.input : invocation.output;
    io::WriteFile(target, png.Serialize());
    out << Green("encoded") << " " << mode.files.size() << " file(s) into " << target.string() << "\n";
}

void RunDecode(const Invocation& invocation, const DecodeMode& mode, std::ostream& out) {
    Container png = Load(invocation.input);
    std::vector<std::pair<std::string, Bytes>> extracted;
    for (const auto& raw : mode.keys) {
        std::string key = io::KeyFromPath(raw);
        std::optional<Bytes> data = png.Get(key);
        if (!data) {
            throw Error("Key " + key + " not found in image");
        }
        extracted.emplace_back(std::move(key), std::move(*data));
    }
    std::filesystem::path dir = invocation.output.empty() ? std::filesystem::path(".") : invocation.output;
    for (const auto& [key, data] : extracted) {
        std::filesystem::path target = dir / key;
        io::WriteFile(target, data);
        out << Green("decoded") << " " << key << " -> " << target.string() << "\n";
    }
}

void RunRemove(const Invocation& invocation, const RemoveMode& mode, std::ostream& out) {
    Container png = Load(invocation.input);
    std::size_t removed = 0;
    for (const auto& raw : mode.keys) {
        std::string key = io::KeyFromPath(raw);
        if (png.Remove(key)) {
            ++removed;
        } else {
            log::Debug("Key " + key + " not present; nothing removed");
        }
    }
    io::WriteFile(invocation.input, png.Serialize());
    out << Green("removed") << " " << removed << " file(s) from " << invocation.input.string() << "\n";
}

void RunList(const Invocation& invocation, const ListMode& mode, std::ostream& out) {
    Container png = Load(invocation.input);
    if (!mode.all_chunks) {
        for (const auto& key : png.Keys()) {
            out << key << "\n";
        }
        return;
    }
    for (const auto& chunk : png.Chunks()) {
        out << Cyan(chunk.tag) << " " << chunk.length << " bytes"
            << (chunk_type::IsAncillary(chunk.tag) ? " ancillary" : " critical")
            << (chunk_type::IsPrivate(chunk.tag) ? " private" : " public")
            << (chunk_type::IsSafeToCopy(chunk.tag) ? " safe-to-copy" : "");
        if (chunk.key) {
            out << " " << Dim("key=") << *chunk.key;
        }
        out << "\n";
    }
}

std::string RequireValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    idx += 2;
    return argv[idx - 1];
}

}  // namespace

void PrintUsage(std::ostream& os) {
    os << "Usage:\n";
    os << "  pngfiles encode <input.png> [-o <output.png>] <file>...\n";
    os << "  pngfiles decode <input.png> [-o <output-dir>] <key>...\n";
    os << "  pngfiles remove <input.png> <key>...\n";
    os << "  pngfiles list <input.png> [--all]\n";
    os << "Options:\n";
    os << "  -v, --verbose   print debug diagnostics\n";
    os << "  --no-color      disable colored output\n";
}

Invocation ParseArgs(int argc, char** argv) {
    if (argc < 3) {
        throw UsageError("Missing command or input path");
    }
    std::string command(argv[1]);
    Invocation invocation;
    invocation.input = argv[2];

    std::vector<std::string> operands;
    bool all_chunks = false;
    int idx = 3;
    while (idx < argc) {
        std::string arg(argv[idx]);
        if (arg == "-o" || arg == "--output") {
            invocation.output = RequireValue(argc, argv, idx, arg);
        } else if (arg == "-v" || arg == "--verbose") {
            invocation.verbose = true;
            idx += 1;
        } else if (arg == "--no-color") {
            invocation.no_color = true;
            idx += 1;
        } else if (arg == "-a" || arg == "--all") {
            all_chunks = true;
            idx += 1;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown flag: " + arg);
        } else {
            operands.push_back(std::move(arg));
            idx += 1;
        }
    }

    if (command == "list") {
        if (!operands.empty()) {
            throw UsageError("list takes no operands");
        }
        invocation.mode = ListMode{all_chunks};
        return invocation;
    }
    if (all_chunks) {
        throw UsageError("--all is only valid with list");
    }
    if (operands.empty()) {
        throw UsageError("No files or keys given for " + command);
    }
    if (command == "encode") {
        EncodeMode encode;
        for (const auto& operand : operands) {
            encode.files.emplace_back(operand);
        }
        invocation.mode = std::move(encode);
    } else if (command == "decode") {
        invocation.mode = DecodeMode{std::move(operands)};
    } else if (command == "remove") {
        if (!invocation.output.empty()) {
            throw UsageError("remove rewrites the input; -o is not accepted");
        }
        invocation.mode = RemoveMode{std::move(operands)};
    } else {
        throw UsageError("Unknown command: " + command);
    }
    return invocation;
}

void Run(const Invocation& invocation, std::ostream& out) {
    if (invocation.no_color) {
        SetColorsEnabled(false);
    }
    if (invocation.verbose) {
        log::SetDebugEnabled(true);
    }
    std::visit(
        [&](const auto& mode) {
            using T = std::decay_t<decltype(mode)>;
            if constexpr (std::is_same_v<T, EncodeMode>) {
                RunEncode(invocation, mode, out);
            } else if constexpr (std::is_same_v<T, DecodeMode>) {
                RunDecode(invocation, mode, out);
            } else if constexpr (std::is_same_v<T, RemoveMode>) {
                RunRemove(invocation, mode, out);
            } else {
                RunList(invocation, mode, out);
            }
        },
        invocation.mode);
}

}  // namespace pngfiles::cli
