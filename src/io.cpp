#include "pngfiles/io.hpp"

#include "pngfiles/errors.hpp"

#include <fstream>
#include <system_error>

namespace pngfiles::io {

Bytes ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw IoError("Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw IoError("Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFile(const std::filesystem::path& path, ByteView data) {
    if (!path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::filesystem::path temp = path;
    temp += ".pngfiles-tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IoError("Failed to open output file: " + temp.string());
        }
        if (!data.empty()) {
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw IoError("Failed to write output file: " + path.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw IoError("Failed to replace " + path.string() + ": " + ec.message());
    }
}

std::string KeyFromPath(const std::filesystem::path& path) {
    std::string key = path.filename().string();
    if (key.empty()) {
        throw IoError("Path has no file name: " + path.string());
    }
    return key;
}

}  // namespace pngfiles::io
