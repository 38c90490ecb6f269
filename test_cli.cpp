#include "pngfiles/cli.hpp"
#include "pngfiles/container.hpp"
#include "pngfiles/errors.hpp"
#include "pngfiles/io.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using namespace pngfiles;
using pngfiles::test::AsBytes;
using pngfiles::test::Expect;
using pngfiles::test::ExpectThrows;

namespace fs = std::filesystem;

namespace {

cli::Invocation Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "pngfiles");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli::ParseArgs(static_cast<int>(argv.size()), argv.data());
}

std::string Run(std::vector<std::string> args) {
    std::ostringstream out;
    cli::Invocation invocation = Parse(std::move(args));
    invocation.no_color = true;
    cli::Run(invocation, out);
    return out.str();
}

fs::path MakeTempDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("pngfiles-test-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void TestParseArgs() {
    std::cout << "argument parsing\n";
    cli::Invocation encode = Parse({"encode", "in.png", "-o", "out.png", "dir/a.txt", "b.bin"});
    const auto* mode = std::get_if<cli::EncodeMode>(&encode.mode);
    Expect(mode && mode->files.size() == 2, "encode collects its files");
    Expect(encode.output == "out.png", "encode takes an output path");

    cli::Invocation list = Parse({"list", "in.png", "--all", "-v"});
    const auto* list_mode = std::get_if<cli::ListMode>(&list.mode);
    Expect(list_mode && list_mode->all_chunks && list.verbose, "list accepts --all and --verbose");

    ExpectThrows<cli::UsageError>([] { Parse({"encode", "in.png"}); }, "encode without files");
    ExpectThrows<cli::UsageError>([] { Parse({"explode", "in.png", "x"}); }, "unknown command");
    ExpectThrows<cli::UsageError>([] { Parse({"decode", "in.png", "--bogus", "x"}); }, "unknown flag");
    ExpectThrows<cli::UsageError>([] { Parse({"remove", "in.png", "-o", "x", "k"}); }, "remove with -o");
    ExpectThrows<cli::UsageError>([] { Parse({"decode"}); }, "missing input");
}

void TestEndToEnd(const fs::path& dir) {
    std::cout << "end to end\n";
    fs::path image = dir / "image.png";
    fs::path stored = dir / "stored.png";
    io::WriteFile(image, test::SampleImage());
    io::WriteFile(dir / "notes.txt", AsBytes("remember the milk"));
    io::WriteFile(dir / "data.bin", Bytes{0, 1, 2, 3, 4, 5});

    Run({"encode", image.string(), "-o", stored.string(), (dir / "notes.txt").string(), (dir / "data.bin").string()});
    Expect(io::ReadFile(image) == test::SampleImage(), "encode with -o leaves the input alone");
    Container png = Container::Parse(io::ReadFile(stored));
    Expect(png.Keys() == std::vector<std::string>({"notes.txt", "data.bin"}), "keys are base file names");

    std::string listing = Run({"list", stored.string()});
    Expect(listing == "notes.txt\ndata.bin\n", "list prints the keys");
    std::string all = Run({"list", stored.string(), "--all"});
    Expect(all.find("IHDR 13 bytes critical public") != std::string::npos, "list --all describes chunks");

    fs::path out_dir = dir / "out";
    Run({"decode", stored.string(), "-o", out_dir.string(), "notes.txt", "some/where/data.bin"});
    Expect(io::ReadFile(out_dir / "notes.txt") == AsBytes("remember the milk"), "decode writes the first key");
    Expect(io::ReadFile(out_dir / "data.bin") == Bytes({0, 1, 2, 3, 4, 5}), "decode derives keys from paths");

    fs::path missing_dir = dir / "missing";
    ExpectThrows<Error>([&] { Run({"decode", stored.string(), "-o", missing_dir.string(), "notes.txt", "nope"}); },
                        "decode fails when a key is absent");
    Expect(!fs::exists(missing_dir / "notes.txt"), "failed decode writes nothing");

    Run({"remove", stored.string(), "notes.txt", "not-there"});
    Container after = Container::Parse(io::ReadFile(stored));
    Expect(after.Keys() == std::vector<std::string>({"data.bin"}), "remove persists to the input");

    Run({"remove", stored.string(), "data.bin"});
    Expect(io::ReadFile(stored) == test::SampleImage(), "removing every key restores the image");

    io::WriteFile(dir / "broken.png", AsBytes("not a png"));
    ExpectThrows<FormatError>([&] { Run({"list", (dir / "broken.png").string()}); }, "non-PNG input is fatal");
    ExpectThrows<IoError>([&] { Run({"list", (dir / "absent.png").string()}); }, "missing input is an IoError");
}

}  // namespace

int main() {
    TestParseArgs();
    fs::path dir = MakeTempDir();
    try {
        TestEndToEnd(dir);
    } catch (const std::exception& exc) {
        Expect(false, std::string("unexpected exception: ") + exc.what());
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    return pngfiles::test::Finish("test_cli");
}
