#include "pngfiles/pngfiles.hpp"
#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pngfiles;
using pngfiles::test::AppendChunk;
using pngfiles::test::AsBytes;
using pngfiles::test::Expect;
using pngfiles::test::ExpectThrows;

namespace {

std::vector<std::string> Tags(const Container& png) {
    std::vector<std::string> tags;
    for (const auto& chunk : png.Chunks()) {
        tags.push_back(chunk.tag);
    }
    return tags;
}

void TestMinimalBuffer() {
    std::cout << "minimal buffer\n";
    Container png = Container::Parse(test::Signature());
    Expect(png.size() == 0, "signature only parses to zero chunks");
    Expect(png.Serialize() == test::Signature(), "empty container serializes to the signature");

    png.Insert("a.txt", Bytes{0x01, 0x02, 0x03}, true);
    Container reparsed = Container::Parse(png.Serialize());
    auto data = reparsed.Get("a.txt");
    Expect(data.has_value() && *data == Bytes({0x01, 0x02, 0x03}), "inserted bytes survive serialize and parse");
}

void TestRoundTrip() {
    std::cout << "round trip\n";
    Bytes original = test::SampleImage();
    Container png = Container::Parse(original);
    Expect(png.size() == 4, "sample image has four chunks");
    Expect(Tags(png) == std::vector<std::string>({"IHDR", "tEXt", "IDAT", "IEND"}), "chunk order is kept");
    Expect(png.Chunks().back().length == 0, "zero-length IEND payload is accepted");
    Expect(png.SizeHint() == original.size(), "size hint is the parsed length");
    Expect(png.Serialize() == original, "unmodified container serializes byte for byte");

    Bytes with_file = test::SampleImage();
    with_file.resize(with_file.size() - 12);
    AppendChunk(with_file, "fiLe", file_record::Encode("notes.md", AsBytes("# notes")));
    AppendChunk(with_file, "IEND", Bytes{});
    Container embedded = Container::Parse(with_file);
    Expect(embedded.Serialize() == with_file, "container with a fiLe chunk round-trips");
    Expect(embedded.Chunks()[3].key.value_or("") == "notes.md", "fiLe key is decoded at parse time");
}

void TestInsertGetRemove() {
    std::cout << "insert / get / remove\n";
    Container png = Container::Parse(test::SampleImage());
    Bytes payload = AsBytes("hello hello hello hello world");
    png.Insert("hello.txt", payload, false);

    Expect(png.Contains("hello.txt"), "key is present after insert");
    Expect(png.Get("hello.txt") == std::optional<Bytes>(payload), "get returns inserted bytes");
    Expect(png.Chunks().back().tag == "fiLe", "new chunk is appended after IEND");
    Expect(!png.Get("missing.txt").has_value(), "unknown key is absent");

    Expect(png.Remove("hello.txt"), "remove reports a removal");
    Expect(!png.Get("hello.txt").has_value(), "removed key is absent");
    Expect(!png.Remove("hello.txt"), "second remove is a no-op");
    Expect(png.Serialize() == test::SampleImage(), "insert then remove restores the original bytes");

    png.Insert("empty.bin", Bytes{}, false);
    auto empty = png.Get("empty.bin");
    Expect(empty.has_value() && empty->empty(), "empty payload round-trips");
}

void TestDuplicateAndReplace() {
    std::cout << "duplicate keys\n";
    Bytes base = test::SampleImage();
    base.resize(base.size() - 12);
    AppendChunk(base, "fiLe", file_record::Encode("a.txt", AsBytes("first")));
    AppendChunk(base, "IEND", Bytes{});
    Container png = Container::Parse(base);
    png.Insert("b.txt", AsBytes("second"), false);
    Bytes before = png.Serialize();

    ExpectThrows<DuplicateKeyError>([&] { png.Insert("a.txt", AsBytes("other"), false); },
                                    "insert without replace rejects an existing key");
    Expect(png.Serialize() == before, "rejected insert leaves the container unchanged");

    png.Insert("a.txt", AsBytes("replaced"), true);
    Expect(png.Get("a.txt") == std::optional<Bytes>(AsBytes("replaced")), "replace stores the new bytes");
    Expect(Tags(png) == std::vector<std::string>({"IHDR", "tEXt", "IDAT", "fiLe", "IEND", "fiLe"}),
           "replace keeps the chunk in its original position");
    Expect(png.Keys() == std::vector<std::string>({"a.txt", "b.txt"}), "keys are listed in sequence order");
    Expect(!png.Chunks()[3].data.IsBorrowed(), "replaced chunk owns its payload");
}

void TestDuplicateKeysInInput() {
    std::cout << "duplicate keys in input\n";
    Bytes raw = test::Signature();
    AppendChunk(raw, "fiLe", file_record::Encode("dup", AsBytes("one")));
    AppendChunk(raw, "IEND", Bytes{});
    AppendChunk(raw, "fiLe", file_record::Encode("dup", AsBytes("two")));

    Container png = Container::Parse(raw);
    Expect(png.Keys().size() == 2, "duplicate keys are tolerated at parse time");
    Expect(png.Get("dup") == std::optional<Bytes>(AsBytes("one")), "get returns the first match");
    Expect(png.Remove("dup"), "remove drops the first match");
    Expect(png.Get("dup") == std::optional<Bytes>(AsBytes("two")), "second match becomes visible");
}

void TestCorruption() {
    std::cout << "corruption detection\n";
    Container source = Container::Parse(test::SampleImage());
    source.Insert("secret.bin", Bytes(64, 0x5A), true);
    Bytes clean = source.Serialize();

    // IHDR tag and payload, then the whole fiLe chunk minus its length and CRC.
    std::vector<std::pair<std::size_t, std::size_t>> ranges = {{12, 29}};
    std::size_t file_start = clean.size() - (source.Chunks().back().length + constants::kChunkOverhead);
    ranges.emplace_back(file_start + 4, clean.size() - 4);

    bool all_detected = true;
    for (const auto& [begin, end] : ranges) {
        for (std::size_t i = begin; i < end; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                Bytes damaged = clean;
                damaged[i] ^= static_cast<std::uint8_t>(1u << bit);
                try {
                    Container::Parse(damaged);
                    all_detected = false;
                } catch (const IntegrityError&) {
                } catch (const std::exception&) {
                    all_detected = false;
                }
            }
        }
    }
    Expect(all_detected, "every single-bit flip in tag or payload raises IntegrityError");

    Bytes bad_crc = clean;
    bad_crc[29] ^= 0x01;
    ExpectThrows<IntegrityError>([&] { Container::Parse(bad_crc); }, "damaged stored CRC is detected");
}

void TestStructuralErrors() {
    std::cout << "structural errors\n";
    Bytes sample = test::SampleImage();

    Bytes bad_signature = sample;
    bad_signature[1] = 'Q';
    ExpectThrows<FormatError>([&] { Container::Parse(bad_signature); }, "bad signature is a FormatError");
    ExpectThrows<FormatError>([&] { Container::Parse(Bytes{0x89, 0x50}); }, "short buffer is a FormatError");
    ExpectThrows<FormatError>([&] { Container::Parse(Bytes{}); }, "empty buffer is a FormatError");

    ExpectThrows<OutOfBoundsError>([&] { Container::Parse(Bytes(sample.begin(), sample.end() - 2)); },
                                   "truncated CRC is out of bounds");
    ExpectThrows<OutOfBoundsError>([&] { Container::Parse(Bytes(sample.begin(), sample.begin() + 10)); },
                                   "truncated length field is out of bounds");
    ExpectThrows<OutOfBoundsError>([&] { Container::Parse(Bytes(sample.begin(), sample.begin() + 20)); },
                                   "truncated payload is out of bounds");

    Bytes huge_length = sample;
    huge_length[8] = 0xFF;
    ExpectThrows<OutOfBoundsError>([&] { Container::Parse(huge_length); }, "oversized length is out of bounds");

    Bytes bad_tag = test::Signature();
    AppendChunk(bad_tag, std::string("\xFF\xFE\x41\x41", 4), Bytes{1});
    ExpectThrows<FormatError>([&] { Container::Parse(bad_tag); }, "tag that is not text is a FormatError");

    Bytes bad_record = test::Signature();
    AppendChunk(bad_record, "fiLe", Bytes{0, 0, 0, 9, 'x'});
    ExpectThrows<EncodingError>([&] { Container::Parse(bad_record); }, "malformed fiLe record fails the parse");
}

void TestUndecodableRecord() {
    std::cout << "undecodable record\n";
    Bytes raw = test::Signature();
    AppendChunk(raw, "fiLe", format::PackLengthPrefixed({ByteView(AsBytes("broken")), ByteView(Bytes{0xFF, 0xFF})}));
    Container png = Container::Parse(raw);
    Expect(png.Contains("broken"), "key of a record with a bad stream is indexed");
    Expect(!png.Get("broken").has_value(), "get reports a bad stream as absent");
    ExpectThrows<CompressionError>([&] { file_record::Extract(png.Chunks()[0].Payload()); },
                                   "extract surfaces the CompressionError");
}

void TestSizeLimit() {
    std::cout << "size limit\n";
    Bytes data = AsBytes("size limited payload");
    std::size_t encoded = file_record::Encode("k", data).size();

    ContainerOptions options;
    options.max_chunk_length = static_cast<std::uint32_t>(encoded - 1);
    Container png = Container::Parse(test::SampleImage(), options);
    Bytes before = png.Serialize();
    ExpectThrows<SizeLimitError>([&] { png.Insert("k", data, true); }, "encoded payload above the limit is rejected");
    Expect(png.Serialize() == before, "rejected insert leaves the container unchanged");

    options.max_chunk_length = static_cast<std::uint32_t>(encoded);
    Container exact = Container::Parse(test::SampleImage(), options);
    exact.Insert("k", data, true);
    Expect(exact.Get("k") == std::optional<Bytes>(data), "payload exactly at the limit is accepted");
}

void TestOwnership() {
    std::cout << "ownership\n";
    auto png = std::make_unique<Container>(Container::Parse(test::SampleImage()));
    bool all_borrowed = true;
    for (const auto& chunk : png->Chunks()) {
        all_borrowed = all_borrowed && chunk.data.IsBorrowed();
    }
    Expect(all_borrowed, "parsed chunks borrow the backing buffer");

    Container copy = *png;
    png->Insert("x", AsBytes("owned"), true);
    Expect(!png->Chunks().back().data.IsBorrowed(), "inserted chunk owns its payload");
    png.reset();
    Expect(copy.Serialize() == test::SampleImage(), "copies stay valid after the original is gone");
}

void TestChunkTypeBits() {
    std::cout << "chunk type bits\n";
    Expect(chunk_type::IsAncillary("fiLe") && chunk_type::IsPrivate("fiLe")
               && !chunk_type::IsReservedBitSet("fiLe") && chunk_type::IsSafeToCopy("fiLe"),
           "fiLe is ancillary, private, reserved-clear, safe-to-copy");
    Expect(!chunk_type::IsAncillary("IHDR") && !chunk_type::IsPrivate("IHDR")
               && !chunk_type::IsSafeToCopy("IHDR"),
           "IHDR is critical, public, unsafe-to-copy");
    Expect(chunk_type::IsAncillary("tEXt") && chunk_type::IsSafeToCopy("tEXt"), "tEXt is ancillary and safe-to-copy");
}

}  // namespace

int main() {
    TestMinimalBuffer();
    TestRoundTrip();
    TestInsertGetRemove();
    TestDuplicateAndReplace();
    TestDuplicateKeysInInput();
    TestCorruption();
    TestStructuralErrors();
    TestUndecodableRecord();
    TestSizeLimit();
    TestOwnership();
    TestChunkTypeBits();
    return pngfiles::test::Finish("test_container");
}
