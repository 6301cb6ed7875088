#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "peershare/base/error_code.h"
#include "peershare/transfer/chunker.h"
#include "peershare/transfer/content_hasher.h"
#include "peershare/transfer/file_source.h"

using namespace peershare;

namespace {

std::vector<uint8_t> make_pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
    }
    return data;
}

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

TEST_CASE("Total chunk count", "[chunker][count]") {
    REQUIRE(Chunker::total_chunks(0, 65536) == 1);
    REQUIRE(Chunker::total_chunks(1, 65536) == 1);
    REQUIRE(Chunker::total_chunks(65536, 65536) == 1);
    REQUIRE(Chunker::total_chunks(65537, 65536) == 2);
    REQUIRE(Chunker::total_chunks(150000, 65536) == 3);
    REQUIRE_THROWS_AS(Chunker::total_chunks(10, 0), PeerShareError);
}

TEST_CASE("Chunker rejects a zero chunk size", "[chunker]") {
    try {
        Chunker chunker(0);
        FAIL("expected PeerShareError");
    } catch (const PeerShareError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Chunking a 150000 byte file", "[chunker][sequence]") {
    auto data = make_pattern(150000);
    auto file = std::make_shared<MemoryFile>("report.bin", data);
    Chunker chunker;
    REQUIRE(chunker.chunk_size() == Chunker::DEFAULT_CHUNK_SIZE);

    auto stream = chunker.chunk(file);
    REQUIRE(stream.total_chunks() == 3);

    std::vector<FileChunk> chunks;
    while (auto chunk = stream.next()) {
        chunks.push_back(std::move(*chunk));
    }
    REQUIRE(stream.done());
    REQUIRE_FALSE(stream.next().has_value());

    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].data.size() == 65536);
    REQUIRE(chunks[1].data.size() == 65536);
    REQUIRE(chunks[2].data.size() == 18928);
    REQUIRE_FALSE(chunks[0].is_last);
    REQUIRE_FALSE(chunks[1].is_last);
    REQUIRE(chunks[2].is_last);

    std::vector<uint8_t> joined;
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].index == i);
        joined.insert(joined.end(), chunks[i].data.begin(), chunks[i].data.end());
    }
    REQUIRE(joined == data);
}

TEST_CASE("Chunking an empty file yields one empty chunk", "[chunker][sequence][empty]") {
    auto file = std::make_shared<MemoryFile>("empty.txt", std::vector<uint8_t>{});
    Chunker chunker(1024);

    auto stream = chunker.chunk(file);
    auto first = stream.next();
    REQUIRE(first.has_value());
    REQUIRE(first->index == 0);
    REQUIRE(first->data.empty());
    REQUIRE(first->is_last);
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("Chunk sequences restart from index zero", "[chunker][sequence]") {
    auto file = std::make_shared<MemoryFile>("small.bin", make_pattern(2500));
    Chunker chunker(1000);

    auto first = chunker.chunk(file);
    REQUIRE(first.next()->index == 0);
    REQUIRE(first.next()->index == 1);

    auto second = chunker.chunk(file);
    auto chunk = second.next();
    REQUIRE(chunk->index == 0);
    REQUIRE(chunk->data.size() == 1000);
}

TEST_CASE("Random access chunk reads", "[chunker][read_chunk]") {
    auto data = make_pattern(2500);
    MemoryFile file("small.bin", data);
    Chunker chunker(1000);

    auto last = chunker.read_chunk(file, 2);
    REQUIRE(last.index == 2);
    REQUIRE(last.is_last);
    REQUIRE(last.data == std::vector<uint8_t>(data.begin() + 2000, data.end()));

    try {
        chunker.read_chunk(file, 3);
        FAIL("expected PeerShareError");
    } catch (const PeerShareError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Disk files chunk like memory files", "[chunker][disk]") {
    auto path = std::filesystem::temp_directory_path() / "peershare_chunker_disk.bin";
    auto data = make_pattern(5000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    auto file = std::make_shared<DiskFile>(path);
    REQUIRE(file->name() == "peershare_chunker_disk.bin");
    REQUIRE(file->size() == 5000);

    Chunker chunker(2048);
    auto stream = chunker.chunk(file);
    std::vector<uint8_t> joined;
    while (auto chunk = stream.next()) {
        joined.insert(joined.end(), chunk->data.begin(), chunk->data.end());
    }
    REQUIRE(joined == data);

    std::filesystem::remove(path);
}

TEST_CASE("Missing disk file reports an IO error", "[chunker][disk]") {
    try {
        DiskFile file("/nonexistent/peershare/file.bin");
        FAIL("expected PeerShareError");
    } catch (const PeerShareError& e) {
        REQUIRE(e.code() == ErrorCode::IoError);
    }
}

TEST_CASE("Memory file reads are clamped", "[chunker][source]") {
    MemoryFile file("abc", bytes_of("abcdef"));
    REQUIRE(file.read(4, 10) == bytes_of("ef"));
    REQUIRE(file.read(6, 10).empty());
    REQUIRE(file.read(100, 1).empty());
}

TEST_CASE("SHA-256 digests of known inputs", "[hasher]") {
    REQUIRE(ContentHasher::hash(bytes_of("abc")) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(ContentHasher::hash(std::vector<uint8_t>{}) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    MemoryFile file("abc.txt", bytes_of("abc"));
    REQUIRE(ContentHasher::hash(file) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Hashing a source spanning several read blocks", "[hasher]") {
    auto data = make_pattern(ContentHasher::READ_BLOCK_SIZE * 2 + 123);
    MemoryFile file("large.bin", data);
    REQUIRE(ContentHasher::hash(file) == ContentHasher::hash(data));
}

TEST_CASE("Digest verification", "[hasher][verify]") {
    auto data = bytes_of("abc");
    REQUIRE(ContentHasher::verify(data, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    REQUIRE(ContentHasher::verify(data, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));

    data[0] = 'x';
    REQUIRE_FALSE(ContentHasher::verify(data, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    ReceivedFile file{"abc.txt", bytes_of("abc"), ""};
    REQUIRE(ContentHasher::verify(file, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}
