#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "peershare/base/error_code.h"
#include "peershare/transfer/chunk_assembler.h"
#include "peershare/transfer/chunker.h"
#include "peershare/transfer/content_hasher.h"

using namespace peershare;

namespace {

std::vector<uint8_t> make_pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 13 + 1) % 256);
    }
    return data;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& data, size_t offset, size_t length) {
    return std::vector<uint8_t>(data.begin() + offset, data.begin() + offset + length);
}

ChunkedFileInfo info_for(const std::vector<uint8_t>& data, uint32_t chunk_size) {
    ChunkedFileInfo info;
    info.name = "data.bin";
    info.size = data.size();
    info.hash = ContentHasher::hash(data);
    info.chunk_size = chunk_size;
    info.total_chunks = Chunker::total_chunks(data.size(), chunk_size);
    return info;
}

ErrorCode code_of_add(ChunkAssembler& assembler, uint32_t index, std::vector<uint8_t> data) {
    try {
        assembler.add_chunk(index, std::move(data));
    } catch (const PeerShareError& e) {
        return e.code();
    }
    return ErrorCode::Success;
}

} // anonymous namespace

TEST_CASE("Assembler rejects inconsistent metadata", "[assembler][init]") {
    ChunkedFileInfo info;
    info.name = "bad.bin";
    info.size = 150000;
    info.chunk_size = 65536;
    info.total_chunks = 2;
    REQUIRE_THROWS_AS(ChunkAssembler(info), PeerShareError);

    info.total_chunks = 3;
    info.chunk_size = 0;
    REQUIRE_THROWS_AS(ChunkAssembler(info), PeerShareError);
}

TEST_CASE("Assembling chunks delivered in reverse order", "[assembler][order]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));

    REQUIRE_FALSE(assembler.add_chunk(2, slice(data, 2000, 500)));
    REQUIRE_FALSE(assembler.add_chunk(1, slice(data, 1000, 1000)));
    REQUIRE(assembler.missing_chunks() == std::vector<uint32_t>{0});
    REQUIRE(assembler.add_chunk(0, slice(data, 0, 1000)));

    REQUIRE(assembler.is_complete());
    REQUIRE(assembler.received_bytes() == 2500);

    auto file = assembler.assemble();
    REQUIRE(file.name == "data.bin");
    REQUIRE(file.data == data);
    REQUIRE(ContentHasher::verify(file, assembler.expected_hash()));
}

TEST_CASE("Assembler progress counts chunks", "[assembler][progress]") {
    auto data = make_pattern(3000);
    ChunkAssembler assembler(info_for(data, 1000));

    REQUIRE(assembler.progress() == 0);
    assembler.add_chunk(1, slice(data, 1000, 1000));
    REQUIRE(assembler.progress() == 33);
    REQUIRE(assembler.received_count() == 1);
    assembler.add_chunk(0, slice(data, 0, 1000));
    REQUIRE(assembler.progress() == 66);
    assembler.add_chunk(2, slice(data, 2000, 1000));
    REQUIRE(assembler.progress() == 100);
}

TEST_CASE("Assembling before every chunk arrived fails", "[assembler][state]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));
    assembler.add_chunk(0, slice(data, 0, 1000));

    try {
        assembler.assemble();
        FAIL("expected PeerShareError");
    } catch (const PeerShareError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidState);
    }
}

TEST_CASE("Duplicate chunks", "[assembler][duplicate]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));
    assembler.add_chunk(0, slice(data, 0, 1000));

    SECTION("identical bytes are accepted once") {
        REQUIRE_FALSE(assembler.add_chunk(0, slice(data, 0, 1000)));
        REQUIRE(assembler.received_count() == 1);
        REQUIRE(assembler.received_bytes() == 1000);
    }

    SECTION("different bytes are an integrity error") {
        auto altered = slice(data, 0, 1000);
        altered[10] ^= 0xFF;
        REQUIRE(code_of_add(assembler, 0, altered) == ErrorCode::IntegrityError);
        REQUIRE(assembler.received_count() == 1);
    }
}

TEST_CASE("Chunks outside the announced layout", "[assembler][validation]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));

    REQUIRE(code_of_add(assembler, 3, slice(data, 0, 500)) == ErrorCode::ProtocolError);
    REQUIRE(code_of_add(assembler, 0, slice(data, 0, 999)) == ErrorCode::IntegrityError);
    REQUIRE(code_of_add(assembler, 2, slice(data, 2000, 400)) == ErrorCode::IntegrityError);
    REQUIRE(assembler.received_count() == 0);
}

TEST_CASE("Empty file assembles from one empty chunk", "[assembler][empty]") {
    std::vector<uint8_t> empty;
    ChunkAssembler assembler(info_for(empty, 65536));
    REQUIRE(assembler.info().total_chunks == 1);
    REQUIRE(assembler.expected_chunk_length(0) == 0);

    REQUIRE(assembler.add_chunk(0, {}));
    auto file = assembler.assemble();
    REQUIRE(file.data.empty());
    REQUIRE(ContentHasher::verify(file, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

TEST_CASE("Corrupted content fails verification", "[assembler][verify]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));

    auto tampered = slice(data, 1000, 1000);
    tampered[0] ^= 0x01;
    assembler.add_chunk(0, slice(data, 0, 1000));
    assembler.add_chunk(1, tampered);
    assembler.add_chunk(2, slice(data, 2000, 500));

    auto file = assembler.assemble();
    REQUIRE_FALSE(ContentHasher::verify(file, assembler.expected_hash()));
}

TEST_CASE("Clearing releases buffered chunks", "[assembler][clear]") {
    auto data = make_pattern(2500);
    ChunkAssembler assembler(info_for(data, 1000));
    assembler.add_chunk(0, slice(data, 0, 1000));

    assembler.clear();
    REQUIRE(assembler.received_count() == 0);
    REQUIRE(assembler.received_bytes() == 0);
    REQUIRE(assembler.missing_chunks().size() == 3);
}
