#include "peershare/transfer/chunker.h"
#include "peershare/base/error_code.h"
#include <algorithm>
#include <limits>

namespace peershare {

namespace {

std::vector<uint8_t> read_exact(const FileSource& file, uint64_t offset, size_t length) {
    auto data = file.read(offset, length);
    if (data.size() != length) {
        throw PeerShareError(ErrorCode::IoError,
                             "Expected " + std::to_string(length) + " bytes from " + file.name() +
                             " at offset " + std::to_string(offset) + ", got " + std::to_string(data.size()));
    }
    return data;
}

size_t chunk_length(uint64_t file_size, uint32_t chunk_size, uint32_t index) {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    if (offset >= file_size) {
        return 0;
    }
    return static_cast<size_t>(std::min<uint64_t>(chunk_size, file_size - offset));
}

} // anonymous namespace

ChunkStream::ChunkStream(std::shared_ptr<const FileSource> file, uint32_t chunk_size)
    : file_(std::move(file)),
      chunk_size_(chunk_size),
      total_chunks_(Chunker::total_chunks(file_ ? file_->size() : 0, chunk_size)) {
    if (!file_) {
        throw PeerShareError(ErrorCode::InvalidArgument, "ChunkStream requires a file");
    }
}

std::optional<FileChunk> ChunkStream::next() {
    if (done()) {
        return std::nullopt;
    }

    FileChunk chunk;
    chunk.index = next_index_;
    uint64_t offset = static_cast<uint64_t>(next_index_) * chunk_size_;
    chunk.data = read_exact(*file_, offset, chunk_length(file_->size(), chunk_size_, next_index_));
    chunk.is_last = (next_index_ + 1 == total_chunks_);

    ++next_index_;
    return chunk;
}

Chunker::Chunker(uint32_t chunk_size)
    : chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw PeerShareError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
    }
}

ChunkStream Chunker::chunk(std::shared_ptr<const FileSource> file) const {
    return ChunkStream(std::move(file), chunk_size_);
}

FileChunk Chunker::read_chunk(const FileSource& file, uint32_t index) const {
    uint32_t total = total_chunks(file.size(), chunk_size_);
    if (index >= total) {
        throw PeerShareError(ErrorCode::InvalidArgument,
                             "Chunk index " + std::to_string(index) + " out of range (" +
                             std::to_string(total) + " chunks)");
    }

    FileChunk chunk;
    chunk.index = index;
    chunk.data = read_exact(file, static_cast<uint64_t>(index) * chunk_size_,
                            chunk_length(file.size(), chunk_size_, index));
    chunk.is_last = (index + 1 == total);
    return chunk;
}

uint32_t Chunker::total_chunks(uint64_t file_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw PeerShareError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
    }
    if (file_size == 0) {
        return 1;
    }
    uint64_t count = (file_size + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw PeerShareError(ErrorCode::InvalidArgument, "File too large for chunk size");
    }
    return static_cast<uint32_t>(count);
}

} // namespace peershare
