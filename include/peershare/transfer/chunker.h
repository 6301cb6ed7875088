#ifndef PEERSHARE_TRANSFER_CHUNKER_H
#define PEERSHARE_TRANSFER_CHUNKER_H

#include "peershare/transfer/file_source.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace peershare {

struct FileChunk {
    uint32_t index = 0;
    std::vector<uint8_t> data;
    bool is_last = false;
};

// Lazy, finite sequence of chunks over one file.
// Every chunk is chunk_size bytes except the last, which holds the remainder.
// An empty file yields exactly one zero-length chunk.
class ChunkStream {
public:
    ChunkStream(std::shared_ptr<const FileSource> file, uint32_t chunk_size);

    // Reads the next chunk from the source; std::nullopt once exhausted
    std::optional<FileChunk> next();

    bool done() const { return next_index_ >= total_chunks_; }
    uint32_t total_chunks() const { return total_chunks_; }

private:
    std::shared_ptr<const FileSource> file_;
    uint32_t chunk_size_;
    uint32_t total_chunks_;
    uint32_t next_index_ = 0;
};

class Chunker {
public:
    // 64KB: reliably below the single-message limit of browser data channels
    static constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    explicit Chunker(uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Each call starts a fresh sequence from index 0
    ChunkStream chunk(std::shared_ptr<const FileSource> file) const;

    // Random access to a single chunk
    FileChunk read_chunk(const FileSource& file, uint32_t index) const;

    uint32_t chunk_size() const { return chunk_size_; }

    // ceil(file_size / chunk_size), with an empty file mapping to 1
    static uint32_t total_chunks(uint64_t file_size, uint32_t chunk_size);

private:
    uint32_t chunk_size_;
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_CHUNKER_H
