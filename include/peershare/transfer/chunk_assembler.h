#ifndef PEERSHARE_TRANSFER_CHUNK_ASSEMBLER_H
#define PEERSHARE_TRANSFER_CHUNK_ASSEMBLER_H

#include "peershare/transfer/file_source.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace peershare {

// Expected file metadata announced by the sender
struct ChunkedFileInfo {
    std::string name;
    uint64_t size = 0;
    std::string hash;
    uint32_t total_chunks = 0;
    uint32_t chunk_size = 0;
};

// Receiver-side buffer that accepts chunks in any order and rebuilds the file.
class ChunkAssembler {
public:
    // Throws PeerShareError(InvalidArgument) if total_chunks does not match
    // size and chunk_size.
    explicit ChunkAssembler(ChunkedFileInfo info);

    // Stores the chunk and returns true once every index is filled.
    // Re-delivering identical bytes is a no-op. Throws
    // PeerShareError(ProtocolError) for an out-of-range index and
    // PeerShareError(IntegrityError) for a wrong length or for different
    // bytes at an index that is already filled.
    bool add_chunk(uint32_t index, std::vector<uint8_t> data);

    bool is_complete() const { return chunks_.size() == info_.total_chunks; }

    // received_count / total_chunks * 100, rounded down
    uint32_t progress() const;

    uint32_t received_count() const { return static_cast<uint32_t>(chunks_.size()); }
    uint64_t received_bytes() const { return received_bytes_; }
    std::vector<uint32_t> missing_chunks() const;

    // Concatenates chunks in index order. Throws PeerShareError(InvalidState)
    // unless is_complete().
    ReceivedFile assemble() const;

    const std::string& expected_hash() const { return info_.hash; }
    const ChunkedFileInfo& info() const { return info_; }
    uint64_t expected_chunk_length(uint32_t index) const;

    // Release buffered chunks
    void clear();

private:
    ChunkedFileInfo info_;
    std::map<uint32_t, std::vector<uint8_t>> chunks_;
    uint64_t received_bytes_ = 0;
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_CHUNK_ASSEMBLER_H
