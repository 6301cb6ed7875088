#include "peershare/transfer/chunk_assembler.h"
#include "peershare/transfer/chunker.h"
#include "peershare/base/error_code.h"
#include <algorithm>

namespace peershare {

ChunkAssembler::ChunkAssembler(ChunkedFileInfo info)
    : info_(std::move(info)) {
    if (info_.chunk_size == 0) {
        throw PeerShareError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
    }
    uint32_t expected = Chunker::total_chunks(info_.size, info_.chunk_size);
    if (info_.total_chunks != expected) {
        throw PeerShareError(ErrorCode::InvalidArgument,
                             "Announced " + std::to_string(info_.total_chunks) + " chunks for " +
                             std::to_string(info_.size) + " bytes, expected " + std::to_string(expected));
    }
}

uint64_t ChunkAssembler::expected_chunk_length(uint32_t index) const {
    uint64_t offset = static_cast<uint64_t>(index) * info_.chunk_size;
    if (index >= info_.total_chunks || offset >= info_.size) {
        return 0;
    }
    return std::min<uint64_t>(info_.chunk_size, info_.size - offset);
}

bool ChunkAssembler::add_chunk(uint32_t index, std::vector<uint8_t> data) {
    if (index >= info_.total_chunks) {
        throw PeerShareError(ErrorCode::ProtocolError,
                             "Chunk index " + std::to_string(index) + " out of range for " + info_.name);
    }

    uint64_t expected_len = expected_chunk_length(index);
    if (data.size() != expected_len) {
        throw PeerShareError(ErrorCode::IntegrityError,
                             "Chunk " + std::to_string(index) + " has " + std::to_string(data.size()) +
                             " bytes, expected " + std::to_string(expected_len));
    }

    auto it = chunks_.find(index);
    if (it != chunks_.end()) {
        if (it->second != data) {
            throw PeerShareError(ErrorCode::IntegrityError,
                                 "Conflicting data for chunk " + std::to_string(index) + " of " + info_.name);
        }
        return is_complete();
    }

    received_bytes_ += data.size();
    chunks_.emplace(index, std::move(data));
    return is_complete();
}

uint32_t ChunkAssembler::progress() const {
    if (info_.total_chunks == 0) {
        return 100;
    }
    return static_cast<uint32_t>(static_cast<uint64_t>(chunks_.size()) * 100 / info_.total_chunks);
}

std::vector<uint32_t> ChunkAssembler::missing_chunks() const {
    std::vector<uint32_t> missing;
    for (uint32_t i = 0; i < info_.total_chunks; ++i) {
        if (chunks_.find(i) == chunks_.end()) {
            missing.push_back(i);
        }
    }
    return missing;
}

ReceivedFile ChunkAssembler::assemble() const {
    if (!is_complete()) {
        throw PeerShareError(ErrorCode::InvalidState,
                             "Cannot assemble " + info_.name + ": missing " +
                             std::to_string(info_.total_chunks - chunks_.size()) + " chunks");
    }

    ReceivedFile file;
    file.name = info_.name;
    file.hash = info_.hash;
    file.data.reserve(static_cast<size_t>(info_.size));

    // std::map iterates in index order
    for (const auto& entry : chunks_) {
        file.data.insert(file.data.end(), entry.second.begin(), entry.second.end());
    }

    if (file.data.size() != info_.size) {
        throw PeerShareError(ErrorCode::InternalError,
                             "Assembled " + std::to_string(file.data.size()) + " bytes, expected " +
                             std::to_string(info_.size));
    }
    return file;
}

void ChunkAssembler::clear() {
    chunks_.clear();
    received_bytes_ = 0;
}

} // namespace peershare
