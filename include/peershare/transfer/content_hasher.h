#ifndef PEERSHARE_TRANSFER_CONTENT_HASHER_H
#define PEERSHARE_TRANSFER_CONTENT_HASHER_H

#include "peershare/transfer/file_source.h"
#include <cstdint>
#include <string>
#include <vector>

namespace peershare {

// SHA-256 content identity of a whole file, as lowercase hex
class ContentHasher {
public:
    // Block size for the sequential read pass over a file source
    static constexpr size_t READ_BLOCK_SIZE = 1024 * 1024;

    // One full sequential read of the source. Read errors propagate.
    static std::string hash(const FileSource& file);
    static std::string hash(const std::vector<uint8_t>& data);

    static bool verify(const ReceivedFile& file, const std::string& expected_digest);
    static bool verify(const std::vector<uint8_t>& data, const std::string& expected_digest);
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_CONTENT_HASHER_H
