#ifndef PEERSHARE_TRANSFER_FILE_SOURCE_H
#define PEERSHARE_TRANSFER_FILE_SOURCE_H

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace peershare {

// Read-only byte source for an outgoing file
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual const std::string& name() const = 0;
    virtual uint64_t size() const = 0;

    // Read up to length bytes at offset; reads past the end are clamped.
    // Throws PeerShareError(IoError) when the underlying source fails.
    virtual std::vector<uint8_t> read(uint64_t offset, size_t length) const = 0;
};

// File held entirely in memory
class MemoryFile : public FileSource {
public:
    MemoryFile(std::string name, std::vector<uint8_t> data);

    const std::string& name() const override { return name_; }
    uint64_t size() const override { return data_.size(); }
    std::vector<uint8_t> read(uint64_t offset, size_t length) const override;

    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::string name_;
    std::vector<uint8_t> data_;
};

// File on disk, reopened for every read so a chunk sequence can be restarted
class DiskFile : public FileSource {
public:
    explicit DiskFile(const std::filesystem::path& path);

    const std::string& name() const override { return name_; }
    uint64_t size() const override { return size_; }
    std::vector<uint8_t> read(uint64_t offset, size_t length) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string name_;
    uint64_t size_ = 0;
};

// Reconstructed file produced on the receive path
struct ReceivedFile {
    std::string name;
    std::vector<uint8_t> data;
    std::string hash;
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_FILE_SOURCE_H
