#include "peershare/transfer/file_source.h"
#include "peershare/base/error_code.h"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace peershare {

namespace fs = std::filesystem;

MemoryFile::MemoryFile(std::string name, std::vector<uint8_t> data)
    : name_(std::move(name)), data_(std::move(data)) {}

std::vector<uint8_t> MemoryFile::read(uint64_t offset, size_t length) const {
    if (offset >= data_.size()) {
        return {};
    }
    size_t end = static_cast<size_t>(std::min<uint64_t>(offset + length, data_.size()));
    return std::vector<uint8_t>(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                                data_.begin() + static_cast<std::ptrdiff_t>(end));
}

DiskFile::DiskFile(const fs::path& path)
    : path_(path), name_(path.filename().string()) {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec) {
        throw PeerShareError(ErrorCode::IoError, path_.string() + ": " + ec.message());
    }
    size_ = size;
}

std::vector<uint8_t> DiskFile::read(uint64_t offset, size_t length) const {
    if (offset >= size_) {
        return {};
    }
    size_t to_read = static_cast<size_t>(std::min<uint64_t>(length, size_ - offset));

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw PeerShareError(ErrorCode::IoError, "Failed to open " + path_.string());
    }

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    std::vector<uint8_t> data(to_read);
    if (!file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(to_read))) {
        throw PeerShareError(ErrorCode::IoError,
                             "Short read from " + path_.string() + " at offset " + std::to_string(offset));
    }
    return data;
}

} // namespace peershare
