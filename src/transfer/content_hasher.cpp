#include "peershare/transfer/content_hasher.h"
#include "peershare/base/error_code.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace peershare {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw PeerShareError(ErrorCode::InternalError, "Failed to initialise SHA-256 context");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const uint8_t* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw PeerShareError(ErrorCode::InternalError, "SHA-256 update failed");
    }
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw PeerShareError(ErrorCode::InternalError, "SHA-256 finalisation failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

std::string ContentHasher::hash(const FileSource& file) {
    auto ctx = new_sha256_context();

    uint64_t offset = 0;
    const uint64_t total = file.size();
    while (offset < total) {
        auto block = file.read(offset, READ_BLOCK_SIZE);
        if (block.empty()) {
            throw PeerShareError(ErrorCode::IoError,
                                 "Unexpected end of " + file.name() + " at offset " + std::to_string(offset));
        }
        update(ctx.get(), block.data(), block.size());
        offset += block.size();
    }

    return finish_hex(ctx.get());
}

std::string ContentHasher::hash(const std::vector<uint8_t>& data) {
    auto ctx = new_sha256_context();
    update(ctx.get(), data.data(), data.size());
    return finish_hex(ctx.get());
}

bool ContentHasher::verify(const ReceivedFile& file, const std::string& expected_digest) {
    return verify(file.data, expected_digest);
}

bool ContentHasher::verify(const std::vector<uint8_t>& data, const std::string& expected_digest) {
    return hash(data) == to_lower(expected_digest);
}

} // namespace peershare
