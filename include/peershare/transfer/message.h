#ifndef PEERSHARE_TRANSFER_MESSAGE_H
#define PEERSHARE_TRANSFER_MESSAGE_H

#include "peershare/transfer/chunker.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace peershare {

// Wire type tags
static constexpr const char* MESSAGE_TYPE_START = "file-start";
static constexpr const char* MESSAGE_TYPE_CHUNK = "file-chunk";
static constexpr const char* MESSAGE_TYPE_END = "file-end";
static constexpr const char* MESSAGE_TYPE_ERROR = "file-error";

struct StartMessage {
    std::string request_id;
    std::string name;
    uint64_t size = 0;
    std::string hash;
    uint32_t total_chunks = 0;
    // Optional on the wire; absent means Chunker::DEFAULT_CHUNK_SIZE
    uint32_t chunk_size = Chunker::DEFAULT_CHUNK_SIZE;
};

// Always followed by exactly one binary message of `size` bytes
struct ChunkHeaderMessage {
    std::string request_id;
    uint32_t index = 0;
    uint32_t size = 0;
};

struct EndMessage {
    std::string request_id;
    std::string hash;
};

struct ErrorMessage {
    std::string request_id;
    std::string error;
};

using ProtocolMessage = std::variant<StartMessage, ChunkHeaderMessage, EndMessage, ErrorMessage>;

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string encode_message(const ProtocolMessage& message);

// std::nullopt for malformed JSON, unknown type tags, or missing/mistyped fields
std::optional<ProtocolMessage> decode_message(const std::string& text);

const std::string& request_id_of(const ProtocolMessage& message);
const char* message_type_name(const ProtocolMessage& message);

} // namespace peershare

#endif // PEERSHARE_TRANSFER_MESSAGE_H
