#include "peershare/transfer/message.h"
#include "peershare/base/logger.h"
#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>

namespace peershare {

using json = nlohmann::json;

namespace {

class FieldError : public std::runtime_error {
public:
    FieldError(const std::string& key, const char* expected)
        : std::runtime_error("field '" + key + "' must be " + expected) {}
};

std::string get_string(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw FieldError(key, "a string");
    }
    return value.get<std::string>();
}

uint64_t get_unsigned(const json& j, const char* key, uint64_t max = std::numeric_limits<uint64_t>::max()) {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() > max) {
        throw FieldError(key, "an unsigned integer");
    }
    return value.get<uint64_t>();
}

uint32_t get_u32(const json& j, const char* key) {
    return static_cast<uint32_t>(get_unsigned(j, key, std::numeric_limits<uint32_t>::max()));
}

} // anonymous namespace

std::string encode_message(const ProtocolMessage& message) {
    json j = std::visit(overloaded{
        [](const StartMessage& m) {
            return json{
                {"type", MESSAGE_TYPE_START},
                {"request_id", m.request_id},
                {"name", m.name},
                {"size", m.size},
                {"hash", m.hash},
                {"total_chunks", m.total_chunks},
                {"chunk_size", m.chunk_size}
            };
        },
        [](const ChunkHeaderMessage& m) {
            return json{
                {"type", MESSAGE_TYPE_CHUNK},
                {"request_id", m.request_id},
                {"index", m.index},
                {"size", m.size}
            };
        },
        [](const EndMessage& m) {
            return json{
                {"type", MESSAGE_TYPE_END},
                {"request_id", m.request_id},
                {"hash", m.hash}
            };
        },
        [](const ErrorMessage& m) {
            return json{
                {"type", MESSAGE_TYPE_ERROR},
                {"request_id", m.request_id},
                {"error", m.error}
            };
        }
    }, message);
    return j.dump();
}

std::optional<ProtocolMessage> decode_message(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return std::nullopt;
        }

        std::string type = get_string(j, "type");
        if (type == MESSAGE_TYPE_START) {
            StartMessage m;
            m.request_id = get_string(j, "request_id");
            m.name = get_string(j, "name");
            m.size = get_unsigned(j, "size");
            m.hash = get_string(j, "hash");
            m.total_chunks = get_u32(j, "total_chunks");
            if (j.contains("chunk_size")) {
                m.chunk_size = get_u32(j, "chunk_size");
            }
            return m;
        }
        if (type == MESSAGE_TYPE_CHUNK) {
            ChunkHeaderMessage m;
            m.request_id = get_string(j, "request_id");
            m.index = get_u32(j, "index");
            m.size = get_u32(j, "size");
            return m;
        }
        if (type == MESSAGE_TYPE_END) {
            EndMessage m;
            m.request_id = get_string(j, "request_id");
            m.hash = get_string(j, "hash");
            return m;
        }
        if (type == MESSAGE_TYPE_ERROR) {
            ErrorMessage m;
            m.request_id = get_string(j, "request_id");
            m.error = get_string(j, "error");
            return m;
        }

        Logger::instance().debug("Unknown message type: {}", type);
        return std::nullopt;
    } catch (const json::exception& e) {
        Logger::instance().debug("Failed to decode message: {}", e.what());
        return std::nullopt;
    } catch (const FieldError& e) {
        Logger::instance().debug("Failed to decode message: {}", e.what());
        return std::nullopt;
    }
}

const std::string& request_id_of(const ProtocolMessage& message) {
    return std::visit([](const auto& m) -> const std::string& { return m.request_id; }, message);
}

const char* message_type_name(const ProtocolMessage& message) {
    return std::visit(overloaded{
        [](const StartMessage&) { return MESSAGE_TYPE_START; },
        [](const ChunkHeaderMessage&) { return MESSAGE_TYPE_CHUNK; },
        [](const EndMessage&) { return MESSAGE_TYPE_END; },
        [](const ErrorMessage&) { return MESSAGE_TYPE_ERROR; }
    }, message);
}

} // namespace peershare
