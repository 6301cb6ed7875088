#include "peershare/transfer/tcp_channel.h"
#include "peershare/transfer/transfer_coordinator.h"
#include "peershare/base/error_code.h"
#include "peershare/base/logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>

namespace peershare {

std::vector<uint8_t> encode_frame(const ChannelPayload& payload) {
    const size_t length = payload.size();
    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + length);

    frame[0] = static_cast<uint8_t>(payload.kind);
    uint32_t net_length = htonl(static_cast<uint32_t>(length));
    std::memcpy(frame.data() + 1, &net_length, 4);

    if (payload.is_text()) {
        std::memcpy(frame.data() + FRAME_HEADER_SIZE, payload.text.data(), length);
    } else if (length > 0) {
        std::memcpy(frame.data() + FRAME_HEADER_SIZE, payload.binary.data(), length);
    }
    return frame;
}

std::optional<FrameHeader> decode_frame_header(const uint8_t* data, uint32_t max_binary_size) {
    FrameHeader header;
    uint32_t net_length = 0;
    std::memcpy(&net_length, data + 1, 4);
    header.length = ntohl(net_length);

    switch (data[0]) {
        case static_cast<uint8_t>(PayloadKind::Text):
            header.kind = PayloadKind::Text;
            if (header.length > MAX_TEXT_FRAME_SIZE) return std::nullopt;
            break;
        case static_cast<uint8_t>(PayloadKind::Binary):
            header.kind = PayloadKind::Binary;
            if (header.length > max_binary_size) return std::nullopt;
            break;
        default:
            return std::nullopt;
    }
    return header;
}

TcpPeerChannel::TcpPeerChannel(std::string peer_id, elio::net::tcp_stream stream, uint32_t max_message_size)
    : peer_id_(std::move(peer_id)), stream_(std::move(stream)), max_message_size_(max_message_size) {}

TcpPeerChannel::~TcpPeerChannel() = default;

elio::coro::task<std::shared_ptr<TcpPeerChannel>> TcpPeerChannel::connect(std::string address, uint16_t port,
                                                                          std::string peer_id,
                                                                          uint32_t max_message_size) {
    elio::net::tcp_options opts;
    opts.no_delay = true;

    auto connect_result = co_await elio::net::tcp_connect(address, port, opts);
    if (!connect_result) {
        throw PeerShareError(ErrorCode::ConnectionFailed,
                             address + ":" + std::to_string(port) + ": " + std::strerror(errno));
    }

    Logger::instance().info("Connected to {}:{}", address, port);
    co_return std::make_shared<TcpPeerChannel>(std::move(peer_id), std::move(*connect_result), max_message_size);
}

elio::coro::task<void> TcpPeerChannel::send(ChannelPayload payload) {
    if (!open_.load()) {
        throw PeerShareError(ErrorCode::SendFailed, "Connection to " + peer_id_ + " is closed");
    }

    auto frame = encode_frame(payload);
    size_t written = 0;
    while (written < frame.size()) {
        auto result = co_await stream_.write(frame.data() + written, frame.size() - written);
        if (result.result <= 0) {
            open_ = false;
            throw PeerShareError(ErrorCode::SendFailed,
                                 "Write to " + peer_id_ + " failed: " + std::strerror(errno));
        }
        written += static_cast<size_t>(result.result);
    }
}

elio::coro::task<bool> TcpPeerChannel::read_exact(uint8_t* buffer, size_t length) {
    size_t total_read = 0;
    while (total_read < length) {
        auto result = co_await stream_.read(buffer + total_read, length - total_read);
        if (result.result <= 0) {
            co_return false;
        }
        total_read += static_cast<size_t>(result.result);
    }
    co_return true;
}

elio::coro::task<void> TcpPeerChannel::receive_loop(TransferCoordinator& coordinator) {
    Logger::instance().debug("Receive loop started for {}", peer_id_);

    try {
        while (open_.load()) {
            uint8_t header_buf[FRAME_HEADER_SIZE];
            if (!co_await read_exact(header_buf, FRAME_HEADER_SIZE)) {
                break;
            }

            auto header = decode_frame_header(header_buf, max_message_size_);
            if (!header) {
                Logger::instance().warning("Invalid frame from {}, closing connection", peer_id_);
                break;
            }

            std::vector<uint8_t> body(header->length);
            if (header->length > 0 && !co_await read_exact(body.data(), body.size())) {
                break;
            }

            if (header->kind == PayloadKind::Text) {
                coordinator.handle_inbound(peer_id_, ChannelPayload::from_text(std::string(body.begin(), body.end())));
            } else {
                coordinator.handle_inbound(peer_id_, ChannelPayload::from_binary(std::move(body)));
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Receive loop for {} failed: {}", peer_id_, e.what());
    }

    open_ = false;
    coordinator.remove_channel(peer_id_);
    Logger::instance().info("Connection to {} closed", peer_id_);
}

elio::coro::task<void> TcpPeerChannel::close() {
    open_ = false;
    if (!closed_.exchange(true)) {
        co_await stream_.close();
    }
}

} // namespace peershare
