#ifndef PEERSHARE_TRANSFER_TCP_CHANNEL_H
#define PEERSHARE_TRANSFER_TCP_CHANNEL_H

#include "peershare/transfer/peer_channel.h"
#include <elio/net/tcp.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peershare {

class TransferCoordinator;

// Wire frame: [kind:u8][length:u32 big-endian][payload]
struct FrameHeader {
    PayloadKind kind = PayloadKind::Text;
    uint32_t length = 0;
};

static constexpr size_t FRAME_HEADER_SIZE = 5;
// Upper bound for JSON control messages
static constexpr uint32_t MAX_TEXT_FRAME_SIZE = 16 * 1024;

std::vector<uint8_t> encode_frame(const ChannelPayload& payload);

// std::nullopt for an unknown kind or a frame over its size limit
std::optional<FrameHeader> decode_frame_header(const uint8_t* data, uint32_t max_binary_size);

// PeerChannel over one TCP connection
class TcpPeerChannel : public PeerChannel {
public:
    TcpPeerChannel(std::string peer_id, elio::net::tcp_stream stream, uint32_t max_message_size);
    ~TcpPeerChannel() override;

    // Throws PeerShareError(ConnectionFailed)
    static elio::coro::task<std::shared_ptr<TcpPeerChannel>> connect(std::string address, uint16_t port,
                                                                     std::string peer_id,
                                                                     uint32_t max_message_size);

    const std::string& peer_id() const override { return peer_id_; }
    elio::coro::task<void> send(ChannelPayload payload) override;
    bool is_open() const override { return open_.load(); }

    // Feeds every inbound frame to coordinator.handle_inbound until the
    // connection ends, then removes this channel from the coordinator.
    elio::coro::task<void> receive_loop(TransferCoordinator& coordinator);

    elio::coro::task<void> close();

private:
    elio::coro::task<bool> read_exact(uint8_t* buffer, size_t length);

    std::string peer_id_;
    elio::net::tcp_stream stream_;
    uint32_t max_message_size_;
    std::atomic<bool> open_{true};
    std::atomic<bool> closed_{false};
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_TCP_CHANNEL_H
