#ifndef PEERSHARE_TRANSFER_PEER_CHANNEL_H
#define PEERSHARE_TRANSFER_PEER_CHANNEL_H

#include <elio/elio.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace peershare {

enum class PayloadKind : uint8_t {
    Text = 1,
    Binary = 2
};

// One physical channel message, tagged text or binary by the transport
struct ChannelPayload {
    PayloadKind kind = PayloadKind::Text;
    std::string text;
    std::vector<uint8_t> binary;

    static ChannelPayload from_text(std::string text) {
        ChannelPayload payload;
        payload.kind = PayloadKind::Text;
        payload.text = std::move(text);
        return payload;
    }

    static ChannelPayload from_binary(std::vector<uint8_t> data) {
        ChannelPayload payload;
        payload.kind = PayloadKind::Binary;
        payload.binary = std::move(data);
        return payload;
    }

    bool is_text() const { return kind == PayloadKind::Text; }
    size_t size() const { return is_text() ? text.size() : binary.size(); }
};

// Ordered, message-oriented link to one remote peer.
// Inbound messages are pushed into TransferCoordinator::handle_inbound by
// whoever owns the transport.
class PeerChannel {
public:
    virtual ~PeerChannel() = default;

    virtual const std::string& peer_id() const = 0;

    // Completes once the message is handed to the transport.
    // Throws PeerShareError(SendFailed) on failure.
    virtual elio::coro::task<void> send(ChannelPayload payload) = 0;

    virtual bool is_open() const = 0;
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_PEER_CHANNEL_H
