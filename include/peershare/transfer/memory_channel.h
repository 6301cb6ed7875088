#ifndef PEERSHARE_TRANSFER_MEMORY_CHANNEL_H
#define PEERSHARE_TRANSFER_MEMORY_CHANNEL_H

#include "peershare/transfer/peer_channel.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace peershare {

class TransferCoordinator;

// In-process channel that hands every message straight to a delivery
// function, preserving send order.
class MemoryChannel : public PeerChannel {
public:
    using DeliverFn = std::function<void(ChannelPayload)>;

    MemoryChannel(std::string peer_id, DeliverFn deliver);

    const std::string& peer_id() const override { return peer_id_; }
    elio::coro::task<void> send(ChannelPayload payload) override;
    bool is_open() const override { return open_.load(); }

    void close() { open_ = false; }

    uint64_t messages_sent() const { return messages_sent_.load(); }

private:
    std::string peer_id_;
    DeliverFn deliver_;
    std::atomic<bool> open_{true};
    std::atomic<uint64_t> messages_sent_{0};
};

// Connects two coordinators in the same process. The channel registered on
// `a` reaches `b` (which sees the sender as a_id) and vice versa.
std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
connect_memory_pair(TransferCoordinator& a, const std::string& a_id,
                    TransferCoordinator& b, const std::string& b_id);

} // namespace peershare

#endif // PEERSHARE_TRANSFER_MEMORY_CHANNEL_H
