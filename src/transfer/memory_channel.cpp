#include "peershare/transfer/memory_channel.h"
#include "peershare/transfer/transfer_coordinator.h"
#include "peershare/base/error_code.h"

namespace peershare {

MemoryChannel::MemoryChannel(std::string peer_id, DeliverFn deliver)
    : peer_id_(std::move(peer_id)), deliver_(std::move(deliver)) {}

elio::coro::task<void> MemoryChannel::send(ChannelPayload payload) {
    if (!open_.load()) {
        throw PeerShareError(ErrorCode::SendFailed, "Channel to " + peer_id_ + " is closed");
    }
    ++messages_sent_;
    if (deliver_) {
        deliver_(std::move(payload));
    }
    co_return;
}

std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
connect_memory_pair(TransferCoordinator& a, const std::string& a_id,
                    TransferCoordinator& b, const std::string& b_id) {
    auto a_to_b = std::make_shared<MemoryChannel>(b_id, [&b, a_id](ChannelPayload payload) {
        b.handle_inbound(a_id, std::move(payload));
    });
    auto b_to_a = std::make_shared<MemoryChannel>(a_id, [&a, b_id](ChannelPayload payload) {
        a.handle_inbound(b_id, std::move(payload));
    });
    a.register_channel(a_to_b);
    b.register_channel(b_to_a);
    return {a_to_b, b_to_a};
}

} // namespace peershare
