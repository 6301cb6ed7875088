#ifndef PEERSHARE_TRANSFER_TRANSFER_COORDINATOR_H
#define PEERSHARE_TRANSFER_TRANSFER_COORDINATOR_H

#include "peershare/base/config.h"
#include "peershare/base/error_code.h"
#include "peershare/transfer/file_source.h"
#include "peershare/transfer/peer_channel.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peershare {

// Correlation token plus caller metadata for one transfer
struct TransferRequest {
    std::string request_id;
    std::string peer_id;          // Target peer (sender) or source peer (receiver)
    std::string requester_name;
    std::map<std::string, std::string> metadata;
};

// Moves forward only: Connecting -> Transferring -> Verifying -> {Done | Error},
// or straight to Error from any non-terminal state.
enum class TransferStatus {
    Connecting,
    Transferring,
    Verifying,
    Done,
    Error
};

enum class TransferDirection {
    Outgoing,
    Incoming
};

// Sender state machine phases
enum class SendPhase {
    Idle,
    Hashing,
    Announced,
    Streaming,
    Cancelling,
    Ended,
    Done,
    Error
};

struct TransferProgress {
    std::string request_id;
    TransferDirection direction = TransferDirection::Outgoing;
    std::string peer_id;
    std::string file_name;
    std::string file_hash;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    uint32_t percent = 0;
    double speed = 0.0;                                    // bytes/sec
    double eta = std::numeric_limits<double>::infinity();  // seconds
    TransferStatus status = TransferStatus::Connecting;
    std::string error_message;

    bool is_terminal() const {
        return status == TransferStatus::Done || status == TransferStatus::Error;
    }
};

const char* to_string(TransferStatus status);
const char* to_string(SendPhase phase);

// floor(transferred * 100 / total); 0 for an empty file
uint32_t compute_percent(uint64_t transferred_bytes, uint64_t total_bytes);

// Whether status may move from `from` to `to`
bool can_transition(TransferStatus from, TransferStatus to);

using ProgressCallback = std::function<void(const TransferProgress&)>;
using CompleteCallback = std::function<void(const std::string& request_id)>;
using ErrorCallback = std::function<void(const std::string& request_id, ErrorCode code,
                                         const std::string& message)>;
using FileReceivedCallback = std::function<void(const ReceivedFile& file, const TransferRequest& request)>;

class TransferCoordinator {
public:
    explicit TransferCoordinator(const TransferConfig& config);
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Channel table
    void register_channel(std::shared_ptr<PeerChannel> channel);
    void remove_channel(const std::string& peer_id);
    bool has_channel(const std::string& peer_id) const;

    // Hash, announce, stream and finish one file. Chunks are sent strictly
    // one after another. Throws PeerShareError: ConnectionFailed (no
    // channel, nothing sent), AlreadyExists, Cancelled, SendFailed,
    // RemoteError, IoError.
    elio::coro::task<void> send_file(std::string peer_id,
                                     std::shared_ptr<const FileSource> file,
                                     TransferRequest request);

    // Outgoing: the send loop stops before its next chunk.
    // Incoming: the assembler is discarded and the transfer fails locally.
    // Returns false if no active transfer has this id.
    bool cancel_transfer(const std::string& request_id);

    // Inbound entry point for every physical message from a peer
    void handle_inbound(const std::string& peer_id, ChannelPayload payload);

    // Notification hooks; set before transfers start
    void set_on_progress(ProgressCallback callback);
    void set_on_complete(CompleteCallback callback);
    void set_on_error(ErrorCallback callback);
    void set_on_file_received(FileReceivedCallback callback);

    // Snapshots of the live progress table
    std::optional<TransferProgress> get_progress(const std::string& request_id,
                                                 TransferDirection direction) const;
    std::vector<TransferProgress> get_transfers() const;
    std::optional<SendPhase> get_send_phase(const std::string& request_id) const;
    bool is_transferring() const;

    // Drops Done and Error entries from the progress table. Returns how many
    // were removed.
    size_t clear_finished();

    struct TransferStats {
        uint64_t completed_sends = 0;
        uint64_t completed_receives = 0;
        uint64_t failed_sends = 0;
        uint64_t failed_receives = 0;
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t active_transfers = 0;
    };
    TransferStats get_stats() const;

    const TransferConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace peershare

#endif // PEERSHARE_TRANSFER_TRANSFER_COORDINATOR_H
