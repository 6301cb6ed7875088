#include "peershare/transfer/transfer_coordinator.h"
#include "peershare/transfer/chunk_assembler.h"
#include "peershare/transfer/chunker.h"
#include "peershare/transfer/content_hasher.h"
#include "peershare/transfer/message.h"
#include "peershare/base/logger.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace peershare {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Connecting: return "connecting";
        case TransferStatus::Transferring: return "transferring";
        case TransferStatus::Verifying: return "verifying";
        case TransferStatus::Done: return "done";
        case TransferStatus::Error: return "error";
        default: return "unknown";
    }
}

const char* to_string(SendPhase phase) {
    switch (phase) {
        case SendPhase::Idle: return "idle";
        case SendPhase::Hashing: return "hashing";
        case SendPhase::Announced: return "announced";
        case SendPhase::Streaming: return "streaming";
        case SendPhase::Cancelling: return "cancelling";
        case SendPhase::Ended: return "ended";
        case SendPhase::Done: return "done";
        case SendPhase::Error: return "error";
        default: return "unknown";
    }
}

uint32_t compute_percent(uint64_t transferred_bytes, uint64_t total_bytes) {
    if (total_bytes == 0) {
        return 0;
    }
    uint64_t clamped = std::min(transferred_bytes, total_bytes);
    return static_cast<uint32_t>(clamped * 100 / total_bytes);
}

bool can_transition(TransferStatus from, TransferStatus to) {
    if (from == TransferStatus::Done || from == TransferStatus::Error) {
        return false;
    }
    if (to == TransferStatus::Error) {
        return true;
    }
    return static_cast<int>(to) >= static_cast<int>(from);
}

namespace {

using Clock = std::chrono::steady_clock;

struct OutgoingState {
    TransferRequest request;
    SendPhase phase = SendPhase::Idle;
    bool cancel_requested = false;
    std::optional<std::string> remote_error;
    Clock::time_point start_time = Clock::now();
};

struct IncomingState {
    TransferRequest request;
    std::unique_ptr<ChunkAssembler> assembler;
    Clock::time_point start_time = Clock::now();
};

void set_status(TransferProgress& progress, TransferStatus status) {
    if (can_transition(progress.status, status)) {
        progress.status = status;
    }
}

void update_rate(TransferProgress& progress, Clock::time_point start_time) {
    double elapsed = std::chrono::duration<double>(Clock::now() - start_time).count();
    progress.speed = elapsed > 0 ? static_cast<double>(progress.transferred_bytes) / elapsed : 0.0;
    uint64_t remaining = progress.total_bytes - std::min(progress.transferred_bytes, progress.total_bytes);
    progress.eta = progress.speed > 0
        ? static_cast<double>(remaining) / progress.speed
        : std::numeric_limits<double>::infinity();
}

} // anonymous namespace

struct TransferCoordinator::Impl {
    TransferConfig config;
    Chunker chunker;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<PeerChannel>> channels;
    std::unordered_map<std::string, OutgoingState> outgoing;
    std::unordered_map<std::string, IncomingState> incoming;
    std::unordered_map<std::string, TransferProgress> outgoing_progress;
    std::unordered_map<std::string, TransferProgress> incoming_progress;
    // At most one header awaiting its binary payload per peer connection
    std::unordered_map<std::string, ChunkHeaderMessage> pending_headers;
    TransferStats stats;

    ProgressCallback on_progress;
    CompleteCallback on_complete;
    ErrorCallback on_error;
    FileReceivedCallback on_file_received;

    explicit Impl(const TransferConfig& cfg)
        : config(cfg), chunker(cfg.chunk_size) {}

    std::unordered_map<std::string, TransferProgress>& progress_table(TransferDirection direction) {
        return direction == TransferDirection::Outgoing ? outgoing_progress : incoming_progress;
    }

    // Applies fn to a non-terminal progress entry and returns the new snapshot.
    // Caller must hold the mutex.
    template<typename Fn>
    std::optional<TransferProgress> mutate_locked(TransferDirection direction, const std::string& request_id, Fn&& fn) {
        auto& table = progress_table(direction);
        auto it = table.find(request_id);
        if (it == table.end() || it->second.is_terminal()) {
            return std::nullopt;
        }
        fn(it->second);
        return it->second;
    }

    void emit_progress(const std::optional<TransferProgress>& progress) {
        if (progress && on_progress) {
            on_progress(*progress);
        }
    }

    void emit_error(const std::string& request_id, ErrorCode code, const std::string& message) {
        if (on_error) {
            on_error(request_id, code, message);
        }
    }

    void emit_complete(const std::string& request_id) {
        if (on_complete) {
            on_complete(request_id);
        }
    }

    std::shared_ptr<PeerChannel> find_channel(const std::string& peer_id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = channels.find(peer_id);
        return it != channels.end() ? it->second : nullptr;
    }

    // ---- Send path ----

    void begin_outgoing(const TransferRequest& request, const FileSource& file) {
        TransferProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outgoing.count(request.request_id)) {
                throw PeerShareError(ErrorCode::AlreadyExists,
                                     "Outgoing transfer already active: " + request.request_id);
            }

            OutgoingState state;
            state.request = request;
            outgoing.emplace(request.request_id, std::move(state));

            TransferProgress progress;
            progress.request_id = request.request_id;
            progress.direction = TransferDirection::Outgoing;
            progress.peer_id = request.peer_id;
            progress.file_name = file.name();
            progress.total_bytes = file.size();
            progress.status = TransferStatus::Connecting;
            outgoing_progress[request.request_id] = progress;
            snapshot = progress;
        }
        emit_progress(snapshot);
    }

    void set_phase(const std::string& request_id, SendPhase phase) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = outgoing.find(request_id);
        if (it == outgoing.end()) {
            return;
        }
        Logger::instance().debug("Transfer {}: {} -> {}", request_id, to_string(it->second.phase), to_string(phase));
        it->second.phase = phase;
    }

    void mark_hashed(const std::string& request_id, const std::string& hash) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = outgoing.find(request_id);
            if (it != outgoing.end()) {
                it->second.start_time = Clock::now();
            }
            snapshot = mutate_locked(TransferDirection::Outgoing, request_id, [&](TransferProgress& p) {
                p.file_hash = hash;
                p.transferred_bytes = 0;
                p.percent = 0;
                set_status(p, TransferStatus::Transferring);
            });
        }
        emit_progress(snapshot);
    }

    // Polled before Start and between chunks
    void check_cancelled(const std::string& request_id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = outgoing.find(request_id);
        if (it == outgoing.end() || !it->second.cancel_requested) {
            return;
        }
        if (it->second.remote_error) {
            throw PeerShareError(ErrorCode::RemoteError, *it->second.remote_error);
        }
        throw PeerShareError(ErrorCode::Cancelled, "Transfer cancelled");
    }

    void record_chunk_sent(const std::string& request_id, uint64_t bytes) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto state = outgoing.find(request_id);
            Clock::time_point start = state != outgoing.end() ? state->second.start_time : Clock::now();
            snapshot = mutate_locked(TransferDirection::Outgoing, request_id, [&](TransferProgress& p) {
                p.transferred_bytes = std::min(p.transferred_bytes + bytes, p.total_bytes);
                p.percent = compute_percent(p.transferred_bytes, p.total_bytes);
                update_rate(p, start);
            });
            stats.bytes_sent += bytes;
        }
        emit_progress(snapshot);
    }

    void complete_outgoing(const std::string& request_id) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot = mutate_locked(TransferDirection::Outgoing, request_id, [](TransferProgress& p) {
                p.transferred_bytes = p.total_bytes;
                p.percent = 100;
                p.eta = 0.0;
                set_status(p, TransferStatus::Done);
            });
            auto it = outgoing.find(request_id);
            if (it != outgoing.end()) {
                it->second.phase = SendPhase::Done;
            }
            ++stats.completed_sends;
        }
        Logger::instance().info("Transfer {} sent successfully", request_id);
        emit_progress(snapshot);
        emit_complete(request_id);
    }

    void fail_outgoing(const std::string& request_id, const PeerShareError& error) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot = mutate_locked(TransferDirection::Outgoing, request_id, [&](TransferProgress& p) {
                p.error_message = error.detail();
                set_status(p, TransferStatus::Error);
            });
            auto it = outgoing.find(request_id);
            if (it != outgoing.end()) {
                it->second.phase = SendPhase::Error;
            }
            if (snapshot) {
                ++stats.failed_sends;
            }
        }
        Logger::instance().error("Transfer {} failed: {}", request_id, error.what());
        emit_progress(snapshot);
    }

    // Failure to reach the peer here is logged and swallowed
    elio::coro::task<void> notify_peer_of_failure(std::shared_ptr<PeerChannel> channel,
                                                  std::string request_id,
                                                  std::string message) {
        try {
            co_await channel->send(ChannelPayload::from_text(
                encode_message(ErrorMessage{request_id, message})));
        } catch (const std::exception& e) {
            Logger::instance().debug("Could not notify {} of failed transfer {}: {}",
                                     channel->peer_id(), request_id, e.what());
        }
    }

    void finish_outgoing(const std::string& request_id) {
        std::lock_guard<std::mutex> lock(mutex);
        outgoing.erase(request_id);
    }

    // ---- Receive path ----

    void handle_start(const std::string& peer_id, const StartMessage& message) {
        ChunkedFileInfo info;
        info.name = message.name;
        info.size = message.size;
        info.hash = message.hash;
        info.total_chunks = message.total_chunks;
        info.chunk_size = message.chunk_size;

        std::unique_ptr<ChunkAssembler> assembler;
        try {
            assembler = std::make_unique<ChunkAssembler>(info);
        } catch (const PeerShareError& e) {
            Logger::instance().warning("Rejecting file-start {} from {}: {}", message.request_id, peer_id, e.what());
            return;
        }

        TransferProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (incoming.count(message.request_id)) {
                Logger::instance().warning("Ignoring duplicate file-start for active transfer {}", message.request_id);
                return;
            }

            IncomingState state;
            state.request.request_id = message.request_id;
            state.request.peer_id = peer_id;
            state.assembler = std::move(assembler);
            incoming.emplace(message.request_id, std::move(state));

            TransferProgress progress;
            progress.request_id = message.request_id;
            progress.direction = TransferDirection::Incoming;
            progress.peer_id = peer_id;
            progress.file_name = message.name;
            progress.file_hash = message.hash;
            progress.total_bytes = message.size;
            progress.status = TransferStatus::Transferring;
            incoming_progress[message.request_id] = progress;
            snapshot = progress;
        }

        Logger::instance().info("Receiving {} ({} bytes, {} chunks) from {} as {}",
                                message.name, message.size, message.total_chunks, peer_id, message.request_id);
        emit_progress(snapshot);
    }

    void handle_chunk_header(const std::string& peer_id, const ChunkHeaderMessage& message) {
        bool known = false;
        bool replaced = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            known = incoming.count(message.request_id) > 0;
            if (known) {
                replaced = pending_headers.count(peer_id) > 0;
                pending_headers[peer_id] = message;
            } else {
                // The payload that follows must not attach to a stale header
                pending_headers.erase(peer_id);
            }
        }

        if (!known) {
            Logger::instance().warning("Dropping file-chunk header for unknown transfer {} from {}",
                                       message.request_id, peer_id);
        } else if (replaced) {
            Logger::instance().warning("Chunk header from {} replaced a header with no payload", peer_id);
        }
    }

    void handle_binary(const std::string& peer_id, std::vector<uint8_t> data) {
        std::optional<ChunkHeaderMessage> header;
        std::optional<TransferProgress> snapshot;
        std::optional<PeerShareError> failure;
        std::unique_ptr<ChunkAssembler> completed;
        TransferRequest request;
        bool known = false;

        {
            std::lock_guard<std::mutex> lock(mutex);
            auto pending = pending_headers.find(peer_id);
            if (pending != pending_headers.end()) {
                header = pending->second;
                pending_headers.erase(pending);

                auto it = incoming.find(header->request_id);
                known = it != incoming.end();
                if (known && data.size() != header->size) {
                    failure = PeerShareError(ErrorCode::IntegrityError,
                                             "Payload of " + std::to_string(data.size()) +
                                             " bytes does not match header size " + std::to_string(header->size));
                } else if (known) {
                    try {
                        auto& state = it->second;
                        bool complete = state.assembler->add_chunk(header->index, std::move(data));

                        auto& progress = incoming_progress[header->request_id];
                        uint64_t received = state.assembler->received_bytes();
                        stats.bytes_received += received - progress.transferred_bytes;
                        progress.transferred_bytes = received;
                        progress.percent = compute_percent(received, progress.total_bytes);
                        update_rate(progress, state.start_time);

                        if (complete) {
                            progress.percent = 100;
                            progress.eta = 0.0;
                            set_status(progress, TransferStatus::Verifying);
                            request = state.request;
                            completed = std::move(state.assembler);
                            incoming.erase(it);
                        }
                        snapshot = progress;
                    } catch (const PeerShareError& e) {
                        failure = e;
                    }
                }
            }
        }

        if (!header) {
            Logger::instance().warning("Dropping binary message from {} with no pending chunk header", peer_id);
            return;
        }
        if (!known) {
            Logger::instance().warning("Dropping chunk {} for inactive transfer {}", header->index, header->request_id);
            return;
        }
        if (failure) {
            fail_incoming(header->request_id, failure->code(), failure->detail());
            return;
        }

        emit_progress(snapshot);
        if (completed) {
            finish_incoming(request, *completed);
        }
    }

    void finish_incoming(const TransferRequest& request, const ChunkAssembler& assembler) {
        const std::string& request_id = request.request_id;
        ReceivedFile file;
        try {
            file = assembler.assemble();
        } catch (const PeerShareError& e) {
            fail_incoming(request_id, e.code(), e.detail());
            return;
        }

        if (!ContentHasher::verify(file, assembler.expected_hash())) {
            fail_incoming(request_id, ErrorCode::IntegrityError,
                          "Digest of " + file.name + " does not match " + assembler.expected_hash());
            return;
        }

        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot = mutate_locked(TransferDirection::Incoming, request_id, [](TransferProgress& p) {
                set_status(p, TransferStatus::Done);
            });
            ++stats.completed_receives;
        }

        Logger::instance().info("Received {} ({} bytes) for transfer {}", file.name, file.data.size(), request_id);
        emit_progress(snapshot);
        if (on_file_received) {
            on_file_received(file, request);
        }
        emit_complete(request_id);
    }

    void fail_incoming(const std::string& request_id, ErrorCode code, const std::string& message) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            incoming.erase(request_id);
            snapshot = mutate_locked(TransferDirection::Incoming, request_id, [&](TransferProgress& p) {
                p.error_message = message;
                set_status(p, TransferStatus::Error);
            });
            if (snapshot) {
                ++stats.failed_receives;
            }
        }
        if (!snapshot) {
            return;
        }

        Logger::instance().error("Incoming transfer {} failed: {}: {}", request_id, to_string(code), message);
        emit_progress(snapshot);
        emit_error(request_id, code, message);
    }

    void handle_end(const std::string& peer_id, const EndMessage& message) {
        std::optional<std::string> expected;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = incoming.find(message.request_id);
            if (it != incoming.end()) {
                expected = it->second.assembler->expected_hash();
            } else {
                auto progress = incoming_progress.find(message.request_id);
                if (progress != incoming_progress.end()) {
                    expected = progress->second.file_hash;
                }
            }
        }

        if (expected && *expected != message.hash) {
            Logger::instance().warning("file-end for {} from {} carries hash {} but {} was announced",
                                       message.request_id, peer_id, message.hash, *expected);
        } else {
            Logger::instance().debug("file-end for {} from {}", message.request_id, peer_id);
        }
    }

    void handle_remote_error(const std::string& peer_id, const ErrorMessage& message) {
        bool is_incoming = false;
        bool is_outgoing = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            is_incoming = incoming.count(message.request_id) > 0;
            auto out = outgoing.find(message.request_id);
            if (out != outgoing.end()) {
                is_outgoing = true;
                out->second.cancel_requested = true;
                out->second.remote_error = message.error;
            }
        }

        if (is_incoming) {
            fail_incoming(message.request_id, ErrorCode::RemoteError, message.error);
        }
        if (is_outgoing) {
            Logger::instance().warning("Peer {} aborted transfer {}: {}", peer_id, message.request_id, message.error);
        }
        if (!is_incoming && !is_outgoing) {
            Logger::instance().debug("Ignoring file-error for unknown transfer {} from {}", message.request_id, peer_id);
        }
    }
};

TransferCoordinator::TransferCoordinator(const TransferConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

TransferCoordinator::~TransferCoordinator() = default;

void TransferCoordinator::register_channel(std::shared_ptr<PeerChannel> channel) {
    if (!channel) {
        throw PeerShareError(ErrorCode::InvalidArgument, "Cannot register a null channel");
    }
    std::string peer_id = channel->peer_id();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->channels[peer_id] = std::move(channel);
        impl_->pending_headers.erase(peer_id);
    }
    Logger::instance().debug("Registered channel to {}", peer_id);
}

void TransferCoordinator::remove_channel(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->channels.erase(peer_id);
    impl_->pending_headers.erase(peer_id);
}

bool TransferCoordinator::has_channel(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->channels.count(peer_id) > 0;
}

elio::coro::task<void> TransferCoordinator::send_file(std::string peer_id,
                                                      std::shared_ptr<const FileSource> file,
                                                      TransferRequest request) {
    auto channel = impl_->find_channel(peer_id);
    if (!channel) {
        throw PeerShareError(ErrorCode::ConnectionFailed, peer_id);
    }
    if (!file) {
        throw PeerShareError(ErrorCode::InvalidArgument, "No file to send");
    }
    if (request.request_id.empty()) {
        throw PeerShareError(ErrorCode::InvalidArgument, "Transfer request has no id");
    }
    if (request.peer_id.empty()) {
        request.peer_id = peer_id;
    }

    const std::string request_id = request.request_id;
    impl_->begin_outgoing(request, *file);

    std::optional<PeerShareError> failure;
    bool announced = false;

    try {
        impl_->set_phase(request_id, SendPhase::Hashing);
        std::string hash = ContentHasher::hash(*file);
        impl_->mark_hashed(request_id, hash);

        StartMessage start;
        start.request_id = request_id;
        start.name = file->name();
        start.size = file->size();
        start.hash = hash;
        start.chunk_size = impl_->chunker.chunk_size();
        start.total_chunks = Chunker::total_chunks(start.size, start.chunk_size);

        Logger::instance().info("Sending {} ({} bytes, {} chunks) to {} as {}",
                                start.name, start.size, start.total_chunks, peer_id, request_id);

        // Cancelled while hashing: stop before the peer hears of it
        impl_->check_cancelled(request_id);
        co_await channel->send(ChannelPayload::from_text(encode_message(start)));
        announced = true;
        impl_->set_phase(request_id, SendPhase::Announced);

        auto stream = impl_->chunker.chunk(file);
        impl_->set_phase(request_id, SendPhase::Streaming);
        while (auto chunk = stream.next()) {
            impl_->check_cancelled(request_id);

            auto size = static_cast<uint32_t>(chunk->data.size());
            co_await channel->send(ChannelPayload::from_text(
                encode_message(ChunkHeaderMessage{request_id, chunk->index, size})));
            co_await channel->send(ChannelPayload::from_binary(std::move(chunk->data)));

            impl_->record_chunk_sent(request_id, size);
        }

        impl_->set_phase(request_id, SendPhase::Ended);
        co_await channel->send(ChannelPayload::from_text(encode_message(EndMessage{request_id, hash})));
        impl_->complete_outgoing(request_id);
    } catch (const PeerShareError& e) {
        failure = e;
    } catch (const std::exception& e) {
        failure = PeerShareError(ErrorCode::SendFailed, e.what());
    }

    if (failure) {
        impl_->fail_outgoing(request_id, *failure);
        // A peer that reported the failure itself needs no reply
        if (announced && failure->code() != ErrorCode::RemoteError) {
            co_await impl_->notify_peer_of_failure(channel, request_id, failure->detail());
        }
        impl_->emit_error(request_id, failure->code(), failure->detail());
        impl_->finish_outgoing(request_id);
        throw *failure;
    }

    impl_->finish_outgoing(request_id);
}

bool TransferCoordinator::cancel_transfer(const std::string& request_id) {
    bool found = false;
    bool is_incoming = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto out = impl_->outgoing.find(request_id);
        if (out != impl_->outgoing.end()) {
            out->second.cancel_requested = true;
            if (out->second.phase == SendPhase::Streaming) {
                out->second.phase = SendPhase::Cancelling;
            }
            found = true;
        }
        is_incoming = impl_->incoming.count(request_id) > 0;
    }

    if (found) {
        Logger::instance().info("Cancellation requested for transfer {}", request_id);
    }
    if (is_incoming) {
        impl_->fail_incoming(request_id, ErrorCode::Cancelled, "Transfer cancelled");
        found = true;
    }
    return found;
}

void TransferCoordinator::handle_inbound(const std::string& peer_id, ChannelPayload payload) {
    if (payload.kind == PayloadKind::Binary) {
        impl_->handle_binary(peer_id, std::move(payload.binary));
        return;
    }

    auto message = decode_message(payload.text);
    if (!message) {
        Logger::instance().warning("Dropping malformed message from {}", peer_id);
        return;
    }

    std::visit(overloaded{
        [&](const StartMessage& m) { impl_->handle_start(peer_id, m); },
        [&](const ChunkHeaderMessage& m) { impl_->handle_chunk_header(peer_id, m); },
        [&](const EndMessage& m) { impl_->handle_end(peer_id, m); },
        [&](const ErrorMessage& m) { impl_->handle_remote_error(peer_id, m); }
    }, *message);
}

void TransferCoordinator::set_on_progress(ProgressCallback callback) {
    impl_->on_progress = std::move(callback);
}

void TransferCoordinator::set_on_complete(CompleteCallback callback) {
    impl_->on_complete = std::move(callback);
}

void TransferCoordinator::set_on_error(ErrorCallback callback) {
    impl_->on_error = std::move(callback);
}

void TransferCoordinator::set_on_file_received(FileReceivedCallback callback) {
    impl_->on_file_received = std::move(callback);
}

std::optional<TransferProgress> TransferCoordinator::get_progress(const std::string& request_id,
                                                                  TransferDirection direction) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const auto& table = impl_->progress_table(direction);
    auto it = table.find(request_id);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferProgress> TransferCoordinator::get_transfers() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<TransferProgress> result;
    result.reserve(impl_->outgoing_progress.size() + impl_->incoming_progress.size());
    for (const auto& [id, progress] : impl_->outgoing_progress) {
        result.push_back(progress);
    }
    for (const auto& [id, progress] : impl_->incoming_progress) {
        result.push_back(progress);
    }
    return result;
}

std::optional<SendPhase> TransferCoordinator::get_send_phase(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->outgoing.find(request_id);
    if (it == impl_->outgoing.end()) {
        return std::nullopt;
    }
    return it->second.phase;
}

bool TransferCoordinator::is_transferring() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return !impl_->outgoing.empty() || !impl_->incoming.empty();
}

size_t TransferCoordinator::clear_finished() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t removed = 0;
    for (auto* table : {&impl_->outgoing_progress, &impl_->incoming_progress}) {
        for (auto it = table->begin(); it != table->end();) {
            if (it->second.is_terminal()) {
                it = table->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

TransferCoordinator::TransferStats TransferCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    TransferStats stats = impl_->stats;
    stats.active_transfers = impl_->outgoing.size() + impl_->incoming.size();
    return stats;
}

const TransferConfig& TransferCoordinator::config() const {
    return impl_->config;
}

} // namespace peershare
