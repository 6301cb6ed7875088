#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>

#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>

#include "peershare/base/config.h"
#include "peershare/base/logger.h"
#include "peershare/transfer/file_source.h"
#include "peershare/transfer/format.h"
#include "peershare/transfer/tcp_channel.h"
#include "peershare/transfer/transfer_coordinator.h"

using namespace peershare;

namespace fs = std::filesystem;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

std::string generate_request_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return fmt::format("{:016x}{:016x}", gen(), gen());
}

// Picks a name in dir that does not overwrite an existing file
fs::path unique_destination(const fs::path& dir, const std::string& name) {
    fs::path base = fs::path(name).filename();
    if (base.empty() || base == "." || base == "..") {
        base = "received.bin";
    }

    fs::path candidate = dir / base;
    for (int i = 1; fs::exists(candidate); ++i) {
        candidate = dir / (base.stem().string() + "." + std::to_string(i) + base.extension().string());
    }
    return candidate;
}

} // anonymous namespace

class PeerShareApplication {
public:
    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();

        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            return false;
        }

        auto& config = Config::instance().get();
        if (config.node.peer_id.empty()) {
            config.node.peer_id = "peer-" + generate_request_id().substr(0, 8);
        }

        coordinator_ = std::make_unique<TransferCoordinator>(config.transfer);
        install_callbacks();

        Config::instance().print();
        Logger::instance().info("PeerShare initialized as {}", config.node.peer_id);
        return true;
    }

    int run() {
        const auto& config = Config::instance().get();
        if (!config.node.connect_address.empty()) {
            int exit_code = 1;
            elio::run(send_once(exit_code));
            return exit_code;
        }

        server_thread_ = std::thread([this]() {
            elio::run(serve());
        });

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Logger::instance().info("Shutting down");
        // The accept loop has no cancellation point; skip static destructors
        std::_Exit(0);
    }

private:
    void install_callbacks() {
        coordinator_->set_on_progress([this](const TransferProgress& progress) {
            log_progress(progress);
        });

        coordinator_->set_on_error([](const std::string& request_id, ErrorCode code, const std::string& message) {
            Logger::instance().error("Transfer {} failed ({}): {}", request_id, to_string(code), message);
        });

        coordinator_->set_on_file_received([](const ReceivedFile& file, const TransferRequest& request) {
            const auto& output_dir = Config::instance().get().transfer.output_dir;
            std::error_code ec;
            fs::create_directories(output_dir, ec);

            fs::path destination = unique_destination(output_dir, file.name);
            std::ofstream out(destination, std::ios::binary);
            if (!out) {
                Logger::instance().error("Failed to open {} for writing", destination.string());
                return;
            }
            out.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
            if (!out) {
                Logger::instance().error("Failed to write {}", destination.string());
                return;
            }
            Logger::instance().info("Saved {} from {} to {}", file.name, request.peer_id, destination.string());
        });
    }

    // Logs every 10% step and every status change
    void log_progress(const TransferProgress& progress) {
        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            auto key = progress.request_id + (progress.direction == TransferDirection::Outgoing ? ">" : "<");
            auto& last = last_logged_[key];
            uint32_t step = progress.percent / 10;
            if (last.first == step && last.second == progress.status) {
                return;
            }
            last = {step, progress.status};
            if (progress.is_terminal()) {
                last_logged_.erase(key);
            }
        }

        Logger::instance().info("{} {} {}% {}/{} {} eta {} [{}]",
                                progress.direction == TransferDirection::Outgoing ? "send" : "recv",
                                progress.file_name, progress.percent,
                                format_bytes(progress.transferred_bytes), format_bytes(progress.total_bytes),
                                format_speed(progress.speed), format_eta(progress.eta),
                                to_string(progress.status));
    }

    elio::coro::task<void> serve() {
        const auto& config = Config::instance().get();

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;

        auto bind_addr = elio::net::socket_address(config.node.bind_address, config.node.listen_port);
        auto listener = elio::net::tcp_listener::bind(bind_addr, opts);
        if (!listener) {
            Logger::instance().error("Failed to bind {}:{}", config.node.bind_address, config.node.listen_port);
            g_running = 0;
            co_return;
        }

        Logger::instance().info("Listening on {}:{}, saving files to {}",
                                config.node.bind_address, config.node.listen_port, config.transfer.output_dir);

        while (g_running) {
            auto stream_result = co_await listener->accept();
            if (!stream_result) {
                continue;
            }

            auto peer = stream_result->peer_address();
            std::string peer_id = peer ? peer->to_string() : "peer-" + generate_request_id().substr(0, 8);

            auto channel = std::make_shared<TcpPeerChannel>(peer_id, std::move(*stream_result),
                                                            config.transfer.max_message_size);
            coordinator_->register_channel(channel);
            Logger::instance().info("Accepted connection from {}", peer_id);

            (void)handle_connection(channel).spawn();
        }
    }

    elio::coro::task<void> handle_connection(std::shared_ptr<TcpPeerChannel> channel) {
        co_await channel->receive_loop(*coordinator_);
        co_await channel->close();

        size_t cleared = coordinator_->clear_finished();
        if (cleared > 0) {
            Logger::instance().debug("Cleared {} finished transfers after {} disconnected",
                                     cleared, channel->peer_id());
        }
    }

    elio::coro::task<void> send_once(int& exit_code) {
        const auto& config = Config::instance().get();
        exit_code = 1;

        std::shared_ptr<const FileSource> file;
        try {
            file = std::make_shared<DiskFile>(config.transfer.send_path);
        } catch (const PeerShareError& e) {
            Logger::instance().error("{}", e.what());
            co_return;
        }

        std::string remote = config.node.connect_address + ":" + std::to_string(config.node.connect_port);
        std::shared_ptr<TcpPeerChannel> channel;
        try {
            channel = co_await TcpPeerChannel::connect(config.node.connect_address, config.node.connect_port,
                                                       remote, config.transfer.max_message_size);
        } catch (const PeerShareError& e) {
            Logger::instance().error("{}", e.what());
            co_return;
        }

        coordinator_->register_channel(channel);
        auto receiver = channel->receive_loop(*coordinator_).spawn();

        TransferRequest request;
        request.request_id = generate_request_id();
        request.peer_id = remote;
        request.requester_name = config.node.peer_id;

        bool sent = false;
        try {
            co_await coordinator_->send_file(remote, file, request);
            sent = true;
        } catch (const PeerShareError& e) {
            Logger::instance().error("Send failed: {}", e.what());
        }

        co_await channel->close();
        co_await receiver;
        exit_code = sent ? 0 : 1;
    }

    std::unique_ptr<TransferCoordinator> coordinator_;
    std::thread server_thread_;
    std::mutex progress_mutex_;
    std::unordered_map<std::string, std::pair<uint32_t, TransferStatus>> last_logged_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        PeerShareApplication app;
        if (!app.initialize(argc, argv)) {
            return 1;
        }
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
