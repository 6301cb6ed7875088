#ifndef PEERSHARE_BASE_CONFIG_H
#define PEERSHARE_BASE_CONFIG_H

#include <cstdint>
#include <string>

namespace peershare {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Node configuration
struct NodeConfig {
    std::string peer_id;
    std::string bind_address = "0.0.0.0";
    uint16_t listen_port = 9000;
    std::string connect_address;  // empty means listen mode
    uint16_t connect_port = 9000;
};

// Transfer configuration
struct TransferConfig {
    // Must stay below the largest message the peer channel delivers reliably
    uint32_t chunk_size = 64 * 1024;
    uint32_t max_message_size = 256 * 1024;
    std::string output_dir = ".";
    std::string send_path;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    TransferConfig transfer;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    // Check if required fields are set
    bool validate() const;

    // Reset to defaults
    void reset();

    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_log_config();

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace peershare

#endif // PEERSHARE_BASE_CONFIG_H
