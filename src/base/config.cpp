#include "peershare/base/config.h"
#include "peershare/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>

namespace peershare {

namespace {

using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, SectionMap& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

// Numeric values that fail to parse or do not fit T keep their previous setting
template<typename T>
void assign_number(T& target, const std::string& key, const std::string& value) {
    std::string text = trim(value);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        Logger::instance().warning("Ignoring invalid numeric value for {}: {}", key, value);
        return;
    }

    unsigned long long parsed = 0;
    size_t consumed = 0;
    try {
        parsed = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid numeric value for {}: {}", key, value);
        return;
    }

    if (consumed != text.size()) {
        Logger::instance().warning("Ignoring invalid numeric value for {}: {}", key, value);
        return;
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        Logger::instance().warning("Ignoring out of range value for {}: {} (max {})",
                                   key, value, std::numeric_limits<T>::max());
        return;
    }
    target = static_cast<T>(parsed);
}

// Finds the -c/--config value ahead of the full parse so the file can be
// applied underneath the other command line options
std::string find_config_argument(int argc, char* argv[]) {
    CLI::App pre;
    pre.set_help_flag();
    pre.allow_extras();

    std::string config_file;
    pre.add_option("-c,--config", config_file);
    try {
        pre.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // The full parse reports the error with its own usage text
        return "";
    }
    return config_file;
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    SectionMap sections;
    parse_ini_file(path, sections);

    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config_.log.level = s["level"];
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    if (sections.count("node")) {
        auto& s = sections["node"];
        if (s.count("peer_id")) config_.node.peer_id = s["peer_id"];
        if (s.count("bind_address")) config_.node.bind_address = s["bind_address"];
        if (s.count("listen_port")) assign_number(config_.node.listen_port, "listen_port", s["listen_port"]);
        if (s.count("connect_address")) config_.node.connect_address = s["connect_address"];
        if (s.count("connect_port")) assign_number(config_.node.connect_port, "connect_port", s["connect_port"]);
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        if (s.count("chunk_size")) assign_number(config_.transfer.chunk_size, "chunk_size", s["chunk_size"]);
        if (s.count("max_message_size")) {
            assign_number(config_.transfer.max_message_size, "max_message_size", s["max_message_size"]);
        }
        if (s.count("output_dir")) config_.transfer.output_dir = s["output_dir"];
        if (s.count("send_path")) config_.transfer.send_path = s["send_path"];
    }

    apply_log_config();

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_from_env() {
    if (const char* val = std::getenv("PEERSHARE_PEER_ID")) {
        config_.node.peer_id = val;
    }
    if (const char* val = std::getenv("PEERSHARE_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("PEERSHARE_LISTEN_PORT")) {
        assign_number(config_.node.listen_port, "PEERSHARE_LISTEN_PORT", val);
    }
    if (const char* val = std::getenv("PEERSHARE_CHUNK_SIZE")) {
        assign_number(config_.transfer.chunk_size, "PEERSHARE_CHUNK_SIZE", val);
    }
    if (const char* val = std::getenv("PEERSHARE_OUTPUT_DIR")) {
        config_.transfer.output_dir = val;
    }

    apply_log_config();
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"PeerShare - peer-to-peer chunked file transfer"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Node options
    app.add_option("--peer-id", config_.node.peer_id, "Local peer identifier");
    app.add_option("--bind-address", config_.node.bind_address, "Bind address for listen mode");
    app.add_option("--listen-port", config_.node.listen_port, "Listen port");
    app.add_option("--connect", config_.node.connect_address, "Remote peer address (enables send mode)");
    app.add_option("--connect-port", config_.node.connect_port, "Remote peer port");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Transfer options
    app.add_option("--chunk-size", config_.transfer.chunk_size, "Chunk size in bytes");
    app.add_option("--max-message-size", config_.transfer.max_message_size, "Largest channel message in bytes");
    app.add_option("--output-dir", config_.transfer.output_dir, "Directory for received files");
    app.add_option("--send", config_.transfer.send_path, "File to send to the connected peer");

    app.set_version_flag("-v,--version", "0.1.0");

    // Precedence: file first, then explicit options on top
    std::string early_config = find_config_argument(argc, argv);
    if (!early_config.empty()) {
        load_from_file(early_config);
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            app.exit(e);
            return false;
        }
        std::cerr << "Command line parse error: " << e.what() << std::endl;
        return false;
    }

    apply_log_config();
    return true;
}

void Config::apply_log_config() {
    auto& logger = Logger::instance();
    if (!config_.log.level.empty()) {
        logger.set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else if (config_.log.output == "stdout") {
        logger.set_output(LogOutput::Stdout);
    }
}

bool Config::validate() const {
    if (config_.transfer.chunk_size == 0) {
        Logger::instance().error("transfer.chunk_size must be greater than zero");
        return false;
    }
    if (config_.transfer.chunk_size > config_.transfer.max_message_size) {
        Logger::instance().error("transfer.chunk_size ({}) exceeds transfer.max_message_size ({})",
                                 config_.transfer.chunk_size, config_.transfer.max_message_size);
        return false;
    }
    if (!config_.node.connect_address.empty() && config_.transfer.send_path.empty()) {
        Logger::instance().error("--send is required when --connect is given");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Peer ID: " + config_.node.peer_id);
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Listen: " + config_.node.bind_address + ":" + std::to_string(config_.node.listen_port));
    Logger::instance().info("Chunk Size: " + std::to_string(config_.transfer.chunk_size) + " bytes");
    Logger::instance().info("Output Dir: " + config_.transfer.output_dir);
}

} // namespace peershare
