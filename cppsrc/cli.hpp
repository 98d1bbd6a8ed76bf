#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace sdrcp {

struct Args {
    int verbose = 0;
    bool help = false;
    enum class CommandType { Send, Recv } command_type = CommandType::Send;
    std::optional<std::string> config_path;

    // Link endpoint: file/stdio path, or TCP
    std::string host;
    uint16_t port = 0;
    bool listen = false;
    std::string endpoint;  // send: --output FILE, recv: INPUT ("-" for stdin)

    // Send args
    std::filesystem::path source;
    std::optional<size_t> packet_size;
    std::optional<bool> repeat;
    std::optional<std::string> tag_key;
    std::optional<std::filesystem::path> tag_file;
    uint64_t cycles = 0;
    std::optional<uint64_t> limit;

    // Recv args
    std::optional<std::string> out_dir;
    std::optional<bool> overwrite;
    std::optional<size_t> max_buffer;
    bool debug = false;
};

// Throws std::runtime_error on malformed command lines
Args parse_args(const std::vector<std::string>& args);

void print_help();

} // namespace sdrcp
