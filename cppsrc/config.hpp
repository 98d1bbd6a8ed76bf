#pragma once

#include "recv.hpp"
#include "send.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace sdrcp {

// Options shared by the send and recv commands
struct LinkConfig {
    bool debug_logging = false;

    // send
    size_t packet_size = DEFAULT_PACKET_SIZE;
    bool repeat = true;
    std::string length_tag_name = DEFAULT_LENGTH_TAG_NAME;

    // recv
    std::string output_directory = ".";
    bool overwrite = true;
    size_t max_scan_buffer_bytes = DEFAULT_MAX_SCAN_BUFFER;
    size_t scan_buffer_keep_bytes = DEFAULT_SCAN_BUFFER_KEEP;
    uint64_t max_file_size = MAX_FILE_SIZE;
};

// Load configuration from a YAML file. A relative output_directory is
// resolved against the file's directory.
// Throws std::runtime_error if the file cannot be read, parsed, or validated
LinkConfig load_config(const std::string& path);

// Same as load_config, from an already parsed document
LinkConfig parse_config(const YAML::Node& yaml);

// Throws std::runtime_error naming the first out-of-range option
void validate_config(const LinkConfig& config);

PacketizerOptions to_packetizer_options(const LinkConfig& config);
ReassemblerOptions to_reassembler_options(const LinkConfig& config);

} // namespace sdrcp
