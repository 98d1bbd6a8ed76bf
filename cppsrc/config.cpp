#include "config.hpp"
#include <filesystem>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sdrcp {

static void reject_unknown_keys(const YAML::Node& node, const std::string& section,
                                const std::set<std::string>& known) {
    for (const auto& kv : node) {
        std::string key = kv.first.as<std::string>();
        if (known.find(key) == known.end()) {
            std::string where = section.empty() ? key : section + "." + key;
            throw std::runtime_error("[CONFIG] Unknown option '" + where + "'");
        }
    }
}

template <typename T>
static void read_option(const YAML::Node& node, const std::string& section,
                        const std::string& key, T& out) {
    if (!node[key]) return;
    try {
        out = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("[CONFIG] Invalid " + section + "." + key + ": " + e.what());
    }
}

static const YAML::Node section_node(const YAML::Node& yaml, const std::string& name) {
    const YAML::Node node = yaml[name];
    if (node && !node.IsMap()) {
        throw std::runtime_error("[CONFIG] '" + name + "' section must be a map");
    }
    return node;
}

LinkConfig parse_config(const YAML::Node& yaml) {
    LinkConfig config;

    if (!yaml || yaml.IsNull()) {
        return config;
    }
    if (!yaml.IsMap()) {
        throw std::runtime_error("[CONFIG] Top level must be a map");
    }

    reject_unknown_keys(yaml, "", {"debug_logging", "send", "recv"});

    if (yaml["debug_logging"]) {
        try {
            config.debug_logging = yaml["debug_logging"].as<bool>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("[CONFIG] Invalid debug_logging: " + std::string(e.what()));
        }
    }

    const YAML::Node send = section_node(yaml, "send");
    if (send) {
        reject_unknown_keys(send, "send", {"packet_size", "repeat", "length_tag_name"});
        read_option(send, "send", "packet_size", config.packet_size);
        read_option(send, "send", "repeat", config.repeat);
        read_option(send, "send", "length_tag_name", config.length_tag_name);
    }

    const YAML::Node recv = section_node(yaml, "recv");
    if (recv) {
        reject_unknown_keys(recv, "recv", {"output_directory", "overwrite", "max_scan_buffer_bytes",
                                           "scan_buffer_keep_bytes", "max_file_size"});
        read_option(recv, "recv", "output_directory", config.output_directory);
        read_option(recv, "recv", "overwrite", config.overwrite);
        read_option(recv, "recv", "max_scan_buffer_bytes", config.max_scan_buffer_bytes);
        read_option(recv, "recv", "scan_buffer_keep_bytes", config.scan_buffer_keep_bytes);
        read_option(recv, "recv", "max_file_size", config.max_file_size);
    }

    validate_config(config);
    return config;
}

LinkConfig load_config(const std::string& path) {
    YAML::Node yaml;

    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file '" + path + "': " + e.what());
    }

    LinkConfig config = parse_config(yaml);

    fs::path out_dir(config.output_directory);
    if (out_dir.is_relative() && yaml["recv"] && yaml["recv"]["output_directory"]) {
        config.output_directory = (fs::absolute(path).parent_path() / out_dir).lexically_normal().string();
    }

    return config;
}

void validate_config(const LinkConfig& config) {
    if (config.packet_size < MIN_META_LEN || config.packet_size > MAX_META_LEN) {
        throw std::runtime_error("[CONFIG] send.packet_size must be in range [16, 4096]");
    }
    if (config.length_tag_name.empty()) {
        throw std::runtime_error("[CONFIG] send.length_tag_name must not be empty");
    }
    if (config.output_directory.empty()) {
        throw std::runtime_error("[CONFIG] recv.output_directory must not be empty");
    }
    if (config.max_scan_buffer_bytes < MAX_META_LEN) {
        throw std::runtime_error("[CONFIG] recv.max_scan_buffer_bytes must be >= 4096");
    }
    if (config.scan_buffer_keep_bytes == 0 ||
        config.scan_buffer_keep_bytes > config.max_scan_buffer_bytes) {
        throw std::runtime_error(
            "[CONFIG] recv.scan_buffer_keep_bytes must be in range [1, max_scan_buffer_bytes]");
    }
    if (config.max_file_size == 0) {
        throw std::runtime_error("[CONFIG] recv.max_file_size must be > 0");
    }
}

PacketizerOptions to_packetizer_options(const LinkConfig& config) {
    PacketizerOptions options;
    options.packet_size = config.packet_size;
    options.repeat = config.repeat;
    options.length_tag_name = config.length_tag_name;
    return options;
}

ReassemblerOptions to_reassembler_options(const LinkConfig& config) {
    ReassemblerOptions options;
    options.output_directory = config.output_directory;
    options.overwrite = config.overwrite;
    options.debug_logging = config.debug_logging;
    options.max_scan_buffer_bytes = config.max_scan_buffer_bytes;
    options.scan_buffer_keep_bytes = config.scan_buffer_keep_bytes;
    options.limits.max_file_size = config.max_file_size;
    return options;
}

} // namespace sdrcp
