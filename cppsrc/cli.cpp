#include "cli.hpp"
#include <iostream>
#include <cstddef>
#include <stdexcept>

namespace sdrcp {

void print_help() {
    std::cout << "sdrcp 0.1.0 - File transfer over a lossy one-way byte stream\n\n";
    std::cout << "USAGE:\n";
    std::cout << "    sdrcp [-v|-vv] [--config FILE] send [OPTIONS] <SRC>\n";
    std::cout << "    sdrcp [-v|-vv] [--config FILE] recv [OPTIONS] [<INPUT>|-]\n\n";
    std::cout << "GLOBAL OPTIONS:\n";
    std::cout << "    -v, -vv              Increase verbosity\n";
    std::cout << "    --config <FILE>      YAML configuration file\n";
    std::cout << "    -h, --help           Show this help\n\n";
    std::cout << "SEND OPTIONS:\n";
    std::cout << "    --packet-size <N>    Packet size in bytes, 16..4096 (default: 512)\n";
    std::cout << "    --repeat             Resend the file forever (default)\n";
    std::cout << "    --no-repeat          Send once, then zero packets\n";
    std::cout << "    --tag-key <KEY>      Length tag name (default: packet_len)\n";
    std::cout << "    --tags <FILE>        Write packet length tags to FILE\n";
    std::cout << "    --cycles <N>         Stop after N complete transfers\n";
    std::cout << "    --limit <BYTES>      Stop after BYTES of output\n";
    std::cout << "    --output <FILE>      Write the stream to FILE (default: stdout)\n\n";
    std::cout << "RECV OPTIONS:\n";
    std::cout << "    --out-dir <DIR>      Output directory (default: .)\n";
    std::cout << "    --overwrite <M>      Overwrite mode: yes, no (default: yes)\n";
    std::cout << "    --max-buffer <N>     Scan buffer cap in bytes (default: 4194304)\n";
    std::cout << "    --debug              Trace reassembly phases\n\n";
    std::cout << "LINK OPTIONS:\n";
    std::cout << "    --host <HOST>        Connect to HOST (IPv4)\n";
    std::cout << "    --port <PORT>        TCP port\n";
    std::cout << "    --listen, -l         Accept one TCP peer on --port\n";
}

static bool parse_overwrite_mode(const std::string& mode) {
    if (mode == "yes") return true;
    if (mode == "no") return false;
    throw std::runtime_error("Invalid overwrite mode: " + mode);
}

static uint64_t parse_number(const std::string& option, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(option + " requires a non-negative integer");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(option + " value out of range");
    }
}

static uint16_t parse_port(const std::string& value) {
    uint64_t port = parse_number("--port", value);
    if (port == 0 || port > 65535) {
        throw std::runtime_error("--port must be in range [1, 65535]");
    }
    return static_cast<uint16_t>(port);
}

// Shared --host/--port/--listen handling. Returns false if arg is not a link option.
static bool parse_link_option(const std::vector<std::string>& args, size_t& i, Args& result) {
    if (args[i] == "--host") {
        if (++i >= args.size()) throw std::runtime_error("--host requires value");
        result.host = args[i];
        return true;
    }
    if (args[i] == "--port") {
        if (++i >= args.size()) throw std::runtime_error("--port requires value");
        result.port = parse_port(args[i]);
        return true;
    }
    if (args[i] == "--listen" || args[i] == "-l") {
        result.listen = true;
        return true;
    }
    return false;
}

static void check_link(const Args& result) {
    bool tcp = result.listen || !result.host.empty();
    if (tcp && result.port == 0) throw std::runtime_error("--port required");
    if (!tcp && result.port != 0) throw std::runtime_error("--port requires --host or --listen");
    if (tcp && !result.endpoint.empty() && result.endpoint != "-") {
        throw std::runtime_error("Cannot combine a TCP link with " + result.endpoint);
    }
}

static void parse_send_args(const std::vector<std::string>& args, Args& result) {
    result.command_type = Args::CommandType::Send;
    bool src_specified = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (parse_link_option(args, i, result)) {
            continue;
        } else if (args[i] == "--packet-size") {
            if (++i >= args.size()) throw std::runtime_error("--packet-size requires value");
            result.packet_size = static_cast<size_t>(parse_number("--packet-size", args[i]));
        } else if (args[i] == "--repeat") {
            result.repeat = true;
        } else if (args[i] == "--no-repeat") {
            result.repeat = false;
        } else if (args[i] == "--tag-key") {
            if (++i >= args.size()) throw std::runtime_error("--tag-key requires value");
            result.tag_key = args[i];
        } else if (args[i] == "--tags") {
            if (++i >= args.size()) throw std::runtime_error("--tags requires value");
            result.tag_file = std::filesystem::path(args[i]);
        } else if (args[i] == "--cycles") {
            if (++i >= args.size()) throw std::runtime_error("--cycles requires value");
            result.cycles = parse_number("--cycles", args[i]);
        } else if (args[i] == "--limit") {
            if (++i >= args.size()) throw std::runtime_error("--limit requires value");
            result.limit = parse_number("--limit", args[i]);
        } else if (args[i] == "--output") {
            if (++i >= args.size()) throw std::runtime_error("--output requires value");
            result.endpoint = args[i];
        } else if (args[i].empty() || args[i][0] != '-') {
            if (src_specified) throw std::runtime_error("Unexpected argument: " + args[i]);
            result.source = args[i];
            src_specified = true;
        } else {
            throw std::runtime_error("Unknown option: " + args[i]);
        }
    }

    if (!src_specified) throw std::runtime_error("source path required");
    check_link(result);
}

static void parse_recv_args(const std::vector<std::string>& args, Args& result) {
    result.command_type = Args::CommandType::Recv;
    bool input_specified = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (parse_link_option(args, i, result)) {
            continue;
        } else if (args[i] == "--out-dir") {
            if (++i >= args.size()) throw std::runtime_error("--out-dir requires value");
            result.out_dir = args[i];
        } else if (args[i] == "--overwrite") {
            if (++i >= args.size()) throw std::runtime_error("--overwrite requires value");
            result.overwrite = parse_overwrite_mode(args[i]);
        } else if (args[i] == "--max-buffer") {
            if (++i >= args.size()) throw std::runtime_error("--max-buffer requires value");
            result.max_buffer = static_cast<size_t>(parse_number("--max-buffer", args[i]));
        } else if (args[i] == "--debug") {
            result.debug = true;
        } else if (args[i] == "-" || args[i].empty() || args[i][0] != '-') {
            if (input_specified) throw std::runtime_error("Unexpected argument: " + args[i]);
            result.endpoint = args[i];
            input_specified = true;
        } else {
            throw std::runtime_error("Unknown option: " + args[i]);
        }
    }

    check_link(result);
}

Args parse_args(const std::vector<std::string>& args) {
    Args result;
    size_t i = 0;

    // Parse global options
    while (i < args.size() && !args[i].empty() && args[i][0] == '-') {
        if (args[i] == "-v") {
            result.verbose = 1;
        } else if (args[i] == "-vv") {
            result.verbose = 2;
        } else if (args[i] == "--help" || args[i] == "-h") {
            result.help = true;
            return result;
        } else if (args[i] == "--config") {
            if (++i >= args.size()) throw std::runtime_error("--config requires value");
            result.config_path = args[i];
        } else {
            throw std::runtime_error("Unknown option: " + args[i]);
        }
        ++i;
    }

    if (i >= args.size()) {
        throw std::runtime_error("Missing command");
    }

    std::vector<std::string> cmd_args(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

    if (args[i] == "send") {
        parse_send_args(cmd_args, result);
    } else if (args[i] == "recv") {
        parse_recv_args(cmd_args, result);
    } else {
        throw std::runtime_error("Unknown command: " + args[i]);
    }

    return result;
}

} // namespace sdrcp
