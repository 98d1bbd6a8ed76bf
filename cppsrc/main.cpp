#include "cli.hpp"
#include "config.hpp"
#include "link.hpp"
#include "logging.hpp"
#include "recv.hpp"
#include "send.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

static std::atomic<bool> g_stop_requested{false};

static void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

// No SA_RESTART, so a blocking read returns and the loop sees the flag
static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

static sdrcp::LinkConfig resolve_config(const sdrcp::Args& args) {
    sdrcp::LinkConfig config;
    if (args.config_path) {
        config = sdrcp::load_config(*args.config_path);
    }

    if (args.packet_size) config.packet_size = *args.packet_size;
    if (args.repeat) config.repeat = *args.repeat;
    if (args.tag_key) config.length_tag_name = *args.tag_key;
    if (args.out_dir) config.output_directory = *args.out_dir;
    if (args.overwrite) config.overwrite = *args.overwrite;
    if (args.max_buffer) {
        config.max_scan_buffer_bytes = *args.max_buffer;
        if (config.scan_buffer_keep_bytes > config.max_scan_buffer_bytes) {
            config.scan_buffer_keep_bytes = config.max_scan_buffer_bytes / 4;
        }
    }
    if (args.debug) config.debug_logging = true;

    sdrcp::validate_config(config);
    return config;
}

static sdrcp::Link open_link(const sdrcp::Args& args) {
    if (args.listen) {
        return sdrcp::Link::accept_tcp(args.host.empty() ? "0.0.0.0" : args.host, args.port);
    }
    if (!args.host.empty()) {
        return sdrcp::Link::connect_tcp(args.host, args.port);
    }

    bool use_stdio = args.endpoint.empty() || args.endpoint == "-";
    if (args.command_type == sdrcp::Args::CommandType::Send) {
        return use_stdio ? sdrcp::Link::standard_output()
                         : sdrcp::Link::open_file_for_write(args.endpoint);
    }
    return use_stdio ? sdrcp::Link::standard_input()
                     : sdrcp::Link::open_file_for_read(args.endpoint);
}

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> raw(argv + 1, argv + argc);
        if (raw.empty()) {
            sdrcp::print_help();
            return 1;
        }

        sdrcp::Args args = sdrcp::parse_args(raw);
        if (args.help) {
            sdrcp::print_help();
            return 0;
        }

        sdrcp::set_verbosity(args.verbose);
        SDRCP_LOG_INFO("Starting sdrcp with verbosity level " << args.verbose);

        sdrcp::LinkConfig config = resolve_config(args);
        install_signal_handlers();

        if (args.command_type == sdrcp::Args::CommandType::Send) {
            sdrcp::SendOptions options;
            options.packetizer = sdrcp::to_packetizer_options(config);
            options.packetizer.source = args.source;
            options.cycles = args.cycles;
            options.limit = args.limit;
            options.tag_file = args.tag_file;

            SDRCP_LOG_DEBUG("Executing send: " << args.source << " -> "
                            << (args.endpoint.empty() ? "stdout" : args.endpoint));

            sdrcp::Link link = open_link(args);
            sdrcp::execute_send(options, link, &g_stop_requested);
        } else {
            sdrcp::RecvOptions options;
            options.reassembler = sdrcp::to_reassembler_options(config);

            SDRCP_LOG_DEBUG("Executing recv -> " << config.output_directory);

            sdrcp::Link link = open_link(args);
            if (!sdrcp::execute_recv(options, link, &g_stop_requested)) {
                return 2;
            }
        }

        SDRCP_LOG_INFO("Operation completed successfully");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
