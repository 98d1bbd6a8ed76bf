#include "send.hpp"
#include "frame_builder.hpp"
#include "link.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace sdrcp {

const char* phase_name(PacketPhase phase) {
    switch (phase) {
        case PacketPhase::Meta: return "META";
        case PacketPhase::File: return "FILE";
        case PacketPhase::Zeros: return "ZEROS";
    }
    return "UNKNOWN";
}

Packetizer::Packetizer(PacketizerOptions options)
    : options_(std::move(options)) {
    if (options_.packet_size < MIN_META_LEN) {
        throw std::invalid_argument("packet_size must be >= 16");
    }
    if (options_.packet_size > MAX_META_LEN) {
        throw std::invalid_argument("packet_size must be <= 4096");
    }

    header_ = build_header(options_.source, static_cast<uint16_t>(options_.packet_size));
}

size_t Packetizer::work(uint8_t* out, size_t n, std::vector<LengthTag>& tags) {
    const size_t pkt = options_.packet_size;
    const size_t n_pkts = n / pkt;

    size_t produced = 0;
    for (size_t i = 0; i < n_pkts; ++i) {
        uint8_t* packet = out + produced;

        tags.push_back({items_written_ + produced, options_.length_tag_name, pkt});

        switch (phase_) {
            case PacketPhase::Meta:
                emit_meta(packet);
                break;
            case PacketPhase::File:
                emit_file(packet);
                break;
            case PacketPhase::Zeros:
                std::memset(packet, 0, pkt);
                break;
        }

        produced += pkt;
    }

    items_written_ += produced;
    return produced;
}

void Packetizer::emit_meta(uint8_t* packet) {
    const size_t pkt = options_.packet_size;
    std::memset(packet, 0, pkt);
    std::memcpy(packet, header_.data(), std::min(header_.size(), pkt));

    reopen_source();
    file_bytes_left_ = source_.is_open() ? query_file_size(options_.source).value_or(0) : 0;
    phase_ = PacketPhase::File;

    SDRCP_LOG_DEBUG("[PKTZ] META @ " << items_written_ << ", sending " << file_bytes_left_
                    << " bytes of " << options_.source);
}

void Packetizer::emit_file(uint8_t* packet) {
    const size_t pkt = options_.packet_size;
    std::memset(packet, 0, pkt);

    if (file_bytes_left_ > 0) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(pkt, file_bytes_left_));
        size_t got = 0;
        if (source_.is_open() && source_.good()) {
            source_.read(reinterpret_cast<char*>(packet), static_cast<std::streamsize>(to_read));
            got = static_cast<size_t>(source_.gcount());
        }
        if (got < to_read) {
            SDRCP_LOG_DEBUG("[PKTZ] short read (" << got << " of " << to_read
                            << "), zero-filling");
        }
        // Count what was announced, not what was read, so the stream keeps
        // the packet count the header implies
        file_bytes_left_ -= to_read;
    }

    if (file_bytes_left_ == 0) {
        ++cycles_completed_;
        if (options_.repeat) {
            header_ = build_header(options_.source, static_cast<uint16_t>(pkt));
            phase_ = PacketPhase::Meta;
        } else {
            source_.close();
            phase_ = PacketPhase::Zeros;
            SDRCP_LOG_DEBUG("[PKTZ] transfer finished, emitting zeros");
        }
    }
}

void Packetizer::reopen_source() {
    if (source_.is_open()) {
        source_.close();
    }
    source_.clear();
    source_.open(options_.source, std::ios::binary);
    if (!source_.is_open()) {
        SDRCP_LOG_DEBUG("[PKTZ] cannot open " << options_.source << ", sending zeros");
    }
}

uint64_t execute_send(const SendOptions& options, Link& link,
                      const std::atomic<bool>* stop_requested) {
    Packetizer packetizer(options.packetizer);
    const size_t pkt = packetizer.packet_size();

    std::ofstream tag_out;
    if (options.tag_file) {
        tag_out.open(*options.tag_file);
        if (!tag_out) {
            throw std::runtime_error("Cannot create tag file: " + options.tag_file->string());
        }
    }

    size_t packets_per_chunk = std::max<size_t>(1, options.chunk_size / pkt);
    std::vector<uint8_t> buffer(packets_per_chunk * pkt);
    std::vector<LengthTag> tags;

    uint64_t total = 0;
    size_t fill = 0;
    size_t zero_packets = 0;

    auto flush = [&]() {
        if (fill == 0) return;
        link.write_all(buffer.data(), fill);
        total += fill;
        fill = 0;
        for (const auto& tag : tags) {
            if (tag_out.is_open()) {
                tag_out << tag.offset << '\t' << tag.key << '\t' << tag.value << '\n';
            }
        }
        tags.clear();
    };

    SDRCP_LOG_INFO("Sending " << options.packetizer.source << " (" << pkt << "-byte packets, "
                   << (options.packetizer.repeat ? "repeating" : "single shot") << ")");

    while (true) {
        if (stop_requested && stop_requested->load()) {
            SDRCP_LOG_INFO("Stop requested");
            break;
        }
        if (options.cycles > 0 && packetizer.cycles_completed() >= options.cycles) {
            break;
        }
        if (options.limit && packetizer.items_written() + pkt > *options.limit) {
            break;
        }
        if (packetizer.phase() == PacketPhase::Zeros) {
            if (zero_packets >= options.trailing_zero_packets) break;
            ++zero_packets;
        }

        packetizer.work(buffer.data() + fill, pkt, tags);
        fill += pkt;
        if (fill == buffer.size()) {
            flush();
        }
    }
    flush();

    if (tag_out.is_open()) {
        tag_out.flush();
        if (!tag_out) {
            throw std::runtime_error("Failed writing tag file: " + options.tag_file->string());
        }
    }

    SDRCP_LOG_INFO("Sent " << total << " bytes in " << packetizer.cycles_completed()
                   << " cycle(s)");
    return total;
}

} // namespace sdrcp
