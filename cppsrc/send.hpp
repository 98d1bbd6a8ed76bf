#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace sdrcp {

constexpr size_t DEFAULT_PACKET_SIZE = 512;
constexpr const char* DEFAULT_LENGTH_TAG_NAME = "packet_len";

// Boundary marker attached to the first byte of every packet
struct LengthTag {
    uint64_t offset;
    std::string key;
    uint64_t value;
};

enum class PacketPhase {
    Meta,
    File,
    Zeros
};

const char* phase_name(PacketPhase phase);

struct PacketizerOptions {
    std::filesystem::path source;
    size_t packet_size = DEFAULT_PACKET_SIZE;
    bool repeat = true;
    std::string length_tag_name = DEFAULT_LENGTH_TAG_NAME;
};

// Turns a file into an endless run of fixed-size packets:
// META, FILE..., META, FILE..., or META, FILE..., zeros forever.
class Packetizer {
public:
    // Throws std::invalid_argument when packet_size is outside [16, 4096]
    explicit Packetizer(PacketizerOptions options);

    // Fill out with as many whole packets as fit in n bytes and append one
    // tag per packet. Returns the number of bytes produced.
    size_t work(uint8_t* out, size_t n, std::vector<LengthTag>& tags);

    PacketPhase phase() const { return phase_; }
    uint64_t items_written() const { return items_written_; }
    uint64_t cycles_completed() const { return cycles_completed_; }
    size_t packet_size() const { return options_.packet_size; }
    const std::vector<uint8_t>& current_header() const { return header_; }

private:
    void emit_meta(uint8_t* packet);
    void emit_file(uint8_t* packet);
    void reopen_source();

    PacketizerOptions options_;
    PacketPhase phase_ = PacketPhase::Meta;
    std::vector<uint8_t> header_;
    std::ifstream source_;
    uint64_t file_bytes_left_ = 0;
    uint64_t items_written_ = 0;
    uint64_t cycles_completed_ = 0;
};

struct SendOptions {
    PacketizerOptions packetizer;
    size_t chunk_size = 8192;
    uint64_t cycles = 0;               // 0: unlimited (repeat mode)
    std::optional<uint64_t> limit;     // total output byte budget
    size_t trailing_zero_packets = 4;  // non-repeat mode, after the last FILE packet
    std::optional<std::filesystem::path> tag_file;
};

class Link;

// Packetize into link until the cycle count, the byte limit, the end of a
// non-repeating transfer, or stop_requested. Returns bytes written.
uint64_t execute_send(const SendOptions& options, Link& link,
                      const std::atomic<bool>* stop_requested = nullptr);

} // namespace sdrcp
