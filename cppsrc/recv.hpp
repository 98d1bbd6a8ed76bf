#pragma once

#include "protocol.hpp"
#include "scanner.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace sdrcp {

constexpr size_t DEFAULT_MAX_SCAN_BUFFER = 4 * 1024 * 1024;
constexpr size_t DEFAULT_SCAN_BUFFER_KEEP = 1024 * 1024;

enum class ReassemblyState {
    Scan,
    Recv,
    Done
};

const char* state_name(ReassemblyState state);

struct ReassemblerOptions {
    std::filesystem::path output_directory;
    bool overwrite = true;
    bool debug_logging = false;
    size_t max_scan_buffer_bytes = DEFAULT_MAX_SCAN_BUFFER;
    size_t scan_buffer_keep_bytes = DEFAULT_SCAN_BUFFER_KEEP;
    HeaderLimits limits;
};

// Single-shot receiver: finds one header in an unaligned byte stream, writes
// the announced number of payload bytes to <name>.part and renames it once
// complete. Everything after that is dropped.
class Reassembler {
public:
    // Creates the output directory. Throws std::runtime_error if it cannot.
    explicit Reassembler(ReassemblerOptions options);
    ~Reassembler();

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Consume all of data. Throws std::runtime_error only when the output
    // file cannot be created or written.
    void push(const uint8_t* data, size_t len);

    // Flush and close an unfinished output; it stays at part_path()
    void stop();

    ReassemblyState state() const { return state_; }
    bool done() const { return state_ == ReassemblyState::Done; }
    uint64_t bytes_written() const { return written_; }
    size_t buffered_bytes() const { return buffer_.size(); }
    const std::optional<FileHeader>& header() const { return header_; }
    const std::filesystem::path& final_path() const { return final_path_; }
    const std::filesystem::path& part_path() const { return part_path_; }

private:
    ScanResult scan();
    void receive();
    void open_output();
    void finish();
    void close_output();

    ReassemblerOptions options_;
    ReassemblyState state_ = ReassemblyState::Scan;
    ScanBuffer buffer_;
    std::optional<FileHeader> header_;
    std::ofstream out_;
    std::filesystem::path final_path_;
    std::filesystem::path part_path_;
    uint64_t written_ = 0;
    bool stopped_ = false;
};

struct RecvOptions {
    ReassemblerOptions reassembler;
    size_t chunk_size = 8192;
};

class Link;

// Feed link into a Reassembler until the file completes, the stream ends or
// stop_requested. Returns true if the file was completed.
bool execute_recv(const RecvOptions& options, Link& link,
                  const std::atomic<bool>* stop_requested = nullptr);

} // namespace sdrcp
