#include "recv.hpp"
#include "directory.hpp"
#include "diskspace.hpp"
#include "link.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Phase-transition trace, enabled per session or by -vv
#define REASM_LOG(expr) \
    SDRCP_LOG_IF(options_.debug_logging || ::sdrcp::get_verbosity() >= ::sdrcp::LOG_LEVEL_DEBUG, \
                 "REASM", expr)

namespace sdrcp {

const char* state_name(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::Scan: return "SCAN";
        case ReassemblyState::Recv: return "RECV";
        case ReassemblyState::Done: return "DONE";
    }
    return "UNKNOWN";
}

Reassembler::Reassembler(ReassemblerOptions options)
    : options_(std::move(options)) {
    if (options_.max_scan_buffer_bytes == 0) {
        throw std::invalid_argument("max_scan_buffer_bytes must be > 0");
    }
    ensure_directory(options_.output_directory);
}

Reassembler::~Reassembler() {
    stop();
}

void Reassembler::push(const uint8_t* data, size_t len) {
    if (state_ == ReassemblyState::Done || stopped_ || len == 0) {
        return;
    }

    if (state_ == ReassemblyState::Scan) {
        buffer_.append(data, len);

        ScanResult found = scan();
        if (state_ == ReassemblyState::Recv) {
            receive();
            return;
        }
        if (found.status == ParseStatus::NeedMoreData) {
            // Nothing before a pending candidate can start a header
            buffer_.consume_front(found.offset);
        }

        // Bound memory while no header shows up
        if (buffer_.size() > options_.max_scan_buffer_bytes) {
            size_t keep = std::min(options_.scan_buffer_keep_bytes, options_.max_scan_buffer_bytes);
            REASM_LOG("scan buffer at " << buffer_.size() << " bytes, keeping last " << keep);
            buffer_.keep_last(keep);
        }
        return;
    }

    // RECV: payload goes straight to the file, surplus is dropped
    buffer_.append(data, len);
    receive();
}

ScanResult Reassembler::scan() {
    ScanResult found = scan_for_header(buffer_, options_.limits);
    if (found.status != ParseStatus::Ok) {
        return found;
    }

    const FileHeader& header = found.header;
    REASM_LOG("META ok @ " << found.offset << ": ver=" << static_cast<int>(header.version)
              << ", meta_len=" << header.meta_len << ", name=" << header.file_name
              << ", size=" << header.file_size);
    if (header.name_truncated) {
        REASM_LOG("name field cut by meta_len (" << static_cast<int>(header.name_len)
                  << " bytes declared)");
    }

    buffer_.consume_front(found.offset);
    buffer_.consume_front(header.meta_len);
    header_ = header;

    open_output();
    state_ = ReassemblyState::Recv;
    return found;
}

void Reassembler::receive() {
    if (!out_.is_open()) {
        return;
    }

    uint64_t remain = header_->file_size - written_;
    size_t take = static_cast<size_t>(std::min<uint64_t>(remain, buffer_.size()));
    if (take > 0) {
        out_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(take));
        if (!out_) {
            throw std::runtime_error("Failed writing " + part_path_.string());
        }
        written_ += take;
        buffer_.consume_front(take);
    }

    if (written_ >= header_->file_size) {
        finish();
    }
}

void Reassembler::open_output() {
    OutputPaths paths = resolve_output_paths(options_.output_directory, header_->file_name,
                                             options_.overwrite);
    final_path_ = paths.final_path;
    part_path_ = paths.part_path;

    SpaceEstimate space = estimate_space(part_path_, header_->file_size);
    if (!space.known) {
        REASM_LOG("free space unknown for " << part_path_.string());
    } else if (!space.sufficient()) {
        SDRCP_LOG_WARN("Low disk space for " << final_path_.string() << ": need "
                       << format_bytes(space.required) << ", available "
                       << format_bytes(space.available));
    }

    close_output();
    out_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("Cannot create output file " + part_path_.string());
    }
    written_ = 0;

    REASM_LOG("OPEN " << part_path_.string() << " (expect " << header_->file_size << " bytes)");
}

void Reassembler::finish() {
    out_.flush();
    bool ok = static_cast<bool>(out_);
    out_.close();
    if (!ok || out_.fail()) {
        throw std::runtime_error("Failed closing " + part_path_.string());
    }

    std::error_code ec;
    if (fs::exists(final_path_, ec)) {
        fs::remove(final_path_, ec);
        if (ec) {
            throw std::runtime_error("Cannot replace " + final_path_.string() + ": " + ec.message());
        }
    }
    fs::rename(part_path_, final_path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot rename " + part_path_.string() + " to " +
                                 final_path_.string() + ": " + ec.message());
    }

    buffer_.clear();
    state_ = ReassemblyState::Done;

    REASM_LOG("DONE " << final_path_.string() << " (written=" << written_ << ")");
}

void Reassembler::close_output() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

void Reassembler::stop() {
    if (stopped_) return;
    stopped_ = true;

    if (state_ == ReassemblyState::Recv) {
        close_output();
        REASM_LOG("STOP with " << written_ << " of " << header_->file_size << " bytes in "
                  << part_path_.string());
    }
    buffer_.clear();
}

bool execute_recv(const RecvOptions& options, Link& link,
                  const std::atomic<bool>* stop_requested) {
    Reassembler reassembler(options.reassembler);
    std::vector<uint8_t> buffer(std::max<size_t>(1, options.chunk_size));

    SDRCP_LOG_INFO("Receiving from " << link.description() << " into "
                   << options.reassembler.output_directory);

    while (!reassembler.done()) {
        if (stop_requested && stop_requested->load()) {
            SDRCP_LOG_INFO("Stop requested");
            break;
        }

        size_t n = link.read_some(buffer.data(), buffer.size());
        if (n == 0) {
            if (stop_requested && stop_requested->load()) continue;
            SDRCP_LOG_INFO("End of stream");
            break;
        }
        reassembler.push(buffer.data(), n);
    }

    if (reassembler.done()) {
        std::cout << "Received " << reassembler.final_path().string() << " ("
                  << format_bytes(reassembler.bytes_written()) << ")" << std::endl;
        return true;
    }

    reassembler.stop();
    if (reassembler.header()) {
        SDRCP_LOG_WARN("Transfer incomplete: " << reassembler.bytes_written() << "/"
                       << reassembler.header()->file_size << " bytes left in "
                       << reassembler.part_path().string());
    } else {
        SDRCP_LOG_WARN("No file header found in stream");
    }
    return false;
}

} // namespace sdrcp
