#pragma once

#include "protocol.hpp"
#include <vector>
#include <cstddef>
#include <cstdint>

namespace sdrcp {

// Ordered receive history. Bytes enter at the back and leave from the front.
class ScanBuffer {
public:
    void append(const uint8_t* data, size_t len);

    // Drop the first k bytes (all of them if k >= size)
    void consume_front(size_t k);

    // Keep only the most recent k bytes
    void keep_last(size_t k);

    void clear() { bytes_.clear(); }

    // Offset of the first magic occurrence at or after from, or npos
    size_t find_magic(size_t from) const;

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    std::vector<uint8_t> bytes_;
};

// Validate the candidate header that starts at offset in buffer
ParseStatus try_parse(const ScanBuffer& buffer, size_t offset, FileHeader& header,
                      const HeaderLimits& limits = HeaderLimits());

struct ScanResult {
    ParseStatus status = ParseStatus::Invalid;
    size_t offset = 0;
    FileHeader header;
};

// Walk every magic occurrence in ascending order. Stops at the first
// candidate that validates (Ok) or that needs more bytes (NeedMoreData).
// Invalid means no candidate in the buffer can become a header.
ScanResult scan_for_header(const ScanBuffer& buffer,
                           const HeaderLimits& limits = HeaderLimits());

} // namespace sdrcp
