#include "scanner.hpp"
#include <algorithm>

namespace sdrcp {

void ScanBuffer::append(const uint8_t* data, size_t len) {
    bytes_.insert(bytes_.end(), data, data + len);
}

void ScanBuffer::consume_front(size_t k) {
    if (k >= bytes_.size()) {
        bytes_.clear();
        return;
    }
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(k));
}

void ScanBuffer::keep_last(size_t k) {
    if (bytes_.size() > k) {
        consume_front(bytes_.size() - k);
    }
}

size_t ScanBuffer::find_magic(size_t from) const {
    if (from >= bytes_.size()) return npos;

    auto it = std::search(bytes_.begin() + static_cast<std::ptrdiff_t>(from), bytes_.end(),
                          MAGIC, MAGIC + MAGIC_LEN);
    if (it == bytes_.end()) return npos;
    return static_cast<size_t>(it - bytes_.begin());
}

ParseStatus try_parse(const ScanBuffer& buffer, size_t offset, FileHeader& header,
                      const HeaderLimits& limits) {
    if (offset > buffer.size()) {
        return ParseStatus::NeedMoreData;
    }
    return parse_header(buffer.data() + offset, buffer.size() - offset, header, limits);
}

ScanResult scan_for_header(const ScanBuffer& buffer, const HeaderLimits& limits) {
    ScanResult result;

    size_t start = 0;
    while (true) {
        size_t idx = buffer.find_magic(start);
        if (idx == ScanBuffer::npos) break;

        FileHeader header;
        ParseStatus status = try_parse(buffer, idx, header, limits);
        if (status != ParseStatus::Invalid) {
            result.status = status;
            result.offset = idx;
            result.header = header;
            return result;
        }
        start = idx + 1;
    }

    return result;
}

} // namespace sdrcp
