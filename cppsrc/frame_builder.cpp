#include "frame_builder.hpp"
#include "protocol.hpp"

namespace fs = std::filesystem;

namespace sdrcp {

std::optional<uint64_t> query_file_size(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::string wire_name(const fs::path& path) {
    std::string base = path.filename().string();
    std::string clean = decode_utf8_lossy(reinterpret_cast<const uint8_t*>(base.data()),
                                          base.size());
    return clamp_name(clean);
}

std::vector<uint8_t> build_header(const fs::path& path, uint16_t meta_len) {
    uint64_t size = query_file_size(path).value_or(0);
    return encode_header(wire_name(path), size, meta_len);
}

} // namespace sdrcp
