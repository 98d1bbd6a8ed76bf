#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace sdrcp {

// Current size of path, or nullopt when it cannot be queried
std::optional<uint64_t> query_file_size(const std::filesystem::path& path);

// Name carried on the wire for path: its basename, UTF-8 cleaned, at most 255 bytes
std::string wire_name(const std::filesystem::path& path);

// Build the META header for path. An inaccessible file is announced with size 0.
std::vector<uint8_t> build_header(const std::filesystem::path& path, uint16_t meta_len);

} // namespace sdrcp
