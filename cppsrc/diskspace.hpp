#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace sdrcp {

// Free space seen by an output file that is about to be written
struct SpaceEstimate {
    bool known = false;      // false when the filesystem could not be queried
    uint64_t available = 0;  // bytes usable by an unprivileged writer
    uint64_t required = 0;   // declared size rounded up to whole blocks
    uint64_t block_size = 0;

    bool sufficient() const { return !known || available >= required; }
};

// Query the filesystem that will hold target. target need not exist yet;
// the nearest existing ancestor directory is asked instead.
SpaceEstimate estimate_space(const std::filesystem::path& target, uint64_t declared_size);

// 1536 -> "1.5 KiB"
std::string format_bytes(uint64_t bytes);

} // namespace sdrcp
