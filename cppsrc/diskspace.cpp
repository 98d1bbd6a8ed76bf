#include "diskspace.hpp"
#include <cstdio>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace sdrcp {

static fs::path existing_ancestor(const fs::path& target) {
    std::error_code ec;
    fs::path probe = target;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        probe = probe.parent_path();
    }
    return probe.empty() ? fs::path(".") : probe;
}

SpaceEstimate estimate_space(const fs::path& target, uint64_t declared_size) {
    SpaceEstimate estimate;

    struct statvfs stat;
    if (statvfs(existing_ancestor(target).c_str(), &stat) != 0) {
        return estimate;
    }

    estimate.known = true;
    estimate.block_size = stat.f_frsize ? stat.f_frsize : stat.f_bsize;
    if (estimate.block_size == 0) estimate.block_size = 1;
    estimate.available = static_cast<uint64_t>(stat.f_bavail) * estimate.block_size;

    uint64_t blocks = declared_size / estimate.block_size;
    if (declared_size % estimate.block_size) ++blocks;
    estimate.required = blocks * estimate.block_size;
    return estimate;
}

std::string format_bytes(uint64_t bytes) {
    static const char* const units[] = {"KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes) / 1024;
    size_t unit = 0;
    for (; value >= 1024 && unit + 1 < sizeof(units) / sizeof(units[0]); ++unit) {
        value /= 1024;
    }

    char text[32];
    std::snprintf(text, sizeof(text), "%.1f %s", value, units[unit]);
    return text;
}

} // namespace sdrcp
