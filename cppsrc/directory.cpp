#include "directory.hpp"
#include "protocol.hpp"
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sdrcp {

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + dir.string() + ": " +
                                 ec.message());
    }
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("Output path is not a directory: " + dir.string());
    }
}

std::string safe_file_name(const std::string& declared) {
    // The OS would end the path at an embedded NUL
    std::string name = declared.substr(0, declared.find('\0'));

    size_t slash = name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);

    if (base.empty() || base == "." || base == "..") {
        return DEFAULT_FILE_NAME;
    }
    return base;
}

static fs::path with_part_suffix(const fs::path& final_path) {
    fs::path part = final_path;
    part += PART_SUFFIX;
    return part;
}

static std::string cut_utf8(const std::string& text, size_t max) {
    if (text.size() <= max) return text;

    size_t cut = max;
    while (cut > 0 && (static_cast<uint8_t>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

// stem + tag + ext, with the stem shortened until the .part sibling fits
static std::string fit_name(std::string stem, std::string ext, const std::string& tag) {
    size_t budget = MAX_OUTPUT_NAME_LEN - std::strlen(PART_SUFFIX) - tag.size();
    if (stem.size() + ext.size() <= budget) {
        return stem + tag + ext;
    }
    if (ext.size() >= budget) {
        stem += ext;
        ext.clear();
    }
    return cut_utf8(stem, budget - ext.size()) + tag + ext;
}

OutputPaths resolve_output_paths(const fs::path& dir, const std::string& name, bool overwrite) {
    fs::path base = safe_file_name(name);
    std::string stem = base.stem().string();
    std::string ext = base.extension().string();

    fs::path final_path = dir / fit_name(stem, ext, "");

    std::error_code ec;
    if (!overwrite && fs::exists(final_path, ec)) {
        for (unsigned k = 1;; ++k) {
            fs::path candidate = dir / fit_name(stem, ext, "_" + std::to_string(k));
            if (!fs::exists(candidate, ec) && !fs::exists(with_part_suffix(candidate), ec)) {
                final_path = candidate;
                break;
            }
        }
    }

    return {final_path, with_part_suffix(final_path)};
}

} // namespace sdrcp
