#pragma once

#include <string>
#include <filesystem>
#include <cstddef>

namespace sdrcp {

constexpr const char* PART_SUFFIX = ".part";

// NAME_MAX on common filesystems; output names and their .part siblings stay within it
constexpr size_t MAX_OUTPUT_NAME_LEN = 255;

struct OutputPaths {
    std::filesystem::path final_path;
    std::filesystem::path part_path;
};

// Create dir (and parents) if absent. Throws std::runtime_error on failure.
void ensure_directory(const std::filesystem::path& dir);

// Basename of a name received from the wire, cut at the first NUL.
// Directory parts, ".", ".." and empty results fall back to DEFAULT_FILE_NAME.
std::string safe_file_name(const std::string& declared);

// Where to write name inside dir. Without overwrite, an existing target
// gets a numeric suffix: name_1.ext, name_2.ext, ... Long stems are
// shortened so that name.part stays within MAX_OUTPUT_NAME_LEN.
OutputPaths resolve_output_paths(const std::filesystem::path& dir, const std::string& name,
                                 bool overwrite);

} // namespace sdrcp
