#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace sdrcp {

// Header layout (little-endian)
//   0  magic      4  "FILE"
//   4  version    1
//   5  meta_len   2  total header size
//   7  name_len   1
//   8  file_size  8
//  16  name       name_len bytes, then zero padding up to meta_len
constexpr uint8_t MAGIC[4] = {'F', 'I', 'L', 'E'};
constexpr size_t MAGIC_LEN = 4;
constexpr uint8_t FORMAT_VERSION = 1;
constexpr size_t FIXED_HEADER_LEN = 16;
constexpr size_t MAX_NAME_LEN = 255;

constexpr uint16_t MIN_META_LEN = 16;
constexpr uint16_t MAX_META_LEN = 4096;
constexpr uint64_t MAX_FILE_SIZE = 1024ULL * 1024ULL * 1024ULL;

constexpr const char* DEFAULT_FILE_NAME = "recv.bin";

// Protocol structures
struct FileHeader {
    uint8_t version = FORMAT_VERSION;
    uint16_t meta_len = 0;
    uint8_t name_len = 0;
    uint64_t file_size = 0;
    std::string file_name;
    bool name_truncated = false;
};

// Receiver-side sanity limits used to reject false magic matches
struct HeaderLimits {
    uint16_t max_meta_len = MAX_META_LEN;
    uint64_t max_file_size = MAX_FILE_SIZE;
};

enum class ParseStatus {
    Ok,
    NeedMoreData,
    Invalid
};

// Little-endian field helpers
void put_le16(uint8_t* dst, uint16_t val);
void put_le64(uint8_t* dst, uint64_t val);
uint16_t get_le16(const uint8_t* src);
uint64_t get_le64(const uint8_t* src);

// Encode a header of exactly meta_len bytes. Content that does not fit is cut.
std::vector<uint8_t> encode_header(const std::string& file_name, uint64_t file_size,
                                   uint16_t meta_len);

// Validate and decode a header starting at data[0], with avail bytes readable.
ParseStatus parse_header(const uint8_t* data, size_t avail, FileHeader& out,
                         const HeaderLimits& limits = HeaderLimits());

// Keep well-formed UTF-8 sequences, drop every byte that is not part of one.
std::string decode_utf8_lossy(const uint8_t* data, size_t len);

// Trim the name to at most MAX_NAME_LEN bytes without splitting a UTF-8 sequence.
std::string clamp_name(const std::string& name);

} // namespace sdrcp
