#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace sdrcp {

void put_le16(uint8_t* dst, uint16_t val) {
    dst[0] = static_cast<uint8_t>(val & 0xFF);
    dst[1] = static_cast<uint8_t>((val >> 8) & 0xFF);
}

void put_le64(uint8_t* dst, uint64_t val) {
    for (size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<uint8_t>((val >> (8 * i)) & 0xFF);
    }
}

uint16_t get_le16(const uint8_t* src) {
    return static_cast<uint16_t>(src[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(src[1]) << 8);
}

uint64_t get_le64(const uint8_t* src) {
    uint64_t val = 0;
    for (size_t i = 0; i < 8; ++i) {
        val |= static_cast<uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// Length of the well-formed UTF-8 sequence at data[0], or 0 if there is none.
static size_t utf8_sequence_length(const uint8_t* data, size_t len) {
    uint8_t lead = data[0];
    if (lead < 0x80) return 1;

    size_t need = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 3;
        if (lead == 0xE0) lo = 0xA0;      // overlong
        if (lead == 0xED) hi = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 4;
        if (lead == 0xF0) lo = 0x90;      // overlong
        if (lead == 0xF4) hi = 0x8F;      // above U+10FFFF
    } else {
        return 0;
    }

    if (len < need) return 0;
    if (data[1] < lo || data[1] > hi) return 0;
    for (size_t i = 2; i < need; ++i) {
        if (data[i] < 0x80 || data[i] > 0xBF) return 0;
    }
    return need;
}

std::string decode_utf8_lossy(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len);

    size_t i = 0;
    while (i < len) {
        size_t n = utf8_sequence_length(data + i, len - i);
        if (n == 0) {
            ++i;
            continue;
        }
        out.append(reinterpret_cast<const char*>(data + i), n);
        i += n;
    }
    return out;
}

std::string clamp_name(const std::string& name) {
    if (name.size() <= MAX_NAME_LEN) return name;

    size_t cut = MAX_NAME_LEN;
    // Back off continuation bytes so the last character stays whole
    while (cut > 0 && (static_cast<uint8_t>(name[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return name.substr(0, cut);
}

std::vector<uint8_t> encode_header(const std::string& file_name, uint64_t file_size,
                                   uint16_t meta_len) {
    std::string name = clamp_name(file_name);
    uint8_t name_len = static_cast<uint8_t>(name.size());

    std::vector<uint8_t> full(FIXED_HEADER_LEN + name_len, 0);
    std::memcpy(full.data(), MAGIC, MAGIC_LEN);
    full[4] = FORMAT_VERSION;
    put_le16(full.data() + 5, meta_len);
    full[7] = name_len;
    put_le64(full.data() + 8, file_size);
    std::memcpy(full.data() + FIXED_HEADER_LEN, name.data(), name_len);

    // Pad or cut to exactly meta_len; a cut keeps name_len as written
    full.resize(meta_len, 0);
    return full;
}

ParseStatus parse_header(const uint8_t* data, size_t avail, FileHeader& out,
                         const HeaderLimits& limits) {
    if (avail < FIXED_HEADER_LEN) {
        return ParseStatus::NeedMoreData;
    }

    if (std::memcmp(data, MAGIC, MAGIC_LEN) != 0) {
        return ParseStatus::Invalid;
    }

    uint8_t version = data[4];
    uint16_t meta_len = get_le16(data + 5);
    uint8_t name_len = data[7];
    uint64_t file_size = get_le64(data + 8);

    // Sanity checks reject magic that happens to appear inside payload
    if (version != FORMAT_VERSION) {
        return ParseStatus::Invalid;
    }
    if (meta_len < MIN_META_LEN || meta_len > limits.max_meta_len) {
        return ParseStatus::Invalid;
    }
    // name_len is one byte wide, so it can never exceed MAX_NAME_LEN
    static_assert(MAX_NAME_LEN >= UINT8_MAX, "name_len field wider than MAX_NAME_LEN");
    if (file_size == 0 || file_size > limits.max_file_size) {
        return ParseStatus::Invalid;
    }

    if (avail < meta_len) {
        return ParseStatus::NeedMoreData;
    }

    // Lenient: a name cut short by meta_len is decoded from what is present
    size_t name_avail = std::min<size_t>(name_len, meta_len - FIXED_HEADER_LEN);
    std::string name = decode_utf8_lossy(data + FIXED_HEADER_LEN, name_avail);

    size_t first = name.find_first_not_of('\0');
    if (first == std::string::npos) {
        name.clear();
    } else {
        size_t last = name.find_last_not_of('\0');
        name = name.substr(first, last - first + 1);
    }
    if (name.empty()) {
        name = DEFAULT_FILE_NAME;
    }

    out.version = version;
    out.meta_len = meta_len;
    out.name_len = name_len;
    out.file_size = file_size;
    out.file_name = name;
    out.name_truncated = name_avail < name_len;
    return ParseStatus::Ok;
}

} // namespace sdrcp
