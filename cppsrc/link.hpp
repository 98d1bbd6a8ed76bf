#pragma once

#include <filesystem>
#include <string>
#include <cstddef>
#include <cstdint>

namespace sdrcp {

// One end of the unidirectional byte stream. Owns its descriptor unless it
// wraps stdin/stdout.
class Link {
public:
    Link(int fd, bool owned, std::string description);
    ~Link();

    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;
    Link(Link&& other) noexcept;
    Link& operator=(Link&& other) noexcept;

    void write_all(const void* data, size_t size);

    // Returns 0 on end of stream or when a signal interrupted the read
    size_t read_some(void* data, size_t size);

    const std::string& description() const { return description_; }

    static Link open_file_for_read(const std::filesystem::path& path);
    static Link open_file_for_write(const std::filesystem::path& path);
    static Link standard_input();
    static Link standard_output();
    static Link connect_tcp(const std::string& host, uint16_t port);
    static Link accept_tcp(const std::string& host, uint16_t port);

private:
    void close_fd();

    int fd_;
    bool owned_;
    std::string description_;
};

} // namespace sdrcp
