#include "link.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace sdrcp {

static std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

Link::Link(int fd, bool owned, std::string description)
    : fd_(fd), owned_(owned), description_(std::move(description)) {}

Link::~Link() {
    close_fd();
}

Link::Link(Link&& other) noexcept
    : fd_(other.fd_), owned_(other.owned_), description_(std::move(other.description_)) {
    other.fd_ = -1;
    other.owned_ = false;
}

Link& Link::operator=(Link&& other) noexcept {
    if (this != &other) {
        close_fd();
        fd_ = other.fd_;
        owned_ = other.owned_;
        description_ = std::move(other.description_);
        other.fd_ = -1;
        other.owned_ = false;
    }
    return *this;
}

void Link::close_fd() {
    if (owned_ && fd_ >= 0) {
        close(fd_);
    }
    fd_ = -1;
}

void Link::write_all(const void* data, size_t size) {
    const char* ptr = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < size) {
        ssize_t result = ::write(fd_, ptr + sent, size - sent);
        if (result < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(errno_message("Write to " + description_ + " failed"));
        }
        if (result == 0) throw std::runtime_error("Write to " + description_ + " failed");
        sent += static_cast<size_t>(result);
    }
}

size_t Link::read_some(void* data, size_t size) {
    ssize_t result = ::read(fd_, data, size);
    if (result < 0) {
        if (errno == EINTR) return 0;
        throw std::runtime_error(errno_message("Read from " + description_ + " failed"));
    }
    return static_cast<size_t>(result);
}

Link Link::open_file_for_read(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error(errno_message("Cannot open " + path.string()));
    }
    return Link(fd, true, path.string());
}

Link Link::open_file_for_write(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error(errno_message("Cannot create " + path.string()));
    }
    return Link(fd, true, path.string());
}

Link Link::standard_input() {
    return Link(STDIN_FILENO, false, "stdin");
}

Link Link::standard_output() {
    return Link(STDOUT_FILENO, false, "stdout");
}

static sockaddr_in make_address(const std::string& host, uint16_t port) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        throw std::runtime_error("Invalid IPv4 address: " + host);
    }
    return address;
}

Link Link::connect_tcp(const std::string& host, uint16_t port) {
    sockaddr_in server_addr = make_address(host, port);

    int client_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (client_fd < 0) {
        throw std::runtime_error("Socket creation failed");
    }
    Link link(client_fd, true, host + ":" + std::to_string(port));

    SDRCP_LOG_INFO("Connecting to " << host << ":" << port << "...");

    if (connect(client_fd, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        throw std::runtime_error(errno_message("Connection failed"));
    }

    SDRCP_LOG_INFO("Connection established");
    return link;
}

Link Link::accept_tcp(const std::string& host, uint16_t port) {
    sockaddr_in address = make_address(host, port);

    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        throw std::runtime_error("Socket creation failed");
    }
    Link server(server_fd, true, "listener");

    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        throw std::runtime_error(errno_message("Bind failed"));
    }

    if (listen(server_fd, 1) < 0) {
        throw std::runtime_error(errno_message("Listen failed"));
    }

    SDRCP_LOG_INFO("Listening on " << host << ":" << port);

    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd = accept(server_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
        throw std::runtime_error(errno_message("Accept failed"));
    }

    std::string peer = std::string(inet_ntoa(client_addr.sin_addr)) + ":" +
                       std::to_string(ntohs(client_addr.sin_port));
    SDRCP_LOG_INFO("Connection from: " << peer);
    return Link(client_fd, true, peer);
}

} // namespace sdrcp
