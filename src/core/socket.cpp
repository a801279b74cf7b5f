#include "minikv/socket.hpp"

#include <arpa/inet.h>   // inet_pton(), htons()
#include <netinet/in.h>  // sockaddr_in
#include <sys/socket.h>  // socket(), bind(), listen()
#include <unistd.h>      // close()

#include <cerrno>
#include <system_error>


namespace minikv {


Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    reset();
}

Socket::Socket(Socket&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::listen_tcp(const std::string& address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port); // Converts port to network byte order
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
        throw std::system_error(EINVAL, std::generic_category(), "Invalid listen address " + address);

    Socket listener{::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!listener.valid())
        throw std::system_error(errno, std::generic_category(), "Failed to create socket");

    int opt = 1;
    if (::setsockopt(listener.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
        throw std::system_error(errno, std::generic_category(), "setsockopt(SO_REUSEADDR) failed");

    if (::bind(listener.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        throw std::system_error(errno, std::generic_category(),
                                "Bind failed on " + address + ":" + std::to_string(port));

    if (::listen(listener.fd(), SOMAXCONN) == -1)
        throw std::system_error(errno, std::generic_category(), "Listen failed");

    return listener;
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

uint16_t Socket::local_port() const noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (fd_ == -1 || ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        return 0;
    return ntohs(addr.sin_port);
}

void Socket::reset() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace minikv
