#pragma once

#include <cstdint>
#include <string>

namespace minikv {

/*
 * RAII wrapper for a POSIX socket descriptor
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Creates a non-blocking IPv4 listener bound to address:port.
    // Port 0 picks an ephemeral port, see local_port().
    // Throws std::system_error on failure.
    static Socket listen_tcp(const std::string& address, uint16_t port);

    bool valid() const noexcept;

    int fd() const noexcept;

    // Port the descriptor is bound to, 0 if unknown
    uint16_t local_port() const noexcept;

private:
    void reset() noexcept;

    int fd_;
};

} // namespace minikv
