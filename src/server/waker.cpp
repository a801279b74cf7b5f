#include "waker.hpp"

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>


namespace minikv {

Waker::Waker() {
    // Both ends non-blocking: a full pipe already means "wake up"
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) == -1)
        throw std::system_error(errno, std::generic_category(), "Failed to create self-pipe");
}

Waker::~Waker() {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
}

int Waker::read_fd() const noexcept {
    return pipe_fds_[0];
}

void Waker::notify() noexcept {
    char c = 'x';
    [[maybe_unused]] ssize_t n = ::write(pipe_fds_[1], &c, 1);
}

void Waker::clear() noexcept {
    char buf[64];
    while (::read(pipe_fds_[0], buf, sizeof(buf)) > 0);
}

} // namespace minikv
