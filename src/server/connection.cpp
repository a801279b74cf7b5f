#include "connection.hpp"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace minikv {

namespace {

bool retryable(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace


bool Connection::read_to_inbox() {
    char chunk[4096];
    const ssize_t received = ::recv(socket_.fd(), chunk, sizeof(chunk), 0);

    if (received < 0) {
        if (retryable(errno))
            return true; // spurious wakeup, try again on the next POLLIN
        throw IOError{std::string{"recv failed: "} + std::strerror(errno)};
    }
    if (received == 0)
        return false; // orderly shutdown by the peer

    if (inbox_.size() + static_cast<size_t>(received) > MAX_INBOX_SIZE) {
        // No complete request fits, so whatever is buffered is useless
        inbox_.clear();
        throw BufferOverflowError{"ERROR: request too large"};
    }
    inbox_.append(chunk, static_cast<size_t>(received));
    return true;
}

std::optional<Request> Connection::try_get_request() {
    try {
        return Protocol::extract(inbox_);
    } catch (const ProtocolError&) {
        // Framing is lost, nothing after the bad frame can be trusted
        inbox_.clear();
        throw;
    }
}

void Connection::append_response(std::string data, bool last) {
    std::lock_guard lock(outbox_mutex_);
    if (last_queued_)
        return;
    last_queued_ = last;
    if (outbox_.empty())
        outbox_ = std::move(data);
    else
        outbox_ += data;
}

bool Connection::write_from_outbox() {
    std::lock_guard lock(outbox_mutex_);
    if (outbox_.empty())
        return false;

    const ssize_t sent = ::send(socket_.fd(), outbox_.data(), outbox_.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        if (retryable(errno))
            return true;
        throw IOError{std::string{"send failed: "} + std::strerror(errno)};
    }
    outbox_.erase(0, static_cast<size_t>(sent));
    return !outbox_.empty();
}

bool Connection::finished() const {
    std::lock_guard lock(outbox_mutex_);
    return last_queued_ && outbox_.empty();
}

size_t Connection::outbox_size() const {
    std::lock_guard lock(outbox_mutex_);
    return outbox_.size();
}

bool Connection::inbox_has_data() const {
    return !inbox_.empty();
}

bool Connection::outbox_has_data() const {
    std::lock_guard lock(outbox_mutex_);
    return !outbox_.empty();
}

} // namespace minikv
