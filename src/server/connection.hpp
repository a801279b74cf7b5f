#pragma once

#include "minikv/protocol.hpp"
#include "minikv/socket.hpp"
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace minikv {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * Byte buffers of a single client connection.
 *
 * The inbox is touched by the reactor thread only. The outbox is shared
 * with the worker that runs the connection's session, hence the mutex.
 */
class Connection {
public:
    explicit Connection(Socket socket) : socket_(std::move(socket)) {}

    int fd() const noexcept { return socket_.fd(); }

    // Queue encoded reply bytes. `last` marks the final reply of a
    // connection that is being shut down, see finished().
    void append_response(std::string data, bool last = false);

    // Write to client. Return true if there is still data left to send
    bool write_from_outbox();

    // Returns false if the client disconnected.
    // Throws BufferOverflowError when the inbox would exceed its limit.
    bool read_to_inbox();

    // Next complete request, if the inbox holds one.
    // On a framing error the inbox is discarded and ProtocolError rethrown.
    std::optional<Request> try_get_request();

    // True once the last reply was queued and fully written
    bool finished() const;

    size_t outbox_size() const;

    // Buffer state, used by the tests to observe partial reads and writes
    bool inbox_has_data() const;
    bool outbox_has_data() const;

    // Queued reply bytes above which a session stops running commands
    static constexpr size_t MAX_OUTBOX_SIZE = 1024 * 1024 * 2;

private:
    static constexpr size_t MAX_INBOX_SIZE = 1024 * 1024 * 2; // 2MB limit
    Socket socket_;
    std::string inbox_;
    std::string outbox_;  // guarded by outbox_mutex_
    bool last_queued_{false};  // guarded by outbox_mutex_
    mutable std::mutex outbox_mutex_;
};

} // namespace minikv
